/**
 * @file manager_config.hpp
 * @brief Runtime configuration of the container manager
 *
 * Populated by the CLI from command-line options, environment variables
 * (DOCKER_HOST, DOCKHAND_LOG_LEVEL) and an optional config file.
 *
 * @date 2025
 */

#pragma once

#include <chrono>
#include <string>

namespace dockhand {
namespace core {

/**
 * @struct ManagerConfig
 * @brief Settings shared by the manager facade and the runtime client
 */
struct ManagerConfig {
    // Runtime Connection
    std::string docker_host;                 ///< Daemon address ("" = CLI default / local socket)
    std::string docker_binary{"docker"};     ///< docker executable

    // Recreation
    std::chrono::seconds stop_timeout{10};   ///< Grace period before SIGKILL on stop
    bool serialize_updates{true};            ///< One recreation per container name at a time

    // Caching
    std::chrono::seconds system_info_ttl{30};  ///< System info cache lifetime (0 disables)

    // Logging
    std::string log_level{"info"};           ///< trace, debug, info, warn, error, critical, off
};

} // namespace core
} // namespace dockhand
