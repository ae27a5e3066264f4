/**
 * @file port_bindings.hpp
 * @brief Conversion between published-port strings and PortMap entries
 *
 * Accepted publish forms (same as `docker run -p`):
 *
 * ```
 * 80                     container port only, host port assigned by runtime
 * 8080:80                host port 8080 on all interfaces
 * 127.0.0.1:8080:80      host port 8080 on loopback
 * 127.0.0.1::80/udp      runtime-assigned host port on loopback, UDP
 * [::1]:8080:80          IPv6 host interface
 * ```
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/container_spec.hpp"

#include <string>
#include <utility>
#include <vector>

namespace dockhand {
namespace utils {

/**
 * @class PortBindings
 * @brief Publish string codec
 */
class PortBindings {
public:
    /**
     * @brief Parse a publish string
     * @return Container port spec ("80/tcp") and its host binding
     * @throws core::EngineError INVALID_SPEC on malformed input
     */
    static std::pair<std::string, core::PortBinding> ParsePublish(const std::string& publish);

    /// Publish string for one binding of a container port
    static std::string FormatPublish(const std::string& container_port,
                                     const core::PortBinding& binding);

    /// Parse a list of publish strings into a PortMap
    static core::PortMap ToPortMap(const std::vector<std::string>& publish_specs);

    /// Append "/tcp" when no protocol is given
    static std::string NormalizeContainerPort(const std::string& container_port);
};

} // namespace utils
} // namespace dockhand
