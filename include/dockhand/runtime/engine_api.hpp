/**
 * @file engine_api.hpp
 * @brief Read-only libcurl client for the Docker Engine API
 *
 * The docker CLI only exposes formatted, rounded stats. Raw cumulative
 * counters (stats, system df) are read straight from the Engine API with a
 * GET over the daemon's unix socket or a tcp:// host.
 *
 * @date 2025
 */

#pragma once

#include <string>

namespace dockhand {
namespace runtime {

/**
 * @struct HttpResponse
 * @brief Status and body of one Engine API call
 */
struct HttpResponse {
    int status{0};
    std::string body;

    bool Ok() const { return status >= 200 && status < 300; }
};

/**
 * @class EngineApi
 * @brief One-shot GET requests against the daemon
 *
 * Each call uses its own curl easy handle, so one instance can be shared by
 * several threads.
 *
 * **Host Mapping**:
 * ```
 * unix:///var/run/docker.sock  -> http://localhost<path> via CURLOPT_UNIX_SOCKET_PATH
 * tcp://10.0.0.5:2375          -> http://10.0.0.5:2375<path>
 * https://10.0.0.5:2376        -> https://10.0.0.5:2376<path>
 * ```
 */
class EngineApi {
public:
    /**
     * @param docker_host "unix:///var/run/docker.sock", "tcp://host:port"
     *        or an http(s):// URL; empty means the default socket
     */
    explicit EngineApi(std::string docker_host = "unix:///var/run/docker.sock");

    /**
     * @brief GET a path such as "/system/df"
     * @throws core::EngineError RUNTIME_UNAVAILABLE if the daemon cannot be
     *         reached, RUNTIME_ERROR on any other transfer failure
     */
    HttpResponse Get(const std::string& path) const;

    const std::string& Host() const { return docker_host_; }

    /// URL requested for `path`
    std::string UrlFor(const std::string& path) const;

    /// Socket path for unix:// hosts, empty otherwise
    const std::string& SocketPath() const { return socket_path_; }

private:
    std::string docker_host_;
    std::string base_url_;
    std::string socket_path_;
};

} // namespace runtime
} // namespace dockhand
