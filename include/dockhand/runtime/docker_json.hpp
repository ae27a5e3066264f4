/**
 * @file docker_json.hpp
 * @brief Parsers for Docker CLI / Engine API JSON documents
 *
 * Docker writes `null` for many empty collections ("Binds": null,
 * "Env": null, "PortBindings": null); every parser here treats null and a
 * missing key the same way.
 *
 * @date 2025
 */

#pragma once

#include "dockhand/runtime/runtime_client.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace dockhand {
namespace runtime {
namespace docker_json {

/// `docker container inspect` output (array with one object, or the object)
ContainerRecord ParseInspectOutput(const std::string& json_str);

/// One line of `docker ps --format '{{json .}}'`
ContainerSummary ParseListLine(const std::string& line);

/// `/containers/{id}/stats?stream=false` body: precpu_stats -> previous
StatPair ParseStatsOutput(const std::string& json_str);

/// `/system/df` body
DiskUsageReport ParseDiskUsage(const std::string& json_str);

/**
 * @brief Port map from JSON
 *
 * Accepts the runtime's own form
 * `{"80/tcp": [{"HostIp": "", "HostPort": "8080"}]}` as well as the shorthand
 * `{"80/tcp": 8080}`, `{"80": "127.0.0.1:8080"}` and `{"80/tcp": null}`.
 *
 * @throws core::EngineError INVALID_SPEC on anything else
 */
core::PortMap PortMapFromJson(const nlohmann::json& j);

} // namespace docker_json
} // namespace runtime
} // namespace dockhand
