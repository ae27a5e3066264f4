/**
 * @file runtime_client.hpp
 * @brief Capability interface of the container runtime driven by the engine
 *
 * The engine never talks to Docker directly: every component receives one
 * shared RuntimeClient built at startup. Implementations must be safe to call
 * from several threads at once.
 *
 * Failures are reported as core::EngineError:
 * - RUNTIME_UNAVAILABLE when the control API cannot be reached
 * - CONTAINER_NOT_FOUND when the referenced container does not exist
 * - RUNTIME_ERROR for any other rejected call
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/container_spec.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace dockhand {
namespace runtime {

/**
 * @struct MountRecord
 * @brief Mount as reported by inspect ("Mounts" entry)
 */
struct MountRecord {
    std::string type;         ///< "bind", "volume", "tmpfs", ...
    std::string name;         ///< Volume name (volumes only)
    std::string source;       ///< Host path
    std::string destination;  ///< Path inside container
    bool read_write{true};    ///< RW flag
};

/**
 * @struct ContainerRecord
 * @brief Declared configuration of a container as stored by the runtime
 */
struct ContainerRecord {
    std::string id;
    std::string name;                           ///< May carry a leading '/'
    std::string state;                          ///< State.Status
    std::string image;                          ///< Config.Image
    std::vector<std::string> environment;       ///< Config.Env
    std::vector<std::string> binds;             ///< HostConfig.Binds
    std::vector<MountRecord> mounts;            ///< Mounts
    std::string network_mode;                   ///< HostConfig.NetworkMode
    std::vector<std::string> networks;          ///< NetworkSettings.Networks keys
    core::PortMap port_bindings;                ///< HostConfig.PortBindings
    std::map<std::string, std::string> labels;  ///< Config.Labels
    std::string restart_policy;                 ///< HostConfig.RestartPolicy
};

/**
 * @struct ContainerSummary
 * @brief One row of a container listing
 */
struct ContainerSummary {
    std::string id;
    std::string name;
    std::string state;
};

/**
 * @struct StatSample
 * @brief Cumulative resource counters of one container at one instant
 */
struct StatSample {
    std::uint64_t cpu_total_usage{0};     ///< Container CPU time (ns, monotonic)
    std::uint64_t system_cpu_usage{0};    ///< Host CPU time (ns, monotonic)
    std::uint32_t online_cpu_count{0};    ///< Online CPUs
    std::uint64_t memory_usage_bytes{0};  ///< Memory usage
};

/**
 * @struct StatPair
 * @brief Two consecutive samples of the same container
 */
struct StatPair {
    StatSample previous;
    StatSample current;
};

struct ImageUsage {
    std::int64_t size{0};
    std::int64_t containers{0};  ///< Referencing containers (-1 = unknown)
};

struct ContainerUsage {
    std::int64_t size_rw{0};  ///< Writable layer size
    std::string state;
};

struct VolumeUsage {
    std::int64_t size{0};       ///< -1 = not computed
    std::int64_t ref_count{0};  ///< -1 = not computed
};

struct BuildCacheUsage {
    std::int64_t size{0};
};

/**
 * @struct DiskUsageReport
 * @brief Raw per-resource disk usage ("system df")
 */
struct DiskUsageReport {
    std::vector<ImageUsage> images;
    std::vector<ContainerUsage> containers;
    std::vector<VolumeUsage> volumes;
    std::vector<BuildCacheUsage> build_cache;
};

struct ResourceCounts {
    std::size_t images{0};
    std::size_t volumes{0};
    std::size_t networks{0};
};

struct RuntimeVersion {
    std::string version{"Unknown"};         ///< Engine version
    std::string server_version{"Unknown"};  ///< Daemon version from info
};

/**
 * @class RuntimeClient
 * @brief Abstract control API of the container runtime
 */
class RuntimeClient {
public:
    virtual ~RuntimeClient() = default;

    /// @return std::nullopt when the container does not exist
    virtual std::optional<ContainerRecord> InspectContainer(const std::string& ref) = 0;

    virtual void StopContainer(const std::string& id, std::chrono::seconds timeout) = 0;
    virtual void StartContainer(const std::string& id) = 0;
    virtual void RemoveContainer(const std::string& id) = 0;

    /**
     * @brief Create (not start) a container
     *
     * Only `spec.networks[0]` is attached at creation; the caller connects
     * the remaining networks.
     *
     * @return Id of the new container
     */
    virtual std::string CreateContainer(const std::string& name,
                                        const core::ContainerSpec& spec) = 0;

    virtual void ConnectNetwork(const std::string& container_id,
                                const std::string& network) = 0;

    virtual std::vector<ContainerSummary> ListContainers(bool all) = 0;

    /// @return std::nullopt when the container disappeared meanwhile
    virtual std::optional<StatPair> GetStats(const std::string& id) = 0;

    virtual DiskUsageReport GetDiskUsage() = 0;
    virtual ResourceCounts CountResources() = 0;
    virtual RuntimeVersion GetVersion() = 0;
};

} // namespace runtime
} // namespace dockhand
