/**
 * @file docker_runtime.hpp
 * @brief RuntimeClient backed by the docker CLI and the Engine API
 *
 * Lifecycle calls (create, start, stop, rm, network connect, inspect, ps)
 * run the docker CLI; raw counters (stats, system df, version, info) are
 * read from the Engine API socket.
 *
 * @date 2025
 */

#pragma once

#include "dockhand/runtime/runtime_client.hpp"
#include "dockhand/runtime/engine_api.hpp"

#include <string>
#include <vector>

namespace dockhand {
namespace runtime {

/**
 * @struct CommandResult
 * @brief Exit status and combined output of one CLI invocation
 */
struct CommandResult {
    int exit_code{0};
    std::string output;   ///< stdout and stderr, interleaved
    bool success{false};
};

/**
 * @class DockerRuntime
 * @brief Docker implementation of RuntimeClient
 *
 * Holds no per-container state; one instance is shared by all components
 * and may be called from several threads.
 *
 * **Usage Example**:
 * @code
 * auto runtime = std::make_shared<DockerRuntime>("unix:///var/run/docker.sock");
 * if (!runtime->Ping()) {
 *     spdlog::error("Docker daemon not reachable");
 * }
 * auto record = runtime->InspectContainer("web-1");
 * @endcode
 */
class DockerRuntime : public RuntimeClient {
public:
    /**
     * @param docker_host Daemon address; empty means the CLI default
     * @param docker_binary docker executable name or path
     */
    explicit DockerRuntime(std::string docker_host = "",
                           std::string docker_binary = "docker");

    ~DockerRuntime() override;

    /// True when the daemon answers `/_ping`
    bool Ping() const;

    /**
     * @brief Run a shell command in its own session, capturing stdout and stderr
     *
     * The child does not belong to the caller's process group, so terminal
     * interrupts delivered to the caller are not delivered to it.
     */
    static CommandResult RunCommand(const std::string& command);

    std::optional<ContainerRecord> InspectContainer(const std::string& ref) override;
    void StopContainer(const std::string& id, std::chrono::seconds timeout) override;
    void StartContainer(const std::string& id) override;
    void RemoveContainer(const std::string& id) override;
    std::string CreateContainer(const std::string& name,
                                const core::ContainerSpec& spec) override;
    void ConnectNetwork(const std::string& container_id,
                        const std::string& network) override;
    std::vector<ContainerSummary> ListContainers(bool all) override;
    std::optional<StatPair> GetStats(const std::string& id) override;
    DiskUsageReport GetDiskUsage() override;
    ResourceCounts CountResources() override;
    RuntimeVersion GetVersion() override;

    /**
     * @brief `docker create` arguments for a spec
     *
     * Only the primary network is passed; ports with no host binding are
     * exposed, not published.
     */
    static std::vector<std::string> BuildCreateCommand(const std::string& name,
                                                       const core::ContainerSpec& spec);

private:
    CommandResult ExecuteDockerCommand(const std::vector<std::string>& args) const;

    /// Throw the EngineError matching a failed CLI call
    [[noreturn]] void ThrowCommandFailure(const std::string& action,
                                          const CommandResult& result) const;

    std::size_t CountUniqueLines(const std::vector<std::string>& args) const;

    std::string docker_host_;
    std::string docker_binary_;
    EngineApi engine_api_;
};

} // namespace runtime
} // namespace dockhand
