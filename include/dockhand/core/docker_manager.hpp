/**
 * @file docker_manager.hpp
 * @brief Caller-facing operations of the container manager
 *
 * DockerManager is the entry point used by the CLI. It wires the runtime
 * client, the recreation engine, the stats aggregator and the response
 * cache together and returns JSON payloads:
 *
 * ```
 * {"status": "success", "message": "...", ...}
 * ```
 *
 * Failures are thrown as EngineError / RecreationLostError.
 *
 * **Cache Policy**:
 * - GetSystemInfo reads through the "docker:system_info" entry
 * - every mutating operation deletes that entry when it returns, and also
 *   when it ends in RecreationLostError
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/container_spec.hpp"
#include "dockhand/core/manager_config.hpp"
#include "dockhand/core/recreation_orchestrator.hpp"
#include "dockhand/core/stats_aggregator.hpp"
#include "dockhand/core/volume_attacher.hpp"
#include "dockhand/runtime/runtime_client.hpp"
#include "dockhand/utils/response_cache.hpp"

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace dockhand {
namespace core {

/**
 * @class DockerManager
 * @brief Facade over the reconfiguration engine and the stats aggregator
 *
 * **Usage Example**:
 * @code
 * ManagerConfig config;
 * auto runtime = std::make_shared<runtime::DockerRuntime>(config.docker_host);
 * auto cache = std::make_shared<utils::InMemoryResponseCache>();
 * DockerManager manager(config, runtime, cache);
 *
 * PartialContainerSpec patch;
 * patch.networks = std::vector<std::string>{"frontend", "backend"};
 * auto payload = manager.UpdateContainer("web-1", patch);
 * std::cout << payload.dump(2) << std::endl;
 * @endcode
 */
class DockerManager {
public:
    static constexpr const char* kSystemInfoCacheKey = "docker:system_info";

    DockerManager(ManagerConfig config,
                  std::shared_ptr<runtime::RuntimeClient> runtime,
                  std::shared_ptr<utils::ResponseCache> cache);

    /**
     * @brief Change image, environment, mounts, networks or ports
     *
     * @throws EngineError INVALID_SPEC for an empty patch, plus everything
     *         RecreationOrchestrator::Run throws
     */
    nlohmann::json UpdateContainer(const std::string& ref,
                                   const PartialContainerSpec& patch,
                                   const CancellationToken* cancel = nullptr);

    /// Mount a volume and recreate the container
    nlohmann::json AttachVolume(const std::string& ref,
                                const std::string& volume,
                                const std::string& mount_point,
                                const std::string& mode = "rw",
                                const CancellationToken* cancel = nullptr);

    /// Host overview, served from cache while fresh
    nlohmann::json GetSystemInfo();

    /// CPU percent and memory of one container
    nlohmann::json GetContainerCpuPercent(const std::string& ref);

    const ManagerConfig& Config() const { return config_; }

private:
    nlohmann::json SuccessPayload(const std::string& message,
                                  const RecreationResult& result) const;

    void InvalidateSystemInfo();

    ManagerConfig config_;
    std::shared_ptr<runtime::RuntimeClient> runtime_;
    std::shared_ptr<utils::ResponseCache> cache_;
    RecreationOrchestrator orchestrator_;
    VolumeAttacher attacher_;
    StatsAggregator stats_;
};

} // namespace core
} // namespace dockhand
