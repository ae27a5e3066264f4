/**
 * @file docker_manager.cpp
 * @brief Implementation of the manager facade
 *
 * @date 2025
 */

#include "dockhand/core/docker_manager.hpp"
#include "dockhand/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace dockhand {
namespace core {

using json = nlohmann::json;

namespace {

OrchestratorOptions MakeOrchestratorOptions(const ManagerConfig& config) {
    OrchestratorOptions options;
    options.stop_timeout = config.stop_timeout;
    options.serialize_per_name = config.serialize_updates;
    return options;
}

} // anonymous namespace

// Constructor
DockerManager::DockerManager(ManagerConfig config,
                             std::shared_ptr<runtime::RuntimeClient> runtime,
                             std::shared_ptr<utils::ResponseCache> cache)
    : config_(std::move(config))
    , runtime_(std::move(runtime))
    , cache_(std::move(cache))
    , orchestrator_(runtime_, MakeOrchestratorOptions(config_))
    , attacher_(orchestrator_)
    , stats_(runtime_) {

    spdlog::debug("Manager initialized (stop timeout {}s, system info ttl {}s, serialized updates: {})",
                  config_.stop_timeout.count(), config_.system_info_ttl.count(),
                  config_.serialize_updates);
}

json DockerManager::UpdateContainer(const std::string& ref,
                                    const PartialContainerSpec& patch,
                                    const CancellationToken* cancel) {
    if (patch.Empty()) {
        throw EngineError(ErrorKind::INVALID_SPEC, "No changes requested for " + ref);
    }

    try {
        auto result = orchestrator_.Reconfigure(ref, patch, cancel);
        InvalidateSystemInfo();
        return SuccessPayload("Container " + ref + " updated and recreated", result);
    }
    catch (const RecreationLostError&) {
        InvalidateSystemInfo();
        throw;
    }
}

json DockerManager::AttachVolume(const std::string& ref,
                                 const std::string& volume,
                                 const std::string& mount_point,
                                 const std::string& mode,
                                 const CancellationToken* cancel) {
    try {
        auto result = attacher_.Attach(ref, volume, mount_point, mode, cancel);
        InvalidateSystemInfo();
        return SuccessPayload("Volume " + volume + " attached to container", result);
    }
    catch (const RecreationLostError&) {
        InvalidateSystemInfo();
        throw;
    }
}

json DockerManager::GetSystemInfo() {
    if (cache_) {
        if (auto cached = cache_->Get(kSystemInfoCacheKey)) {
            spdlog::debug("System info served from cache");
            return *cached;
        }
    }

    json info = stats_.CollectSystemInfo();

    if (cache_ && config_.system_info_ttl.count() > 0) {
        cache_->Set(kSystemInfoCacheKey, info, config_.system_info_ttl);
    }
    return info;
}

json DockerManager::GetContainerCpuPercent(const std::string& ref) {
    json payload = stats_.CollectContainerLoad(ref);
    payload["status"] = "success";
    return payload;
}

json DockerManager::SuccessPayload(const std::string& message,
                                   const RecreationResult& result) const {
    json payload = {
        {"status", "success"},
        {"message", message},
        {"container_id", result.container_id},
        {"previous_id", result.previous_id},
        {"name", result.name},
        {"was_running", result.was_running},
        {"warnings", result.warnings}
    };

    if (!result.warnings.empty()) {
        payload["warning"] = ErrorKindToString(ErrorKind::PARTIAL_REATTACHMENT);
    }
    return payload;
}

void DockerManager::InvalidateSystemInfo() {
    if (cache_) {
        cache_->Delete(kSystemInfoCacheKey);
        spdlog::debug("System info cache invalidated");
    }
}

} // namespace core
} // namespace dockhand
