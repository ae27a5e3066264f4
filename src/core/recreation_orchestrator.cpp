/**
 * @file recreation_orchestrator.cpp
 * @brief Implementation of the container recreation state machine
 *
 * **Failure Matrix**:
 * ```
 * Stage        | Old container           | New container | Raised
 * -------------+-------------------------+---------------+---------------------
 * INSPECTING   | untouched               | none          | EngineError
 * STOPPING     | untouched               | none          | EngineError(STOPPING)
 * REMOVING     | restarted if we stopped | none          | EngineError(REMOVING)
 * CREATING     | gone                    | none          | RecreationLostError
 * STARTING     | gone                    | created       | RecreationLostError
 * REATTACHING  | gone                    | running       | warnings only
 * ```
 *
 * @date 2025
 */

#include "dockhand/core/recreation_orchestrator.hpp"
#include "dockhand/core/config_merger.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <optional>
#include <utility>

namespace dockhand {
namespace core {

namespace {

void ThrowIfCancelled(const CancellationToken* cancel, const std::string& name,
                      RecreationStage stage) {
    if (cancel && cancel->IsCancelled()) {
        throw EngineError(ErrorKind::CANCELLED,
                          "Update of " + name + " cancelled before removal", stage);
    }
}

} // anonymous namespace

void to_json(nlohmann::json& j, const RecreationResult& result) {
    nlohmann::json stages = nlohmann::json::array();
    for (auto stage : result.stages) {
        stages.push_back(StageToString(stage));
    }

    j = nlohmann::json{
        {"container_id", result.container_id},
        {"previous_id", result.previous_id},
        {"name", result.name},
        {"was_running", result.was_running},
        {"warnings", result.warnings},
        {"stages", stages}
    };
}

// Constructor
RecreationOrchestrator::RecreationOrchestrator(std::shared_ptr<runtime::RuntimeClient> runtime,
                                               OrchestratorOptions options)
    : runtime_(runtime)
    , options_(options)
    , extractor_(runtime)
    , reattacher_(runtime) {
}

RecreationResult RecreationOrchestrator::Run(const std::string& ref,
                                             const TargetBuilder& build_target,
                                             const CancellationToken* cancel) {
    RecreationResult result;

    // ========================================================================
    // INSPECTING
    // ========================================================================

    result.stages.push_back(RecreationStage::INSPECTING);
    auto snapshot = extractor_.Snapshot(ref);

    // Another update may have replaced the container between the read above
    // and the lock, contended or not: the snapshot is re-read under the lock
    std::optional<utils::NameLockTable::Guard> guard;
    if (options_.serialize_per_name) {
        guard.emplace(locks_.Acquire(snapshot.name));
        if (guard->Contended()) {
            spdlog::info("[{}] waited for a concurrent update", snapshot.name);
        }
        snapshot = extractor_.Snapshot(snapshot.name);
    }

    const ContainerSpec target = build_target(snapshot);
    ValidateSpec(target);
    ThrowIfCancelled(cancel, snapshot.name, RecreationStage::INSPECTING);

    result.name = snapshot.name;
    result.previous_id = snapshot.id;
    result.was_running = snapshot.WasRunning();

    spdlog::info("[{}] recreating {} (state {}) with image {}",
                 snapshot.name, snapshot.id, ContainerStateToString(snapshot.state), target.image);

    // ========================================================================
    // STOPPING
    // ========================================================================

    bool stopped_here = false;
    if (result.was_running) {
        result.stages.push_back(RecreationStage::STOPPING);
        spdlog::info("[{}] stopping {}", snapshot.name, snapshot.id);
        try {
            runtime_->StopContainer(snapshot.id, options_.stop_timeout);
        }
        catch (const EngineError& e) {
            spdlog::error("[{}] stop failed, container left in place: {}", snapshot.name, e.what());
            throw e.AtStage(RecreationStage::STOPPING);
        }
        stopped_here = true;

        if (cancel && cancel->IsCancelled()) {
            RestoreOriginal(snapshot);
            ThrowIfCancelled(cancel, snapshot.name, RecreationStage::STOPPING);
        }
    }

    // ========================================================================
    // REMOVING
    // ========================================================================

    result.stages.push_back(RecreationStage::REMOVING);
    spdlog::info("[{}] removing {}", snapshot.name, snapshot.id);
    try {
        runtime_->RemoveContainer(snapshot.id);
    }
    catch (const EngineError& e) {
        spdlog::error("[{}] remove failed, container left in place: {}", snapshot.name, e.what());
        if (stopped_here) {
            RestoreOriginal(snapshot);
        }
        throw e.AtStage(RecreationStage::REMOVING);
    }

    // ========================================================================
    // CREATING
    // ========================================================================

    result.stages.push_back(RecreationStage::CREATING);
    spdlog::info("[{}] creating replacement on network {}", snapshot.name,
                 target.networks.empty() ? std::string("<default>") : target.networks.front());
    try {
        result.container_id = runtime_->CreateContainer(snapshot.name, target);
    }
    catch (const std::exception& e) {
        spdlog::critical("[{}] create failed after removal, container lost: {}",
                         snapshot.name, e.what());
        throw RecreationLostError(RecreationStage::CREATING, e.what(), snapshot);
    }

    // ========================================================================
    // STARTING
    // ========================================================================

    if (result.was_running) {
        result.stages.push_back(RecreationStage::STARTING);
        spdlog::info("[{}] starting {}", snapshot.name, result.container_id);
        try {
            runtime_->StartContainer(result.container_id);
        }
        catch (const std::exception& e) {
            spdlog::critical("[{}] start of {} failed after removal: {}",
                             snapshot.name, result.container_id, e.what());
            throw RecreationLostError(RecreationStage::STARTING, e.what(), snapshot,
                                      result.container_id);
        }
    }

    // ========================================================================
    // REATTACHING
    // ========================================================================

    result.stages.push_back(RecreationStage::REATTACHING);
    result.warnings = reattacher_.Reattach(result.container_id, target.networks);
    if (!result.warnings.empty()) {
        spdlog::warn("[{}] {} network(s) not reattached", snapshot.name, result.warnings.size());
    }

    result.stages.push_back(RecreationStage::DONE);
    spdlog::info("[{}] recreated as {}", snapshot.name, result.container_id);
    return result;
}

RecreationResult RecreationOrchestrator::Reconfigure(const std::string& ref,
                                                     const PartialContainerSpec& patch,
                                                     const CancellationToken* cancel) {
    return Run(ref,
               [&patch](const ContainerSnapshot& snapshot) {
                   return ConfigMerger::Merge(snapshot.spec, patch);
               },
               cancel);
}

void RecreationOrchestrator::RestoreOriginal(const ContainerSnapshot& snapshot) const {
    spdlog::info("[{}] starting original container {} again", snapshot.name, snapshot.id);
    try {
        runtime_->StartContainer(snapshot.id);
    }
    catch (const EngineError& e) {
        spdlog::error("[{}] could not restart original container {}: {}",
                      snapshot.name, snapshot.id, e.what());
    }
}

} // namespace core
} // namespace dockhand
