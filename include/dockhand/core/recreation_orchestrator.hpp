/**
 * @file recreation_orchestrator.hpp
 * @brief Destroy-then-recreate state machine for container reconfiguration
 *
 * The runtime has no in-place update for image, environment, mounts,
 * networks or ports. Changing any of them means replacing the container:
 *
 * ```
 * INSPECTING -> STOPPING -> REMOVING -> CREATING -> STARTING -> REATTACHING -> DONE
 *     |            |           |           |           |
 *     +------------+-----------+-----------+-----------+---> FAILED(stage, cause)
 * ```
 *
 * - STOPPING runs only when the container was running (or paused/restarting).
 * - STARTING runs only when it was running. A paused container comes back
 *   running, not paused; the same holds when the original is restarted
 *   after an aborted attempt.
 * - A failure before or during REMOVING leaves the old container in place
 *   (restarted if this attempt had stopped it).
 * - A failure in CREATING or STARTING raises RecreationLostError with the
 *   original snapshot: the old container is gone and nothing replaced it.
 *   No automatic retry is made.
 * - Per-network reattachment failures are returned as warnings.
 *
 * Cancellation is honoured only before REMOVING starts.
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/container_spec.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/core/network_reattacher.hpp"
#include "dockhand/core/snapshot_extractor.hpp"
#include "dockhand/runtime/runtime_client.hpp"
#include "dockhand/utils/name_lock_table.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json_fwd.hpp>

namespace dockhand {
namespace core {

/**
 * @class CancellationToken
 * @brief Cooperative cancellation flag shared with the calling layer
 */
class CancellationToken {
public:
    void Cancel() { cancelled_.store(true); }
    bool IsCancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

/**
 * @struct OrchestratorOptions
 * @brief Tunables of the recreation state machine
 */
struct OrchestratorOptions {
    std::chrono::seconds stop_timeout{10};  ///< Grace period passed to stop
    bool serialize_per_name{true};          ///< Hold a per-name lock during the swap
};

/**
 * @struct RecreationResult
 * @brief Outcome of a successful recreation
 */
struct RecreationResult {
    std::string container_id;             ///< Id of the replacement
    std::string previous_id;              ///< Id of the removed container
    std::string name;                     ///< Stable container name
    bool was_running{false};              ///< Running state restored
    std::vector<std::string> warnings;    ///< Networks that could not be reattached
    std::vector<RecreationStage> stages;  ///< Stages visited, in order
};

void to_json(nlohmann::json& j, const RecreationResult& result);

/**
 * @class RecreationOrchestrator
 * @brief Executes the stop/remove/create/start/reattach swap
 *
 * **Thread Safety**: safe to share. With `serialize_per_name` (default)
 * concurrent recreations of the same name run one after another, and the
 * snapshot the target is built from is read while holding the name lock.
 *
 * **Usage Example**:
 * @code
 * RecreationOrchestrator orchestrator(runtime);
 *
 * PartialContainerSpec patch;
 * patch.image = "nginx:1.27";
 *
 * try {
 *     auto result = orchestrator.Reconfigure("web-1", patch);
 *     for (const auto& network : result.warnings) {
 *         spdlog::warn("Not reattached: {}", network);
 *     }
 * }
 * catch (const RecreationLostError& e) {
 *     // e.Original() holds the configuration needed to recreate by hand
 * }
 * @endcode
 */
class RecreationOrchestrator {
public:
    /// Builds the target spec from a fresh snapshot; may throw to abort
    using TargetBuilder = std::function<ContainerSpec(const ContainerSnapshot&)>;

    explicit RecreationOrchestrator(std::shared_ptr<runtime::RuntimeClient> runtime,
                                    OrchestratorOptions options = OrchestratorOptions());

    /**
     * @brief Run the state machine against a container
     *
     * @param ref Container id or name
     * @param build_target Called once the snapshot is taken (and the name
     *        lock held); errors it throws abort with no runtime mutation
     * @param cancel Optional cancellation token
     *
     * @throws EngineError CONTAINER_NOT_FOUND, validation kinds, CANCELLED,
     *         or the runtime's kind tagged with STOPPING / REMOVING
     * @throws RecreationLostError on CREATING / STARTING failures
     */
    RecreationResult Run(const std::string& ref,
                         const TargetBuilder& build_target,
                         const CancellationToken* cancel = nullptr);

    /// Snapshot + ConfigMerger::Merge + Run
    RecreationResult Reconfigure(const std::string& ref,
                                 const PartialContainerSpec& patch,
                                 const CancellationToken* cancel = nullptr);

private:
    /// Start the old container again after an aborted attempt stopped it
    void RestoreOriginal(const ContainerSnapshot& snapshot) const;

    std::shared_ptr<runtime::RuntimeClient> runtime_;
    OrchestratorOptions options_;
    SnapshotExtractor extractor_;
    NetworkReattacher reattacher_;
    utils::NameLockTable locks_;
};

} // namespace core
} // namespace dockhand
