/**
 * @file volume_attacher.hpp
 * @brief Attaches one volume to an existing container
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/recreation_orchestrator.hpp"

#include <string>

namespace dockhand {
namespace core {

/**
 * @class VolumeAttacher
 * @brief Single-volume variant of the recreation flow
 *
 * The target is the current configuration plus one mount. Conflicts are
 * detected against the snapshot before anything is stopped:
 * - same source already mounted: ALREADY_ATTACHED, no runtime mutation
 * - mount point already used by another mount: MALFORMED_MOUNT_SPEC
 */
class VolumeAttacher {
public:
    explicit VolumeAttacher(RecreationOrchestrator& orchestrator);

    /**
     * @brief Mount `volume` at `mount_point` and recreate the container
     *
     * @param ref Container id or name
     * @param volume Volume name; host paths are rejected
     * @param mount_point Absolute path inside the container
     * @param mode "rw" (default) or "ro"
     * @param cancel Optional cancellation token
     */
    RecreationResult Attach(const std::string& ref,
                            const std::string& volume,
                            const std::string& mount_point,
                            const std::string& mode = "rw",
                            const CancellationToken* cancel = nullptr);

    /// Target spec for the attachment; throws on conflicts
    static ContainerSpec BuildTarget(const ContainerSnapshot& snapshot,
                                     const MountDescriptor& candidate);

private:
    RecreationOrchestrator& orchestrator_;
};

} // namespace core
} // namespace dockhand
