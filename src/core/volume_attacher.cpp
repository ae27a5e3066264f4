/**
 * @file volume_attacher.cpp
 * @brief Implementation of the volume attacher
 *
 * @date 2025
 */

#include "dockhand/core/volume_attacher.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/utils/mount_translator.hpp"

#include <spdlog/spdlog.h>

namespace dockhand {
namespace core {

using utils::MountTranslator;

VolumeAttacher::VolumeAttacher(RecreationOrchestrator& orchestrator)
    : orchestrator_(orchestrator) {
}

RecreationResult VolumeAttacher::Attach(const std::string& ref,
                                        const std::string& volume,
                                        const std::string& mount_point,
                                        const std::string& mode,
                                        const CancellationToken* cancel) {
    // Validated before the container is even inspected
    if (volume.find(':') != std::string::npos || mount_point.find(':') != std::string::npos) {
        throw EngineError(ErrorKind::MALFORMED_MOUNT_SPEC,
                          "Volume name and mount point must not contain ':'");
    }

    auto candidate = MountTranslator::Decode(volume + ":" + mount_point);
    candidate.mode = MountTranslator::ParseMode(mode);

    if (candidate.kind != MountKind::NAMED_VOLUME) {
        throw EngineError(ErrorKind::MALFORMED_MOUNT_SPEC,
                          "'" + volume + "' is a host path, not a volume name");
    }

    spdlog::info("Attaching {} to {} at {} ({})", candidate.source, ref,
                 candidate.destination, MountTranslator::ModeToString(candidate.mode));

    return orchestrator_.Run(ref,
                             [&candidate](const ContainerSnapshot& snapshot) {
                                 return BuildTarget(snapshot, candidate);
                             },
                             cancel);
}

ContainerSpec VolumeAttacher::BuildTarget(const ContainerSnapshot& snapshot,
                                          const MountDescriptor& candidate) {
    if (MountTranslator::HasConflict(snapshot.spec.mounts, candidate)) {
        throw EngineError(ErrorKind::ALREADY_ATTACHED,
                          candidate.source + " is already attached to " + snapshot.name);
    }
    if (MountTranslator::HasDestinationConflict(snapshot.spec.mounts, candidate)) {
        throw EngineError(ErrorKind::MALFORMED_MOUNT_SPEC,
                          "Mount point " + candidate.destination + " is already used in " +
                          snapshot.name);
    }

    ContainerSpec target = snapshot.spec;
    target.mounts.push_back(candidate);
    return target;
}

} // namespace core
} // namespace dockhand
