/**
 * @file errors.cpp
 * @brief Engine error types
 *
 * @date 2025
 */

#include "dockhand/core/errors.hpp"

#include <utility>

namespace dockhand {
namespace core {

std::string ErrorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::CONTAINER_NOT_FOUND: return "ContainerNotFound";
        case ErrorKind::MALFORMED_MOUNT_SPEC: return "MalformedMountSpec";
        case ErrorKind::ALREADY_ATTACHED: return "AlreadyAttached";
        case ErrorKind::RECREATION_LOST: return "RecreationLost";
        case ErrorKind::RUNTIME_UNAVAILABLE: return "RuntimeUnavailable";
        case ErrorKind::PARTIAL_REATTACHMENT: return "PartialReattachment";
        case ErrorKind::INVALID_SPEC: return "InvalidSpec";
        case ErrorKind::RUNTIME_ERROR: return "RuntimeError";
        case ErrorKind::CANCELLED: return "Cancelled";
        default: return "Unknown";
    }
}

std::string StageToString(RecreationStage stage) {
    switch (stage) {
        case RecreationStage::INSPECTING: return "inspecting";
        case RecreationStage::STOPPING: return "stopping";
        case RecreationStage::REMOVING: return "removing";
        case RecreationStage::CREATING: return "creating";
        case RecreationStage::STARTING: return "starting";
        case RecreationStage::REATTACHING: return "reattaching";
        case RecreationStage::DONE: return "done";
        case RecreationStage::FAILED: return "failed";
        default: return "unknown";
    }
}

EngineError::EngineError(ErrorKind kind, const std::string& message,
                         RecreationStage stage)
    : std::runtime_error(message)
    , kind_(kind)
    , stage_(stage) {
}

EngineError EngineError::AtStage(RecreationStage stage) const {
    return EngineError(kind_, what(), stage);
}

RecreationLostError::RecreationLostError(RecreationStage stage,
                                         const std::string& cause,
                                         ContainerSnapshot original,
                                         std::string partial_container_id)
    : EngineError(ErrorKind::RECREATION_LOST,
                  "Container " + original.name + " was removed but could not be " +
                  (stage == RecreationStage::STARTING ? "started" : "recreated") +
                  ": " + cause,
                  stage)
    , original_(std::move(original))
    , partial_container_id_(std::move(partial_container_id)) {
}

} // namespace core
} // namespace dockhand
