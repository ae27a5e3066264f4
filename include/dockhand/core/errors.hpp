/**
 * @file errors.hpp
 * @brief Error kinds and exceptions raised by the reconfiguration engine
 *
 * Every failure leaving the engine is an EngineError carrying an ErrorKind
 * and the RecreationStage it happened in. Failures after the old container
 * was removed are RecreationLostError, which also carries the snapshot taken
 * before the change so an operator can recreate the container by hand.
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/container_spec.hpp"

#include <stdexcept>
#include <string>

namespace dockhand {
namespace core {

/**
 * @enum ErrorKind
 * @brief Classification of engine failures
 */
enum class ErrorKind {
    CONTAINER_NOT_FOUND,    ///< Reference no longer resolves
    MALFORMED_MOUNT_SPEC,   ///< Bad bind string or duplicate destination
    ALREADY_ATTACHED,       ///< Volume source already mounted
    RECREATION_LOST,        ///< Old container removed, replacement not running
    RUNTIME_UNAVAILABLE,    ///< Control API unreachable
    PARTIAL_REATTACHMENT,   ///< Warning only, never thrown
    INVALID_SPEC,           ///< Empty image, bad port spec
    RUNTIME_ERROR,          ///< Runtime reachable but the call failed
    CANCELLED               ///< Caller cancelled before removal
};

/**
 * @enum RecreationStage
 * @brief States of the recreation state machine
 */
enum class RecreationStage {
    INSPECTING,
    STOPPING,
    REMOVING,
    CREATING,
    STARTING,
    REATTACHING,
    DONE,
    FAILED
};

std::string ErrorKindToString(ErrorKind kind);
std::string StageToString(RecreationStage stage);

/**
 * @class EngineError
 * @brief Base exception for all engine failures
 */
class EngineError : public std::runtime_error {
public:
    EngineError(ErrorKind kind, const std::string& message,
                RecreationStage stage = RecreationStage::INSPECTING);

    ErrorKind Kind() const noexcept { return kind_; }
    RecreationStage Stage() const noexcept { return stage_; }

    /// Copy of this error attributed to another stage
    EngineError AtStage(RecreationStage stage) const;

private:
    ErrorKind kind_;
    RecreationStage stage_;
};

/**
 * @class RecreationLostError
 * @brief The old container is gone and the replacement is not running
 *
 * Raised when Creating or Starting fails. `PartialContainerId()` is set when
 * the replacement exists but could not be started.
 */
class RecreationLostError : public EngineError {
public:
    RecreationLostError(RecreationStage stage, const std::string& cause,
                        ContainerSnapshot original,
                        std::string partial_container_id = "");

    const ContainerSnapshot& Original() const noexcept { return original_; }
    const std::string& PartialContainerId() const noexcept { return partial_container_id_; }

private:
    ContainerSnapshot original_;
    std::string partial_container_id_;
};

} // namespace core
} // namespace dockhand
