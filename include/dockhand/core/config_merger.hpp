/**
 * @file config_merger.hpp
 * @brief Overlay of a partial update request onto a container snapshot
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/container_spec.hpp"

namespace dockhand {
namespace core {

/**
 * @class ConfigMerger
 * @brief Field-level merge of PartialContainerSpec into ContainerSpec
 *
 * Each field present in the patch replaces the base field as a whole:
 * a patch with one environment entry yields an environment of exactly one
 * entry. Labels and restart policy always come from the base.
 */
class ConfigMerger {
public:
    /**
     * @brief Merge patch into base
     * @throws EngineError INVALID_SPEC / MALFORMED_MOUNT_SPEC when the
     *         result fails ValidateSpec
     */
    static ContainerSpec Merge(const ContainerSpec& base, const PartialContainerSpec& patch);
};

} // namespace core
} // namespace dockhand
