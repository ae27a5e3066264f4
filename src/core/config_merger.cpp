/**
 * @file config_merger.cpp
 * @brief Implementation of the config merger
 *
 * @date 2025
 */

#include "dockhand/core/config_merger.hpp"

namespace dockhand {
namespace core {

ContainerSpec ConfigMerger::Merge(const ContainerSpec& base, const PartialContainerSpec& patch) {
    ContainerSpec merged = base;

    if (patch.image) merged.image = *patch.image;
    if (patch.environment) merged.environment = *patch.environment;
    if (patch.mounts) merged.mounts = *patch.mounts;
    if (patch.networks) merged.networks = *patch.networks;
    if (patch.ports) merged.ports = *patch.ports;

    ValidateSpec(merged);
    return merged;
}

} // namespace core
} // namespace dockhand
