/**
 * @file snapshot_extractor.cpp
 * @brief Implementation of the config snapshot extractor
 *
 * @date 2025
 */

#include "dockhand/core/snapshot_extractor.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/utils/mount_translator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

namespace dockhand {
namespace core {

using utils::MountTranslator;

SnapshotExtractor::SnapshotExtractor(std::shared_ptr<runtime::RuntimeClient> runtime)
    : runtime_(std::move(runtime)) {
}

ContainerSnapshot SnapshotExtractor::Snapshot(const std::string& ref) const {
    auto record = runtime_->InspectContainer(ref);
    if (!record) {
        throw EngineError(ErrorKind::CONTAINER_NOT_FOUND, "Container " + ref + " not found");
    }

    auto snapshot = FromRecord(*record);
    spdlog::debug("Snapshot of {}: image={}, {} env, {} mounts, {} networks, {} ports",
                  snapshot.name, snapshot.spec.image, snapshot.spec.environment.size(),
                  snapshot.spec.mounts.size(), snapshot.spec.networks.size(),
                  snapshot.spec.ports.size());
    return snapshot;
}

ContainerSnapshot SnapshotExtractor::FromRecord(const runtime::ContainerRecord& record) {
    ContainerSnapshot snapshot;
    snapshot.id = record.id;
    snapshot.name = record.name;
    if (!snapshot.name.empty() && snapshot.name.front() == '/') {
        snapshot.name.erase(0, 1);
    }
    snapshot.state = ParseContainerState(record.state);

    ContainerSpec& spec = snapshot.spec;
    spec.image = record.image;
    spec.environment = record.environment;
    spec.ports = record.port_bindings;
    spec.labels = record.labels;
    spec.restart_policy = record.restart_policy;

    for (const auto& bind : record.binds) {
        spec.mounts.push_back(MountTranslator::Decode(bind));
    }

    for (const auto& mount : record.mounts) {
        if (mount.type != "bind" && mount.type != "volume") {
            continue;
        }

        MountDescriptor descriptor;
        descriptor.destination = mount.destination;
        descriptor.mode = mount.read_write ? MountMode::READ_WRITE : MountMode::READ_ONLY;
        if (mount.type == "volume") {
            descriptor.kind = MountKind::NAMED_VOLUME;
            descriptor.source = mount.name;
        } else {
            descriptor.kind = MountKind::BIND;
            descriptor.source = mount.source;
        }

        if (descriptor.source.empty() ||
            MountTranslator::HasDestinationConflict(spec.mounts, descriptor)) {
            continue;
        }
        spec.mounts.push_back(descriptor);
    }

    std::vector<std::string> networks = record.networks;
    std::sort(networks.begin(), networks.end());
    // "default" is the bridge network on Linux daemons
    std::string primary_name = record.network_mode == "default" ? "bridge" : record.network_mode;
    auto primary = std::find(networks.begin(), networks.end(), primary_name);
    if (primary != networks.end()) {
        std::rotate(networks.begin(), primary, primary + 1);
    }
    spec.networks = networks;

    return snapshot;
}

} // namespace core
} // namespace dockhand
