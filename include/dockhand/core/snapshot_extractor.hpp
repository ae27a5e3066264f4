/**
 * @file snapshot_extractor.hpp
 * @brief Reads the declared configuration of an existing container
 *
 * @date 2025
 */

#pragma once

#include "dockhand/core/container_spec.hpp"
#include "dockhand/runtime/runtime_client.hpp"

#include <memory>
#include <string>

namespace dockhand {
namespace core {

/**
 * @class SnapshotExtractor
 * @brief Normalizes a runtime record into a ContainerSnapshot
 *
 * Values are taken as the runtime stores them; the only interpretation is
 * structural decoding of bind strings.
 *
 * - Mounts: HostConfig.Binds first (decoded by MountTranslator), then any
 *   bind/volume entry of Mounts whose destination is not yet covered
 *   (volumes declared with --mount or by the image).
 * - Networks: the declared network mode first when the container is a
 *   member of it, the remaining memberships after it in name order.
 */
class SnapshotExtractor {
public:
    explicit SnapshotExtractor(std::shared_ptr<runtime::RuntimeClient> runtime);

    /**
     * @brief Snapshot a container by id or name
     * @throws EngineError CONTAINER_NOT_FOUND if the reference does not resolve
     */
    ContainerSnapshot Snapshot(const std::string& ref) const;

    /// Conversion without a runtime call
    static ContainerSnapshot FromRecord(const runtime::ContainerRecord& record);

private:
    std::shared_ptr<runtime::RuntimeClient> runtime_;
};

} // namespace core
} // namespace dockhand
