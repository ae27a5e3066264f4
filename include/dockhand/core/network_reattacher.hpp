/**
 * @file network_reattacher.hpp
 * @brief Connects a freshly created container to its secondary networks
 *
 * @date 2025
 */

#pragma once

#include "dockhand/runtime/runtime_client.hpp"

#include <memory>
#include <string>
#include <vector>

namespace dockhand {
namespace core {

/**
 * @class NetworkReattacher
 * @brief Best-effort connect of networks[1:]
 *
 * networks[0] is attached at creation time. Every other network is tried
 * independently: a failure is recorded and the next network is still
 * attempted; earlier successful connections are kept.
 */
class NetworkReattacher {
public:
    explicit NetworkReattacher(std::shared_ptr<runtime::RuntimeClient> runtime);

    /**
     * @param container_id New container
     * @param networks Full network list of the target spec, primary first
     * @return Networks that could not be connected (empty on full success)
     */
    std::vector<std::string> Reattach(const std::string& container_id,
                                      const std::vector<std::string>& networks) const;

private:
    std::shared_ptr<runtime::RuntimeClient> runtime_;
};

} // namespace core
} // namespace dockhand
