/**
 * @file network_reattacher.cpp
 * @brief Implementation of the network reattacher
 *
 * @date 2025
 */

#include "dockhand/core/network_reattacher.hpp"
#include "dockhand/core/errors.hpp"

#include <spdlog/spdlog.h>

#include <set>
#include <utility>

namespace dockhand {
namespace core {

NetworkReattacher::NetworkReattacher(std::shared_ptr<runtime::RuntimeClient> runtime)
    : runtime_(std::move(runtime)) {
}

std::vector<std::string> NetworkReattacher::Reattach(const std::string& container_id,
                                                     const std::vector<std::string>& networks) const {
    std::vector<std::string> failed;
    if (networks.size() < 2) {
        return failed;
    }

    std::set<std::string> attached{networks.front()};

    for (std::size_t i = 1; i < networks.size(); ++i) {
        const auto& network = networks[i];
        if (!attached.insert(network).second) {
            spdlog::debug("Network {} listed twice, skipping", network);
            continue;
        }

        try {
            runtime_->ConnectNetwork(container_id, network);
            spdlog::info("Reattached {} to network {}", container_id, network);
        }
        catch (const EngineError& e) {
            spdlog::warn("Could not reattach {} to network {}: {}", container_id, network, e.what());
            failed.push_back(network);
        }
    }

    return failed;
}

} // namespace core
} // namespace dockhand
