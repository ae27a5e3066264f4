/**
 * @file mock_runtime.hpp
 * @brief gmock RuntimeClient and record builders shared by the tests
 *
 * @date 2025
 */

#pragma once

#include "dockhand/runtime/runtime_client.hpp"

#include <gmock/gmock.h>

#include <string>
#include <vector>

namespace dockhand {
namespace testing {

class MockRuntime : public runtime::RuntimeClient {
public:
    MOCK_METHOD(std::optional<runtime::ContainerRecord>, InspectContainer,
                (const std::string& ref), (override));
    MOCK_METHOD(void, StopContainer, (const std::string& id, std::chrono::seconds timeout),
                (override));
    MOCK_METHOD(void, StartContainer, (const std::string& id), (override));
    MOCK_METHOD(void, RemoveContainer, (const std::string& id), (override));
    MOCK_METHOD(std::string, CreateContainer,
                (const std::string& name, const core::ContainerSpec& spec), (override));
    MOCK_METHOD(void, ConnectNetwork,
                (const std::string& container_id, const std::string& network), (override));
    MOCK_METHOD(std::vector<runtime::ContainerSummary>, ListContainers, (bool all), (override));
    MOCK_METHOD(std::optional<runtime::StatPair>, GetStats, (const std::string& id), (override));
    MOCK_METHOD(runtime::DiskUsageReport, GetDiskUsage, (), (override));
    MOCK_METHOD(runtime::ResourceCounts, CountResources, (), (override));
    MOCK_METHOD(runtime::RuntimeVersion, GetVersion, (), (override));
};

/// Running nginx container "web-1" on the "frontend" network
inline runtime::ContainerRecord WebRecord() {
    runtime::ContainerRecord record;
    record.id = "aaa111";
    record.name = "/web-1";
    record.state = "running";
    record.image = "nginx:1.25";
    record.environment = {"MODE=prod", "WORKERS=4"};
    record.binds = {"/srv/www:/usr/share/nginx/html:ro"};
    record.network_mode = "frontend";
    record.networks = {"frontend"};
    record.port_bindings["80/tcp"] = {core::PortBinding{"", "8080"}};
    record.labels["team"] = "web";
    record.restart_policy = "unless-stopped";
    return record;
}

inline runtime::StatSample Sample(std::uint64_t cpu, std::uint64_t system,
                                  std::uint32_t cpus, std::uint64_t memory = 0) {
    runtime::StatSample sample;
    sample.cpu_total_usage = cpu;
    sample.system_cpu_usage = system;
    sample.online_cpu_count = cpus;
    sample.memory_usage_bytes = memory;
    return sample;
}

} // namespace testing
} // namespace dockhand
