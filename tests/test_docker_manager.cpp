/**
 * @file test_docker_manager.cpp
 * @brief Facade payload and cache policy tests
 *
 * @date 2025
 */

#include "dockhand/core/docker_manager.hpp"
#include "dockhand/core/errors.hpp"
#include "mock_runtime.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace dockhand::core;
using dockhand::runtime::ContainerSummary;
using dockhand::runtime::DiskUsageReport;
using dockhand::runtime::ResourceCounts;
using dockhand::runtime::RuntimeVersion;
using dockhand::runtime::StatPair;
using dockhand::testing::MockRuntime;
using dockhand::testing::Sample;
using dockhand::testing::WebRecord;
using dockhand::utils::InMemoryResponseCache;
using ::testing::_;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::Throw;

namespace {

class DockerManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime_ = std::make_shared<NiceMock<MockRuntime>>();
        cache_ = std::make_shared<InMemoryResponseCache>();

        ON_CALL(*runtime_, InspectContainer("web-1")).WillByDefault(Return(WebRecord()));
        ON_CALL(*runtime_, CreateContainer(_, _)).WillByDefault(Return("bbb222"));
        ON_CALL(*runtime_, ListContainers(true)).WillByDefault(Return(std::vector<ContainerSummary>{
            {"aaa111", "web-1", "running"},
        }));
        ON_CALL(*runtime_, GetStats("aaa111")).WillByDefault(Return(
            StatPair{Sample(1000, 100000, 2, 2048), Sample(1500, 100500, 2, 2048)}));
        ON_CALL(*runtime_, CountResources()).WillByDefault(Return(ResourceCounts{1, 1, 3}));
        ON_CALL(*runtime_, GetVersion()).WillByDefault(Return(RuntimeVersion()));
        ON_CALL(*runtime_, GetDiskUsage()).WillByDefault(Return(DiskUsageReport()));
    }

    DockerManager MakeManager() {
        return DockerManager(config_, runtime_, cache_);
    }

    ManagerConfig config_;
    std::shared_ptr<NiceMock<MockRuntime>> runtime_;
    std::shared_ptr<InMemoryResponseCache> cache_;
};

PartialContainerSpec NewImage() {
    PartialContainerSpec patch;
    patch.image = "nginx:1.27";
    return patch;
}

} // namespace

TEST_F(DockerManagerTest, UpdateReturnsSuccessPayload) {
    auto manager = MakeManager();
    auto payload = manager.UpdateContainer("web-1", NewImage());

    EXPECT_EQ(payload["status"], "success");
    EXPECT_EQ(payload["container_id"], "bbb222");
    EXPECT_EQ(payload["name"], "web-1");
    EXPECT_TRUE(payload["warnings"].empty());
    EXPECT_FALSE(payload.contains("warning"));
}

TEST_F(DockerManagerTest, PartialReattachmentIsReportedInPayload) {
    EXPECT_CALL(*runtime_, ConnectNetwork("bbb222", "backend"))
        .WillOnce(Throw(EngineError(ErrorKind::RUNTIME_ERROR, "no such network")));

    PartialContainerSpec patch;
    patch.networks = std::vector<std::string>{"frontend", "backend"};

    auto manager = MakeManager();
    auto payload = manager.UpdateContainer("web-1", patch);

    EXPECT_EQ(payload["status"], "success");
    EXPECT_EQ(payload["warning"], "PartialReattachment");
    EXPECT_EQ(payload["warnings"], nlohmann::json::array({"backend"}));
}

TEST_F(DockerManagerTest, EmptyPatchIsRejected) {
    EXPECT_CALL(*runtime_, StopContainer(_, _)).Times(0);
    EXPECT_CALL(*runtime_, RemoveContainer(_)).Times(0);

    auto manager = MakeManager();
    try {
        manager.UpdateContainer("web-1", PartialContainerSpec());
        FAIL() << "expected InvalidSpec";
    }
    catch (const EngineError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::INVALID_SPEC);
    }
}

TEST_F(DockerManagerTest, SystemInfoIsServedFromCacheUntilUpdate) {
    EXPECT_CALL(*runtime_, ListContainers(true)).Times(2);

    auto manager = MakeManager();

    auto first = manager.GetSystemInfo();
    auto second = manager.GetSystemInfo();
    EXPECT_EQ(first, second);
    EXPECT_EQ(first["containers_running"], 1);

    manager.UpdateContainer("web-1", NewImage());
    EXPECT_FALSE(cache_->Get(DockerManager::kSystemInfoCacheKey).has_value());

    manager.GetSystemInfo();
}

TEST_F(DockerManagerTest, RecreationLostInvalidatesCache) {
    cache_->Set(DockerManager::kSystemInfoCacheKey, {{"stale", true}}, std::chrono::seconds(30));
    EXPECT_CALL(*runtime_, CreateContainer(_, _))
        .WillOnce(Throw(EngineError(ErrorKind::RUNTIME_ERROR, "no space left on device")));

    auto manager = MakeManager();
    EXPECT_THROW(manager.UpdateContainer("web-1", NewImage()), RecreationLostError);
    EXPECT_FALSE(cache_->Get(DockerManager::kSystemInfoCacheKey).has_value());
}

TEST_F(DockerManagerTest, FailureBeforeRemovalKeepsCache) {
    cache_->Set(DockerManager::kSystemInfoCacheKey, {{"cached", true}}, std::chrono::seconds(30));
    EXPECT_CALL(*runtime_, StopContainer(_, _))
        .WillOnce(Throw(EngineError(ErrorKind::RUNTIME_UNAVAILABLE, "daemon down")));

    auto manager = MakeManager();
    EXPECT_THROW(manager.UpdateContainer("web-1", NewImage()), EngineError);
    EXPECT_TRUE(cache_->Get(DockerManager::kSystemInfoCacheKey).has_value());
}

TEST_F(DockerManagerTest, ZeroTtlDisablesCaching) {
    config_.system_info_ttl = std::chrono::seconds(0);
    EXPECT_CALL(*runtime_, ListContainers(true)).Times(2);

    auto manager = MakeManager();
    manager.GetSystemInfo();
    manager.GetSystemInfo();
}

TEST_F(DockerManagerTest, AttachVolumeInvalidatesCache) {
    cache_->Set(DockerManager::kSystemInfoCacheKey, {{"cached", true}}, std::chrono::seconds(30));

    auto manager = MakeManager();
    auto payload = manager.AttachVolume("web-1", "logs", "/var/log/nginx");

    EXPECT_EQ(payload["message"], "Volume logs attached to container");
    EXPECT_FALSE(cache_->Get(DockerManager::kSystemInfoCacheKey).has_value());
}

TEST_F(DockerManagerTest, ContainerCpuPercentPayload) {
    auto manager = MakeManager();
    auto payload = manager.GetContainerCpuPercent("aaa111");

    EXPECT_EQ(payload["status"], "success");
    EXPECT_EQ(payload["cpu_percent"], 200.0);
    EXPECT_EQ(payload["memory_usage_bytes"], 2048);
}
