/**
 * @file test_volume_attacher.cpp
 * @brief Volume attachment tests
 *
 * @date 2025
 */

#include "dockhand/core/volume_attacher.hpp"
#include "dockhand/core/errors.hpp"
#include "mock_runtime.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

using namespace dockhand::core;
using dockhand::runtime::MountRecord;
using dockhand::testing::MockRuntime;
using dockhand::testing::WebRecord;
using ::testing::_;
using ::testing::Contains;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::StrictMock;

namespace {

class VolumeAttacherTest : public ::testing::Test {
protected:
    void SetUp() override {
        runtime_ = std::make_shared<StrictMock<MockRuntime>>();
        orchestrator_ = std::make_unique<RecreationOrchestrator>(runtime_);
    }

    std::shared_ptr<StrictMock<MockRuntime>> runtime_;
    std::unique_ptr<RecreationOrchestrator> orchestrator_;
};

ErrorKind AttachErrorKind(VolumeAttacher& attacher, const std::string& volume,
                          const std::string& mount_point, const std::string& mode = "rw") {
    try {
        attacher.Attach("web-1", volume, mount_point, mode);
    }
    catch (const EngineError& e) {
        return e.Kind();
    }
    ADD_FAILURE() << "Attach did not throw";
    return ErrorKind::RUNTIME_ERROR;
}

} // namespace

TEST_F(VolumeAttacherTest, AddsNamedVolumeAndRecreates) {
    EXPECT_CALL(*runtime_, InspectContainer("web-1")).WillRepeatedly(Return(WebRecord()));

    const MountDescriptor expected{"logs", "/var/log/nginx", MountMode::READ_ONLY,
                                   MountKind::NAMED_VOLUME};
    {
        InSequence sequence;
        EXPECT_CALL(*runtime_, StopContainer("aaa111", _));
        EXPECT_CALL(*runtime_, RemoveContainer("aaa111"));
        EXPECT_CALL(*runtime_, CreateContainer("web-1",
                                               Field(&ContainerSpec::mounts, Contains(expected))))
            .WillOnce(Return("bbb222"));
        EXPECT_CALL(*runtime_, StartContainer("bbb222"));
    }

    VolumeAttacher attacher(*orchestrator_);
    auto result = attacher.Attach("web-1", "logs", "/var/log/nginx", "ro");

    EXPECT_EQ(result.container_id, "bbb222");
    EXPECT_TRUE(result.warnings.empty());
}

TEST_F(VolumeAttacherTest, AlreadyAttachedSourceMutatesNothing) {
    auto record = WebRecord();
    record.mounts.push_back(MountRecord{"volume", "logs", "/var/lib/docker/volumes/logs/_data",
                                        "/var/log/nginx", true});
    EXPECT_CALL(*runtime_, InspectContainer("web-1")).WillRepeatedly(Return(record));
    EXPECT_CALL(*runtime_, StopContainer(_, _)).Times(0);
    EXPECT_CALL(*runtime_, RemoveContainer(_)).Times(0);
    EXPECT_CALL(*runtime_, CreateContainer(_, _)).Times(0);
    EXPECT_CALL(*runtime_, StartContainer(_)).Times(0);
    EXPECT_CALL(*runtime_, ConnectNetwork(_, _)).Times(0);

    VolumeAttacher attacher(*orchestrator_);

    EXPECT_EQ(AttachErrorKind(attacher, "logs", "/var/log/other"), ErrorKind::ALREADY_ATTACHED);
}

TEST_F(VolumeAttacherTest, UsedMountPointIsMalformed) {
    EXPECT_CALL(*runtime_, InspectContainer("web-1")).WillRepeatedly(Return(WebRecord()));

    VolumeAttacher attacher(*orchestrator_);

    EXPECT_EQ(AttachErrorKind(attacher, "content", "/usr/share/nginx/html"),
              ErrorKind::MALFORMED_MOUNT_SPEC);
}

TEST_F(VolumeAttacherTest, InvalidRequestFailsBeforeInspect) {
    VolumeAttacher attacher(*orchestrator_);

    EXPECT_EQ(AttachErrorKind(attacher, "logs", "relative/path"), ErrorKind::MALFORMED_MOUNT_SPEC);
    EXPECT_EQ(AttachErrorKind(attacher, "logs", "/var/log", "rx"), ErrorKind::MALFORMED_MOUNT_SPEC);
    EXPECT_EQ(AttachErrorKind(attacher, "", "/var/log"), ErrorKind::MALFORMED_MOUNT_SPEC);
    EXPECT_EQ(AttachErrorKind(attacher, "logs", "/var/log:ro"), ErrorKind::MALFORMED_MOUNT_SPEC);
}

TEST_F(VolumeAttacherTest, HostPathIsNotAVolume) {
    VolumeAttacher attacher(*orchestrator_);

    EXPECT_EQ(AttachErrorKind(attacher, "/host/dir", "/data"), ErrorKind::MALFORMED_MOUNT_SPEC);
    EXPECT_EQ(AttachErrorKind(attacher, "./conf", "/etc/app"), ErrorKind::MALFORMED_MOUNT_SPEC);
    EXPECT_EQ(AttachErrorKind(attacher, "~/cache", "/cache"), ErrorKind::MALFORMED_MOUNT_SPEC);
}

TEST(VolumeAttacherTargetTest, TargetIsSnapshotPlusMount) {
    auto snapshot = SnapshotExtractor::FromRecord(WebRecord());
    const MountDescriptor candidate{"logs", "/var/log/nginx", MountMode::READ_WRITE,
                                    MountKind::NAMED_VOLUME};

    auto target = VolumeAttacher::BuildTarget(snapshot, candidate);

    ASSERT_EQ(target.mounts.size(), snapshot.spec.mounts.size() + 1);
    EXPECT_EQ(target.mounts.back(), candidate);
    EXPECT_EQ(target.image, snapshot.spec.image);
    EXPECT_EQ(target.networks, snapshot.spec.networks);
    EXPECT_EQ(target.ports, snapshot.spec.ports);
}
