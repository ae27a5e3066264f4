/**
 * @file test_config_merger.cpp
 * @brief Partial update overlay tests
 *
 * @date 2025
 */

#include "dockhand/core/config_merger.hpp"
#include "dockhand/core/errors.hpp"

#include <gtest/gtest.h>

#include <random>

using namespace dockhand::core;

namespace {

ContainerSpec BaseSpec() {
    return ContainerSpecBuilder()
        .WithImage("nginx:1.25")
        .WithEnvironment("MODE", "prod")
        .WithEnvironment("WORKERS", "4")
        .WithMount({"/srv/www", "/www", MountMode::READ_ONLY, MountKind::BIND})
        .WithNetwork("frontend")
        .WithPort("80/tcp", {"", "8080"})
        .WithLabel("team", "web")
        .WithRestartPolicy("always")
        .Build();
}

ContainerSpec OtherSpec() {
    ContainerSpec spec;
    spec.image = "nginx:1.27";
    spec.environment = {"MODE=staging"};
    spec.mounts = {{"assets", "/assets", MountMode::READ_WRITE, MountKind::NAMED_VOLUME}};
    spec.networks = {"frontend", "backend"};
    spec.ports["443/tcp"] = {PortBinding{"127.0.0.1", "8443"}};
    return spec;
}

} // namespace

TEST(ConfigMergerTest, EmptyPatchKeepsBase) {
    auto base = BaseSpec();
    EXPECT_EQ(ConfigMerger::Merge(base, PartialContainerSpec()), base);
}

TEST(ConfigMergerTest, EnvironmentIsReplacedWholesale) {
    PartialContainerSpec patch;
    patch.environment = std::vector<std::string>{"DEBUG=1"};

    auto merged = ConfigMerger::Merge(BaseSpec(), patch);

    ASSERT_EQ(merged.environment.size(), 1u);
    EXPECT_EQ(merged.environment[0], "DEBUG=1");
    EXPECT_EQ(merged.image, "nginx:1.25");
}

TEST(ConfigMergerTest, CarriedFieldsAlwaysComeFromBase) {
    PartialContainerSpec patch;
    patch.image = "nginx:1.27";

    auto merged = ConfigMerger::Merge(BaseSpec(), patch);

    EXPECT_EQ(merged.labels.at("team"), "web");
    EXPECT_EQ(merged.restart_policy, "always");
}

TEST(ConfigMergerTest, RejectsEmptyImage) {
    PartialContainerSpec patch;
    patch.image = "";

    try {
        ConfigMerger::Merge(BaseSpec(), patch);
        FAIL() << "expected InvalidSpec";
    }
    catch (const EngineError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::INVALID_SPEC);
    }
}

TEST(ConfigMergerTest, RejectsDuplicateMountDestination) {
    PartialContainerSpec patch;
    patch.mounts = std::vector<MountDescriptor>{
        {"a", "/data", MountMode::READ_WRITE, MountKind::NAMED_VOLUME},
        {"b", "/data", MountMode::READ_ONLY, MountKind::NAMED_VOLUME},
    };

    try {
        ConfigMerger::Merge(BaseSpec(), patch);
        FAIL() << "expected MalformedMountSpec";
    }
    catch (const EngineError& e) {
        EXPECT_EQ(e.Kind(), ErrorKind::MALFORMED_MOUNT_SPEC);
    }
}

// Every subset of patch fields: set fields come from the patch, the rest from the base
TEST(ConfigMergerTest, MergeTakesExactlyThePatchedFields) {
    const auto base = BaseSpec();
    const auto other = OtherSpec();

    std::mt19937 rng(20250101);
    std::bernoulli_distribution coin(0.5);

    for (int round = 0; round < 200; ++round) {
        PartialContainerSpec patch;
        const bool set_image = coin(rng);
        const bool set_env = coin(rng);
        const bool set_mounts = coin(rng);
        const bool set_networks = coin(rng);
        const bool set_ports = coin(rng);

        if (set_image) patch.image = other.image;
        if (set_env) patch.environment = other.environment;
        if (set_mounts) patch.mounts = other.mounts;
        if (set_networks) patch.networks = other.networks;
        if (set_ports) patch.ports = other.ports;

        auto merged = ConfigMerger::Merge(base, patch);

        EXPECT_EQ(merged.image, set_image ? other.image : base.image);
        EXPECT_EQ(merged.environment, set_env ? other.environment : base.environment);
        EXPECT_EQ(merged.mounts, set_mounts ? other.mounts : base.mounts);
        EXPECT_EQ(merged.networks, set_networks ? other.networks : base.networks);
        EXPECT_EQ(merged.ports, set_ports ? other.ports : base.ports);
        EXPECT_EQ(merged.labels, base.labels);
        EXPECT_EQ(merged.restart_policy, base.restart_policy);
    }
}
