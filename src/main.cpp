/**
 * @file main.cpp
 * @brief dockhand - Command-line interface
 *
 * Entry point for the dockhand container manager. Reconfigures existing
 * containers (image, environment, volumes, networks, ports) by recreating
 * them, attaches volumes, and reports host and container resource usage.
 *
 * Every command prints a JSON document on stdout; logs go to stderr.
 *
 * **Exit Codes**:
 * - 0: success
 * - 1: runtime or unexpected failure
 * - 2: invalid request (nothing was changed)
 * - 3: container removed but not recreated (payload holds its old configuration)
 *
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <nlohmann/json.hpp>

#include "dockhand/core/docker_manager.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/runtime/docker_runtime.hpp"
#include "dockhand/utils/mount_translator.hpp"
#include "dockhand/utils/port_bindings.hpp"
#include "dockhand/utils/response_cache.hpp"

#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

using json = nlohmann::json;

using dockhand::core::CancellationToken;
using dockhand::core::EngineError;
using dockhand::core::ErrorKind;
using dockhand::core::RecreationLostError;

namespace {

constexpr int kExitRuntimeError = 1;
constexpr int kExitInvalidRequest = 2;
constexpr int kExitRecreationLost = 3;

CancellationToken g_cancel;

void HandleInterrupt(int) {
    g_cancel.Cancel();
}

/*******************************************************************************
 * Output
 ******************************************************************************/

void PrintJson(const json& payload) {
    std::cout << payload.dump(2) << std::endl;
}

int ReportEngineError(const EngineError& e) {
    json payload = {
        {"status", "error"},
        {"error", dockhand::core::ErrorKindToString(e.Kind())},
        {"stage", dockhand::core::StageToString(e.Stage())},
        {"message", e.what()}
    };
    PrintJson(payload);

    switch (e.Kind()) {
        case ErrorKind::MALFORMED_MOUNT_SPEC:
        case ErrorKind::ALREADY_ATTACHED:
        case ErrorKind::INVALID_SPEC:
            return kExitInvalidRequest;
        default:
            return kExitRuntimeError;
    }
}

int ReportRecreationLost(const RecreationLostError& e) {
    json payload = {
        {"status", "error"},
        {"error", dockhand::core::ErrorKindToString(e.Kind())},
        {"stage", dockhand::core::StageToString(e.Stage())},
        {"message", e.what()},
        {"original", e.Original()}
    };
    if (!e.PartialContainerId().empty()) {
        payload["partial_container_id"] = e.PartialContainerId();
    }
    PrintJson(payload);
    return kExitRecreationLost;
}

/*******************************************************************************
 * Request Building
 ******************************************************************************/

dockhand::core::PartialContainerSpec BuildPatch(const CLI::Option* image_opt, const std::string& image,
                                                const CLI::Option* env_opt, const std::vector<std::string>& env,
                                                const CLI::Option* volume_opt, const std::vector<std::string>& volumes,
                                                const CLI::Option* network_opt, const std::vector<std::string>& networks,
                                                const CLI::Option* port_opt, const std::vector<std::string>& ports) {
    dockhand::core::PartialContainerSpec patch;

    if (image_opt->count() > 0) {
        patch.image = image;
    }
    if (env_opt->count() > 0) {
        patch.environment = env;
    }
    if (volume_opt->count() > 0) {
        std::vector<dockhand::core::MountDescriptor> mounts;
        for (const auto& bind : volumes) {
            mounts.push_back(dockhand::utils::MountTranslator::Decode(bind));
        }
        patch.mounts = mounts;
    }
    if (network_opt->count() > 0) {
        patch.networks = networks;
    }
    if (port_opt->count() > 0) {
        patch.ports = dockhand::utils::PortBindings::ToPortMap(ports);
    }

    return patch;
}

void ConfigureLogging(const std::string& level, bool verbose) {
    auto logger = spdlog::stderr_color_mt("dockhand");
    spdlog::set_default_logger(logger);

    if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::from_str(level));
    }
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

} // anonymous namespace

/*******************************************************************************
 * Main Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"dockhand - reconfigure Docker containers in place"};
    app.set_config("--config", "", "Read options from an INI/TOML file");
    app.require_subcommand(1);

    dockhand::core::ManagerConfig config;
    int stop_timeout = static_cast<int>(config.stop_timeout.count());
    int cache_ttl = static_cast<int>(config.system_info_ttl.count());
    bool no_serialize = false;
    bool verbose = false;

    app.add_option("-H,--host", config.docker_host, "Docker daemon address")
        ->envname("DOCKER_HOST");
    app.add_option("--docker-binary", config.docker_binary, "docker executable")
        ->capture_default_str();
    app.add_option("--stop-timeout", stop_timeout, "Seconds to wait for a container to stop")
        ->capture_default_str()
        ->check(CLI::NonNegativeNumber);
    app.add_option("--cache-ttl", cache_ttl, "System info cache lifetime in seconds")
        ->capture_default_str()
        ->check(CLI::NonNegativeNumber);
    app.add_flag("--no-serialize", no_serialize,
                 "Allow concurrent updates of the same container");
    app.add_option("--log-level", config.log_level, "Log level")
        ->envname("DOCKHAND_LOG_LEVEL")
        ->capture_default_str()
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "error", "critical", "off"}));
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    // info
    auto* info_cmd = app.add_subcommand("info", "Show host-wide container and disk usage");

    // update
    std::string update_ref;
    std::string image;
    std::vector<std::string> env;
    std::vector<std::string> volumes;
    std::vector<std::string> networks;
    std::vector<std::string> ports;

    auto* update_cmd = app.add_subcommand("update", "Change a container's configuration by recreating it");
    update_cmd->add_option("container", update_ref, "Container id or name")->required();
    auto* image_opt = update_cmd->add_option("--image", image, "New image");
    auto* env_opt = update_cmd->add_option("-e,--env", env, "KEY=VALUE (replaces the whole environment)");
    auto* volume_opt = update_cmd->add_option("--volume", volumes, "source:destination[:mode] (replaces all mounts)");
    auto* network_opt = update_cmd->add_option("--network", networks, "Network, primary first (replaces all networks)");
    auto* port_opt = update_cmd->add_option("-p,--port", ports, "[ip:][host:]port[/proto] (replaces all ports)");

    // attach-volume
    std::string attach_ref;
    std::string volume_name;
    std::string mount_point;
    std::string mode = "rw";

    auto* attach_cmd = app.add_subcommand("attach-volume", "Mount a volume into a container");
    attach_cmd->add_option("container", attach_ref, "Container id or name")->required();
    attach_cmd->add_option("volume", volume_name, "Volume name")->required();
    attach_cmd->add_option("mount-point", mount_point, "Absolute path inside the container")->required();
    attach_cmd->add_option("--mode", mode, "Access mode")
        ->capture_default_str()
        ->check(CLI::IsMember({"rw", "ro"}));

    // stats
    std::string stats_ref;
    auto* stats_cmd = app.add_subcommand("stats", "Show CPU percent and memory of a container");
    stats_cmd->add_option("container", stats_ref, "Container id or name")->required();

    CLI11_PARSE(app, argc, argv);

    config.stop_timeout = std::chrono::seconds(stop_timeout);
    config.system_info_ttl = std::chrono::seconds(cache_ttl);
    config.serialize_updates = !no_serialize;

    ConfigureLogging(config.log_level, verbose);
    std::signal(SIGINT, HandleInterrupt);
    std::signal(SIGTERM, HandleInterrupt);

    try {
        auto runtime = std::make_shared<dockhand::runtime::DockerRuntime>(config.docker_host,
                                                                          config.docker_binary);
        if (!runtime->Ping()) {
            throw EngineError(ErrorKind::RUNTIME_UNAVAILABLE,
                              "Docker daemon " +
                              (config.docker_host.empty() ? std::string("(default socket)")
                                                          : config.docker_host) +
                              " is not responding");
        }

        auto cache = std::make_shared<dockhand::utils::InMemoryResponseCache>();
        dockhand::core::DockerManager manager(config, runtime, cache);

        if (info_cmd->parsed()) {
            PrintJson(manager.GetSystemInfo());
        }
        else if (update_cmd->parsed()) {
            auto patch = BuildPatch(image_opt, image, env_opt, env, volume_opt, volumes,
                                    network_opt, networks, port_opt, ports);
            PrintJson(manager.UpdateContainer(update_ref, patch, &g_cancel));
        }
        else if (attach_cmd->parsed()) {
            PrintJson(manager.AttachVolume(attach_ref, volume_name, mount_point, mode, &g_cancel));
        }
        else if (stats_cmd->parsed()) {
            PrintJson(manager.GetContainerCpuPercent(stats_ref));
        }

        return 0;

    } catch (const RecreationLostError& e) {
        spdlog::critical("{}", e.what());
        return ReportRecreationLost(e);
    } catch (const EngineError& e) {
        spdlog::error("{}", e.what());
        return ReportEngineError(e);
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        PrintJson({{"status", "error"}, {"error", "Internal"}, {"message", e.what()}});
        return kExitRuntimeError;
    }
}
