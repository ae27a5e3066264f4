/**
 * @file docker_runtime.cpp
 * @brief Implementation of the Docker runtime client
 *
 * **Call Mapping**:
 * ```
 * InspectContainer  docker container inspect <ref>
 * StopContainer     docker stop --time <s> <id>
 * StartContainer    docker start <id>
 * RemoveContainer   docker rm <id>
 * CreateContainer   docker create --name ... <image>
 * ConnectNetwork    docker network connect <network> <id>
 * ListContainers    docker ps [--all] --no-trunc --format '{{json .}}'
 * CountResources    docker image ls -q / volume ls -q / network ls -q
 * GetStats          GET /containers/<id>/stats?stream=false
 * GetDiskUsage      GET /system/df
 * GetVersion        GET /version, GET /info
 * ```
 *
 * **Process Isolation**: every CLI call runs `/bin/sh -c` in a new session
 * with stdin on /dev/null. A Ctrl-C or SIGTERM aimed at dockhand's process
 * group only raises the cancellation flag; it never reaches an in-flight
 * `docker rm` or `docker create`, so a swap that has started removing runs
 * to completion or to an explicit failure.
 *
 * **Failure Classification** (CLI output):
 * - "No such container" / "No such object" -> CONTAINER_NOT_FOUND
 * - "Cannot connect to the Docker daemon"  -> RUNTIME_UNAVAILABLE
 * - anything else                          -> RUNTIME_ERROR
 *
 * @date 2025
 */

#include "dockhand/runtime/docker_runtime.hpp"
#include "dockhand/runtime/docker_json.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/utils/mount_translator.hpp"
#include "dockhand/utils/port_bindings.hpp"
#include "dockhand/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <array>
#include <cerrno>
#include <cstring>
#include <set>
#include <sstream>
#include <utility>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

using json = nlohmann::json;

namespace dockhand {
namespace runtime {

using core::EngineError;
using core::ErrorKind;
using utils::StringUtils;

namespace {

bool IsNotFound(const std::string& output) {
    return StringUtils::Contains(output, "No such container") ||
           StringUtils::Contains(output, "No such object");
}

bool IsDaemonUnreachable(const std::string& output) {
    return StringUtils::Contains(output, "Cannot connect to the Docker daemon") ||
           StringUtils::Contains(output, "error during connect") ||
           StringUtils::Contains(output, "command not found");
}

} // anonymous namespace

// ============================================================================
// CONSTRUCTOR / DESTRUCTOR
// ============================================================================

DockerRuntime::DockerRuntime(std::string docker_host, std::string docker_binary)
    : docker_host_(std::move(docker_host))
    , docker_binary_(std::move(docker_binary))
    , engine_api_(docker_host_) {
    spdlog::debug("Docker runtime client initialized (host: {}, binary: {})",
                  engine_api_.Host(), docker_binary_);
}

DockerRuntime::~DockerRuntime() {
    spdlog::debug("Docker runtime client destroyed");
}

// ============================================================================
// COMMAND EXECUTION
// ============================================================================
// stderr folded into stdout, child detached from the terminal's process group

CommandResult DockerRuntime::RunCommand(const std::string& command) {
    CommandResult result;

    // Close-on-exec so children spawned by other threads do not hold the write end
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        result.exit_code = -1;
        result.output = std::string("Failed to create pipe: ") + std::strerror(errno);
        return result;
    }

    const char* shell_command = command.c_str();
    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(fds[0]);
        ::close(fds[1]);
        result.exit_code = -1;
        result.output = std::string("Failed to execute command: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only
        ::setsid();
        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            ::close(null_fd);
        }
        ::dup2(fds[1], STDOUT_FILENO);
        ::dup2(fds[1], STDERR_FILENO);
        ::close(fds[0]);
        ::close(fds[1]);
        ::execl("/bin/sh", "sh", "-c", shell_command, static_cast<char*>(nullptr));
        ::_exit(127);
    }

    ::close(fds[1]);

    std::array<char, 256> buffer;
    while (true) {
        ssize_t n = ::read(fds[0], buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        result.output.append(buffer.data(), static_cast<std::size_t>(n));
    }
    ::close(fds[0]);

    int status = 0;
    pid_t waited;
    do {
        waited = ::waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (waited < 0) {
        result.exit_code = -1;
    } else if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else {
        result.exit_code = 128 + (WIFSIGNALED(status) ? WTERMSIG(status) : 0);
    }
    result.success = (result.exit_code == 0);
    return result;
}

bool DockerRuntime::Ping() const {
    try {
        return engine_api_.Get("/_ping").Ok();
    }
    catch (const EngineError& e) {
        spdlog::warn("Docker ping failed: {}", e.what());
        return false;
    }
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::optional<ContainerRecord> DockerRuntime::InspectContainer(const std::string& ref) {
    auto result = ExecuteDockerCommand({"container", "inspect", ref});

    if (!result.success) {
        if (IsNotFound(result.output)) {
            spdlog::debug("Container {} not found", ref);
            return std::nullopt;
        }
        ThrowCommandFailure("inspect container " + ref, result);
    }

    try {
        return docker_json::ParseInspectOutput(result.output);
    }
    catch (const json::exception& e) {
        throw EngineError(ErrorKind::RUNTIME_ERROR,
                          "Failed to parse inspect output for " + ref + ": " + e.what());
    }
}

void DockerRuntime::StopContainer(const std::string& id, std::chrono::seconds timeout) {
    spdlog::info("Stopping container: {} (timeout: {}s)", id, timeout.count());

    auto result = ExecuteDockerCommand({"stop", "--time", std::to_string(timeout.count()), id});
    if (!result.success) {
        ThrowCommandFailure("stop container " + id, result);
    }
}

void DockerRuntime::StartContainer(const std::string& id) {
    spdlog::info("Starting container: {}", id);

    auto result = ExecuteDockerCommand({"start", id});
    if (!result.success) {
        ThrowCommandFailure("start container " + id, result);
    }
}

void DockerRuntime::RemoveContainer(const std::string& id) {
    spdlog::info("Removing container: {}", id);

    auto result = ExecuteDockerCommand({"rm", id});
    if (!result.success) {
        ThrowCommandFailure("remove container " + id, result);
    }
}

std::string DockerRuntime::CreateContainer(const std::string& name,
                                           const core::ContainerSpec& spec) {
    spdlog::info("Creating container: {} (image: {})", name, spec.image);

    auto result = ExecuteDockerCommand(BuildCreateCommand(name, spec));
    if (!result.success) {
        ThrowCommandFailure("create container " + name, result);
    }

    // Pull progress may precede the id; the id is the last line
    auto lines = StringUtils::SplitLines(result.output);
    if (lines.empty()) {
        throw EngineError(ErrorKind::RUNTIME_ERROR,
                          "docker create printed no container id for " + name);
    }
    std::string container_id = StringUtils::Trim(lines.back());

    spdlog::info("Container created: {}", container_id);
    return container_id;
}

void DockerRuntime::ConnectNetwork(const std::string& container_id,
                                   const std::string& network) {
    spdlog::info("Connecting container {} to network {}", container_id, network);

    auto result = ExecuteDockerCommand({"network", "connect", network, container_id});
    if (!result.success) {
        ThrowCommandFailure("connect " + container_id + " to network " + network, result);
    }
}

// ============================================================================
// LISTING AND COUNTING
// ============================================================================

std::vector<ContainerSummary> DockerRuntime::ListContainers(bool all) {
    std::vector<std::string> args = {"ps", "--no-trunc", "--format", "{{json .}}"};
    if (all) {
        args.push_back("--all");
    }

    auto result = ExecuteDockerCommand(args);
    if (!result.success) {
        ThrowCommandFailure("list containers", result);
    }

    std::vector<ContainerSummary> containers;
    for (const auto& line : StringUtils::SplitLines(result.output)) {
        try {
            containers.push_back(docker_json::ParseListLine(line));
        }
        catch (const json::exception& e) {
            spdlog::warn("Failed to parse container info: {}", e.what());
        }
    }

    return containers;
}

ResourceCounts DockerRuntime::CountResources() {
    ResourceCounts counts;
    counts.images = CountUniqueLines({"image", "ls", "--quiet", "--no-trunc"});
    counts.volumes = CountUniqueLines({"volume", "ls", "--quiet"});
    counts.networks = CountUniqueLines({"network", "ls", "--quiet", "--no-trunc"});
    return counts;
}

std::size_t DockerRuntime::CountUniqueLines(const std::vector<std::string>& args) const {
    auto result = ExecuteDockerCommand(args);
    if (!result.success) {
        ThrowCommandFailure(StringUtils::Join(args, " "), result);
    }

    // An image tagged twice is listed twice
    auto lines = StringUtils::SplitLines(result.output);
    return std::set<std::string>(lines.begin(), lines.end()).size();
}

// ============================================================================
// ENGINE API READS
// ============================================================================

std::optional<StatPair> DockerRuntime::GetStats(const std::string& id) {
    auto response = engine_api_.Get("/containers/" + id + "/stats?stream=false");

    if (response.status == 404) {
        return std::nullopt;
    }
    if (!response.Ok()) {
        throw EngineError(ErrorKind::RUNTIME_ERROR,
                          "Stats for " + id + " failed with HTTP " +
                          std::to_string(response.status));
    }

    try {
        return docker_json::ParseStatsOutput(response.body);
    }
    catch (const json::exception& e) {
        throw EngineError(ErrorKind::RUNTIME_ERROR,
                          "Failed to parse stats for " + id + ": " + e.what());
    }
}

DiskUsageReport DockerRuntime::GetDiskUsage() {
    auto response = engine_api_.Get("/system/df");
    if (!response.Ok()) {
        throw EngineError(ErrorKind::RUNTIME_ERROR,
                          "System df failed with HTTP " + std::to_string(response.status));
    }

    try {
        return docker_json::ParseDiskUsage(response.body);
    }
    catch (const json::exception& e) {
        throw EngineError(ErrorKind::RUNTIME_ERROR,
                          std::string("Failed to parse system df: ") + e.what());
    }
}

RuntimeVersion DockerRuntime::GetVersion() {
    RuntimeVersion version;

    auto parse_field = [](const HttpResponse& response, const char* field) -> std::string {
        if (!response.Ok()) {
            return "Unknown";
        }
        try {
            auto j = json::parse(response.body);
            return j.value(field, std::string("Unknown"));
        }
        catch (const json::exception& e) {
            spdlog::warn("Failed to parse {}: {}", field, e.what());
            return "Unknown";
        }
    };

    version.version = parse_field(engine_api_.Get("/version"), "Version");
    version.server_version = parse_field(engine_api_.Get("/info"), "ServerVersion");
    return version;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

CommandResult DockerRuntime::ExecuteDockerCommand(const std::vector<std::string>& args) const {
    std::ostringstream cmd;
    cmd << StringUtils::ShellQuote(docker_binary_);

    if (!docker_host_.empty()) {
        cmd << " --host " << StringUtils::ShellQuote(docker_host_);
    }

    for (const auto& arg : args) {
        cmd << " " << StringUtils::ShellQuote(arg);
    }

    spdlog::debug("Executing: {}", cmd.str());
    return RunCommand(cmd.str());
}

void DockerRuntime::ThrowCommandFailure(const std::string& action,
                                        const CommandResult& result) const {
    std::string output = StringUtils::Trim(result.output);
    spdlog::error("Failed to {}: {}", action, output);

    if (IsNotFound(output)) {
        throw EngineError(ErrorKind::CONTAINER_NOT_FOUND, output);
    }
    if (IsDaemonUnreachable(output) || result.exit_code == -1 || result.exit_code == 127) {
        throw EngineError(ErrorKind::RUNTIME_UNAVAILABLE, output);
    }
    throw EngineError(ErrorKind::RUNTIME_ERROR, "Failed to " + action + ": " + output);
}

std::vector<std::string> DockerRuntime::BuildCreateCommand(const std::string& name,
                                                           const core::ContainerSpec& spec) {
    std::vector<std::string> args;

    args.push_back("create");

    if (!name.empty()) {
        args.push_back("--name");
        args.push_back(name);
    }

    // Primary network only; the rest are connected after creation
    if (!spec.networks.empty()) {
        args.push_back("--network");
        args.push_back(spec.networks.front());
    }

    for (const auto& env : spec.environment) {
        args.push_back("--env");
        args.push_back(env);
    }

    for (const auto& mount : spec.mounts) {
        args.push_back("--volume");
        args.push_back(utils::MountTranslator::Encode(mount));
    }

    for (const auto& [container_port, bindings] : spec.ports) {
        if (bindings.empty()) {
            args.push_back("--expose");
            args.push_back(container_port);
            continue;
        }
        for (const auto& binding : bindings) {
            args.push_back("--publish");
            args.push_back(utils::PortBindings::FormatPublish(container_port, binding));
        }
    }

    for (const auto& [key, value] : spec.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }

    if (!spec.restart_policy.empty() && spec.restart_policy != "no") {
        args.push_back("--restart");
        args.push_back(spec.restart_policy);
    }

    // Image (must be last)
    args.push_back(spec.image);

    return args;
}

} // namespace runtime
} // namespace dockhand
