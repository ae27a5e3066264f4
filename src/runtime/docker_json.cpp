/**
 * @file docker_json.cpp
 * @brief Implementation of the Docker JSON parsers
 *
 * **Inspect fields used**:
 * ```
 * Id, Name, State.Status
 * Config.Image, Config.Env, Config.Labels
 * HostConfig.Binds, HostConfig.NetworkMode, HostConfig.PortBindings,
 * HostConfig.RestartPolicy.{Name,MaximumRetryCount}
 * Mounts[].{Type,Name,Source,Destination,RW}
 * NetworkSettings.Networks (keys)
 * ```
 *
 * **Stats fields used**:
 * ```
 * cpu_stats / precpu_stats:
 *   cpu_usage.total_usage, cpu_usage.percpu_usage, system_cpu_usage, online_cpus
 * memory_stats.usage
 * ```
 *
 * @date 2025
 */

#include "dockhand/runtime/docker_json.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/utils/port_bindings.hpp"

using json = nlohmann::json;

namespace dockhand {
namespace runtime {
namespace docker_json {

using core::EngineError;
using core::ErrorKind;

namespace {

const json& Child(const json& j, const char* key) {
    static const json null_value;
    if (j.is_object()) {
        auto it = j.find(key);
        if (it != j.end()) {
            return *it;
        }
    }
    return null_value;
}

std::string StringField(const json& j, const char* key) {
    const auto& value = Child(j, key);
    return value.is_string() ? value.get<std::string>() : std::string();
}

template <typename T>
T NumberField(const json& j, const char* key, T fallback = 0) {
    const auto& value = Child(j, key);
    return value.is_number() ? value.get<T>() : fallback;
}

std::vector<std::string> StringList(const json& j, const char* key) {
    std::vector<std::string> result;
    const auto& value = Child(j, key);
    if (value.is_array()) {
        for (const auto& item : value) {
            if (item.is_string()) {
                result.push_back(item.get<std::string>());
            }
        }
    }
    return result;
}

StatSample ParseSample(const json& cpu_stats, const json& memory_stats) {
    StatSample sample;
    const auto& cpu_usage = Child(cpu_stats, "cpu_usage");

    sample.cpu_total_usage = NumberField<std::uint64_t>(cpu_usage, "total_usage");
    sample.system_cpu_usage = NumberField<std::uint64_t>(cpu_stats, "system_cpu_usage");
    sample.online_cpu_count = NumberField<std::uint32_t>(cpu_stats, "online_cpus");

    // Older daemons (and cgroup v1 hosts) only report per-CPU counters
    if (sample.online_cpu_count == 0) {
        const auto& percpu = Child(cpu_usage, "percpu_usage");
        if (percpu.is_array() && !percpu.empty()) {
            sample.online_cpu_count = static_cast<std::uint32_t>(percpu.size());
        }
    }
    if (sample.online_cpu_count == 0) {
        sample.online_cpu_count = 1;
    }

    sample.memory_usage_bytes = NumberField<std::uint64_t>(memory_stats, "usage");
    return sample;
}

core::PortBinding BindingFromJson(const std::string& container_port, const json& value) {
    core::PortBinding binding;
    if (value.is_object()) {
        binding.host_ip = StringField(value, "HostIp");
        binding.host_port = StringField(value, "HostPort");
    } else if (value.is_number_integer()) {
        binding.host_port = std::to_string(value.get<long long>());
    } else if (value.is_string()) {
        // "8080" or "127.0.0.1:8080"
        auto parsed = utils::PortBindings::ParsePublish(value.get<std::string>() + ":" +
                                                        container_port);
        binding = parsed.second;
    } else {
        throw EngineError(ErrorKind::INVALID_SPEC,
                          "Unsupported binding for port " + container_port + ": " + value.dump());
    }
    return binding;
}

} // anonymous namespace

ContainerRecord ParseInspectOutput(const std::string& json_str) {
    json j = json::parse(json_str);

    // Docker inspect returns array with single object
    if (j.is_array()) {
        if (j.empty()) {
            throw EngineError(ErrorKind::CONTAINER_NOT_FOUND, "Empty inspect output");
        }
        j = j[0];
    }

    const auto& config = Child(j, "Config");
    const auto& host_config = Child(j, "HostConfig");

    ContainerRecord record;
    record.id = StringField(j, "Id");
    record.name = StringField(j, "Name");
    record.state = StringField(Child(j, "State"), "Status");
    record.image = StringField(config, "Image");
    record.environment = StringList(config, "Env");
    record.binds = StringList(host_config, "Binds");
    record.network_mode = StringField(host_config, "NetworkMode");

    const auto& labels = Child(config, "Labels");
    if (labels.is_object()) {
        for (auto it = labels.begin(); it != labels.end(); ++it) {
            if (it.value().is_string()) {
                record.labels[it.key()] = it.value().get<std::string>();
            }
        }
    }

    const auto& restart = Child(host_config, "RestartPolicy");
    std::string policy = StringField(restart, "Name");
    int retries = NumberField<int>(restart, "MaximumRetryCount");
    if (policy == "on-failure" && retries > 0) {
        policy += ":" + std::to_string(retries);
    }
    record.restart_policy = policy;

    const auto& mounts = Child(j, "Mounts");
    if (mounts.is_array()) {
        for (const auto& m : mounts) {
            MountRecord mount;
            mount.type = StringField(m, "Type");
            mount.name = StringField(m, "Name");
            mount.source = StringField(m, "Source");
            mount.destination = StringField(m, "Destination");
            const auto& rw = Child(m, "RW");
            mount.read_write = rw.is_boolean() ? rw.get<bool>() : true;
            record.mounts.push_back(mount);
        }
    }

    const auto& networks = Child(Child(j, "NetworkSettings"), "Networks");
    if (networks.is_object()) {
        for (auto it = networks.begin(); it != networks.end(); ++it) {
            record.networks.push_back(it.key());
        }
    }

    record.port_bindings = PortMapFromJson(Child(host_config, "PortBindings"));
    return record;
}

ContainerSummary ParseListLine(const std::string& line) {
    json j = json::parse(line);

    ContainerSummary summary;
    summary.id = StringField(j, "ID");
    summary.name = StringField(j, "Names");
    summary.state = StringField(j, "State");
    return summary;
}

StatPair ParseStatsOutput(const std::string& json_str) {
    json j = json::parse(json_str);

    const auto& memory_stats = Child(j, "memory_stats");

    StatPair pair;
    pair.current = ParseSample(Child(j, "cpu_stats"), memory_stats);
    pair.previous = ParseSample(Child(j, "precpu_stats"), memory_stats);
    return pair;
}

DiskUsageReport ParseDiskUsage(const std::string& json_str) {
    json j = json::parse(json_str);
    DiskUsageReport report;

    const auto& images = Child(j, "Images");
    if (images.is_array()) {
        for (const auto& img : images) {
            ImageUsage usage;
            usage.size = NumberField<std::int64_t>(img, "Size");
            usage.containers = NumberField<std::int64_t>(img, "Containers");
            report.images.push_back(usage);
        }
    }

    const auto& containers = Child(j, "Containers");
    if (containers.is_array()) {
        for (const auto& c : containers) {
            ContainerUsage usage;
            usage.size_rw = NumberField<std::int64_t>(c, "SizeRw");
            usage.state = StringField(c, "State");
            report.containers.push_back(usage);
        }
    }

    const auto& volumes = Child(j, "Volumes");
    if (volumes.is_array()) {
        for (const auto& v : volumes) {
            const auto& usage_data = Child(v, "UsageData");
            VolumeUsage usage;
            usage.size = NumberField<std::int64_t>(usage_data, "Size");
            usage.ref_count = NumberField<std::int64_t>(usage_data, "RefCount");
            report.volumes.push_back(usage);
        }
    }

    const auto& build_cache = Child(j, "BuildCache");
    if (build_cache.is_array()) {
        for (const auto& b : build_cache) {
            BuildCacheUsage usage;
            usage.size = NumberField<std::int64_t>(b, "Size");
            report.build_cache.push_back(usage);
        }
    }

    return report;
}

core::PortMap PortMapFromJson(const json& j) {
    core::PortMap ports;
    if (j.is_null()) {
        return ports;
    }
    if (!j.is_object()) {
        throw EngineError(ErrorKind::INVALID_SPEC, "Port bindings must be an object");
    }

    for (auto it = j.begin(); it != j.end(); ++it) {
        std::string container_port = utils::PortBindings::NormalizeContainerPort(it.key());
        auto& bindings = ports[container_port];

        const auto& value = it.value();
        if (value.is_null()) {
            continue;
        }
        if (value.is_array()) {
            for (const auto& item : value) {
                bindings.push_back(BindingFromJson(container_port, item));
            }
        } else {
            bindings.push_back(BindingFromJson(container_port, value));
        }
    }

    return ports;
}

} // namespace docker_json
} // namespace runtime
} // namespace dockhand
