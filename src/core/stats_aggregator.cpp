/**
 * @file stats_aggregator.cpp
 * @brief Implementation of the resource usage aggregator
 *
 * @date 2025
 */

#include "dockhand/core/stats_aggregator.hpp"
#include "dockhand/core/errors.hpp"
#include "dockhand/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

#include <cmath>
#include <utility>

namespace dockhand {
namespace core {

using json = nlohmann::json;

namespace {

double RoundTo2(double value) {
    return std::round(value * 100.0) / 100.0;
}

// Unknown sizes are reported as -1
std::uint64_t KnownSize(std::int64_t size) {
    return size > 0 ? static_cast<std::uint64_t>(size) : 0;
}

} // anonymous namespace

// ============================================================================
// JSON
// ============================================================================

void to_json(json& j, const ResourceUsage& usage) {
    // "reclaimable" is the key dashboards already read
    j = json{
        {"total_size", usage.total_size},
        {"count", usage.count},
        {"reclaimable", usage.reclaimable_size}
    };
}

void to_json(json& j, const SystemUsageSummary& summary) {
    j = json{
        {"images", summary.images},
        {"containers", summary.containers},
        {"volumes", summary.volumes},
        {"build_cache", summary.build_cache}
    };
}

void to_json(json& j, const SystemInfo& info) {
    j = json{
        {"containers_running", info.status.running},
        {"containers_stopped", info.status.stopped},
        {"containers_exited", info.status.exited},
        {"containers_created", info.status.created},
        {"containers_paused", info.status.paused},
        {"containers_other", info.status.other},
        {"containers_total", info.containers_total},
        {"images_count", info.images_count},
        {"volumes_count", info.volumes_count},
        {"networks_count", info.networks_count},
        {"docker_version", info.docker_version},
        {"server_version", info.server_version},
        {"total_cpu_percent", info.total_cpu_percent},
        {"total_memory_bytes", info.total_memory_bytes},
        {"total_memory_mb", info.total_memory_mb},
        {"system_df", info.system_df}
    };
}

void to_json(json& j, const ContainerLoad& load) {
    j = json{
        {"container_id", load.container_id},
        {"cpu_percent", load.cpu_percent},
        {"memory_usage_bytes", load.memory_usage_bytes}
    };
}

// ============================================================================
// StatsAggregator
// ============================================================================

StatsAggregator::StatsAggregator(std::shared_ptr<runtime::RuntimeClient> runtime)
    : runtime_(std::move(runtime)) {
}

double StatsAggregator::CalculateCpuPercent(const runtime::StatSample& previous,
                                            const runtime::StatSample& current) {
    if (current.system_cpu_usage <= previous.system_cpu_usage) {
        return 0.0;
    }
    if (current.cpu_total_usage < previous.cpu_total_usage) {
        return 0.0;
    }

    const double cpu_delta = static_cast<double>(current.cpu_total_usage - previous.cpu_total_usage);
    const double system_delta = static_cast<double>(current.system_cpu_usage - previous.system_cpu_usage);
    const double cpus = current.online_cpu_count > 0 ? current.online_cpu_count : 1;

    return (cpu_delta / system_delta) * cpus * 100.0;
}

SystemUsageSummary StatsAggregator::SummarizeDiskUsage(const runtime::DiskUsageReport& report) {
    SystemUsageSummary summary;

    summary.images.count = report.images.size();
    for (const auto& image : report.images) {
        const auto size = KnownSize(image.size);
        summary.images.total_size += size;
        if (image.containers == 0) {
            summary.images.reclaimable_size += size;
        }
    }

    summary.containers.count = report.containers.size();
    for (const auto& container : report.containers) {
        const auto size = KnownSize(container.size_rw);
        summary.containers.total_size += size;
        if (container.state != "running") {
            summary.containers.reclaimable_size += size;
        }
    }

    summary.volumes.count = report.volumes.size();
    for (const auto& volume : report.volumes) {
        const auto size = KnownSize(volume.size);
        summary.volumes.total_size += size;
        if (volume.ref_count == 0) {
            summary.volumes.reclaimable_size += size;
        }
    }

    summary.build_cache.count = report.build_cache.size();
    for (const auto& entry : report.build_cache) {
        const auto size = KnownSize(entry.size);
        summary.build_cache.total_size += size;
        summary.build_cache.reclaimable_size += size;
    }

    return summary;
}

SystemUsageSummary StatsAggregator::CollectDiskUsage() const {
    try {
        auto summary = SummarizeDiskUsage(runtime_->GetDiskUsage());
        spdlog::debug("Disk usage: images {}, containers {}, volumes {}, build cache {}",
                      utils::StringUtils::FormatSize(summary.images.total_size),
                      utils::StringUtils::FormatSize(summary.containers.total_size),
                      utils::StringUtils::FormatSize(summary.volumes.total_size),
                      utils::StringUtils::FormatSize(summary.build_cache.total_size));
        return summary;
    }
    catch (const EngineError& e) {
        spdlog::warn("Disk usage unavailable, reporting zeros: {}", e.what());
        return SystemUsageSummary();
    }
}

ContainerLoad StatsAggregator::CollectContainerLoad(const std::string& container_id) const {
    auto stats = runtime_->GetStats(container_id);
    if (!stats) {
        throw EngineError(ErrorKind::CONTAINER_NOT_FOUND, "Container " + container_id + " not found");
    }

    ContainerLoad load;
    load.container_id = container_id;
    load.cpu_percent = RoundTo2(CalculateCpuPercent(stats->previous, stats->current));
    load.memory_usage_bytes = stats->current.memory_usage_bytes;
    return load;
}

SystemInfo StatsAggregator::CollectSystemInfo() const {
    SystemInfo info;

    const auto containers = runtime_->ListContainers(true);
    info.containers_total = containers.size();

    double total_cpu = 0.0;
    for (const auto& container : containers) {
        const auto status = utils::StringUtils::ToLower(container.state);

        if (status == "running") {
            ++info.status.running;
        } else if (status == "exited") {
            ++info.status.exited;
        } else if (status == "stopped") {
            ++info.status.stopped;
        } else if (status == "created") {
            ++info.status.created;
        } else if (status == "paused") {
            ++info.status.paused;
        } else {
            ++info.status.other;
        }

        if (status != "running") {
            continue;
        }

        try {
            auto stats = runtime_->GetStats(container.id);
            if (!stats) {
                spdlog::debug("Container {} disappeared before stats were read", container.name);
                continue;
            }
            total_cpu += CalculateCpuPercent(stats->previous, stats->current);
            info.total_memory_bytes += stats->current.memory_usage_bytes;
        }
        catch (const EngineError& e) {
            spdlog::warn("Stats for {} unavailable: {}", container.name, e.what());
        }
    }

    const auto counts = runtime_->CountResources();
    info.images_count = counts.images;
    info.volumes_count = counts.volumes;
    info.networks_count = counts.networks;

    const auto version = runtime_->GetVersion();
    info.docker_version = version.version;
    info.server_version = version.server_version;

    info.total_cpu_percent = RoundTo2(total_cpu);
    info.total_memory_mb = RoundTo2(static_cast<double>(info.total_memory_bytes) / (1024.0 * 1024.0));
    info.system_df = CollectDiskUsage();

    spdlog::info("System info: {} containers ({} running), cpu {:.2f}%, memory {}",
                 info.containers_total, info.status.running, info.total_cpu_percent,
                 utils::StringUtils::FormatSize(info.total_memory_bytes));
    return info;
}

} // namespace core
} // namespace dockhand
