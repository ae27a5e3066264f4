/**
 * @file stats_aggregator.hpp
 * @brief Live resource usage: CPU percent, memory totals, disk usage
 *
 * CPU percent is a rate and needs two cumulative samples:
 *
 * ```
 * cpu_delta    = cur.cpu_total_usage  - prev.cpu_total_usage
 * system_delta = cur.system_cpu_usage - prev.system_cpu_usage
 * cpu_percent  = system_delta > 0
 *              ? (cpu_delta / system_delta) * cur.online_cpu_count * 100.0
 *              : 0.0
 * ```
 *
 * Disk usage is reported per class (images, containers, volumes, build
 * cache) with the size a prune would reclaim.
 *
 * @date 2025
 */

#pragma once

#include "dockhand/runtime/runtime_client.hpp"

#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace dockhand {
namespace core {

/**
 * @struct ResourceUsage
 * @brief Disk usage of one resource class
 */
struct ResourceUsage {
    std::uint64_t total_size{0};        ///< Bytes used
    std::size_t count{0};               ///< Number of objects
    std::uint64_t reclaimable_size{0};  ///< Bytes a prune would free
};

/**
 * @struct SystemUsageSummary
 * @brief Disk usage of every resource class
 */
struct SystemUsageSummary {
    ResourceUsage images;
    ResourceUsage containers;
    ResourceUsage volumes;
    ResourceUsage build_cache;
};

/**
 * @struct ContainerStatusCounts
 * @brief Containers per lifecycle state
 */
struct ContainerStatusCounts {
    std::size_t running{0};
    std::size_t exited{0};
    std::size_t stopped{0};
    std::size_t created{0};
    std::size_t paused{0};
    std::size_t other{0};   ///< restarting, removing, dead, unknown
};

/**
 * @struct SystemInfo
 * @brief Host-wide overview
 */
struct SystemInfo {
    ContainerStatusCounts status;
    std::size_t containers_total{0};
    std::size_t images_count{0};
    std::size_t volumes_count{0};
    std::size_t networks_count{0};
    std::string docker_version{"Unknown"};
    std::string server_version{"Unknown"};
    double total_cpu_percent{0.0};        ///< Sum over running containers, 2 decimals
    std::uint64_t total_memory_bytes{0};  ///< Sum over running containers
    double total_memory_mb{0.0};          ///< MiB, 2 decimals
    SystemUsageSummary system_df;
};

/**
 * @struct ContainerLoad
 * @brief Instantaneous usage of one container
 */
struct ContainerLoad {
    std::string container_id;
    double cpu_percent{0.0};
    std::uint64_t memory_usage_bytes{0};
};

void to_json(nlohmann::json& j, const ResourceUsage& usage);
void to_json(nlohmann::json& j, const SystemUsageSummary& summary);
void to_json(nlohmann::json& j, const SystemInfo& info);
void to_json(nlohmann::json& j, const ContainerLoad& load);

/**
 * @class StatsAggregator
 * @brief Reads runtime counters and reduces them to usage figures
 *
 * Read-only: it never mutates the runtime. Per-container stats failures
 * count as zero; a failed disk usage read yields an all-zero summary.
 * Listing, counting and version failures propagate.
 */
class StatsAggregator {
public:
    explicit StatsAggregator(std::shared_ptr<runtime::RuntimeClient> runtime);

    /**
     * @brief CPU percent between two samples
     *
     * Returns exactly 0.0 when the system delta is not positive or the
     * container counter went backwards. An online CPU count of 0 is
     * treated as 1.
     */
    static double CalculateCpuPercent(const runtime::StatSample& previous,
                                      const runtime::StatSample& current);

    /// Per-class totals and reclaimable sizes of a disk usage report
    static SystemUsageSummary SummarizeDiskUsage(const runtime::DiskUsageReport& report);

    /// Disk usage summary; all zero when the runtime read fails
    SystemUsageSummary CollectDiskUsage() const;

    /**
     * @brief CPU percent and memory of one container
     * @throws EngineError CONTAINER_NOT_FOUND if the container is gone
     */
    ContainerLoad CollectContainerLoad(const std::string& container_id) const;

    /// Host-wide overview
    SystemInfo CollectSystemInfo() const;

private:
    std::shared_ptr<runtime::RuntimeClient> runtime_;
};

} // namespace core
} // namespace dockhand
