/**
 * @file name_lock_table.hpp
 * @brief Per-name mutual exclusion for container updates
 *
 * Two recreations of the same container race through stop/remove and one of
 * them ends with ContainerNotFound. Holding a per-name lock for the whole
 * swap serializes them instead.
 *
 * @date 2025
 */

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace dockhand {
namespace utils {

/**
 * @class NameLockTable
 * @brief Lazily created mutex per name
 *
 * Entries disappear once no guard references them.
 */
class NameLockTable {
public:
    /**
     * @class Guard
     * @brief Holds the lock of one name until destroyed
     */
    class Guard {
    public:
        Guard(std::shared_ptr<std::mutex> mutex, bool contended);
        Guard(Guard&&) = default;
        Guard& operator=(Guard&&) = delete;

        /// True if another holder had to be waited for
        bool Contended() const { return contended_; }

    private:
        std::shared_ptr<std::mutex> mutex_;  ///< Keeps the mutex alive
        std::unique_lock<std::mutex> lock_;  ///< Released before mutex_
        bool contended_;
    };

    /// Block until the lock for `name` is held
    Guard Acquire(const std::string& name);

    /// Names currently locked or waited on
    std::size_t ActiveNames() const;

private:
    mutable std::mutex table_mutex_;
    std::map<std::string, std::weak_ptr<std::mutex>> locks_;
};

} // namespace utils
} // namespace dockhand
