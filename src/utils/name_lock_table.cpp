/**
 * @file name_lock_table.cpp
 * @brief Implementation of the per-name lock table
 *
 * @date 2025
 */

#include "dockhand/utils/name_lock_table.hpp"

#include <utility>

namespace dockhand {
namespace utils {

NameLockTable::Guard::Guard(std::shared_ptr<std::mutex> mutex, bool contended)
    : mutex_(std::move(mutex))
    , lock_(*mutex_, std::defer_lock)
    , contended_(contended) {
    if (!lock_.try_lock()) {
        contended_ = true;
        lock_.lock();
    }
}

NameLockTable::Guard NameLockTable::Acquire(const std::string& name) {
    std::shared_ptr<std::mutex> mutex;
    {
        std::lock_guard<std::mutex> table_lock(table_mutex_);

        for (auto it = locks_.begin(); it != locks_.end();) {
            if (it->second.expired()) {
                it = locks_.erase(it);
            } else {
                ++it;
            }
        }

        auto& slot = locks_[name];
        mutex = slot.lock();
        if (!mutex) {
            mutex = std::make_shared<std::mutex>();
            slot = mutex;
        }
    }

    // Locking happens outside the table mutex so other names are not blocked
    return Guard(std::move(mutex), false);
}

std::size_t NameLockTable::ActiveNames() const {
    std::lock_guard<std::mutex> table_lock(table_mutex_);
    std::size_t active = 0;
    for (const auto& [name, weak] : locks_) {
        if (!weak.expired()) {
            ++active;
        }
    }
    return active;
}

} // namespace utils
} // namespace dockhand
