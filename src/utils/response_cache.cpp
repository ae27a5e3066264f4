/**
 * @file response_cache.cpp
 * @brief In-process response cache
 *
 * @date 2025
 */

#include "dockhand/utils/response_cache.hpp"

#include <spdlog/spdlog.h>

#include <utility>

namespace dockhand {
namespace utils {

InMemoryResponseCache::InMemoryResponseCache(NowFunction now)
    : now_(std::move(now)) {
}

std::optional<nlohmann::json> InMemoryResponseCache::Get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    if (now_() >= it->second.expires_at) {
        spdlog::debug("Cache entry expired: {}", key);
        entries_.erase(it);
        return std::nullopt;
    }

    spdlog::debug("Cache hit: {}", key);
    return it->second.value;
}

void InMemoryResponseCache::Set(const std::string& key, const nlohmann::json& value,
                                std::chrono::seconds ttl) {
    if (ttl.count() <= 0) {
        return;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    entries_[key] = Entry{value, now_() + ttl};
}

void InMemoryResponseCache::Delete(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.erase(key) > 0) {
        spdlog::debug("Cache entry invalidated: {}", key);
    }
}

std::size_t InMemoryResponseCache::Size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

} // namespace utils
} // namespace dockhand
