/**
 * @file response_cache.hpp
 * @brief Short-lived JSON response cache
 *
 * The management layer caches expensive read responses (system info) for a
 * few seconds and drops them whenever a mutating operation changes what
 * they report.
 *
 * @date 2025
 */

#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace dockhand {
namespace utils {

/**
 * @class ResponseCache
 * @brief Key-value cache of JSON values with per-entry TTL
 */
class ResponseCache {
public:
    virtual ~ResponseCache() = default;

    virtual std::optional<nlohmann::json> Get(const std::string& key) = 0;
    virtual void Set(const std::string& key, const nlohmann::json& value,
                     std::chrono::seconds ttl) = 0;
    virtual void Delete(const std::string& key) = 0;
};

/**
 * @class InMemoryResponseCache
 * @brief Thread-safe in-process ResponseCache
 *
 * Expired entries are dropped lazily on Get. A TTL of zero or less stores
 * nothing.
 */
class InMemoryResponseCache : public ResponseCache {
public:
    using Clock = std::chrono::steady_clock;
    using NowFunction = std::function<Clock::time_point()>;

    /// @param now Clock source (tests pass a fake one)
    explicit InMemoryResponseCache(NowFunction now = &Clock::now);

    std::optional<nlohmann::json> Get(const std::string& key) override;
    void Set(const std::string& key, const nlohmann::json& value,
             std::chrono::seconds ttl) override;
    void Delete(const std::string& key) override;

    std::size_t Size() const;

private:
    struct Entry {
        nlohmann::json value;
        Clock::time_point expires_at;
    };

    NowFunction now_;
    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

} // namespace utils
} // namespace dockhand
