#ifndef CONCURRENTTTLCACHE_HPP
#define CONCURRENTTTLCACHE_HPP

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>

#include "CacheOptions.hpp"
#include "TtlMap.hpp"
#include "../config/AppConfig.hpp" // For MetricsDefinitions
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Thread-safe TTL cache: one TtlMap behind a reader/writer lock.
//
// Reads share the lock. As soon as anything in the map is due, a reader
// drops its shared lock, takes the exclusive one and purges before looking
// up. Several readers may do this at once; purging is idempotent so the
// redundant work is harmless.
//
// Values are returned by copy since the entry can be evicted the moment the
// lock is released. Store std::shared_ptr values if copies are expensive.
//
// logger and statsd_client are optional.
template <typename Key, typename Value, typename Clock = std::chrono::steady_clock>
class ConcurrentTtlCache {
public:
    using Map = TtlMap<Key, Value, Clock>;
    using Duration = typename Map::Duration;

    explicit ConcurrentTtlCache(std::shared_ptr<ILogger> logger = nullptr,
                                std::shared_ptr<IStatsDClient> statsd_client = nullptr)
        : map_(), logger_(std::move(logger)), statsd_client_(std::move(statsd_client)) {}

    explicit ConcurrentTtlCache(std::size_t capacity,
                                std::shared_ptr<ILogger> logger = nullptr,
                                std::shared_ptr<IStatsDClient> statsd_client = nullptr)
        : map_(capacity), logger_(std::move(logger)), statsd_client_(std::move(statsd_client)) {}

    explicit ConcurrentTtlCache(const CacheOptions& options,
                                std::shared_ptr<ILogger> logger = nullptr,
                                std::shared_ptr<IStatsDClient> statsd_client = nullptr)
        : map_(options), logger_(std::move(logger)), statsd_client_(std::move(statsd_client)) {}

    ConcurrentTtlCache(const ConcurrentTtlCache&) = delete;
    ConcurrentTtlCache& operator=(const ConcurrentTtlCache&) = delete;

    std::optional<Value> get(const Key& key) {
        std::optional<Value> result;
        std::size_t purged = 0;
        if (!lookupShared(key, result)) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            purged = map_.purgeExpired();
            result = copyOut(map_.get(key));
        }

        reportPurged(purged);
        increment(result ? MetricsDefinitions::CACHE_HIT : MetricsDefinitions::CACHE_MISS);
        return result;
    }

    // Returns true if the key was already present.
    bool set(const Key& key, Value value, Duration ttl) {
        bool was_present = false;
        bool evicted = false;
        std::optional<std::size_t> capacity;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            std::size_t evictions_before = map_.evictionCount();
            was_present = map_.set(key, std::move(value), ttl);
            evicted = map_.evictionCount() != evictions_before;
            capacity = map_.capacity();
        }

        if (evicted) {
            increment(MetricsDefinitions::CACHE_EVICTION);
            if (logger_ && logger_->isDebugEnabled()) {
                logger_->debug("Cache at capacity " + std::to_string(capacity.value_or(0)) + ", evicted the entry expiring soonest");
            }
        }
        return was_present;
    }

    bool remove(const Key& key) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.remove(key);
    }

    void clear() {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

    // Drops every entry that is already due. Returns true if any was removed.
    bool removeExpiredItems() {
        std::size_t purged = 0;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            purged = map_.purgeExpired();
        }
        reportPurged(purged);
        return purged > 0;
    }

    bool hasExpiredItems() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.hasExpiredItems();
    }

    // Resident entries, including ones that are due but not purged yet.
    std::size_t size() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

    bool empty() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.empty();
    }

    std::optional<std::size_t> capacity() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.capacity();
    }

private:
    // Metrics and logs are emitted by the callers after the lock is released.

    // Looks key up under the shared lock. Returns false, leaving result
    // untouched, when something is due and the caller has to purge first.
    bool lookupShared(const Key& key, std::optional<Value>& result) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        if (map_.hasExpiredItems()) {
            return false;
        }
        result = copyOut(map_.get(key));
        return true;
    }

    static std::optional<Value> copyOut(const Value* value) {
        if (!value) {
            return std::nullopt;
        }
        return *value;
    }

    void reportPurged(std::size_t removed) const {
        if (removed == 0) {
            return;
        }
        increment(MetricsDefinitions::CACHE_EXPIRED, static_cast<int>(removed));
        if (logger_ && logger_->isDebugEnabled()) {
            logger_->debug("Purged " + std::to_string(removed) + " expired cache entries");
        }
    }

    void increment(const std::string& metric, int value = 1) const {
        if (statsd_client_) {
            statsd_client_->increment(metric, value);
        }
    }

    mutable std::shared_mutex mutex_;
    Map map_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
};

#endif // CONCURRENTTTLCACHE_HPP
