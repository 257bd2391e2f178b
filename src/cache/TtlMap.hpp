#ifndef TTLMAP_HPP
#define TTLMAP_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>

#include "CacheOptions.hpp"
#include "ExpiryIndex.hpp"

// Single-threaded TTL store: a value map plus an ExpiryIndex kept in step.
//
// get() is a plain lookup and does not look at the clock. Callers that need
// expired entries to be invisible must check hasExpiredItems() and purge first
// (ConcurrentTtlCache does this).
//
// Overwrites remove the key's previous index record eagerly, so the index
// never holds more records than the map holds keys.
template <typename Key, typename Value, typename Clock = std::chrono::steady_clock>
class TtlMap {
public:
    using Duration = std::chrono::milliseconds;
    using TimePoint = typename Clock::time_point;

    struct Entry {
        Value value;
        TimePoint expiry;
    };

    TtlMap() = default;

    explicit TtlMap(std::size_t capacity) {
        options_.capacity = capacity;
        entries_.reserve(capacity);
    }

    explicit TtlMap(const CacheOptions& options) : options_(options) {
        if (options_.capacity) {
            entries_.reserve(*options_.capacity);
        }
    }

    const Value* get(const Key& key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return nullptr;
        }
        return &it->second.value;
    }

    const Entry* getWithExpiry(const Key& key) const {
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return nullptr;
        }
        return &it->second;
    }

    // Inserts or overwrites key. When a new key arrives while the map is at
    // capacity, the entry expiring soonest is evicted first.
    // Returns true if the key was already present.
    bool set(const Key& key, Value value, Duration ttl) {
        TimePoint expiry = expiryFromNow(ttl);

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            if (options_.overwrite_policy == OverwritePolicy::KeepLongest && it->second.expiry > expiry) {
                expiry = it->second.expiry;
            }
            it->second.value = std::move(value);
            it->second.expiry = expiry;
            // Re-files the key; the stale record goes with it.
            expiries_.insert(expiry, key);
            return true;
        }

        if (options_.capacity && entries_.size() >= *options_.capacity) {
            evict();
        }

        entries_.emplace(key, Entry{std::move(value), expiry});
        expiries_.insert(expiry, key);
        return false;
    }

    bool remove(const Key& key) {
        expiries_.remove(key);
        return entries_.erase(key) > 0;
    }

    bool hasExpiredItems() const {
        auto earliest = expiries_.peekMin();
        return earliest && *earliest <= Clock::now();
    }

    // Pops every index record that is due and drops the matching entries.
    // Returns the number of entries removed.
    std::size_t purgeExpired() {
        std::size_t removed = 0;
        while (hasExpiredItems()) {
            auto key = expiries_.popMin();
            if (key && entries_.erase(*key) > 0) {
                ++removed;
            }
        }
        return removed;
    }

    bool removeExpiredItems() {
        return purgeExpired() > 0;
    }

    // Removes the entry expiring soonest. With several keys on the same
    // instant only one of them goes.
    std::optional<Key> evict() {
        auto key = expiries_.popMin();
        if (!key) {
            return std::nullopt;
        }
        entries_.erase(*key);
        ++evictions_;
        return key;
    }

    void clear() {
        entries_.clear();
        expiries_.clear();
    }

    std::size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }
    std::optional<std::size_t> capacity() const { return options_.capacity; }
    const CacheOptions& options() const { return options_; }

    // Total evictions performed since construction.
    std::size_t evictionCount() const { return evictions_; }

    // Records in the expiry index. Equal to size() at all times.
    std::size_t pendingExpiries() const { return expiries_.size(); }

private:
    // now + ttl, rounded down to the configured granularity. A ttl reaching
    // past what the clock can represent saturates to TimePoint::max() (or
    // min() for negative ttl) instead of wrapping around.
    TimePoint expiryFromNow(Duration ttl) const {
        using ClockDuration = typename Clock::duration;
        TimePoint now = Clock::now();

        // Headroom in milliseconds, one tick short to absorb truncation.
        const Duration since_epoch_ms = std::chrono::duration_cast<Duration>(now.time_since_epoch());
        const Duration room_up = std::chrono::duration_cast<Duration>(ClockDuration::max()) - since_epoch_ms - Duration(1);
        const Duration room_down = std::chrono::duration_cast<Duration>(ClockDuration::min()) - since_epoch_ms + Duration(1);
        if (ttl >= room_up) {
            return TimePoint::max();
        }
        if (ttl <= room_down) {
            return TimePoint::min();
        }

        TimePoint expiry = now + std::chrono::duration_cast<ClockDuration>(ttl);
        auto granularity = std::chrono::duration_cast<ClockDuration>(options_.expiry_granularity);
        if (granularity <= ClockDuration::zero()) {
            return expiry;
        }
        ClockDuration since_epoch = expiry.time_since_epoch();
        ClockDuration remainder = since_epoch % granularity;
        if (remainder < ClockDuration::zero()) {
            remainder += granularity;
        }
        return TimePoint(since_epoch - remainder);
    }

    CacheOptions options_;
    std::unordered_map<Key, Entry> entries_;
    ExpiryIndex<Key, TimePoint> expiries_;
    std::size_t evictions_ = 0;
};

#endif // TTLMAP_HPP
