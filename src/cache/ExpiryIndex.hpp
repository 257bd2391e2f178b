#ifndef EXPIRYINDEX_HPP
#define EXPIRYINDEX_HPP

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <unordered_map>
#include <utility>

// Ordered association instant -> keys expiring at that instant, earliest first.
//
// Keys sharing an instant are kept in a bucket. Buckets are usually tiny since
// the owner rounds instants to a coarse granularity, so removing a key by
// scanning its bucket stays cheap. A locator map remembers which bucket each
// key is filed under, so callers can remove a key without knowing its instant.
//
// A key is filed at most once; inserting it again re-files it.
template <typename Key, typename TimePoint>
class ExpiryIndex {
public:
    using Bucket = std::deque<Key>;

    void insert(TimePoint instant, const Key& key) {
        auto located_it = filed_under_.find(key);
        if (located_it != filed_under_.end()) {
            if (located_it->second == instant) {
                return;
            }
            eraseFromBucket(located_it->second, key);
            located_it->second = instant;
        } else {
            filed_under_.emplace(key, instant);
        }
        buckets_[instant].push_back(key);
    }

    // Returns false if the key was not filed.
    bool remove(const Key& key) {
        auto located_it = filed_under_.find(key);
        if (located_it == filed_under_.end()) {
            return false;
        }
        eraseFromBucket(located_it->second, key);
        filed_under_.erase(located_it);
        return true;
    }

    std::optional<TimePoint> peekMin() const {
        if (buckets_.empty()) {
            return std::nullopt;
        }
        return buckets_.begin()->first;
    }

    // Removes one key from the earliest bucket, oldest insertion first.
    // The bucket itself goes away only with its last member.
    std::optional<Key> popMin() {
        if (buckets_.empty()) {
            return std::nullopt;
        }
        auto bucket_it = buckets_.begin();
        Key key = std::move(bucket_it->second.front());
        bucket_it->second.pop_front();
        if (bucket_it->second.empty()) {
            buckets_.erase(bucket_it);
        }
        filed_under_.erase(key);
        return key;
    }

    bool contains(const Key& key) const {
        return filed_under_.find(key) != filed_under_.end();
    }

    std::size_t size() const { return filed_under_.size(); }
    bool empty() const { return filed_under_.empty(); }

    // Number of distinct instants currently filed.
    std::size_t bucketCount() const { return buckets_.size(); }

    void clear() {
        buckets_.clear();
        filed_under_.clear();
    }

private:
    void eraseFromBucket(TimePoint instant, const Key& key) {
        auto bucket_it = buckets_.find(instant);
        if (bucket_it == buckets_.end()) {
            return;
        }
        Bucket& bucket = bucket_it->second;
        for (auto it = bucket.begin(); it != bucket.end(); ++it) {
            if (*it == key) {
                bucket.erase(it);
                break;
            }
        }
        if (bucket.empty()) {
            buckets_.erase(bucket_it);
        }
    }

    std::map<TimePoint, Bucket> buckets_;
    std::unordered_map<Key, TimePoint> filed_under_;
};

#endif // EXPIRYINDEX_HPP
