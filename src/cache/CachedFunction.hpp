#ifndef CACHEDFUNCTION_HPP
#define CACHEDFUNCTION_HPP

#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <stdexcept>
#include <utility>

#include "ConcurrentTtlCache.hpp"
#include "../config/AppConfig.hpp" // For MetricsDefinitions
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// What a producer hands back on success: the value and how long to keep it.
// The TTL counts from the moment the value is stored, not when it was made.
template <typename Value>
struct ProducedValue {
    Value value{};
    std::chrono::milliseconds ttl{0};
};

// Memoizes an asynchronous producer through a ConcurrentTtlCache.
//
// The producer follows the completion-handler convention of Boost.Asio:
// producer(key, handler) starts the work and eventually calls
// handler(error_code, ProducedValue). The handler may run on any thread.
//
// A call first looks the key up in the cache and completes immediately on a
// hit. On a miss the producer runs with no cache lock held. A successful
// result is stored and passed on; an error is passed on untouched and
// nothing is stored, so the next call for that key asks the producer again.
//
// Concurrent misses on the same key are not coalesced: every caller runs the
// producer and the last one to finish wins the cache slot.
template <typename Key, typename Value, typename Clock = std::chrono::steady_clock>
class CachedFunction {
public:
    using Cache = ConcurrentTtlCache<Key, Value, Clock>;
    using ProducerHandler = std::function<void(boost::system::error_code, ProducedValue<Value>)>;
    using Producer = std::function<void(const Key&, ProducerHandler)>;
    using ResultHandler = std::function<void(boost::system::error_code, Value)>;

    CachedFunction(std::shared_ptr<Cache> cache,
                   Producer producer,
                   std::shared_ptr<ILogger> logger = nullptr,
                   std::shared_ptr<IStatsDClient> statsd_client = nullptr)
        : cache_(std::move(cache)),
          producer_(std::move(producer)),
          logger_(std::move(logger)),
          statsd_client_(std::move(statsd_client)) {
        if (!cache_) {
            throw std::invalid_argument("Cache pointer cannot be null");
        }
        if (!producer_) {
            throw std::invalid_argument("Producer cannot be empty");
        }
    }

    void operator()(const Key& key, ResultHandler handler) const {
        if (auto cached = cache_->get(key)) {
            handler(boost::system::error_code{}, std::move(*cached));
            return;
        }

        // Copies keep the cache and collaborators alive until the producer
        // completes, even if this CachedFunction is gone by then.
        auto cache = cache_;
        auto logger = logger_;
        auto statsd_client = statsd_client_;
        producer_(key, [cache, logger, statsd_client, key, handler = std::move(handler)](
                           boost::system::error_code ec, ProducedValue<Value> produced) {
            if (ec) {
                if (statsd_client) {
                    statsd_client->increment(MetricsDefinitions::PRODUCER_ERROR);
                }
                if (logger) {
                    logger->warn("Producer failed, nothing cached: " + ec.message());
                }
                handler(ec, Value{});
                return;
            }
            cache->set(key, produced.value, produced.ttl);
            handler(ec, std::move(produced.value));
        });
    }

    // Same call, surfaced as a future. On failure the future throws
    // boost::system::system_error carrying the producer's error code.
    std::future<Value> fetch(const Key& key) const {
        auto promise = std::make_shared<std::promise<Value>>();
        std::future<Value> future = promise->get_future();
        (*this)(key, [promise](boost::system::error_code ec, Value value) {
            if (ec) {
                promise->set_exception(std::make_exception_ptr(boost::system::system_error(ec)));
            } else {
                promise->set_value(std::move(value));
            }
        });
        return future;
    }

    const std::shared_ptr<Cache>& cache() const { return cache_; }

private:
    std::shared_ptr<Cache> cache_;
    Producer producer_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
};

// Wraps producer so its results are memoized in cache.
template <typename Key, typename Value, typename Clock>
CachedFunction<Key, Value, Clock> cacheFn(
    std::shared_ptr<ConcurrentTtlCache<Key, Value, Clock>> cache,
    typename CachedFunction<Key, Value, Clock>::Producer producer,
    std::shared_ptr<ILogger> logger = nullptr,
    std::shared_ptr<IStatsDClient> statsd_client = nullptr) {
    return CachedFunction<Key, Value, Clock>(std::move(cache), std::move(producer),
                                             std::move(logger), std::move(statsd_client));
}

#endif // CACHEDFUNCTION_HPP
