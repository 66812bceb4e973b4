#ifndef MEMOCACHE_HPP
#define MEMOCACHE_HPP

#include <boost/asio/io_context.hpp>

#include <any>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

#include "CacheErrors.hpp"
#include "InFlightRegistry.hpp"
#include "../cache/KeyNormalizer.hpp"
#include "../config/CacheConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"
#include "../interfaces/StoreInterface.hpp"
#include "../metrics/DummyStatsDClient.hpp"
#include "../models/CacheInfo.hpp"
#include "../models/CacheKey.hpp"

namespace net = boost::asio;

// Memoizing cache engine with a blocking path (call) and an asynchronous,
// single-flight path (callAsync) over one bounded LRU/TTL store.
//
// Both paths share a single mutex guarding the store, the in-flight registry
// and the counters. The mutex is never held while user code runs or while
// results are handed back, so a memoized function may itself use the cache.
//
// The sync path does not deduplicate: concurrent misses on one key all
// compute, and the last write wins. The async path runs one computation per
// key at a time and broadcasts its outcome to every caller that joined.
//
// Async results, failures and cancellations are always delivered by posting
// to the io_context, never inline from callAsync. Keep the engine in a
// std::shared_ptr: pending async computations hold a reference to it.
class MemoCache : public std::enable_shared_from_this<MemoCache> {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;

    template <typename R>
    using ResultHandler = std::function<void(std::exception_ptr, std::optional<R>)>;

    using ErasedHandler = std::function<void(std::exception_ptr, std::any)>;
    using ErasedComputation = std::function<std::any()>;
    using ErasedAsyncComputation = std::function<void(ErasedHandler)>;

    // Throws CacheConfigurationError if config.max_size <= 0 or the TTL is negative.
    MemoCache(net::io_context& ioc,
              const CacheConfig& config,
              std::shared_ptr<ILogger> logger,
              std::shared_ptr<IStatsDClient> statsd_client = DummyStatsDClient::getInstance(),
              ClockFn clock = ClockFn());

    MemoCache(net::io_context& ioc,
              std::shared_ptr<StoreInterface> store,
              std::shared_ptr<ILogger> logger,
              std::shared_ptr<IStatsDClient> statsd_client = DummyStatsDClient::getInstance(),
              ClockFn clock = ClockFn());

    ~MemoCache() = default;

    MemoCache(const MemoCache&) = delete;
    MemoCache& operator=(const MemoCache&) = delete;
    MemoCache(MemoCache&&) = delete;
    MemoCache& operator=(MemoCache&&) = delete;

    // --- Sync path ---

    // Returns fn(args...) from the cache when fresh, otherwise computes and
    // stores it. Exceptions from fn propagate unchanged and nothing is stored.
    template <typename Fn, typename... Args>
    auto call(Fn&& fn, Args&&... args) {
        using Result = std::decay_t<std::invoke_result_t<Fn&, Args&...>>;
        static_assert(!std::is_void_v<Result>, "memoized functions must return a value");

        CacheKey key = KeyNormalizer::fromArguments(args...);
        std::any value = callWithKey(key, [&fn, &args...]() -> std::any {
            return std::any(std::invoke(fn, args...));
        });
        return unwrap<Result>(value, key);
    }

    std::any callWithKey(const CacheKey& key, const ErasedComputation& compute);

    // --- Async path ---

    // fn(args..., done) starts an asynchronous computation and must eventually
    // call done(nullptr, value) or done(error, std::nullopt). handler receives
    // the cached value, the shared flight's outcome, or ComputationCancelled.
    template <typename R, typename AsyncFn, typename... Args>
    void callAsync(AsyncFn fn, ResultHandler<R> handler, Args... args) {
        CacheKey key = KeyNormalizer::fromArguments(args...);
        ErasedAsyncComputation computation =
            [fn = std::move(fn), arguments = std::make_tuple(std::move(args)...)](ErasedHandler done) mutable {
                ResultHandler<R> typed_done = [done](std::exception_ptr error, std::optional<R> value) {
                    if (error) {
                        done(error, std::any());
                    } else if (!value) {
                        done(std::make_exception_ptr(CacheError("Asynchronous computation completed without a value")),
                             std::any());
                    } else {
                        done(nullptr, std::any(std::move(*value)));
                    }
                };
                std::apply([&fn, &typed_done](auto&... unpacked) { fn(unpacked..., typed_done); }, arguments);
            };
        callAsyncWithKey(key, std::move(computation), wrapHandler<R>(std::move(handler), key));
    }

    void callAsyncWithKey(const CacheKey& key, ErasedAsyncComputation computation, ErasedHandler handler);

    // --- Management ---

    // Drops the stored entry only; an in-flight computation is left running.
    template <typename... Args>
    bool invalidate(const Args&... args) {
        return invalidateKey(KeyNormalizer::fromArguments(args...));
    }
    bool invalidateKey(const CacheKey& key);

    // Drops the stored entry and cancels a live flight for the key.
    template <typename... Args>
    bool invalidateAsync(const Args&... args) {
        return invalidateKeyAsync(KeyNormalizer::fromArguments(args...));
    }
    bool invalidateKeyAsync(const CacheKey& key);

    // Empties the store, zeroes the counters and cancels every live flight
    // without waiting for the computations to finish.
    void clear();

    CacheInfo info() const;

private:
    net::io_context* ioc_;
    std::shared_ptr<StoreInterface> store_;
    std::shared_ptr<ILogger> logger_;
    std::shared_ptr<IStatsDClient> statsd_client_;
    ClockFn clock_;

    mutable std::mutex mutex_;
    InFlightRegistry inflight_;
    std::size_t hits_ = 0;
    std::size_t misses_ = 0;

    // What a locked store access observed. Reported by the report* helpers
    // once mutex_ is released, so metrics and logging never run under it.
    struct LookupOutcome {
        std::optional<std::any> value;
        bool expired = false;
    };
    struct StoreOutcome {
        bool evicted = false;
        std::size_t size = 0;
    };

    // Callers must hold mutex_.
    LookupOutcome lookupLocked(const CacheKey& key, Clock::time_point now);
    StoreOutcome storeLocked(const CacheKey& key, const std::any& value);

    void reportLookup(const CacheKey& key, const LookupOutcome& outcome);
    void reportStore(const CacheKey& key, const StoreOutcome& outcome);

    void resolveFlight(const std::shared_ptr<Flight>& flight, std::exception_ptr error, std::any value);
    void cancelWaiters(const CacheKey& key, std::vector<Flight::Waiter> waiters, const std::string& reason);
    void deliver(Flight::Waiter waiter, std::exception_ptr error, std::any value);

    static std::string describe(const std::exception_ptr& error);
    static std::string mismatchMessage(const CacheKey& key,
                                       const std::type_info& stored,
                                       const std::type_info& requested);

    template <typename R>
    static R unwrap(std::any& value, const CacheKey& key) {
        if (R* typed = std::any_cast<R>(&value)) {
            return std::move(*typed);
        }
        throw CachedTypeMismatch(mismatchMessage(key, value.type(), typeid(R)));
    }

    template <typename R>
    static ErasedHandler wrapHandler(ResultHandler<R> handler, const CacheKey& key) {
        return [handler = std::move(handler), key](std::exception_ptr error, std::any value) {
            if (error) {
                handler(error, std::nullopt);
                return;
            }
            if (R* typed = std::any_cast<R>(&value)) {
                handler(nullptr, std::move(*typed));
                return;
            }
            handler(std::make_exception_ptr(CachedTypeMismatch(mismatchMessage(key, value.type(), typeid(R)))),
                    std::nullopt);
        };
    }
};

#endif // MEMOCACHE_HPP
