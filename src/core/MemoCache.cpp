#include "MemoCache.hpp"

#include <atomic>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

#include <boost/asio/post.hpp>

#include "../cache/LruStore.hpp"

namespace {
    std::shared_ptr<StoreInterface> makeStore(const CacheConfig& config) {
        if (config.max_size <= 0) {
            throw CacheConfigurationError("max_size must be > 0, got " + std::to_string(config.max_size));
        }
        if (config.ttl_in_millis < 0) {
            throw CacheConfigurationError("ttl must be positive, got " + std::to_string(config.ttl_in_millis) + "ms");
        }
        return std::make_shared<LruStore>(static_cast<std::size_t>(config.max_size), config.ttl());
    }

    std::string ttlToString(const std::optional<std::chrono::milliseconds>& ttl) {
        return ttl ? std::to_string(ttl->count()) + "ms" : std::string("none");
    }
}

MemoCache::MemoCache(net::io_context& ioc,
                     const CacheConfig& config,
                     std::shared_ptr<ILogger> logger,
                     std::shared_ptr<IStatsDClient> statsd_client,
                     ClockFn clock)
    : MemoCache(ioc, makeStore(config), std::move(logger), std::move(statsd_client), std::move(clock)) {}

MemoCache::MemoCache(net::io_context& ioc,
                     std::shared_ptr<StoreInterface> store,
                     std::shared_ptr<ILogger> logger,
                     std::shared_ptr<IStatsDClient> statsd_client,
                     ClockFn clock)
    : ioc_(&ioc),
      store_(std::move(store)),
      logger_(std::move(logger)),
      statsd_client_(std::move(statsd_client)),
      clock_(std::move(clock)) {
    if (!store_) {
        throw std::invalid_argument("Store pointer cannot be null");
    }
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (!statsd_client_) {
        throw std::invalid_argument("StatsDClient pointer cannot be null");
    }
    if (store_->maxSize() == 0) {
        throw CacheConfigurationError("max_size must be > 0");
    }
    if (!clock_) {
        clock_ = [] { return Clock::now(); };
    }
    logger_->setup("MemoCache initialized with max_size " + std::to_string(store_->maxSize()) +
                   ", ttl " + ttlToString(store_->ttl()));
}

// --- Sync path ---

std::any MemoCache::callWithKey(const CacheKey& key, const ErasedComputation& compute) {
    LookupOutcome lookup;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lookup = lookupLocked(key, clock_());
        if (!lookup.value) {
            ++misses_;
        }
    }
    reportLookup(key, lookup);
    if (lookup.value) {
        return std::move(*lookup.value);
    }
    statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
    if (logger_->isDebugEnabled()) {
        logger_->debug("Cache miss for key " + key.to_string() + ", computing");
    }

    // User code runs without the lock held
    auto started_at = clock_();
    std::any result;
    try {
        result = compute();
    } catch (const std::exception& e) {
        logger_->warn("Computation failed for key " + key.to_string() + ": " + e.what());
        statsd_client_->increment(MetricsDefinitions::COMPUTATION_FAILED);
        throw;
    } catch (...) {
        logger_->warn("Computation failed for key " + key.to_string() + " with a non-standard exception");
        statsd_client_->increment(MetricsDefinitions::COMPUTATION_FAILED);
        throw;
    }
    statsd_client_->timing(MetricsDefinitions::COMPUTE_TIME,
                           std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - started_at));

    StoreOutcome stored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stored = storeLocked(key, result);
    }
    reportStore(key, stored);
    return result;
}

// --- Async path ---

void MemoCache::callAsyncWithKey(const CacheKey& key, ErasedAsyncComputation computation, ErasedHandler handler) {
    auto self = shared_from_this();
    std::shared_ptr<Flight> flight;
    LookupOutcome lookup;
    std::size_t joined_waiters = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        lookup = lookupLocked(key, clock_());
        if (!lookup.value) {
            if (auto existing = inflight_.find(key)) {
                existing->attach(std::move(handler));
                joined_waiters = existing->waiterCount();
            } else {
                ++misses_;
                flight = inflight_.claim(key, clock_());
                flight->attach(std::move(handler));
            }
        }
    }
    reportLookup(key, lookup);

    if (lookup.value) {
        deliver(std::move(handler), nullptr, std::move(*lookup.value));
        return;
    }
    if (!flight) {
        statsd_client_->increment(MetricsDefinitions::FLIGHT_JOINED);
        if (logger_->isDebugEnabled()) {
            logger_->debug("Joined in-flight computation for key " + key.to_string() + " (" +
                           std::to_string(joined_waiters) + " waiters)");
        }
        return;
    }
    statsd_client_->increment(MetricsDefinitions::CACHE_MISS);
    if (logger_->isDebugEnabled()) {
        logger_->debug("Cache miss for key " + key.to_string() + ", starting computation");
    }

    auto completed = std::make_shared<std::atomic<bool>>(false);
    ErasedHandler done = [self, flight, completed](std::exception_ptr error, std::any value) {
        if (completed->exchange(true)) {
            self->logger_->warn("Ignoring repeated completion for key " + flight->key().to_string());
            return;
        }
        self->resolveFlight(flight, error, std::move(value));
    };

    net::post(*ioc_, [computation = std::move(computation), done]() mutable {
        try {
            computation(done);
        } catch (...) {
            // A computation that throws before completing fails its flight
            done(std::current_exception(), std::any());
        }
    });
}

void MemoCache::resolveFlight(const std::shared_ptr<Flight>& flight, std::exception_ptr error, std::any value) {
    std::vector<Flight::Waiter> waiters;
    bool still_live = false;
    std::optional<StoreOutcome> stored;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        // Store write and deregistration happen in one critical section, so a
        // caller arriving afterwards sees the stored value instead of a flight.
        still_live = inflight_.release(flight);
        if (still_live) {
            if (!error) {
                stored = storeLocked(flight->key(), value);
            }
            waiters = flight->takeWaiters();
        }
    }

    if (!still_live) {
        logger_->info("Discarding outcome of cancelled computation for key " + flight->key().to_string());
        return;
    }
    if (stored) {
        reportStore(flight->key(), *stored);
    }

    if (error) {
        logger_->warn("Computation failed for key " + flight->key().to_string() + ": " + describe(error) +
                      " (notifying " + std::to_string(waiters.size()) + " waiters)");
        statsd_client_->increment(MetricsDefinitions::COMPUTATION_FAILED);
    } else {
        statsd_client_->timing(MetricsDefinitions::COMPUTE_TIME,
                               std::chrono::duration_cast<std::chrono::milliseconds>(clock_() - flight->startedAt()));
        if (logger_->isDebugEnabled()) {
            logger_->debug("Computation resolved for key " + flight->key().to_string() + " (notifying " +
                           std::to_string(waiters.size()) + " waiters)");
        }
    }

    for (auto& waiter : waiters) {
        deliver(std::move(waiter), error, value);
    }
}

void MemoCache::cancelWaiters(const CacheKey& key, std::vector<Flight::Waiter> waiters, const std::string& reason) {
    statsd_client_->increment(MetricsDefinitions::FLIGHT_CANCELLED);
    logger_->info("Cancelled in-flight computation for key " + key.to_string() + " (" + reason + "), notifying " +
                  std::to_string(waiters.size()) + " waiters");

    auto error = std::make_exception_ptr(
        ComputationCancelled("Computation for key " + key.to_string() + " was cancelled: " + reason));
    for (auto& waiter : waiters) {
        deliver(std::move(waiter), error, std::any());
    }
}

void MemoCache::deliver(Flight::Waiter waiter, std::exception_ptr error, std::any value) {
    net::post(*ioc_, [waiter = std::move(waiter), error, value = std::move(value)]() mutable {
        waiter(error, std::move(value));
    });
}

// --- Management ---

bool MemoCache::invalidateKey(const CacheKey& key) {
    bool removed = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = store_->remove(key);
    }
    if (removed && logger_->isDebugEnabled()) {
        logger_->debug("Invalidated key " + key.to_string());
    }
    return removed;
}

bool MemoCache::invalidateKeyAsync(const CacheKey& key) {
    bool removed = false;
    std::shared_ptr<Flight> flight;
    std::vector<Flight::Waiter> waiters;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed = store_->remove(key);
        flight = inflight_.detach(key);
        if (flight) {
            waiters = flight->takeWaiters();
        }
    }
    if (removed && logger_->isDebugEnabled()) {
        logger_->debug("Invalidated key " + key.to_string());
    }
    if (flight) {
        cancelWaiters(key, std::move(waiters), "key invalidated");
    }
    return removed || flight != nullptr;
}

void MemoCache::clear() {
    std::vector<std::pair<CacheKey, std::vector<Flight::Waiter>>> cancelled;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        store_->clear();
        hits_ = 0;
        misses_ = 0;
        for (auto& flight : inflight_.detachAll()) {
            cancelled.emplace_back(flight->key(), flight->takeWaiters());
        }
    }
    statsd_client_->gauge(MetricsDefinitions::CACHE_SIZE, 0);
    logger_->info("Cache cleared, cancelling " + std::to_string(cancelled.size()) + " in-flight computations");

    for (auto& [key, waiters] : cancelled) {
        cancelWaiters(key, std::move(waiters), "cache cleared");
    }
}

CacheInfo MemoCache::info() const {
    std::lock_guard<std::mutex> lock(mutex_);
    CacheInfo info;
    info.hits = hits_;
    info.misses = misses_;
    info.size = store_->size();
    info.max_size = store_->maxSize();
    info.ttl = store_->ttl();
    info.inflight = inflight_.size();
    return info;
}

// --- Private helpers ---

MemoCache::LookupOutcome MemoCache::lookupLocked(const CacheKey& key, Clock::time_point now) {
    LookupOutcome outcome;
    StoreLookup lookup = store_->get(key, now);
    if (lookup.found && lookup.fresh) {
        ++hits_;
        outcome.value = std::move(lookup.value);
    } else {
        outcome.expired = lookup.found;
    }
    return outcome;
}

MemoCache::StoreOutcome MemoCache::storeLocked(const CacheKey& key, const std::any& value) {
    StoreOutcome outcome;
    outcome.evicted = store_->put(key, value, clock_());
    outcome.size = store_->size();
    return outcome;
}

void MemoCache::reportLookup(const CacheKey& key, const LookupOutcome& outcome) {
    if (outcome.value) {
        statsd_client_->increment(MetricsDefinitions::CACHE_HIT);
        return;
    }
    if (outcome.expired) {
        statsd_client_->increment(MetricsDefinitions::CACHE_EXPIRED);
        if (logger_->isDebugEnabled()) {
            logger_->debug("Entry for key " + key.to_string() + " expired");
        }
    }
}

void MemoCache::reportStore(const CacheKey& key, const StoreOutcome& outcome) {
    if (outcome.evicted) {
        statsd_client_->increment(MetricsDefinitions::CACHE_EVICTION);
        if (logger_->isDebugEnabled()) {
            logger_->debug("Evicted least-recently-used entry to admit key " + key.to_string());
        }
    }
    statsd_client_->gauge(MetricsDefinitions::CACHE_SIZE, static_cast<double>(outcome.size));
}

std::string MemoCache::describe(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "non-standard exception";
    }
}

std::string MemoCache::mismatchMessage(const CacheKey& key,
                                       const std::type_info& stored,
                                       const std::type_info& requested) {
    std::stringstream ss;
    ss << "Cached value for key " << key.to_string() << " holds type " << stored.name()
       << " but " << requested.name() << " was requested";
    return ss.str();
}
