#ifndef INFLIGHTREGISTRY_HPP
#define INFLIGHTREGISTRY_HPP

#include <any>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <unordered_map>
#include <utility>
#include <vector>

#include "../models/CacheKey.hpp"

// One pending asynchronous computation. Every caller that asks for the same
// key while it runs attaches a waiter; the single outcome (value, failure or
// cancellation) is broadcast to all of them.
class Flight {
public:
    using Waiter = std::function<void(std::exception_ptr, std::any)>;
    using TimePoint = std::chrono::steady_clock::time_point;

    Flight(CacheKey key, TimePoint started_at) : key_(std::move(key)), started_at_(started_at) {}

    const CacheKey& key() const { return key_; }
    TimePoint startedAt() const { return started_at_; }

    void attach(Waiter waiter) { waiters_.push_back(std::move(waiter)); }
    std::vector<Waiter> takeWaiters();
    std::size_t waiterCount() const { return waiters_.size(); }

private:
    CacheKey key_;
    TimePoint started_at_;
    std::vector<Waiter> waiters_;
};

// Key -> live Flight. Holds at most one flight per key. Not synchronized;
// MemoCache mutates it only under its lock.
class InFlightRegistry {
public:
    std::shared_ptr<Flight> find(const CacheKey& key) const;

    // Registers a new flight for a key that has none.
    std::shared_ptr<Flight> claim(const CacheKey& key, Flight::TimePoint now);

    // Deregisters the flight if it is still the live one for its key. Returns
    // false when it was already detached by a cancellation.
    bool release(const std::shared_ptr<Flight>& flight);

    std::shared_ptr<Flight> detach(const CacheKey& key);
    std::vector<std::shared_ptr<Flight>> detachAll();

    std::size_t size() const { return flights_.size(); }

private:
    std::unordered_map<CacheKey, std::shared_ptr<Flight>, CacheKeyHash> flights_;
};

#endif // INFLIGHTREGISTRY_HPP
