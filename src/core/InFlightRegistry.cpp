#include "InFlightRegistry.hpp"

#include <stdexcept>
#include <utility>

std::vector<Flight::Waiter> Flight::takeWaiters() {
    std::vector<Waiter> taken;
    taken.swap(waiters_);
    return taken;
}

std::shared_ptr<Flight> InFlightRegistry::find(const CacheKey& key) const {
    auto it = flights_.find(key);
    if (it == flights_.end()) {
        return nullptr;
    }
    return it->second;
}

std::shared_ptr<Flight> InFlightRegistry::claim(const CacheKey& key, Flight::TimePoint now) {
    auto flight = std::make_shared<Flight>(key, now);
    auto [it, inserted] = flights_.emplace(key, flight);
    if (!inserted) {
        throw std::logic_error("A flight is already registered for key " + key.to_string());
    }
    return it->second;
}

bool InFlightRegistry::release(const std::shared_ptr<Flight>& flight) {
    auto it = flights_.find(flight->key());
    if (it == flights_.end() || it->second != flight) {
        return false;
    }
    flights_.erase(it);
    return true;
}

std::shared_ptr<Flight> InFlightRegistry::detach(const CacheKey& key) {
    auto it = flights_.find(key);
    if (it == flights_.end()) {
        return nullptr;
    }
    auto flight = std::move(it->second);
    flights_.erase(it);
    return flight;
}

std::vector<std::shared_ptr<Flight>> InFlightRegistry::detachAll() {
    std::vector<std::shared_ptr<Flight>> detached;
    detached.reserve(flights_.size());
    for (auto& entry : flights_) {
        detached.push_back(std::move(entry.second));
    }
    flights_.clear();
    return detached;
}
