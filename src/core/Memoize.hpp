#ifndef MEMOIZE_HPP
#define MEMOIZE_HPP

#include <memory>
#include <stdexcept>
#include <utility>

#include "MemoCache.hpp"

// Wraps fn so that every invocation is routed through cache->call.
//
//   auto slow_square = memoize(cache, [](int x) { return x * x; });
//   int nine = slow_square(3);
template <typename Fn>
auto memoize(std::shared_ptr<MemoCache> cache, Fn fn) {
    if (!cache) {
        throw std::invalid_argument("Cache pointer cannot be null");
    }
    return [cache = std::move(cache), fn = std::move(fn)](const auto&... args) {
        return cache->call(fn, args...);
    };
}

// Wraps an asynchronous fn(args..., done) so that every invocation is routed
// through cache->callAsync<R>. The returned callable takes (handler, args...).
template <typename R, typename AsyncFn>
auto memoizeAsync(std::shared_ptr<MemoCache> cache, AsyncFn fn) {
    if (!cache) {
        throw std::invalid_argument("Cache pointer cannot be null");
    }
    return [cache = std::move(cache), fn = std::move(fn)](MemoCache::ResultHandler<R> handler, const auto&... args) {
        cache->callAsync<R>(fn, std::move(handler), args...);
    };
}

#endif // MEMOIZE_HPP
