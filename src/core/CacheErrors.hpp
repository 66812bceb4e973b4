#ifndef CACHEERRORS_HPP
#define CACHEERRORS_HPP

#include <stdexcept>
#include <string>

class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message) : std::runtime_error(message) {}
};

// Invalid engine or store construction parameters.
class CacheConfigurationError : public CacheError {
public:
    explicit CacheConfigurationError(const std::string& message) : CacheError(message) {}
};

// Delivered to asynchronous waiters whose flight was invalidated or cleared
// before it resolved. The computation itself is not interrupted.
class ComputationCancelled : public CacheError {
public:
    explicit ComputationCancelled(const std::string& message) : CacheError(message) {}
};

// A cached value exists for the key but holds a different C++ type than the caller expects.
class CachedTypeMismatch : public CacheError {
public:
    explicit CachedTypeMismatch(const std::string& message) : CacheError(message) {}
};

#endif // CACHEERRORS_HPP
