#include <stdexcept>

#include "LoggingStatsDClient.hpp"
#include "StatsDFormat.hpp"

namespace {
    const std::string METRIC_LOG_PREFIX = "statsd ";
}

LoggingStatsDClient::LoggingStatsDClient(std::shared_ptr<ILogger> logger) : logger_(logger) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for LoggingStatsDClient");
    }
}

void LoggingStatsDClient::send(const std::string& message) {
    logger_->debug(METRIC_LOG_PREFIX + message);
}

void LoggingStatsDClient::increment(const std::string& key, int value) {
    send(StatsDFormat::counter(key, value));
}

void LoggingStatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void LoggingStatsDClient::gauge(const std::string& key, double value) {
    send(StatsDFormat::gauge(key, value));
}

void LoggingStatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    send(StatsDFormat::timing(key, value));
}
