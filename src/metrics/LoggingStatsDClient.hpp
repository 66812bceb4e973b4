#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Formats metrics as StatsD lines (key:value|type) and hands them to the
// logger at debug level. Used when metrics are wanted but no STATSD_SERVER
// is configured.
class LoggingStatsDClient : public IStatsDClient {
public:
    explicit LoggingStatsDClient(std::shared_ptr<ILogger> logger);
    ~LoggingStatsDClient() override = default;

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;

private:
    void send(const std::string& message);

    std::shared_ptr<ILogger> logger_;

    LoggingStatsDClient(const LoggingStatsDClient&) = delete;
    LoggingStatsDClient& operator=(const LoggingStatsDClient&) = delete;
};
