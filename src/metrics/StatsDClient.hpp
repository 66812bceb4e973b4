#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

#include <cpp-statsd-client/UDPSender.hpp>

#include "../config/CacheConfig.hpp"
#include "../interfaces/ILogger.hpp"
#include "../interfaces/IStatsDClient.hpp"

// Ships memocache.* metrics to a StatsD server over UDP, batched by
// Statsd::UDPSender.
class StatsDClient : public IStatsDClient {
public:
    // The endpoint passed on the first successful call wins.
    static std::shared_ptr<StatsDClient> getInstance(
        const CacheConfig& config,
        std::shared_ptr<ILogger> logger,
        const std::string& stats_server_endpoint);
    ~StatsDClient() override;

    // "<host>:<port>"; "localhost" resolves to 127.0.0.1. Throws std::runtime_error.
    static std::pair<std::string, std::uint16_t> parseEndpoint(const std::string& statsd_address);

    void increment(const std::string& key, int value = 1) override;
    void decrement(const std::string& key, int value = 1) override;
    void gauge(const std::string& key, double value) override;
    void timing(const std::string& key, std::chrono::milliseconds value) override;

private:
    StatsDClient(
        const CacheConfig& config,
        std::shared_ptr<ILogger> logger,
        const std::string& stats_server_endpoint);
    void send(const std::string& message);

    std::shared_ptr<ILogger> logger_;
    std::unique_ptr<Statsd::UDPSender> udp_sender_;

    static std::shared_ptr<StatsDClient> instance;
    static std::once_flag init_flag;

    StatsDClient(const StatsDClient&) = delete;
    StatsDClient& operator=(const StatsDClient&) = delete;
    StatsDClient(StatsDClient&&) = delete;
    StatsDClient& operator=(StatsDClient&&) = delete;
};
