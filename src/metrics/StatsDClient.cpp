#include <stdexcept>

#include "StatsDClient.hpp"
#include "StatsDFormat.hpp"

std::shared_ptr<StatsDClient> StatsDClient::instance = nullptr;
std::once_flag StatsDClient::init_flag;

std::shared_ptr<StatsDClient> StatsDClient::getInstance(
    const CacheConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& stats_server_endpoint) {
    // A throwing initializer leaves init_flag unset, so a later call may retry
    std::call_once(init_flag, [&config, &logger, &stats_server_endpoint]() {
        instance.reset(new StatsDClient(config, logger, stats_server_endpoint));
    });
    return instance;
}

std::pair<std::string, std::uint16_t> StatsDClient::parseEndpoint(const std::string& statsd_address) {
    auto colon_pos = statsd_address.find(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        throw std::runtime_error("STATSD_SERVER must be in the format <host>:<port>");
    }

    std::string host = statsd_address.substr(0, colon_pos);
    if (host == "localhost") {
        host = "127.0.0.1";
    }

    std::string port_text = statsd_address.substr(colon_pos + 1);
    int port = 0;
    try {
        std::size_t consumed = 0;
        port = std::stoi(port_text, &consumed);
        if (consumed != port_text.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + std::string(e.what()));
    }
    if (port <= 0 || port > 65535) {
        throw std::runtime_error("Invalid port in STATSD_SERVER: " + port_text);
    }
    return {host, static_cast<std::uint16_t>(port)};
}

StatsDClient::StatsDClient(
    const CacheConfig& config,
    std::shared_ptr<ILogger> logger,
    const std::string& statsd_address) : logger_(logger), udp_sender_(nullptr) {
    if (!logger_) {
        throw std::invalid_argument("Logger cannot be null for StatsDClient");
    }
    auto [host, port] = parseEndpoint(statsd_address);

    udp_sender_ = std::make_unique<Statsd::UDPSender>(
        host, port,
        static_cast<std::uint64_t>(config.metrics_batch_size),
        static_cast<std::uint64_t>(config.metrics_send_interval_in_millis));
    if (!udp_sender_->initialized()) {
        throw std::runtime_error("Failed to initialize UDPSender: " + udp_sender_->errorMessage());
    }
    logger_->setup("UDPSender initialized for " + host + ":" + std::to_string(port));
}

StatsDClient::~StatsDClient() {
    // UDPSender flushes its pending batch on destruction
    logger_->debug("StatsDClient destroyed.");
}

// UDPSender::send never throws; delivery is best effort
void StatsDClient::send(const std::string& message) {
    udp_sender_->send(message);
}

void StatsDClient::increment(const std::string& key, int value) {
    send(StatsDFormat::counter(key, value));
}

void StatsDClient::decrement(const std::string& key, int value) {
    increment(key, -value);
}

void StatsDClient::gauge(const std::string& key, double value) {
    send(StatsDFormat::gauge(key, value));
}

void StatsDClient::timing(const std::string& key, std::chrono::milliseconds value) {
    send(StatsDFormat::timing(key, value));
}
