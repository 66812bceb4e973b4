#include <atomic>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <future>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include <nlohmann/json.hpp>

#include "config/CacheConfig.hpp"
#include "core/IoThreadPool.hpp"
#include "core/MemoCache.hpp"
#include "core/Memoize.hpp"
#include "logging/ConsoleLogger.hpp"
#include "metrics/DummyStatsDClient.hpp"
#include "metrics/LoggingStatsDClient.hpp"
#include "metrics/StatsDClient.hpp"
#include "utils/Utils.hpp"

using json = nlohmann::json;
using namespace std;

namespace {
    const int ASYNC_BURST_SIZE = 8;
    const auto SIMULATED_LATENCY = std::chrono::milliseconds(50);
}

// --- Helper Function to Initialize StatsD Client ---
std::shared_ptr<IStatsDClient> initializeStatsDClient(const CacheConfig& config, std::shared_ptr<ILogger> logger_) {
    string statsd_server_endpoint;
    const char* statsd_server_value = std::getenv("STATSD_SERVER");
    if (statsd_server_value != nullptr) {
        statsd_server_endpoint = std::string(statsd_server_value);
    }
    logger_->setup("STATSD_SERVER endpoint : " + statsd_server_endpoint);

    if (statsd_server_endpoint.empty()) {
        if (config.emit_metrics) {
            logger_->setup("No STATSD_SERVER set. StatsD lines are written to the debug log.");
            return std::make_shared<LoggingStatsDClient>(logger_);
        }
        logger_->setup("No STATSD_SERVER set. Using DummyStatsDClient.");
        return DummyStatsDClient::getInstance();
    }

    try {
        logger_->debug("STATSD_SERVER endpoint found. Creating real StatsDClient instance.");
        return StatsDClient::getInstance(config, logger_, statsd_server_endpoint);
    } catch (const std::exception& e) {
        logger_->error("StatsDClient failed to get created: " + std::string(e.what()) +
                       ". Creating DummyStatsDClient instance.");
    }
    return DummyStatsDClient::getInstance();
}

// Walks the two-entry example: f(1) miss, f(1) hit, f(2) miss, f(3) miss evicting f(1), f(1) miss.
json runEvictionWalkthrough(boost::asio::io_context& ioc,
                            const CacheConfig& config,
                            std::shared_ptr<ILogger> logger_,
                            std::shared_ptr<IStatsDClient> statsd_client) {
    CacheConfig walkthrough_config = config;
    walkthrough_config.max_size = 2;
    walkthrough_config.ttl_in_millis = 0;
    auto cache = std::make_shared<MemoCache>(ioc, walkthrough_config, logger_, statsd_client);

    int computations = 0;
    auto f = memoize(cache, [&computations](int x) {
        ++computations;
        return x * 10;
    });

    for (int arg : {1, 1, 2, 3, 1}) {
        int before = computations;
        int result = f(arg);
        logger_->info("f(" + std::to_string(arg) + ") = " + std::to_string(result) +
                      (computations > before ? " (computed)" : " (cached)"));
    }
    return cache->info();
}

// Fires a burst of identical asynchronous calls; only one computation should run.
json runSingleFlightBurst(boost::asio::io_context& ioc,
                          std::shared_ptr<MemoCache> cache,
                          std::shared_ptr<ILogger> logger_) {
    std::atomic<int> computations{0};
    auto lookup = memoizeAsync<std::string>(
        cache,
        [&ioc, &computations](const std::string& name, MemoCache::ResultHandler<std::string> done) {
            ++computations;
            auto timer = std::make_shared<boost::asio::steady_timer>(ioc, SIMULATED_LATENCY);
            timer->async_wait([timer, name, done](const boost::system::error_code& ec) {
                if (ec) {
                    done(std::make_exception_ptr(std::runtime_error("Timer failed: " + ec.message())), std::nullopt);
                    return;
                }
                done(nullptr, "profile:" + name);
            });
        });

    std::vector<std::future<std::string>> results;
    for (int i = 0; i < ASYNC_BURST_SIZE; ++i) {
        auto promise = std::make_shared<std::promise<std::string>>();
        results.push_back(promise->get_future());
        lookup([promise](std::exception_ptr error, std::optional<std::string> value) {
            if (error) {
                promise->set_exception(error);
            } else {
                promise->set_value(*value);
            }
        }, std::string("alice"));
    }

    for (auto& result : results) {
        result.get();
    }
    logger_->info("Async burst of " + std::to_string(ASYNC_BURST_SIZE) + " calls ran " +
                  std::to_string(computations.load()) + " computation(s)");
    return cache->info();
}

// --- Main Function ---
int main(int argc, char** argv) {
    try {
        vector<string> args_vec;
        for (int i = 1; i < argc; ++i) {
            args_vec.push_back(argv[i]);
        }

        optional<map<string, string>> parsedArgsOpt = Utils::parseArguments(args_vec);
        if (!parsedArgsOpt) {
            ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Failed to parse command-line arguments. Exiting.");
            return 1;
        }

        CacheConfig config_ = Utils::loadConfiguration(parsedArgsOpt.value());

        std::shared_ptr<ILogger> logger_ = ConsoleLogger::getInstance(config_.log_level);
        logger_->setup("Configuration loaded.");
        logger_->setup(config_.to_string());

        std::shared_ptr<IStatsDClient> statsd_client = initializeStatsDClient(config_, logger_);

        // --- Boost.Asio io_context drives asynchronous computations and result delivery ---
        boost::asio::io_context ioc;
        IoThreadPool io_threads(ioc, config_.num_io_threads, logger_);

        json report;
        report["eviction_walkthrough"] = runEvictionWalkthrough(ioc, config_, logger_, statsd_client);

        auto cache = std::make_shared<MemoCache>(ioc, config_, logger_, statsd_client);
        report["single_flight_burst"] = runSingleFlightBurst(ioc, cache, logger_);

        io_threads.join();

        std::cout << report.dump(4) << std::endl;
        return 0;
    } catch (const CacheConfigurationError& e) {
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error("Invalid cache configuration: " + std::string(e.what()));
        return 2;
    } catch (const std::exception& e) {
        std::stringstream ss;
        ss << "Unhandled exception: " << e.what();
        ConsoleLogger::getInstance(LogUtils::LogLevel::CERROR)->error(ss.str());
        return 1;
    }
}
