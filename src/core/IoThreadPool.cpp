#include "IoThreadPool.hpp"

#include <stdexcept>
#include <string>

IoThreadPool::IoThreadPool(net::io_context& ioc, int num_threads, std::shared_ptr<ILogger> logger)
    : ioc_(ioc), logger_(std::move(logger)), work_guard_(net::make_work_guard(ioc)) {
    if (!logger_) {
        throw std::invalid_argument("Logger pointer cannot be null");
    }
    if (num_threads <= 0) {
        throw std::invalid_argument("IoThreadPool needs at least one thread, got " + std::to_string(num_threads));
    }

    logger_->setup("Starting " + std::to_string(num_threads) + " I/O threads for Boost.Asio.");
    for (int i = 0; i < num_threads; ++i) {
        threads_.emplace_back([this, i]() {
            logger_->debug("Boost.Asio I/O thread " + std::to_string(i) + " started.");
            try {
                ioc_.run();
            } catch (const std::exception& e) {
                logger_->error("Exception in Boost.Asio I/O thread " + std::to_string(i) + ": " + e.what());
            }
            logger_->debug("Boost.Asio I/O thread " + std::to_string(i) + " exiting.");
        });
    }
}

IoThreadPool::~IoThreadPool() {
    join();
}

void IoThreadPool::join() {
    work_guard_.reset();
    bool joined_any = false;
    for (auto& t : threads_) {
        if (t.joinable()) {
            t.join();
            joined_any = true;
        }
    }
    if (joined_any) {
        logger_->setup("All Boost.Asio I/O threads joined.");
    }
}
