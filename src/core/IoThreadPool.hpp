#ifndef IOTHREADPOOL_HPP
#define IOTHREADPOOL_HPP

#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

#include "../interfaces/ILogger.hpp"

namespace net = boost::asio;

// Runs an io_context on a fixed set of threads. The destructor releases the
// work guard and joins, so queued handlers finish and no thread is left
// joinable while an exception unwinds past the pool.
class IoThreadPool {
public:
    IoThreadPool(net::io_context& ioc, int num_threads, std::shared_ptr<ILogger> logger);
    ~IoThreadPool();

    // Lets the threads exit once the queue drains, and waits for them.
    void join();

    std::size_t size() const { return threads_.size(); }

    IoThreadPool(const IoThreadPool&) = delete;
    IoThreadPool& operator=(const IoThreadPool&) = delete;

private:
    net::io_context& ioc_;
    std::shared_ptr<ILogger> logger_;
    net::executor_work_guard<net::io_context::executor_type> work_guard_;
    std::vector<std::thread> threads_;
};

#endif // IOTHREADPOOL_HPP
