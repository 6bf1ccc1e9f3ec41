#pragma once

#include <utility>
#include <boost/asio.hpp>
#include <atomic>
#include <memory>
#include <thread>
#include <vector>

namespace livegate {

namespace net = boost::asio;

/**
 * IOContextPool - one single-threaded io_context per worker thread
 *
 * Each accepted connection is pinned to one context for its whole life, so
 * a relay session and both of its channels never run concurrently with
 * themselves. Contexts are handed out round-robin.
 */
class IOContextPool {
public:
    // pool_size 0 means std::thread::hardware_concurrency()
    explicit IOContextPool(size_t pool_size = 0);

    ~IOContextPool();

    IOContextPool(const IOContextPool&) = delete;
    IOContextPool& operator=(const IOContextPool&) = delete;

    /**
     * Run every context on its own thread and block until stop().
     */
    void run();

    // Safe to call from any thread, including a worker
    void stop();

    // Next context, round-robin. Thread-safe.
    net::io_context& next();

    net::io_context& at(size_t index);

    size_t size() const { return contexts_.size(); }
    bool running() const { return running_.load(std::memory_order_acquire); }

private:
    using WorkGuard = net::executor_work_guard<net::io_context::executor_type>;

    std::vector<std::unique_ptr<net::io_context>> contexts_;
    std::vector<WorkGuard> guards_;
    std::atomic<size_t> next_{0};
    std::atomic<bool> running_{false};
};

} // namespace livegate
