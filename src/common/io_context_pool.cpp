#include "common/io_context_pool.hpp"
#include "common/log.hpp"
#include <stdexcept>

namespace livegate {

IOContextPool::IOContextPool(size_t pool_size) {
    if (pool_size == 0) {
        pool_size = std::max(1u, std::thread::hardware_concurrency());
    }

    contexts_.reserve(pool_size);
    guards_.reserve(pool_size);
    for (size_t i = 0; i < pool_size; ++i) {
        contexts_.push_back(std::make_unique<net::io_context>(1));  // concurrency_hint = 1
        guards_.push_back(net::make_work_guard(*contexts_.back()));
    }

    NLOG_DEBUG(log::SERVER_LOGGER, "IOContextPool: Created with {} threads", pool_size);
}

IOContextPool::~IOContextPool() {
    stop();
}

void IOContextPool::run() {
    if (running_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    std::vector<std::thread> threads;
    threads.reserve(contexts_.size());
    for (size_t i = 0; i < contexts_.size(); ++i) {
        threads.emplace_back([this, i]() {
            try {
                contexts_[i]->run();
            } catch (const std::exception& e) {
                NLOG_ERROR(log::SERVER_LOGGER, "IOContextPool: Worker {} exception: {}", i, e.what());
            }
        });
    }

    NLOG_INFO(log::SERVER_LOGGER, "IOContextPool: Running {} worker threads", threads.size());

    for (auto& t : threads) {
        t.join();
    }
    running_.store(false, std::memory_order_release);
}

void IOContextPool::stop() {
    for (auto& guard : guards_) {
        guard.reset();
    }
    for (auto& ctx : contexts_) {
        ctx->stop();
    }
}

net::io_context& IOContextPool::next() {
    return *contexts_[next_.fetch_add(1, std::memory_order_relaxed) % contexts_.size()];
}

net::io_context& IOContextPool::at(size_t index) {
    if (index >= contexts_.size()) {
        throw std::out_of_range("IOContextPool: Invalid thread index");
    }
    return *contexts_[index];
}

} // namespace livegate
