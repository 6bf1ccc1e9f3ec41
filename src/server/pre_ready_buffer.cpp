#include "server/pre_ready_buffer.hpp"
#include "common/log.hpp"

namespace livegate {

PreReadyBuffer::PreReadyBuffer(size_t capacity)
    : capacity_(capacity)
{}

bool PreReadyBuffer::offer(std::string chunk) {
    if (drained_ || chunks_.size() >= capacity_) {
        ++dropped_;
        NLOG_DEBUG(log::RELAY_LOGGER, "Pre-ready buffer full, dropped {} byte chunk ({} dropped so far)",
                   chunk.size(), dropped_);
        return false;
    }
    chunks_.push_back(std::move(chunk));
    return true;
}

size_t PreReadyBuffer::drain_to(const Sink& sink) {
    if (drained_) {
        return 0;
    }
    drained_ = true;

    size_t count = chunks_.size();
    while (!chunks_.empty()) {
        auto chunk = std::move(chunks_.front());
        chunks_.pop_front();
        sink(std::move(chunk));
    }
    return count;
}

} // namespace livegate
