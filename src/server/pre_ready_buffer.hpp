#pragma once

#include <deque>
#include <functional>
#include <string>

namespace livegate {

/**
 * PreReadyBuffer - client audio that arrives before the upstream is ready
 *
 * Bounded FIFO. When full, new chunks are dropped and counted; offer()
 * never blocks. Drained exactly once; afterwards it accepts nothing.
 */
class PreReadyBuffer {
public:
    using Sink = std::function<void(std::string)>;

    static constexpr size_t kDefaultCapacity = 8;

    explicit PreReadyBuffer(size_t capacity = kDefaultCapacity);

    /**
     * Append a chunk.
     * @return false if the chunk was dropped (full or already drained)
     */
    bool offer(std::string chunk);

    /**
     * Hand every buffered chunk to sink in arrival order.
     * Only the first call forwards anything.
     * @return number of chunks forwarded
     */
    size_t drain_to(const Sink& sink);

    size_t size() const { return chunks_.size(); }
    size_t capacity() const { return capacity_; }
    size_t dropped() const { return dropped_; }
    bool drained() const { return drained_; }

private:
    size_t capacity_;
    std::deque<std::string> chunks_;
    size_t dropped_{0};
    bool drained_{false};
};

} // namespace livegate
