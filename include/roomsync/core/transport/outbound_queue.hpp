#pragma once

#include <cstddef>
#include <deque>
#include <string>


namespace roomsync::core::transport {

/*
===============================================================================
 OutboundQueue
===============================================================================

Unbounded FIFO of encoded envelopes produced while the link cannot deliver
them. Entries leave the queue only from the front, so the enqueue order (and
with it each sender's sequence order) survives any number of reconnects.
===============================================================================
*/
class OutboundQueue {
public:
    inline void push(std::string envelope) {
        items_.push_back(std::move(envelope));
    }

    [[nodiscard]]
    inline const std::string& front() const noexcept {
        return items_.front();
    }

    inline void pop() noexcept {
        items_.pop_front();
    }

    [[nodiscard]]
    inline std::size_t size() const noexcept {
        return items_.size();
    }

    [[nodiscard]]
    inline bool empty() const noexcept {
        return items_.empty();
    }

    inline void clear() noexcept {
        items_.clear();
    }

private:
    std::deque<std::string> items_;
};

} // namespace roomsync::core::transport
