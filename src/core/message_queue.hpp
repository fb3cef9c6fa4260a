#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace camper {

// Multi-producer, single-consumer inbox. Producers on any thread push;
// the owning thread pops.
template <typename T>
class MessageQueue {
public:
    // Returns false once the queue is closed; the message is dropped.
    bool push(T message) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (closed) {
                return false;
            }
            messages.push_back(std::move(message));
        }
        ready.notify_one();
        return true;
    }

    std::optional<T> try_pop() {
        std::lock_guard<std::mutex> lock(mutex);
        return take_front();
    }

    // Waits up to `timeout` for a message. Empty result on timeout or close.
    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
        std::unique_lock<std::mutex> lock(mutex);
        ready.wait_for(lock, timeout, [this] { return closed || !messages.empty(); });
        return take_front();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex);
            closed = true;
        }
        ready.notify_all();
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex);
        return closed;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex);
        return messages.size();
    }

private:
    std::optional<T> take_front() {
        if (messages.empty()) {
            return std::nullopt;
        }
        T message = std::move(messages.front());
        messages.pop_front();
        return message;
    }

    mutable std::mutex mutex;
    std::condition_variable ready;
    std::deque<T> messages;
    bool closed = false;
};

} // namespace camper
