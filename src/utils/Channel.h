#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

/**
 * @brief Bounded blocking queue shared between a transport and a session.
 *
 * Any number of producers and consumers. After close() senders fail
 * immediately and receivers drain what is left, then get std::nullopt.
 */
template <typename T>
class Channel {
public:
    explicit Channel(size_t capacity = 1000) : capacity(capacity == 0 ? 1 : capacity) {}

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    // Blocks while the queue is full. Returns false if the channel is closed.
    bool send(T value) {
        std::unique_lock<std::mutex> lock(mtx);
        notFull.wait(lock, [this] { return closed || items.size() < capacity; });
        if (closed) return false;
        items.push_back(std::move(value));
        notEmpty.notify_one();
        return true;
    }

    template <typename Rep, typename Period>
    bool trySendFor(T value, const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mtx);
        if (!notFull.wait_for(lock, timeout, [this] { return closed || items.size() < capacity; })) {
            return false;
        }
        if (closed) return false;
        items.push_back(std::move(value));
        notEmpty.notify_one();
        return true;
    }

    std::optional<T> receive() {
        std::unique_lock<std::mutex> lock(mtx);
        notEmpty.wait(lock, [this] { return closed || !items.empty(); });
        return popLocked();
    }

    // std::nullopt on timeout as well as on closed-and-drained; use isClosed() to tell them apart.
    template <typename Rep, typename Period>
    std::optional<T> receiveFor(const std::chrono::duration<Rep, Period>& timeout) {
        std::unique_lock<std::mutex> lock(mtx);
        notEmpty.wait_for(lock, timeout, [this] { return closed || !items.empty(); });
        return popLocked();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mtx);
        closed = true;
        notEmpty.notify_all();
        notFull.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mtx);
        return closed;
    }

    // Closed and nothing left to receive.
    bool isDrained() const {
        std::lock_guard<std::mutex> lock(mtx);
        return closed && items.empty();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mtx);
        return items.size();
    }

private:
    std::optional<T> popLocked() {
        if (items.empty()) return std::nullopt;
        T value = std::move(items.front());
        items.pop_front();
        notFull.notify_one();
        return value;
    }

    const size_t capacity;
    mutable std::mutex mtx;
    std::condition_variable notEmpty;
    std::condition_variable notFull;
    std::deque<T> items;
    bool closed = false;
};
