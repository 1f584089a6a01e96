// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stop_token>

namespace talktype
{

/// @brief Outcome of BoundedQueue::push().
template <typename T>
struct PushOutcome
{
    /// False if the queue was closed; the value was not enqueued.
    bool accepted = false;

    /// The oldest element, if it had to be evicted to make room.
    std::optional<T> dropped;
};

/// @brief Thread-safe FIFO with a fixed capacity and a drop-oldest overflow policy.
///
/// Producers never block: pushing into a full queue evicts the oldest element and hands it back
/// to the caller. Consumers block in pop() until an element arrives, the queue is closed, or
/// the stop token fires. A closed queue still hands out the elements it holds.
template <typename T>
class BoundedQueue
{
  public:
    explicit BoundedQueue(std::size_t capacity): _capacity(capacity == 0 ? 1 : capacity) {}

    BoundedQueue(const BoundedQueue&) = delete;
    BoundedQueue& operator=(const BoundedQueue&) = delete;

    auto push(T value) -> PushOutcome<T>
    {
        auto outcome = PushOutcome<T> {};
        {
            auto lock = std::lock_guard(_mutex);
            if (_closed)
                return outcome;

            if (_queue.size() >= _capacity)
            {
                outcome.dropped = std::move(_queue.front());
                _queue.pop_front();
            }
            _queue.push_back(std::move(value));
            outcome.accepted = true;
        }
        _cv.notify_one();
        return outcome;
    }

    /// @brief Blocks until an element is available.
    /// @return The front element, or std::nullopt if the queue is closed and empty or a stop was requested.
    [[nodiscard]] auto pop(const std::stop_token& stopToken) -> std::optional<T>
    {
        auto lock = std::unique_lock(_mutex);
        _cv.wait(lock, stopToken, [this] { return !_queue.empty() || _closed; });

        if (stopToken.stop_requested() || _queue.empty())
            return std::nullopt;

        auto value = std::move(_queue.front());
        _queue.pop_front();
        return value;
    }

    [[nodiscard]] auto tryPop() -> std::optional<T>
    {
        auto lock = std::lock_guard(_mutex);
        if (_queue.empty())
            return std::nullopt;

        auto value = std::move(_queue.front());
        _queue.pop_front();
        return value;
    }

    /// @brief Rejects further pushes and wakes all waiting consumers.
    void close()
    {
        {
            auto lock = std::lock_guard(_mutex);
            _closed = true;
        }
        _cv.notify_all();
    }

    /// @brief Discards all elements and accepts pushes again.
    void reopen()
    {
        auto lock = std::lock_guard(_mutex);
        _queue.clear();
        _closed = false;
    }

    /// @brief Discards all queued elements.
    /// @return The number of discarded elements.
    auto clear() -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        auto const count = _queue.size();
        _queue.clear();
        return count;
    }

    [[nodiscard]] auto size() const -> std::size_t
    {
        auto lock = std::lock_guard(_mutex);
        return _queue.size();
    }

    [[nodiscard]] auto empty() const -> bool { return size() == 0; }

    [[nodiscard]] auto closed() const -> bool
    {
        auto lock = std::lock_guard(_mutex);
        return _closed;
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return _capacity; }

  private:
    std::size_t const _capacity;
    mutable std::mutex _mutex;
    std::condition_variable_any _cv;
    std::deque<T> _queue;
    bool _closed = false;
};

} // namespace talktype
