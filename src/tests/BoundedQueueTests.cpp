// SPDX-License-Identifier: Apache-2.0
#include <core/BoundedQueue.hpp>

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <optional>
#include <thread>

using namespace talktype;

TEST_CASE("BoundedQueue hands out elements in FIFO order", "[queue]")
{
    auto queue = BoundedQueue<int>(4);
    CHECK(queue.push(1).accepted);
    CHECK(queue.push(2).accepted);
    CHECK(queue.push(3).accepted);
    CHECK(queue.size() == 3);

    CHECK(queue.tryPop() == 1);
    CHECK(queue.tryPop() == 2);
    CHECK(queue.tryPop() == 3);
    CHECK(queue.tryPop() == std::nullopt);
    CHECK(queue.empty());
}

TEST_CASE("BoundedQueue drops the oldest element when full", "[queue]")
{
    auto queue = BoundedQueue<int>(2);
    CHECK(!queue.push(1).dropped.has_value());
    CHECK(!queue.push(2).dropped.has_value());

    auto const outcome = queue.push(3);
    CHECK(outcome.accepted);
    REQUIRE(outcome.dropped.has_value());
    CHECK(*outcome.dropped == 1);

    CHECK(queue.size() == 2);
    CHECK(queue.tryPop() == 2);
    CHECK(queue.tryPop() == 3);
}

TEST_CASE("BoundedQueue treats capacity 0 as 1", "[queue]")
{
    auto queue = BoundedQueue<int>(0);
    CHECK(queue.capacity() == 1);
    CHECK(queue.push(1).accepted);
    CHECK(queue.push(2).dropped == 1);
}

TEST_CASE("BoundedQueue rejects pushes after close but drains what it holds", "[queue]")
{
    auto queue = BoundedQueue<int>(4);
    CHECK(queue.push(1).accepted);
    queue.close();

    CHECK(queue.closed());
    CHECK(!queue.push(2).accepted);

    auto const stop = std::stop_source {};
    CHECK(queue.pop(stop.get_token()) == 1);
    CHECK(queue.pop(stop.get_token()) == std::nullopt);
}

TEST_CASE("BoundedQueue::pop wakes up when an element arrives", "[queue]")
{
    auto queue = BoundedQueue<int>(4);
    auto received = std::optional<int> {};

    auto consumer = std::jthread([&](const std::stop_token& token) { received = queue.pop(token); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    CHECK(queue.push(42).accepted);
    consumer.join();

    CHECK(received == 42);
}

TEST_CASE("BoundedQueue::pop returns nothing when a stop is requested", "[queue]")
{
    auto queue = BoundedQueue<int>(4);
    auto received = std::optional<int> { 0 };

    auto consumer = std::jthread([&](const std::stop_token& token) { received = queue.pop(token); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    consumer.request_stop();
    consumer.join();

    CHECK(received == std::nullopt);
}

TEST_CASE("BoundedQueue::reopen discards old elements and accepts pushes again", "[queue]")
{
    auto queue = BoundedQueue<int>(4);
    CHECK(queue.push(1).accepted);
    queue.close();
    queue.reopen();

    CHECK(!queue.closed());
    CHECK(queue.empty());
    CHECK(queue.push(2).accepted);
    CHECK(queue.tryPop() == 2);
}

TEST_CASE("BoundedQueue::clear reports the number of discarded elements", "[queue]")
{
    auto queue = BoundedQueue<int>(4);
    CHECK(queue.push(1).accepted);
    CHECK(queue.push(2).accepted);
    CHECK(queue.clear() == 2);
    CHECK(queue.empty());
}
