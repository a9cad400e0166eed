#include "util/queues.hpp"

#include <compositor/host_event.hpp>

#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace polarbear;
using polarbear::util::SPSCQueue;

TEST_CASE("SPSCQueue requires a power-of-two capacity", "[queues]") {
    REQUIRE(SPSCQueue<int>(8).capacity() == 8);
    REQUIRE(SPSCQueue<int>(1).capacity() == 1);
    REQUIRE_THROWS_AS(SPSCQueue<int>(0), std::invalid_argument);
    REQUIRE_THROWS_AS(SPSCQueue<int>(12), std::invalid_argument);
}

TEST_CASE("SPSCQueue is FIFO and bounded", "[queues]") {
    SPSCQueue<int> queue(4);
    REQUIRE(queue.empty());

    for (int i = 0; i < 4; ++i) {
        REQUIRE(queue.try_push(i));
    }
    REQUIRE(queue.size() == 4);
    REQUIRE_FALSE(queue.try_push(99));
    REQUIRE_FALSE(queue.try_push(100));
    REQUIRE(queue.rejected() == 2);

    for (int i = 0; i < 4; ++i) {
        auto item = queue.try_pop();
        REQUIRE(item.has_value());
        REQUIRE(*item == i);
    }
    REQUIRE_FALSE(queue.try_pop().has_value());
    REQUIRE(queue.empty());
}

TEST_CASE("SPSCQueue wraps around its buffer", "[queues]") {
    SPSCQueue<int> queue(2);
    for (int round = 0; round < 50; ++round) {
        REQUIRE(queue.try_push(round));
        REQUIRE(queue.try_push(round + 1000));
        REQUIRE(queue.try_pop().value() == round);
        REQUIRE(queue.try_pop().value() == round + 1000);
    }
}

TEST_CASE("SPSCQueue drain stops at the limit", "[queues]") {
    SPSCQueue<int> queue(8);
    for (int i = 0; i < 6; ++i) {
        REQUIRE(queue.try_push(i));
    }

    std::vector<int> seen;
    REQUIRE(queue.drain(4, [&seen](int value) { seen.push_back(value); }) == 4);
    REQUIRE(seen == std::vector<int>{0, 1, 2, 3});
    REQUIRE(queue.size() == 2);

    REQUIRE(queue.drain(10, [&seen](int value) { seen.push_back(value); }) == 2);
    REQUIRE(seen.size() == 6);
    REQUIRE(queue.drain(10, [](int) {}) == 0);
}

TEST_CASE("SPSCQueue moves and destroys owned items", "[queues]") {
    auto tracker = std::make_shared<int>(1);
    {
        SPSCQueue<std::shared_ptr<int>> queue(4);
        REQUIRE(queue.try_push(tracker));
        REQUIRE(queue.try_push(std::shared_ptr<int>(tracker)));
        REQUIRE(tracker.use_count() == 3);
        auto popped = queue.try_pop();
        REQUIRE(popped.has_value());
        REQUIRE(tracker.use_count() == 3);
    }
    REQUIRE(tracker.use_count() == 1);
}

TEST_CASE("SPSCQueue carries host events across threads in order", "[queues]") {
    constexpr uint64_t count = 10000;
    SPSCQueue<compositor::HostEvent> queue(256);

    std::thread producer([&queue] {
        for (uint64_t i = 1; i <= count; ++i) {
            compositor::HostEvent event{};
            event.type = compositor::HostEventType::vsync;
            event.vsync_ns = i;
            while (!queue.try_push(event)) {
                std::this_thread::yield();
            }
        }
    });

    uint64_t expected = 1;
    while (expected <= count) {
        if (auto event = queue.try_pop()) {
            REQUIRE(event->type == compositor::HostEventType::vsync);
            REQUIRE(event->vsync_ns == expected);
            ++expected;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();
    REQUIRE(queue.empty());
}
