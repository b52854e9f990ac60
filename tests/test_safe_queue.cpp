#include <doctest/doctest.h>

#include "safe_queue.hpp"

#include <string>
#include <thread>
#include <utility>

TEST_CASE("safe queue keeps insertion order") {
    SafeQueue<std::pair<std::string, std::string>> queue;
    CHECK_FALSE(queue.tryPop().has_value());

    queue.emplace("a", "1");
    queue.emplace("b", "2");

    CHECK(queue.tryPop()->first == "a");
    CHECK(queue.tryPop()->second == "2");
    CHECK_FALSE(queue.tryPop().has_value());
}

TEST_CASE("safe queue hands items across threads") {
    SafeQueue<int> queue;
    std::thread producer([&queue] {
        for (int i = 0; i < 1000; ++i) {
            queue.emplace(i);
        }
    });

    int expected = 0;
    while (expected < 1000) {
        if (auto item = queue.tryPop()) {
            CHECK(*item == expected);
            ++expected;
        } else {
            std::this_thread::yield();
        }
    }
    producer.join();
    CHECK_FALSE(queue.tryPop().has_value());
}
