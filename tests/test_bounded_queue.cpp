#include "catch2/catch.hpp"
#include "../inc/bounded_queue.h"
#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("Queue hands out items in FIFO order", "[bounded_queue]") {
  BoundedQueue<std::string> queue;
  REQUIRE(queue.push("a"));
  REQUIRE(queue.push("b"));
  REQUIRE(queue.push("c"));
  CHECK(queue.size() == 3);

  std::string item;
  REQUIRE(queue.try_pop(item));
  CHECK(item == "a");
  REQUIRE(queue.pop_for(item, 10ms) == QueueStatus::ok);
  CHECK(item == "b");
  REQUIRE(queue.pop(item) == QueueStatus::ok);
  CHECK(item == "c");
  CHECK_FALSE(queue.try_pop(item));
}

TEST_CASE("Timed pop returns on timeout when nothing arrives",
          "[bounded_queue]") {
  BoundedQueue<int> queue(4);
  int item = 0;
  auto start = std::chrono::steady_clock::now();
  CHECK(queue.pop_for(item, 20ms) == QueueStatus::timeout);
  CHECK(std::chrono::steady_clock::now() - start >= 20ms);
}

TEST_CASE("Full queue blocks producers until a consumer makes room",
          "[bounded_queue]") {
  BoundedQueue<int> queue(2);
  REQUIRE(queue.push(1));
  REQUIRE(queue.push(2));

  std::atomic<bool> pushed{false};
  std::thread producer([&]() {
    pushed = queue.push(3);
  });

  std::this_thread::sleep_for(50ms);
  CHECK_FALSE(pushed.load());

  int item = 0;
  REQUIRE(queue.try_pop(item));
  CHECK(item == 1);
  producer.join();
  CHECK(pushed.load());
  CHECK(queue.size() == 2);
}

TEST_CASE("Closing wakes consumers and refuses producers",
          "[bounded_queue]") {
  BoundedQueue<int> queue(1);

  SECTION("Blocked consumer") {
    QueueStatus status = QueueStatus::ok;
    std::thread consumer([&]() {
      int item = 0;
      status = queue.pop(item);
    });
    std::this_thread::sleep_for(20ms);
    queue.close();
    consumer.join();
    CHECK(status == QueueStatus::closed);
  }

  SECTION("Blocked producer") {
    REQUIRE(queue.push(1));
    bool accepted = true;
    std::thread producer([&]() { accepted = queue.push(2); });
    std::this_thread::sleep_for(20ms);
    queue.close();
    producer.join();
    CHECK_FALSE(accepted);
  }

  SECTION("Remaining items are drained first") {
    REQUIRE(queue.push(7));
    queue.close();
    CHECK(queue.closed());
    CHECK_FALSE(queue.push(8));

    int item = 0;
    CHECK(queue.pop_for(item, 10ms) == QueueStatus::ok);
    CHECK(item == 7);
    CHECK(queue.pop_for(item, 10ms) == QueueStatus::closed);
  }
}
