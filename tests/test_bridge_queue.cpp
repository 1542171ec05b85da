/**
 * test_bridge_queue.cpp - Bridge queue ordering, overflow and sentinel handling
 */

#include "app/Logger.h"
#include "relay/BridgeQueue.h"
#include <atomic>
#include <cassert>
#include <iostream>
#include <thread>
#include <vector>

void test_fifo_order() {
  BridgeQueue queue(8, BackpressurePolicy::DROP_OLDEST);
  assert(queue.push("a"));
  assert(queue.push("b"));
  assert(queue.push("c"));
  assert(queue.size() == 3);

  assert(queue.pop().payload() == "a");
  assert(queue.pop().payload() == "b");
  assert(queue.pop().payload() == "c");
  assert(queue.size() == 0);

  std::cout << "[PASS] test_fifo_order" << std::endl;
}

void test_drop_oldest_keeps_newest() {
  BridgeQueue queue(3, BackpressurePolicy::DROP_OLDEST);
  for (int i = 0; i < 10; ++i) {
    assert(queue.push(std::to_string(i)));
  }
  assert(queue.size() == 3);
  assert(queue.droppedCount() == 7);

  assert(queue.pop().payload() == "7");
  assert(queue.pop().payload() == "8");
  assert(queue.pop().payload() == "9");

  std::cout << "[PASS] test_drop_oldest_keeps_newest" << std::endl;
}

void test_sentinel_rejects_pushes() {
  BridgeQueue queue(4, BackpressurePolicy::DROP_OLDEST);
  assert(queue.push("frame"));
  assert(queue.pushEndOfInput());
  assert(!queue.pushEndOfInput());
  assert(!queue.push("late"));
  assert(queue.endOfInputQueued());

  BridgeItem first = queue.pop();
  assert(!first.isEndOfInput());
  assert(first.payload() == "frame");
  assert(queue.pop().isEndOfInput());
  assert(queue.size() == 0);

  std::cout << "[PASS] test_sentinel_rejects_pushes" << std::endl;
}

void test_sentinel_bypasses_bound() {
  BridgeQueue queue(2, BackpressurePolicy::DROP_OLDEST);
  assert(queue.push("x"));
  assert(queue.push("y"));
  assert(queue.pushEndOfInput());
  assert(queue.size() == 3);
  assert(queue.droppedCount() == 0);

  std::cout << "[PASS] test_sentinel_bypasses_bound" << std::endl;
}

void test_timed_pop() {
  BridgeQueue queue(2, BackpressurePolicy::DROP_OLDEST);
  auto start = std::chrono::steady_clock::now();
  auto item = queue.pop(std::chrono::milliseconds(50));
  auto waited = std::chrono::steady_clock::now() - start;
  assert(!item);
  assert(waited >= std::chrono::milliseconds(40));

  assert(queue.push("z"));
  item = queue.pop(std::chrono::milliseconds(50));
  assert(item && item->payload() == "z");

  std::cout << "[PASS] test_timed_pop" << std::endl;
}

void test_block_policy_waits_for_consumer() {
  BridgeQueue queue(2, BackpressurePolicy::BLOCK);
  assert(queue.push("0"));
  assert(queue.push("1"));

  std::atomic<bool> pushed{false};
  std::thread producer([&]() {
    assert(queue.push("2"));
    pushed = true;
  });

  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  assert(!pushed);
  assert(queue.pop().payload() == "0");
  producer.join();
  assert(pushed);
  assert(queue.droppedCount() == 0);
  assert(queue.pop().payload() == "1");
  assert(queue.pop().payload() == "2");

  std::cout << "[PASS] test_block_policy_waits_for_consumer" << std::endl;
}

void test_block_policy_released_by_sentinel() {
  BridgeQueue queue(1, BackpressurePolicy::BLOCK);
  assert(queue.push("0"));

  std::atomic<bool> accepted{true};
  std::thread producer([&]() { accepted = queue.push("1"); });
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  assert(queue.pushEndOfInput());
  producer.join();
  assert(!accepted);

  std::cout << "[PASS] test_block_policy_released_by_sentinel" << std::endl;
}

void test_concurrent_order() {
  BridgeQueue queue(64, BackpressurePolicy::BLOCK);
  const int frames = 2000;

  std::thread producer([&]() {
    for (int i = 0; i < frames; ++i) {
      queue.push(std::to_string(i));
    }
    queue.pushEndOfInput();
  });

  int expected = 0;
  while (true) {
    BridgeItem item = queue.pop();
    if (item.isEndOfInput())
      break;
    assert(item.payload() == std::to_string(expected));
    ++expected;
  }
  producer.join();
  assert(expected == frames);

  std::cout << "[PASS] test_concurrent_order" << std::endl;
}

int main() {
  std::cout << "=== BridgeQueue Tests ===" << std::endl;
  Logger::instance().setLevel(LogLevel::ERROR);

  test_fifo_order();
  test_drop_oldest_keeps_newest();
  test_sentinel_rejects_pushes();
  test_sentinel_bypasses_bound();
  test_timed_pop();
  test_block_policy_waits_for_consumer();
  test_block_policy_released_by_sentinel();
  test_concurrent_order();

  std::cout << "\nAll tests passed!" << std::endl;
  return 0;
}
