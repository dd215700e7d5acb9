#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "support/listener_list.hpp"
#include "support/string_helper.hpp"

namespace uRelay::Test {

using Support::ListenerList;
using Support::StringHelper;

TEST(LISTENERLIST, notifies_in_registration_order) {
  ListenerList<int> listeners;
  std::vector<std::string> calls;
  listeners.add([&calls](int value) {
    calls.push_back("first " + std::to_string(value));
  });
  listeners.add([&calls](int value) {
    calls.push_back("second " + std::to_string(value));
  });
  listeners.notify(7);
  ASSERT_EQ(calls, (std::vector<std::string>{"first 7", "second 7"}));
}

TEST(LISTENERLIST, remove) {
  ListenerList<> listeners;
  int calls = 0;
  uint32_t id = listeners.add([&calls]() { calls++; });
  ASSERT_TRUE(listeners.remove(id));
  ASSERT_FALSE(listeners.remove(id));
  listeners.notify();
  ASSERT_EQ(calls, 0);
  ASSERT_EQ(listeners.size(), 0u);
}

TEST(LISTENERLIST, modification_during_notification) {
  ListenerList<> listeners;
  int first_calls = 0;
  int late_calls = 0;
  uint32_t first = 0;
  first = listeners.add([&]() {
    first_calls++;
    listeners.remove(first);
    listeners.add([&late_calls]() { late_calls++; });
  });
  listeners.notify();
  ASSERT_EQ(first_calls, 1);
  ASSERT_EQ(late_calls, 0);

  listeners.notify();
  ASSERT_EQ(first_calls, 1);
  ASSERT_EQ(late_calls, 1);
}

TEST(STRINGHELPER, split) {
  auto parts = StringHelper::string_split("a,b,,c");
  ASSERT_EQ(parts.size(), 3u);
  ASSERT_EQ(parts.front(), "a");
  ASSERT_EQ(parts.back(), "c");
}

TEST(STRINGHELPER, split_host_port) {
  auto valid = StringHelper::split_host_port("127.0.0.1:1337");
  ASSERT_TRUE(valid);
  ASSERT_EQ(valid->first, "127.0.0.1");
  ASSERT_EQ(valid->second, 1337);

  ASSERT_FALSE(StringHelper::split_host_port("127.0.0.1"));
  ASSERT_FALSE(StringHelper::split_host_port(":1337"));
  ASSERT_FALSE(StringHelper::split_host_port("127.0.0.1:"));
  ASSERT_FALSE(StringHelper::split_host_port("127.0.0.1:0"));
  ASSERT_FALSE(StringHelper::split_host_port("127.0.0.1:70000"));
  ASSERT_FALSE(StringHelper::split_host_port("127.0.0.1:12a"));
}

}  // namespace uRelay::Test
