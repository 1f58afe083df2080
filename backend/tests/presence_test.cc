// ─── VeilProxy — Presence tracker tests ─────────────────────────────────

#include "presence.h"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

namespace {

TEST(PresenceTrackerTest, CountsDistinctMembers) {
  PresenceTracker presence;
  EXPECT_EQ(presence.count(), 0u);
  EXPECT_EQ(presence.join("a"), 1u);
  EXPECT_EQ(presence.join("b"), 2u);
  EXPECT_EQ(presence.join("a"), 2u);
  EXPECT_EQ(presence.leave("a"), 1u);
  EXPECT_EQ(presence.leave("missing"), 1u);
  EXPECT_EQ(presence.leave("b"), 0u);
}

TEST(PresenceTrackerTest, NotifiesOnlyOnChange) {
  PresenceTracker presence;
  std::vector<size_t> seen;
  presence.subscribe([&seen](size_t count) { seen.push_back(count); });

  presence.join("a");
  presence.join("a");
  presence.join("b");
  presence.leave("c");
  presence.leave("a");

  EXPECT_EQ(seen, (std::vector<size_t>{1, 2, 1}));
}

TEST(PresenceTrackerTest, UnsubscribedListenerStopsHearing) {
  PresenceTracker presence;
  int first_calls = 0;
  int second_calls = 0;
  int first = presence.subscribe([&first_calls](size_t) { ++first_calls; });
  presence.subscribe([&second_calls](size_t) { ++second_calls; });

  presence.join("a");
  presence.unsubscribe(first);
  presence.join("b");

  EXPECT_EQ(first_calls, 1);
  EXPECT_EQ(second_calls, 2);
}

TEST(PresenceTrackerTest, ListenerMayReadCount) {
  PresenceTracker presence;
  size_t observed = 0;
  presence.subscribe([&presence, &observed](size_t) { observed = presence.count(); });
  presence.join("a");
  EXPECT_EQ(observed, 1u);
}

TEST(PresenceTrackerTest, ConcurrentJoinsAndLeaves) {
  PresenceTracker presence;
  std::vector<std::thread> workers;
  for (int t = 0; t < 8; ++t) {
    workers.emplace_back([&presence, t] {
      for (int i = 0; i < 200; ++i) {
        const std::string id = std::to_string(t) + ":" + std::to_string(i);
        presence.join(id);
        if (i % 2 == 0) presence.leave(id);
      }
    });
  }
  for (auto &worker : workers) worker.join();
  EXPECT_EQ(presence.count(), 8u * 100u);
}

}  // namespace
