#pragma once
// ─── VeilProxy — Presence tracking ──────────────────────────────────────
// Counts connected visitors and publishes every change to subscribers.
// Kept apart from the proxy core; it has its own locks.

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

class PresenceTracker {
 public:
  using Listener = std::function<void(size_t)>;

  // Both return the count after the change and notify listeners when the
  // membership actually changed.
  size_t join(const std::string &member_id);
  size_t leave(const std::string &member_id);
  size_t count() const;

  int subscribe(Listener listener);
  void unsubscribe(int subscription_id);

 private:
  void publish(size_t count);

  mutable std::mutex member_mutex_;
  std::unordered_set<std::string> members_;

  std::mutex listener_mutex_;
  std::vector<std::pair<int, Listener>> listeners_;
  int next_subscription_id_ = 1;
};
