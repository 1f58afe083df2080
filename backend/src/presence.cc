// ─── VeilProxy — Presence tracking ──────────────────────────────────────

#include "presence.h"

#include <algorithm>

size_t PresenceTracker::join(const std::string &member_id) {
  size_t current = 0;
  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(member_mutex_);
    changed = members_.insert(member_id).second;
    current = members_.size();
  }
  if (changed) publish(current);
  return current;
}

size_t PresenceTracker::leave(const std::string &member_id) {
  size_t current = 0;
  bool changed = false;
  {
    std::lock_guard<std::mutex> lock(member_mutex_);
    changed = members_.erase(member_id) > 0;
    current = members_.size();
  }
  if (changed) publish(current);
  return current;
}

size_t PresenceTracker::count() const {
  std::lock_guard<std::mutex> lock(member_mutex_);
  return members_.size();
}

int PresenceTracker::subscribe(Listener listener) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  int id = next_subscription_id_++;
  listeners_.emplace_back(id, std::move(listener));
  return id;
}

void PresenceTracker::unsubscribe(int subscription_id) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(
      std::remove_if(listeners_.begin(), listeners_.end(),
                     [subscription_id](const std::pair<int, Listener> &entry) {
                       return entry.first == subscription_id;
                     }),
      listeners_.end());
}

void PresenceTracker::publish(size_t count) {
  std::vector<Listener> snapshot;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    snapshot.reserve(listeners_.size());
    for (const auto &entry : listeners_) snapshot.push_back(entry.second);
  }
  for (const auto &listener : snapshot) listener(count);
}
