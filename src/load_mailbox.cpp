#include "load_mailbox.hpp"

bool LoadMailbox::post(PendingLoad load) {
  std::lock_guard<std::mutex> lk(mu_);
  if (slot_) return false;
  slot_ = std::move(load);
  return true;
}

std::optional<PendingLoad> LoadMailbox::take() {
  std::lock_guard<std::mutex> lk(mu_);
  std::optional<PendingLoad> out;
  out.swap(slot_);
  return out;
}

bool LoadMailbox::pending() const {
  std::lock_guard<std::mutex> lk(mu_);
  return slot_.has_value();
}
