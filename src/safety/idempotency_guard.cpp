#include "safety/idempotency_guard.h"

#include <utility>

namespace basket_engine {

IdempotencyGuard::Lease::Lease(Lease&& other) noexcept
    : guard_(other.guard_), key_(std::move(other.key_)), token_(other.token_) {
  other.guard_ = nullptr;
}

IdempotencyGuard::Lease& IdempotencyGuard::Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    Release();
    guard_ = other.guard_;
    key_ = std::move(other.key_);
    token_ = other.token_;
    other.guard_ = nullptr;
  }
  return *this;
}

IdempotencyGuard::Lease::~Lease() {
  Release();
}

void IdempotencyGuard::Lease::Release() {
  if (guard_ != nullptr) {
    guard_->Release(key_, token_);
    guard_ = nullptr;
  }
}

IdempotencyGuard::Lease IdempotencyGuard::TryAcquire(const std::string& key,
                                                     std::int64_t now_ms,
                                                     std::string* out_reason) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(key);
  if (it != entries_.end() && it->second.expires_at_ms > now_ms) {
    if (out_reason != nullptr) {
      *out_reason = "operation already in progress: " + key;
    }
    return Lease();
  }
  const std::uint64_t token = next_token_++;
  entries_[key] = Entry{.expires_at_ms = now_ms + ttl_ms_, .token = token};
  return Lease(this, key, token);
}

bool IdempotencyGuard::IsHeld(const std::string& key, std::int64_t now_ms) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(key);
  return it != entries_.end() && it->second.expires_at_ms > now_ms;
}

void IdempotencyGuard::Release(const std::string& key, std::uint64_t token) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(key);
  // TTL 过期后被他人重新获取的键不能由旧租约释放。
  if (it != entries_.end() && it->second.token == token) {
    entries_.erase(it);
  }
}

}  // namespace basket_engine
