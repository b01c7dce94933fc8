#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <utility>

namespace basket_engine {

/**
 * @brief 幂等守卫（短 TTL 互斥锁）
 *
 * 以操作身份为键（`cycle`、`bridge_job:<id>`、`submit:<decision_id>`），
 * 同一键同一时刻只允许一个持有者；第二个尝试立即失败，不排队。
 * 持有者崩溃未释放时，TTL 到期后可被重新获取。
 */
class IdempotencyGuard {
 public:
  /// RAII 租约：析构时释放（仅当仍是本租约持有该键时）。
  class Lease {
   public:
    Lease() = default;
    Lease(Lease&& other) noexcept;
    Lease& operator=(Lease&& other) noexcept;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    ~Lease();

    bool valid() const { return guard_ != nullptr; }
    const std::string& key() const { return key_; }
    void Release();

   private:
    friend class IdempotencyGuard;
    Lease(IdempotencyGuard* guard, std::string key, std::uint64_t token)
        : guard_(guard), key_(std::move(key)), token_(token) {}

    IdempotencyGuard* guard_{nullptr};
    std::string key_;
    std::uint64_t token_{0};
  };

  explicit IdempotencyGuard(std::int64_t ttl_ms) : ttl_ms_(ttl_ms) {}

  /**
   * @return 有效租约；键已被未过期的持有者占用时返回无效租约并写入 out_reason
   */
  Lease TryAcquire(const std::string& key, std::int64_t now_ms, std::string* out_reason);

  bool IsHeld(const std::string& key, std::int64_t now_ms) const;

 private:
  struct Entry {
    std::int64_t expires_at_ms{0};
    std::uint64_t token{0};
  };

  void Release(const std::string& key, std::uint64_t token);

  std::int64_t ttl_ms_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  std::uint64_t next_token_{1};
};

}  // namespace basket_engine
