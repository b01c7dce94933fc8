#include "safety/kill_switch.h"

#include <filesystem>
#include <system_error>

namespace basket_engine {

bool KillSwitch::engaged() const {
  if (engaged_.load()) {
    return true;
  }
  if (sentinel_path_.empty()) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::exists(sentinel_path_, ec);
}

bool KillSwitch::Release(std::string* out_error) {
  engaged_.store(false);
  if (sentinel_path_.empty()) {
    return true;
  }
  std::error_code ec;
  std::filesystem::remove(sentinel_path_, ec);
  if (ec) {
    if (out_error != nullptr) {
      *out_error = "删除急停哨兵文件失败: " + ec.message();
    }
    return false;
  }
  return true;
}

}  // namespace basket_engine
