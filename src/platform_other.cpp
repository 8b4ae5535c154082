/**
 * Platform services where no native integration exists
 */

#include "platform.hpp"

#if !defined(_WIN32) && !(defined(__linux__) && !defined(__ANDROID__))

#include "error.hpp"

namespace webframe::platform {

namespace {

class UnsupportedHotkeys : public HotkeySource {
public:
  bool Supported() const override { return false; }
  bool Register(std::uint32_t, const Accelerator&) override { return false; }
  void Unregister(std::uint32_t) override {}
  std::vector<std::uint32_t> Poll() override { return {}; }
};

}  // namespace

std::unique_ptr<HotkeySource> CreateHotkeySource() {
  return std::make_unique<UnsupportedHotkeys>();
}

void ShowNotification(const Notification&) {
  throw Error(ErrorCode::kNotSupported, "notifications are not supported on this platform");
}

}  // namespace webframe::platform

#endif
