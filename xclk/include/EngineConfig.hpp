// **********************************************************************
// xclk/include/EngineConfig.hpp
// **********************************************************************
// xclk maintainers Oct 15 2026
/*
Per-instance customization of the device-side ACM protocol engine.  Every
identity field is optional; an absent field means "keep the engine default".
Setters validate their argument (assert_always) and leave the config
untouched when they throw.
*/
#pragma once

#include <cstdint>
#include <string>

namespace xclk {

class EngineConfig {
public:
  enum Field : uint32_t {
    VID     = 1u << 0,
    PID     = 1u << 1,
    VENDOR  = 1u << 2,
    PRODUCT = 1u << 3,
    SERIAL  = 1u << 4,
  };

  static constexpr size_t kMaxStringLen = 126; // UTF-16 payload of a 254-byte string descriptor

  EngineConfig& set_vid(int v);   // 0x0000..0xffff
  EngineConfig& set_pid(int v);
  EngineConfig& set_vendor(const std::string& s);
  EngineConfig& set_product(const std::string& s);
  EngineConfig& set_serial(const std::string& s);
  EngineConfig& set_no_dfu_rt(bool v) { no_dfu_rt_ = v; return *this; }

  bool has(Field f) const { return (present_ & f) != 0; }
  uint32_t present() const { return present_; }

  uint16_t           vid()       const { return vid_; }
  uint16_t           pid()       const { return pid_; }
  const std::string& vendor()    const { return vendor_; }
  const std::string& product()   const { return product_; }
  const std::string& serial()    const { return serial_; }
  bool               no_dfu_rt() const { return no_dfu_rt_; } // DFU runtime interface removed

  std::string describe() const;

private:
  static void     check_string(const std::string& s, const char* what);
  static uint16_t check_id(int v, const char* what);

  uint32_t    present_   = 0;
  uint16_t    vid_       = 0;
  uint16_t    pid_       = 0;
  std::string vendor_;
  std::string product_;
  std::string serial_;
  bool        no_dfu_rt_ = false;
};

} // namespace xclk
