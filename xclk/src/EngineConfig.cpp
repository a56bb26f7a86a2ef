// **********************************************************************
// xclk/src/EngineConfig.cpp
// **********************************************************************
// xclk maintainers Oct 15 2026

#include "EngineConfig.hpp"
#include <cascade/Cascade.hpp>
#include <cstdio>

namespace xclk {

void EngineConfig::check_string(const std::string& s, const char* what) {
  assert_always(!s.empty(), "EngineConfig: empty %s string", what);
  assert_always(s.size() <= kMaxStringLen, "EngineConfig: %s string too long (%u > %u)",
                what, (unsigned)s.size(), (unsigned)kMaxStringLen);
  for (char c : s)             // printable ASCII only
    assert_always(c >= 0x20 && c < 0x7f, "EngineConfig: %s string has non-printable character 0x%02x",
                  what, (unsigned)(unsigned char)c);
}

uint16_t EngineConfig::check_id(int v, const char* what) {
  assert_always(v >= 0 && v <= 0xffff, "EngineConfig: %s 0x%x does not fit 16 bits", what, (unsigned)v);
  return static_cast<uint16_t>(v);
}

EngineConfig& EngineConfig::set_vid(int v) { vid_ = check_id(v, "vid"); present_ |= VID; return *this; }
EngineConfig& EngineConfig::set_pid(int v) { pid_ = check_id(v, "pid"); present_ |= PID; return *this; }

EngineConfig& EngineConfig::set_vendor(const std::string& s) {
  check_string(s, "vendor");
  vendor_ = s;
  present_ |= VENDOR;
  return *this;
}

EngineConfig& EngineConfig::set_product(const std::string& s) {
  check_string(s, "product");
  product_ = s;
  present_ |= PRODUCT;
  return *this;
}

EngineConfig& EngineConfig::set_serial(const std::string& s) {
  check_string(s, "serial");
  serial_ = s;
  present_ |= SERIAL;
  return *this;
}

std::string EngineConfig::describe() const {
  char ids[32];
  std::string out;
  if (has(VID)) { snprintf(ids, sizeof(ids), "vid=%04x ", vid_); out += ids; }
  if (has(PID)) { snprintf(ids, sizeof(ids), "pid=%04x ", pid_); out += ids; }
  if (has(VENDOR))  out += "vendor=\"" + vendor_ + "\" ";
  if (has(PRODUCT)) out += "product=\"" + product_ + "\" ";
  if (has(SERIAL))  out += "serial=\"" + serial_ + "\" ";
  out += no_dfu_rt_ ? "dfu_rt=off" : "dfu_rt=on";
  return out;
}

} // namespace xclk
