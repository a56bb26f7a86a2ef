// **********************************************************************
// xclk/include/XclkTypes.hpp
// **********************************************************************
// xclk maintainers Oct 3 2026
/*
Payload and parameter types shared by the crossing primitives.

Stream items travel on ports as 9-bit words (packItem); the host-side models
speak StreamItem.
*/
#pragma once

#include <cstdint>

namespace xclk {

// One stream item: a byte plus its end-of-record marker.
struct StreamItem {
  uint8_t data = 0;
  bool    last = false;
};

inline bool operator==(const StreamItem& a, const StreamItem& b) { return a.data == b.data && a.last == b.last; }
inline bool operator!=(const StreamItem& a, const StreamItem& b) { return !(a == b); }

// 9-bit FIFO entry: bits 0..7 data, bit 8 end-of-record
inline uint16_t packItem(const StreamItem& it) {
  return static_cast<uint16_t>(it.data | (it.last ? 0x100u : 0u));
}
inline StreamItem unpackItem(uint16_t v) {
  StreamItem it;
  it.data = static_cast<uint8_t>(v & 0xffu);
  it.last = (v & 0x100u) != 0;
  return it;
}

// Register-bus request as latched by the initiator half.  Built once at issue
// time and never modified until the matching acknowledge, so the responder
// domain may read it without per-bit sync.
struct BusRequest {
  uint32_t addr  = 0;
  uint32_t wdata = 0;
  bool     we    = false;
};

constexpr int kMaxStages = 4; // longest synchronizer chain a half carries

struct SyncParams {
  int stages = 2; // synchronizer registers on the receiving side (2..kMaxStages)
};

struct BridgeParams {
  int stages        = 2;  // per handshake direction
  int dev_addr_bits = 12; // responder address width
  int dev_data_bits = 16; // responder data width (read data zero-extended on return)
};

inline uint32_t widthMask(int bits) {
  return bits >= 32 ? 0xffffffffu : ((1u << bits) - 1u);
}

} // namespace xclk
