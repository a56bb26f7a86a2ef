// **********************************************************************
// xclk/src/SyncFifo.cpp
// **********************************************************************
// xclk maintainers Oct 7 2026

#include "SyncFifo.hpp"
#include <algorithm>

namespace xclk {

int SyncFifo::checkDepth(int depth) {
  assert_always(depth >= 1, "SyncFifo: depth must be >= 1 (got %d)", depth);
  return depth;
}

SyncFifo::SyncFifo(std::string /*name*/, Domain& domain, int depth, IMPL_CTOR)
  : depth_(checkDepth(depth)), mem_(static_cast<size_t>(depth_), 0)
{
  clk << domain.clk;
  UPDATE(update_out).writes(writable, readable, dout);
  UPDATE(update_regs).reads(din, we, re);
}

void SyncFifo::reset() {
  std::fill(mem_.begin(), mem_.end(), 0);
  peak_ = 0;
}

void SyncFifo::update_out() {
  const uint32_t n = count;
  writable = n < static_cast<uint32_t>(depth_); // room for one more
  readable = n > 0;                             // head entry valid
  dout     = mem_[static_cast<uint32_t>(rd)];   // head shows without a read (fall-through)
}

void SyncFifo::update_regs() {
  const uint32_t n    = count;
  const uint32_t d    = static_cast<uint32_t>(depth_);
  const bool     push = we && n < d;    // same test the producer sees through writable
  const bool     pop  = re && n > 0;    // same test the consumer sees through readable
  if (push) {
    const uint32_t w = wr;
    mem_[w] = static_cast<uint16_t>(static_cast<uint16_t>(din) & 0x1ffu); // 9-bit entry
    wr = (w + 1) % d;
  }
  if (pop) rd = (static_cast<uint32_t>(rd) + 1) % d;  // head moves on; entry left as is
  const uint32_t next = n + (push ? 1u : 0u) - (pop ? 1u : 0u);
  count = next;
  if (static_cast<int>(next) > peak_) peak_ = static_cast<int>(next);
}

} // namespace xclk
