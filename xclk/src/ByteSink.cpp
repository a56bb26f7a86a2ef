// **********************************************************************
// xclk/src/ByteSink.cpp
// **********************************************************************
// xclk maintainers Oct 13 2026

#include "ByteSink.hpp"
#include "SimHarness.hpp"

namespace xclk {

ByteSink::ByteSink(std::string /*name*/, Domain& domain, int stall_percent, uint32_t seed, IMPL_CTOR)
  : stall_percent_(stall_percent), rng_(seed)
{
  assert_always(stall_percent_ >= 0 && stall_percent_ < 100, "ByteSink: stall percent %d out of range",
                stall_percent_);
  clk << domain.clk;
  UPDATE(update_out).writes(ready);
  UPDATE(update_regs).reads(item, valid);
}

std::vector<uint8_t> ByteSink::bytes() const {
  std::vector<uint8_t> out;
  out.reserve(received_.size());
  for (const StreamItem& it : received_) out.push_back(it.data);
  return out;
}

void ByteSink::update_out() { ready = !static_cast<bool>(stall); }

void ByteSink::update_regs() {
  cyc_++;
  if (valid && !static_cast<bool>(stall)) {     // same test the producer sees
    const StreamItem it = unpackItem(item);     // 9-bit port word back to byte + marker
    received_.push_back(it);                    // record for the testbench
    if (it.last) records_++;                    // one record per end-of-record marker
    last_recv_cyc_ = cyc_;
    last_recv_ps_  = now_ps();
    trace("got 0x%02x%s", it.data, it.last ? " (last)" : "");
  }
  if (stall_percent_ > 0)                       // roll backpressure for the next cycle
    stall = static_cast<int>(rng_() % 100u) < stall_percent_;
}

} // namespace xclk
