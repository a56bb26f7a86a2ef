// **********************************************************************
// xclk/src/CoreRegsModel.cpp
// **********************************************************************
// xclk maintainers Oct 14 2026

#include "CoreRegsModel.hpp"
#include "SimHarness.hpp"

namespace xclk {

CoreRegsModel::CoreRegsModel(std::string /*name*/, Domain& domain, int ack_latency, int sof_period, IMPL_CTOR)
  : latency_(ack_latency), sof_period_(sof_period), regs_(1u << kAddrBits, 0)
{
  assert_always(latency_ >= 1, "CoreRegsModel in %s: ack latency must be >= 1 (got %d)",
                domain.name().c_str(), latency_);
  assert_always(sof_period_ >= 0, "CoreRegsModel in %s: negative sof period", domain.name().c_str());
  clk << domain.clk;
  UPDATE(update_out).writes(ack, dat_r, irq, sof);
  UPDATE(update_regs).reads(cyc, adr, dat_w, we);
}

void CoreRegsModel::poke(uint32_t addr, uint16_t v) {
  regs_[addr & ((1u << kAddrBits) - 1)] = v;
}

uint16_t CoreRegsModel::peek(uint32_t addr) const {
  return regs_[addr & ((1u << kAddrBits) - 1)];
}

void CoreRegsModel::update_out() {
  ack   = static_cast<bool>(ack_r);
  dat_r = static_cast<uint32_t>(dat_r_r);
  irq   = static_cast<bool>(irq_r);
  sof   = static_cast<bool>(sof_r);
}

void CoreRegsModel::update_regs() {
  cyc_++;
  // Start-of-frame tick, independent of the bus
  if (sof_period_ > 0) {
    const uint32_t n    = sof_cnt;
    const bool     fire = n + 1 >= static_cast<uint32_t>(sof_period_);
    sof_cnt = fire ? 0u : n + 1;
    sof_r   = fire;
    if (fire) sofs_++;
  }

  if (ack_r) {                // ack seen this edge: transaction over
    ack_r  = false;
    busy_r = false;
    return;
  }

  if (busy_r) {               // count out the latency, then ack
    const uint32_t w = wait_r;
    if (w > 0) wait_r = w - 1;
    else       ack_r  = true;
    return;
  }

  if (!cyc) return;           // idle

  Access a{};
  a.we   = we;
  a.addr = static_cast<uint32_t>(adr) & ((1u << kAddrBits) - 1);
  a.data = static_cast<uint32_t>(dat_w) & ((1u << kDataBits) - 1);
  a.cyc  = cyc_;
  a.ps   = now_ps();

  if (a.we) {
    regs_[a.addr] = static_cast<uint16_t>(a.data);
    if (a.addr == kIrqAddr) irq_r = a.data != 0;   // irq follows the last write
  } else {
    a.data = regs_[a.addr];
  }
  dat_r_r = a.data;
  log_.push_back(a);
  trace("%s 0x%03x = 0x%04x", a.we ? "wr" : "rd", a.addr, a.data);

  busy_r = true;
  wait_r = static_cast<uint32_t>(latency_ - 1);
}

} // namespace xclk
