// **********************************************************************
// xclk/src/BusMaster.cpp
// **********************************************************************
// xclk maintainers Oct 14 2026

#include "BusMaster.hpp"
#include "SimHarness.hpp"

namespace xclk {

BusMaster::BusMaster(std::string /*name*/, Domain& domain, IMPL_CTOR) {
  clk << domain.clk;
  UPDATE(update_out).writes(cyc, adr, dat_w, we);
  UPDATE(update_regs).reads(ack, dat_r);
}

void BusMaster::enqueue_write(uint32_t addr, uint32_t data) {
  script_.push_back(Op{true, addr, data});
}

void BusMaster::enqueue_read(uint32_t addr) {
  script_.push_back(Op{false, addr, 0u});
}

void BusMaster::issue(const Op& op) {
  cyc_r   = true;
  adr_r   = op.addr;
  dat_w_r = op.data;
  we_r    = op.we;
  issue_cyc_ = cyc_;
  issue_ps_  = now_ps();
}

void BusMaster::update_out() {
  cyc   = static_cast<bool>(cyc_r);
  adr   = static_cast<uint32_t>(adr_r);
  dat_w = static_cast<uint32_t>(dat_w_r);
  we    = static_cast<bool>(we_r);
}

void BusMaster::update_regs() {
  cyc_++;
  if (cyc_r) {                            // *** transaction on the bus ***
    if (!ack) return;                     // hold the request

    Ev e{};
    e.we        = we_r;
    e.addr      = adr_r;
    e.data      = e.we ? static_cast<uint32_t>(dat_w_r) : static_cast<uint32_t>(dat_r);
    e.issue_cyc = issue_cyc_;
    e.ack_cyc   = cyc_;
    e.issue_ps  = issue_ps_;
    e.ack_ps    = now_ps();
    results_.push_back(e);                // one record per ack
    trace("%s 0x%03x = 0x%08x (%llu cycles)", e.we ? "wr" : "rd",
          e.addr, e.data, (unsigned long long)(e.ack_cyc - e.issue_cyc));

    if (gap_ == 0 && pc_ < script_.size()) { // back-to-back: cyc stays high
      issue(script_[pc_++]);
      return;
    }
    cyc_r  = false;                       // drop cyc for at least one cycle
    wait_r = static_cast<uint32_t>(gap_); // then idle out the gap
    return;
  }

  const uint32_t w = wait_r;
  if (w > 0) {                            // idle between transactions
    wait_r = w - 1;
    return;
  }
  if (pc_ < script_.size()) issue(script_[pc_++]); // *** idle: start the next scripted op ***
}

} // namespace xclk
