// **********************************************************************
// xclk/src/BusMaster.hpp
// **********************************************************************
// xclk maintainers Oct 14 2026
/*
Scripted Wishbone-style initiator, one transaction in flight.  Holds cyc and
the request until ack; with gap == 0 the next request follows back-to-back
(cyc stays high across the ack).  One result record per acked transaction.

   +--- BusMaster ---
   | cyc, adr,      |-->
   | dat_w, we      |-->
   | ack, dat_r     |<--
   +-----------------
*/
#pragma once

#include "Domain.hpp"
#include <cstdint>
#include <vector>

namespace xclk {

class BusMaster : public Component {
  DECLARE_COMPONENT(BusMaster);
public:
  BusMaster(std::string name, Domain& domain, COMPONENT_CTOR);
  Clock(clk);
  Output(bool,     cyc);
  Output(uint32_t, adr);
  Output(uint32_t, dat_w);
  Output(bool,     we);
  Input (bool,     ack);
  Input (uint32_t, dat_r);

  struct Op { bool we; uint32_t addr; uint32_t data; };

  // Result record (one per ack observed)
  struct Ev {
    bool     we;
    uint32_t addr;
    uint32_t data;      // write data, or read data returned with the ack
    uint64_t issue_cyc;
    uint64_t ack_cyc;
    uint64_t issue_ps;
    uint64_t ack_ps;
  };

  // Host helpers to build scripts and inspect results
  void enqueue_write(uint32_t addr, uint32_t data);
  void enqueue_read(uint32_t addr);
  void set_gap(int cycles) { gap_ = cycles < 0 ? 0 : cycles; }
  const std::vector<Ev>& results() const { return results_; }
  bool done() const { return pc_ == script_.size() && !static_cast<bool>(cyc_r); }

private:
  Register(bool,     cyc_r);
  Register(uint32_t, adr_r);
  Register(uint32_t, dat_w_r);
  Register(bool,     we_r);
  Register(uint32_t, wait_r);
  std::vector<Op> script_;
  size_t          pc_        = 0;
  int             gap_       = 0;
  uint64_t        cyc_       = 0;   // own cycle count
  uint64_t        issue_cyc_ = 0;
  uint64_t        issue_ps_  = 0;
  std::vector<Ev> results_;

  void issue(const Op& op);
  void update_out();
  void update_regs();
};

} // namespace xclk
