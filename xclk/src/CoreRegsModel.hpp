// **********************************************************************
// xclk/src/CoreRegsModel.hpp
// **********************************************************************
// xclk maintainers Oct 14 2026
/*
Register-bus responder standing in for the device core (dev domain).

  cyc/adr/dat_w/we --> accept --> [latency cycles] --> ack (one cycle), dat_r
  write to kIrqAddr: irq level = (data != 0)
  every sof_period cycles: sof high for one cycle (0 = never)

12-bit word address, 16-bit data.  A request is accepted when cyc is high and
the model is idle; adr/dat_w/we are read once, at accept.
*/
#pragma once

#include "Domain.hpp"
#include <cstdint>
#include <vector>

namespace xclk {

class CoreRegsModel : public Component {
  DECLARE_COMPONENT(CoreRegsModel);
public:
  static constexpr uint32_t kAddrBits = 12;
  static constexpr uint32_t kDataBits = 16;
  static constexpr uint32_t kIrqAddr  = 0xffc;

  CoreRegsModel(std::string name, Domain& domain, int ack_latency = 1, int sof_period = 0, COMPONENT_CTOR);
  Clock(clk);
  Input (bool,     cyc);
  Input (uint32_t, adr);
  Input (uint32_t, dat_w);
  Input (bool,     we);
  Output(bool,     ack);
  Output(uint32_t, dat_r);
  Output(bool,     irq);
  Output(bool,     sof);

  struct Access { bool we; uint32_t addr; uint32_t data; uint64_t cyc; uint64_t ps; };

  // Host backdoor, no bus timing
  void     poke(uint32_t addr, uint16_t v);
  uint16_t peek(uint32_t addr) const;

  const std::vector<Access>& accesses() const { return log_; }
  uint64_t                   sofs()     const { return sofs_; }

private:
  const int             latency_;
  const int             sof_period_;
  std::vector<uint16_t> regs_;
  Register(bool,     busy_r);
  Register(uint32_t, wait_r);
  Register(bool,     ack_r);
  Register(uint32_t, dat_r_r);
  Register(bool,     irq_r);
  Register(bool,     sof_r);
  Register(uint32_t, sof_cnt);
  std::vector<Access>   log_;
  uint64_t              cyc_  = 0;
  uint64_t              sofs_ = 0;

  void update_out();
  void update_regs();
};

} // namespace xclk
