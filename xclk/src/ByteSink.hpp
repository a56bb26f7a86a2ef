// **********************************************************************
// xclk/src/ByteSink.hpp
// **********************************************************************
// xclk maintainers Oct 13 2026
/*
Recording stream consumer.  With stall_percent > 0, ready is dropped at random
(seeded, so runs repeat) on that share of cycles to exercise backpressure.
ready comes out of a register (ready = !stall), so it is high out of reset.
*/
#pragma once

#include "Domain.hpp"
#include "XclkTypes.hpp"
#include <random>
#include <vector>

namespace xclk {

class ByteSink : public Component {
  DECLARE_COMPONENT(ByteSink);
public:
  ByteSink(std::string name, Domain& domain, int stall_percent = 0, uint32_t seed = 1, COMPONENT_CTOR);
  Clock(clk);
  Input (uint16_t, item);
  Input (bool,     valid);
  Output(bool,     ready);

  const std::vector<StreamItem>& received() const { return received_; }
  std::vector<uint8_t>           bytes()    const;
  size_t   records()       const { return records_; }       // items carrying the last marker
  uint64_t last_recv_cyc() const { return last_recv_cyc_; }
  uint64_t last_recv_ps()  const { return last_recv_ps_; }
  void     clear()               { received_.clear(); records_ = 0; }

private:
  const int    stall_percent_;
  std::mt19937 rng_;
  Register(bool, stall);
  std::vector<StreamItem> received_;
  size_t   records_       = 0;
  uint64_t cyc_           = 0;
  uint64_t last_recv_cyc_ = 0;
  uint64_t last_recv_ps_  = 0;

  void update_out();
  void update_regs();
};

} // namespace xclk
