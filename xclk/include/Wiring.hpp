// **********************************************************************
// xclk/include/Wiring.hpp
// **********************************************************************
// xclk maintainers Oct 8 2026
/*
Zero-latency stand-ins used when a channel runs synchronously (both sides in
one shared domain).  They hold no registers: every output is a copy of an
input taken in the same cycle.  Forward and backward directions sit in
separate update functions, so a ready that depends on a valid (or the other
way round) downstream never forms a loop here.
*/
#pragma once

#include "Domain.hpp"
#include "XclkTypes.hpp"
#include <cstdint>

namespace xclk {

// ready/valid stream, same port names as StreamXClk
class StreamWire : public Component {
  DECLARE_COMPONENT(StreamWire);
public:
  StreamWire(std::string name, Domain& domain, COMPONENT_CTOR);
  Clock(clk);
  Input (uint16_t, in_item);
  Input (bool,     in_valid);
  Output(bool,     in_ready);
  Output(uint16_t, out_item);
  Output(bool,     out_valid);
  Input (bool,     out_ready);

private:
  void update_fwd();
  void update_bwd();
};

// one level or strobe
class LevelWire : public Component {
  DECLARE_COMPONENT(LevelWire);
public:
  LevelWire(std::string name, Domain& domain, COMPONENT_CTOR);
  Clock(clk);
  Input (bool, i);
  Output(bool, o);

private:
  void update();
};

// register bus, responder widths applied like the asynchronous bridge does
class BusWire : public Component {
  DECLARE_COMPONENT(BusWire);
public:
  BusWire(std::string name, Domain& domain, const BridgeParams& params, COMPONENT_CTOR);
  Clock(clk);
  // initiator side
  Input (bool,     cyc);
  Input (uint32_t, adr);
  Input (uint32_t, dat_w);
  Input (bool,     we);
  Output(bool,     ack);
  Output(uint32_t, dat_r);
  // responder side
  Output(bool,     dev_cyc);
  Output(uint32_t, dev_adr);
  Output(uint32_t, dev_dat_w);
  Output(bool,     dev_we);
  Input (bool,     dev_ack);
  Input (uint32_t, dev_dat_r);

private:
  const uint32_t addr_mask_;
  const uint32_t data_mask_;

  void update_fwd();
  void update_bwd();
};

} // namespace xclk
