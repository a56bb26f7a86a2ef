// **********************************************************************
// xclk/src/Wiring.cpp
// **********************************************************************
// xclk maintainers Oct 8 2026

#include "Wiring.hpp"

namespace xclk {

// ----- StreamWire -----

StreamWire::StreamWire(std::string /*name*/, Domain& domain, IMPL_CTOR) {
  clk << domain.clk;
  UPDATE(update_fwd).reads(in_item, in_valid).writes(out_item, out_valid);
  UPDATE(update_bwd).reads(out_ready).writes(in_ready);
}

void StreamWire::update_fwd() {
  out_item  = static_cast<uint16_t>(in_item);
  out_valid = static_cast<bool>(in_valid);
}

void StreamWire::update_bwd() { in_ready = static_cast<bool>(out_ready); }

// ----- LevelWire -----

LevelWire::LevelWire(std::string /*name*/, Domain& domain, IMPL_CTOR) {
  clk << domain.clk;
  UPDATE(update).reads(i).writes(o);
}

void LevelWire::update() { o = static_cast<bool>(i); }

// ----- BusWire -----

BusWire::BusWire(std::string /*name*/, Domain& domain, const BridgeParams& params, IMPL_CTOR)
  : addr_mask_(widthMask(params.dev_addr_bits)),
    data_mask_(widthMask(params.dev_data_bits))
{
  clk << domain.clk;
  UPDATE(update_fwd).reads(cyc, adr, dat_w, we).writes(dev_cyc, dev_adr, dev_dat_w, dev_we);
  UPDATE(update_bwd).reads(dev_ack, dev_dat_r).writes(ack, dat_r);
}

void BusWire::update_fwd() {
  dev_cyc   = static_cast<bool>(cyc);
  dev_adr   = static_cast<uint32_t>(adr) & addr_mask_;
  dev_dat_w = static_cast<uint32_t>(dat_w) & data_mask_;
  dev_we    = static_cast<bool>(we);
}

void BusWire::update_bwd() {
  ack   = static_cast<bool>(dev_ack);
  dat_r = static_cast<uint32_t>(dev_dat_r) & data_mask_;  // zero-extended like the bridge's holding register
}

} // namespace xclk
