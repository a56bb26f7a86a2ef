// **********************************************************************
// xclk/src/BusChannel.cpp
// **********************************************************************
// xclk maintainers Oct 10 2026

#include "BusChannel.hpp"

namespace xclk {

BusChannel::BusChannel(std::string name, Domain& sys, Domain& dev, bool sync, BridgeParams params, IMPL_CTOR) {
  requireShared(sys, dev, sync, "BusChannel");   // before any child exists
  BusBridge::checkParams(params);

  bus_ = std::make_unique<BusBridge>(name + ".bus", sys, dev, sync, params);
  bus_->cyc       << cyc;
  bus_->adr       << adr;
  bus_->dat_w     << dat_w;
  bus_->we        << we;
  bus_->dev_ack   << dev_ack;
  bus_->dev_dat_r << dev_dat_r;
  ack       << bus_->ack;
  dat_r     << bus_->dat_r;
  dev_cyc   << bus_->dev_cyc;
  dev_adr   << bus_->dev_adr;
  dev_dat_w << bus_->dev_dat_w;
  dev_we    << bus_->dev_we;

  if (sync) {
    irq_wire_ = std::make_unique<LevelWire>(name + ".irq", sys);
    sof_wire_ = std::make_unique<LevelWire>(name + ".sof", sys);
    irq_wire_->i << dev_irq;
    sof_wire_->i << dev_sof;
    irq << irq_wire_->o;
    sof << sof_wire_->o;
    return;
  }

  SyncParams sp;
  sp.stages = params.stages;
  irq_sync_ = std::make_unique<LevelSync>(name + ".irq", sys, sp);   // level into sys
  sof_sync_ = std::make_unique<PulseSync>(name + ".sof", dev, sys, sp); // event dev -> sys
  irq_sync_->i << dev_irq;
  sof_sync_->i << dev_sof;
  irq << irq_sync_->o;
  sof << sof_sync_->o;
}

} // namespace xclk
