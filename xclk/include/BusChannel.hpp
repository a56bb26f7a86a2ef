// **********************************************************************
// xclk/include/BusChannel.hpp
// **********************************************************************
// xclk maintainers Oct 10 2026
/*
Register-bus channel to a device core running in its own domain.

        sys                                         dev
  cyc/adr/dat_w/we/ack/dat_r <==== BusBridge ====> dev_* (core register bus)
  irq <-------------------------- LevelSync <--- dev_irq
  sof <-------------------------- PulseSync <--- dev_sof   (start-of-frame event)

sync == true: one shared domain, everything is wiring.
*/
#pragma once

#include "BusBridge.hpp"
#include "Domain.hpp"
#include "LevelSync.hpp"
#include "PulseSync.hpp"
#include "Wiring.hpp"
#include <memory>

namespace xclk {

class BusChannel : public Component {
  DECLARE_COMPONENT(BusChannel);
public:
  BusChannel(std::string name, Domain& sys, Domain& dev, bool sync,
             BridgeParams params = BridgeParams(), COMPONENT_CTOR);

  // ---- system side ----
  Input (bool,     cyc);
  Input (uint32_t, adr);
  Input (uint32_t, dat_w);
  Input (bool,     we);
  Output(bool,     ack);
  Output(uint32_t, dat_r);
  Output(bool,     irq);        // level, as seen in sys
  Output(bool,     sof);        // one sys cycle per device frame

  // ---- device side ----
  Output(bool,     dev_cyc);
  Output(uint32_t, dev_adr);
  Output(uint32_t, dev_dat_w);
  Output(bool,     dev_we);
  Input (bool,     dev_ack);
  Input (uint32_t, dev_dat_r);
  Input (bool,     dev_irq);
  Input (bool,     dev_sof);

  const BusBridge& bus() const { return *bus_; }
  bool synchronous()     const { return bus_->synchronous(); }

private:
  std::unique_ptr<BusBridge> bus_;
  // asynchronous mode
  std::unique_ptr<LevelSync> irq_sync_;
  std::unique_ptr<PulseSync> sof_sync_;
  // synchronous mode
  std::unique_ptr<LevelWire> irq_wire_;
  std::unique_ptr<LevelWire> sof_wire_;
};

} // namespace xclk
