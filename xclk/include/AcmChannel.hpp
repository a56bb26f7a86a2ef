// **********************************************************************
// xclk/include/AcmChannel.hpp
// **********************************************************************
// xclk maintainers Oct 11 2026
/*
Duplex byte-stream channel between a system domain and the device domain that
runs the (opaque) ACM protocol engine.

        sys                                                     dev
  in_*  --> [fin] --> StreamXClk (xin)  ------------------> dev_in_*   --> engine
  out_* <-- [fout] <-- StreamXClk (xout) <----------------- dev_out_*  <-- engine
  in_flush_now/time --------- LevelSync ------------------> dev_flush_now/time
  bootloader_req <----------- PulseSync <------------------ dev_bootloader

  [fin]/[fout] : SyncFifo in the sys domain, only when fifo_depth > 0
  sync == true : one shared domain, crossings replaced by StreamWire/LevelWire

All endpoints follow ready/valid: a transfer happens at an edge where both
valid and ready are high, and valid/item are held until then.  Items are
packItem() words on every port.
*/
#pragma once

#include "Domain.hpp"
#include "LevelSync.hpp"
#include "PulseSync.hpp"
#include "StreamXClk.hpp"
#include "SyncFifo.hpp"
#include "Wiring.hpp"
#include "XclkTypes.hpp"
#include <memory>

namespace xclk {

class AcmChannel : public Component {
  DECLARE_COMPONENT(AcmChannel);
public:
  AcmChannel(std::string name, Domain& sys, Domain& dev, bool sync, int fifo_depth = 0,
             SyncParams params = SyncParams(), COMPONENT_CTOR);

  // ---- system side ----
  Input (uint16_t, in_item);        // sys -> device
  Input (bool,     in_valid);
  Output(bool,     in_ready);
  Input (bool,     in_flush_now);   // flush the engine's buffer ASAP
  Input (bool,     in_flush_time);  // enable the engine's flush timeout

  Output(uint16_t, out_item);       // device -> sys
  Output(bool,     out_valid);
  Input (bool,     out_ready);

  Output(bool,     bootloader_req); // one sys cycle per device request

  // ---- device side (engine facing) ----
  Output(uint16_t, dev_in_item);
  Output(bool,     dev_in_valid);
  Input (bool,     dev_in_ready);

  Input (uint16_t, dev_out_item);
  Input (bool,     dev_out_valid);
  Output(bool,     dev_out_ready);

  Output(bool,     dev_flush_now);
  Output(bool,     dev_flush_time);
  Input (bool,     dev_bootloader);

  static int checkDepth(int fifo_depth);   // >= 0, 0 = unbuffered

  bool synchronous() const { return sync_; }
  bool buffered()    const { return fifo_depth_ > 0; }
  int  fifo_depth()  const { return fifo_depth_; }
  const SyncFifo* fifo_in()  const { return fin_.get(); }
  const SyncFifo* fifo_out() const { return fout_.get(); }

private:
  const bool sync_;
  const int  fifo_depth_;

  std::unique_ptr<SyncFifo>   fin_;
  std::unique_ptr<SyncFifo>   fout_;
  // asynchronous mode
  std::unique_ptr<StreamXClk> xin_;
  std::unique_ptr<StreamXClk> xout_;
  std::unique_ptr<LevelSync>  flush_now_;
  std::unique_ptr<LevelSync>  flush_time_;
  std::unique_ptr<PulseSync>  boot_;
  // synchronous mode
  std::unique_ptr<StreamWire> win_;
  std::unique_ptr<StreamWire> wout_;
  std::unique_ptr<LevelWire>  flush_now_wire_;
  std::unique_ptr<LevelWire>  flush_time_wire_;
  std::unique_ptr<LevelWire>  boot_wire_;
};

} // namespace xclk
