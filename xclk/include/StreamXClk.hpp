// **********************************************************************
// xclk/include/StreamXClk.hpp
// **********************************************************************
// xclk maintainers Oct 6 2026
/*
Byte-stream crossing, one item in flight, toggle-free 4-phase send/ack handshake.

  StreamXClkIn (in domain)                    StreamXClkOut (out domain)
  ------------------------                    --------------------------
  send <= (send | (in_valid & !in_ready))     send_s = sync(send)
          & !ack_s                            out_valid <= (out_valid & !out_ready)
  ack_s = sync(ack)                                        | (send_s & !send_s_d)
  in_ready <= ack_s & !ack_s_d                ack <= (ack & send_s) | (out_valid & out_ready)

  the item goes straight across; it is held stable by the producer while
  in_valid & !in_ready, which covers the whole time out_valid is set.

in_ready only pulses after the consumer accepted the item and the ack made it
back, so the next item can never overwrite one still in flight.  Throughput is
one item per handshake round trip, whatever the clock rates.

   +--- StreamXClk ----------------------+
-->| in_item                    out_item |-->
-->| in_valid                  out_valid |-->
<--| in_ready                  out_ready |<--
   +-------------------------------------+
*/
#pragma once

#include "Domain.hpp"
#include "LevelSync.hpp"
#include "XclkTypes.hpp"
#include <memory>

namespace xclk {

class StreamXClkIn : public Component {
  DECLARE_COMPONENT(StreamXClkIn);
public:
  StreamXClkIn(std::string name, Domain& in, COMPONENT_CTOR);
  Clock(clk);
  Input (bool, valid);      // producer has an item
  Input (bool, ack_s);      // consumer's ack, synchronized into this domain
  Output(bool, send_o);     // into the send synchronizer
  Output(bool, ready_o);    // one-cycle accept pulse back to the producer

private:
  Register(bool, send);
  Register(bool, ready);
  Register(bool, ack_s_d);

  void update_out();
  void update_regs();
};

class StreamXClkOut : public Component {
  DECLARE_COMPONENT(StreamXClkOut);
public:
  StreamXClkOut(std::string name, Domain& out, COMPONENT_CTOR);
  Clock(clk);
  Input (bool,     send_s);  // producer's send, synchronized into this domain
  Input (bool,     ready);   // consumer ready
  Input (uint16_t, item_i);  // producer's item (stable while in flight)
  Output(bool,     valid_o);
  Output(bool,     ack_o);   // into the ack synchronizer
  Output(uint16_t, item_o);

  uint64_t transfers() const { return transfers_; }

  void reset();

private:
  Register(bool, send_s_d);
  Register(bool, valid);
  Register(bool, ack);
  uint64_t transfers_ = 0;

  void update_out();
  void update_regs();
};

class StreamXClk : public Component {
  DECLARE_COMPONENT(StreamXClk);
public:
  StreamXClk(std::string name, Domain& in, Domain& out, SyncParams params = SyncParams(), COMPONENT_CTOR);
  // ingress (in domain)
  Input (uint16_t, in_item);   // packItem() format
  Input (bool,     in_valid);
  Output(bool,     in_ready);
  // egress (out domain)
  Output(uint16_t, out_item);
  Output(bool,     out_valid);
  Input (bool,     out_ready);

  uint64_t transfers() const { return out_->transfers(); } // accepted at egress

private:
  std::unique_ptr<StreamXClkIn>  in_;
  std::unique_ptr<LevelSync>     send_sync_;  // out domain
  std::unique_ptr<StreamXClkOut> out_;
  std::unique_ptr<LevelSync>     ack_sync_;   // in domain
};

} // namespace xclk
