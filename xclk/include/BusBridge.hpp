// **********************************************************************
// xclk/include/BusBridge.hpp
// **********************************************************************
// xclk maintainers Oct 9 2026
/*
Request/acknowledge register-bus crossing (Wishbone-style), one transaction in flight.

      BusBridgeSys (sys, initiator)                    BusBridgeDev (dev, responder)
  cyc,adr,dat_w,we -->  issue = cyc & (!cyc_d | ack_d)
                        req <= {adr,dat_w,we} ----------------> dev_adr/dat_w/we (read as-is)
                        issue ==== PulseSync req =============> dev_cyc <= (dev_cyc | start) & !dev_ack
  ack   <-------------------------- PulseSync ack <============ dev_ack
  dat_r <-------------------------------------------- hold <= dev_dat_r on dev_ack (read as-is)

Only the two handshake pulses are synchronized.  The request is latched once at
issue and not written again until it completes; the read data holding register
is written only on the responder's ack and held until the next request.  Both
are therefore stable whenever the other domain reads them.

No timeout: a responder that never acks stalls the initiator forever.

sync == true: both sides share one domain and the bridge is plain wiring
(BusWire: no synchronizer registers, no added latency).  The initiator half
still runs for its bookkeeping.
*/
#pragma once

#include "Domain.hpp"
#include "PulseSync.hpp"
#include "Wiring.hpp"
#include "XclkTypes.hpp"
#include <memory>

namespace xclk {

// sys half: issue detection, request latch, bookkeeping
class BusBridgeSys : public Component {
  DECLARE_COMPONENT(BusBridgeSys);
public:
  BusBridgeSys(std::string name, Domain& sys, const BridgeParams& params, COMPONENT_CTOR);
  Clock(clk);
  Input (bool,     cyc);
  Input (uint32_t, adr);
  Input (uint32_t, dat_w);
  Input (bool,     we);
  Input (bool,     done);     // responder ack as seen in sys
  Output(bool,     issue);    // one cycle per new transaction
  Output(uint32_t, req_adr);  // latched request, masked to the responder widths
  Output(uint32_t, req_dat);
  Output(bool,     req_we);

  bool       outstanding() const { return static_cast<bool>(outstanding_r); }
  BusRequest request()     const;
  uint64_t   issued()      const { return issued_; }
  uint64_t   completed()   const { return completed_; }

  void reset();

private:
  const uint32_t addr_mask_;
  const uint32_t data_mask_;
  Register(bool,     cyc_d);
  Register(bool,     ack_d);
  Register(bool,     outstanding_r);
  Register(uint32_t, req_adr_r);
  Register(uint32_t, req_dat_r);
  Register(bool,     req_we_r);
  uint64_t issued_    = 0;
  uint64_t completed_ = 0;

  bool issue_now() const;
  void update_out();
  void update_regs();
};

// dev half: responder cycle and read data holding register
class BusBridgeDev : public Component {
  DECLARE_COMPONENT(BusBridgeDev);
public:
  BusBridgeDev(std::string name, Domain& dev, const BridgeParams& params, COMPONENT_CTOR);
  Clock(clk);
  Input (bool,     start);    // issue pulse as seen in dev
  Input (bool,     ack);      // responder ack
  Input (uint32_t, rdata);    // responder read data
  Output(bool,     cyc_o);
  Output(uint32_t, hold_o);

private:
  const uint32_t data_mask_;
  Register(bool,     cyc_r);
  Register(uint32_t, hold_r);

  void update_out();
  void update_regs();
};

class BusBridge : public Component {
  DECLARE_COMPONENT(BusBridge);
public:
  BusBridge(std::string name, Domain& sys, Domain& dev, bool sync,
            BridgeParams params = BridgeParams(), COMPONENT_CTOR);

  // Initiator side (sys)
  Input (bool,     cyc);
  Input (uint32_t, adr);
  Input (uint32_t, dat_w);
  Input (bool,     we);
  Output(bool,     ack);
  Output(uint32_t, dat_r);

  // Responder side (dev)
  Output(bool,     dev_cyc);
  Output(uint32_t, dev_adr);
  Output(uint32_t, dev_dat_w);
  Output(bool,     dev_we);
  Input (bool,     dev_ack);
  Input (uint32_t, dev_dat_r);

  static const BridgeParams& checkParams(const BridgeParams& params);

  bool       synchronous() const { return sync_; }
  bool       outstanding() const { return sys_->outstanding(); } // sys: issued, ack not seen yet
  BusRequest request()     const { return sys_->request(); }     // last latched request
  uint64_t   issued()      const { return sys_->issued(); }
  uint64_t   completed()   const { return sys_->completed(); }

private:
  const bool sync_;

  std::unique_ptr<BusBridgeSys> sys_;
  // asynchronous mode
  std::unique_ptr<PulseSync>    req_ps_;
  std::unique_ptr<BusBridgeDev> dev_;
  std::unique_ptr<PulseSync>    ack_ps_;
  // synchronous mode
  std::unique_ptr<BusWire>      wire_;
};

} // namespace xclk
