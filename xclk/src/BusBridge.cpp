// **********************************************************************
// xclk/src/BusBridge.cpp
// **********************************************************************
// xclk maintainers Oct 9 2026
/*
Initiator bookkeeping (both modes):
  issue when cyc rises, or when cyc is still high the cycle after an ack
  (back-to-back transaction).  While outstanding, cyc stays high, cyc_d is high
  and ack_d is low, so nothing new can issue until the ack arrives.
*/
#include "BusBridge.hpp"

namespace xclk {

// ----- sys half -----

BusBridgeSys::BusBridgeSys(std::string /*name*/, Domain& sys, const BridgeParams& params, IMPL_CTOR)
  : addr_mask_(widthMask(params.dev_addr_bits)),
    data_mask_(widthMask(params.dev_data_bits))
{
  clk << sys.clk;
  UPDATE(update_out).reads(cyc).writes(issue, req_adr, req_dat, req_we);
  UPDATE(update_regs).reads(cyc, adr, dat_w, we, done);
}

void BusBridgeSys::reset() {
  issued_    = 0;
  completed_ = 0;
}

BusRequest BusBridgeSys::request() const {
  BusRequest r;
  r.addr  = req_adr_r;
  r.wdata = req_dat_r;
  r.we    = req_we_r;
  return r;
}

bool BusBridgeSys::issue_now() const {
  return cyc && (!static_cast<bool>(cyc_d) || static_cast<bool>(ack_d));
}

void BusBridgeSys::update_out() {
  issue   = issue_now();
  req_adr = static_cast<uint32_t>(req_adr_r);
  req_dat = static_cast<uint32_t>(req_dat_r);
  req_we  = static_cast<bool>(req_we_r);
}

void BusBridgeSys::update_regs() {
  const bool iss = issue_now();
  const bool d   = done;
  assert_always(!(iss && static_cast<bool>(outstanding_r)),
                "BusBridge: new transaction issued while one is outstanding");
  cyc_d = static_cast<bool>(cyc);
  ack_d = d;
  if (iss) {                                   // latch once, hold until the ack
    req_adr_r     = static_cast<uint32_t>(adr) & addr_mask_;
    req_dat_r     = static_cast<uint32_t>(dat_w) & data_mask_;
    req_we_r      = static_cast<bool>(we);
    outstanding_r = true;
    issued_++;
    trace("issue #%llu adr=0x%x we=%d", (unsigned long long)issued_,
          (unsigned)(static_cast<uint32_t>(adr) & addr_mask_), (int)static_cast<bool>(we));
  }
  if (d) {
    outstanding_r = false;
    completed_++;
  }
}

// ----- dev half -----

BusBridgeDev::BusBridgeDev(std::string /*name*/, Domain& dev, const BridgeParams& params, IMPL_CTOR)
  : data_mask_(widthMask(params.dev_data_bits))
{
  clk << dev.clk;
  UPDATE(update_out).writes(cyc_o, hold_o);
  UPDATE(update_regs).reads(start, ack, rdata);
}

void BusBridgeDev::update_out() {
  cyc_o  = static_cast<bool>(cyc_r);
  hold_o = static_cast<uint32_t>(hold_r);
}

void BusBridgeDev::update_regs() {
  const bool a = ack;
  cyc_r = (static_cast<bool>(cyc_r) || static_cast<bool>(start)) && !a; // up on the pulse, down on ack
  if (a) hold_r = static_cast<uint32_t>(rdata) & data_mask_;             // zero-extended on return
}

// ----- assembly -----

const BridgeParams& BusBridge::checkParams(const BridgeParams& params) {
  checkStages(SyncParams{params.stages}, "BusBridge");
  assert_always(params.dev_addr_bits >= 1 && params.dev_addr_bits <= 32,
                "BusBridge: bad address width %d", params.dev_addr_bits);
  assert_always(params.dev_data_bits >= 1 && params.dev_data_bits <= 32,
                "BusBridge: bad data width %d", params.dev_data_bits);
  return params;
}

BusBridge::BusBridge(std::string name, Domain& sys, Domain& dev, bool sync, BridgeParams params, IMPL_CTOR)
  : sync_(requireShared(sys, dev, sync, "BusBridge"))
{
  checkParams(params);
  sys_ = std::make_unique<BusBridgeSys>(name + ".sys", sys, params);
  sys_->cyc   << cyc;
  sys_->adr   << adr;
  sys_->dat_w << dat_w;
  sys_->we    << we;

  if (sync_) {
    wire_ = std::make_unique<BusWire>(name + ".wire", sys, params);
    wire_->cyc       << cyc;
    wire_->adr       << adr;
    wire_->dat_w     << dat_w;
    wire_->we        << we;
    wire_->dev_ack   << dev_ack;
    wire_->dev_dat_r << dev_dat_r;
    sys_->done       << dev_ack;      // same domain: the ack is seen as is
    ack       << wire_->ack;
    dat_r     << wire_->dat_r;
    dev_cyc   << wire_->dev_cyc;
    dev_adr   << wire_->dev_adr;
    dev_dat_w << wire_->dev_dat_w;
    dev_we    << wire_->dev_we;
    return;
  }

  SyncParams sp;
  sp.stages = params.stages;
  req_ps_ = std::make_unique<PulseSync>(name + ".req", sys, dev, sp);
  dev_    = std::make_unique<BusBridgeDev>(name + ".dev", dev, params);
  ack_ps_ = std::make_unique<PulseSync>(name + ".ack", dev, sys, sp);

  req_ps_->i   << sys_->issue;
  dev_->start  << req_ps_->o;
  dev_->ack    << dev_ack;
  dev_->rdata  << dev_dat_r;
  ack_ps_->i   << dev_ack;
  sys_->done   << ack_ps_->o;

  ack       << ack_ps_->o;
  dat_r     << dev_->hold_o;        // stable from the ack until the next issue
  dev_cyc   << dev_->cyc_o;
  dev_adr   << sys_->req_adr;       // stable from issue until the ack
  dev_dat_w << sys_->req_dat;
  dev_we    << sys_->req_we;
}

} // namespace xclk
