// **********************************************************************
// xclk/src/StreamXClk.cpp
// **********************************************************************
// xclk maintainers Oct 6 2026

#include "StreamXClk.hpp"

namespace xclk {

// ----- in half -----

StreamXClkIn::StreamXClkIn(std::string /*name*/, Domain& in, IMPL_CTOR) {
  clk << in.clk;
  UPDATE(update_out).writes(send_o, ready_o);
  UPDATE(update_regs).reads(valid, ack_s);
}

void StreamXClkIn::update_out() {
  send_o  = static_cast<bool>(send);
  ready_o = static_cast<bool>(ready);
}

void StreamXClkIn::update_regs() {
  const bool v  = valid;
  const bool a  = ack_s;
  const bool rd = ready;
  send    = (static_cast<bool>(send) || (v && !rd)) && !a; // raise for a new item, drop on ack
  ready   = a && !static_cast<bool>(ack_s_d);                  // ack rose: the item is taken
  ack_s_d = a;
}

// ----- out half -----

StreamXClkOut::StreamXClkOut(std::string /*name*/, Domain& out, IMPL_CTOR) {
  clk << out.clk;
  UPDATE(update_out).reads(item_i).writes(valid_o, ack_o, item_o);
  UPDATE(update_regs).reads(send_s, ready);
}

void StreamXClkOut::reset() { transfers_ = 0; }

void StreamXClkOut::update_out() {
  valid_o = static_cast<bool>(valid);
  ack_o   = static_cast<bool>(ack);
  item_o  = static_cast<uint16_t>(item_i);
}

void StreamXClkOut::update_regs() {
  const bool s    = send_s;
  const bool r    = ready;
  const bool v    = valid;
  const bool take = v && r;                                         // consumer accepts this edge
  valid    = (v && !r) || (s && !static_cast<bool>(send_s_d));  // hold, or new send seen
  ack      = (static_cast<bool>(ack) && s) || take;                 // ack until send drops
  send_s_d = s;
  if (take) transfers_++;
}

// ----- assembly -----

StreamXClk::StreamXClk(std::string name, Domain& in, Domain& out, SyncParams params, IMPL_CTOR) {
  checkStages(params, "StreamXClk");
  in_        = std::make_unique<StreamXClkIn>(name + ".in", in);
  send_sync_ = std::make_unique<LevelSync>(name + ".send_sync", out, params);
  out_       = std::make_unique<StreamXClkOut>(name + ".out", out);
  ack_sync_  = std::make_unique<LevelSync>(name + ".ack_sync", in, params);

  in_->valid      << in_valid;
  in_->ack_s      << ack_sync_->o;
  in_ready        << in_->ready_o;
  send_sync_->i   << in_->send_o;
  out_->send_s    << send_sync_->o;
  out_->ready     << out_ready;
  out_->item_i    << in_item;       // crosses unsynchronized, held by the producer
  ack_sync_->i    << out_->ack_o;
  out_item        << out_->item_o;
  out_valid       << out_->valid_o;
}

} // namespace xclk
