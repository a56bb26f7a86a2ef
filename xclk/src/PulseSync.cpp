// **********************************************************************
// xclk/src/PulseSync.cpp
// **********************************************************************
// xclk maintainers Oct 5 2026

#include "PulseSync.hpp"

namespace xclk {

// ----- src half -----

PulseSyncSrc::PulseSyncSrc(std::string /*name*/, Domain& src, IMPL_CTOR) {
  clk << src.clk;
  UPDATE(update_out).writes(toggle_o);
  UPDATE(update_regs).reads(i, seen);
}

void PulseSyncSrc::reset() {
  raised_    = 0;
  coalesced_ = 0;
}

void PulseSyncSrc::update_out() { toggle_o = static_cast<bool>(toggle); }

void PulseSyncSrc::update_regs() {
  const bool strobe = i;
  const bool pend   = pending_r;
  if (strobe) raised_++;
  if (!busy() && (strobe || pend)) {      // previous event seen: fire now
    toggle    = !static_cast<bool>(toggle);
    pending_r = false;
    if (strobe && pend) coalesced_++;     // the held raise and this one leave as one event
  } else if (strobe) {                    // busy: remember it, once
    if (pend) coalesced_++;
    pending_r = true;
  }
}

// ----- dst half -----

PulseSyncDst::PulseSyncDst(std::string /*name*/, Domain& dst, IMPL_CTOR) {
  clk << dst.clk;
  UPDATE(update_out).reads(sync_i).writes(o);
  UPDATE(update_regs).reads(sync_i);
}

void PulseSyncDst::reset() { delivered_ = 0; }

void PulseSyncDst::update_out() { o = static_cast<bool>(sync_i) != static_cast<bool>(prev); }

void PulseSyncDst::update_regs() {
  const bool s = sync_i;
  if (s != static_cast<bool>(prev)) delivered_++;  // toggle arrived: the event is out this cycle
  prev = s;
}

// ----- assembly -----

PulseSync::PulseSync(std::string name, Domain& src, Domain& dst, SyncParams params, IMPL_CTOR) {
  checkStages(params, "PulseSync");   // before any half exists
  src_  = std::make_unique<PulseSyncSrc>(name + ".src", src);
  fwd_  = std::make_unique<LevelSync>(name + ".fwd", dst, params);
  dst_  = std::make_unique<PulseSyncDst>(name + ".dst", dst);
  back_ = std::make_unique<LevelSync>(name + ".back", src, params);

  src_->i      << i;
  fwd_->i      << src_->toggle_o;   // toggle into dst
  dst_->sync_i << fwd_->o;
  back_->i     << fwd_->o;          // dst's view back into src
  src_->seen   << back_->o;
  o            << dst_->o;
}

} // namespace xclk
