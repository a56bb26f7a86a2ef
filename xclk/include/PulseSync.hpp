// **********************************************************************
// xclk/include/PulseSync.hpp
// **********************************************************************
// xclk maintainers Oct 5 2026
/*
Single-cycle event from src to dst, delivered exactly once.

   +--- PulseSync -------------------------------------------------------+
   |  PulseSyncSrc (src)            LevelSync fwd (dst)  PulseSyncDst (dst)
-->| i --> toggle ^= 1 --toggle_o--> [s0..sN-1] --o-----> sync_i         |
   |          ^                           |              o = sync_i != prev --> o
   |  busy = toggle != seen               |                               |
   |        seen <---- LevelSync back (src) <-+                            |
   +---------------------------------------------------------------------+

A toggle crosses, not the strobe, so a pulse can never be missed by sampling.
The dst's view of the toggle is synchronized back so src knows when the last
event was observed (busy).  A strobe raised while busy sets a pending flag
that fires once the previous event is seen: any number of raises inside one
busy window collapse into exactly one follow-up event (counted in coalesced()).
*/
#pragma once

#include "Domain.hpp"
#include "LevelSync.hpp"
#include "XclkTypes.hpp"
#include <memory>

namespace xclk {

// src half: owns the toggle and the pending flag
class PulseSyncSrc : public Component {
  DECLARE_COMPONENT(PulseSyncSrc);
public:
  PulseSyncSrc(std::string name, Domain& src, COMPONENT_CTOR);
  Clock(clk);
  Input (bool, i);          // strobe
  Input (bool, seen);       // dst's view of the toggle, synchronized back
  Output(bool, toggle_o);   // into the forward synchronizer

  bool     busy()      const { return static_cast<bool>(toggle) != static_cast<bool>(seen); }
  bool     pending()   const { return static_cast<bool>(pending_r); }
  uint64_t raised()    const { return raised_; }
  uint64_t coalesced() const { return coalesced_; }

  void reset();

private:
  Register(bool, toggle);
  Register(bool, pending_r);
  uint64_t raised_    = 0;
  uint64_t coalesced_ = 0;

  void update_out();
  void update_regs();
};

// dst half: edge-detects the synchronized toggle
class PulseSyncDst : public Component {
  DECLARE_COMPONENT(PulseSyncDst);
public:
  PulseSyncDst(std::string name, Domain& dst, COMPONENT_CTOR);
  Clock(clk);
  Input (bool, sync_i);     // last stage of the forward synchronizer
  Output(bool, o);          // one dst cycle per delivered event

  uint64_t delivered() const { return delivered_; }

  void reset();

private:
  Register(bool, prev);
  uint64_t delivered_ = 0;

  void update_out();
  void update_regs();
};

class PulseSync : public Component {
  DECLARE_COMPONENT(PulseSync);
public:
  PulseSync(std::string name, Domain& src, Domain& dst, SyncParams params = SyncParams(), COMPONENT_CTOR);
  Input (bool, i);          // src: strobe
  Output(bool, o);          // dst: strobe

  // src side status/counters
  bool     busy()      const { return src_->busy(); }
  bool     pending()   const { return src_->pending(); }
  uint64_t raised()    const { return src_->raised(); }
  uint64_t coalesced() const { return src_->coalesced(); }
  // dst side counter
  uint64_t delivered() const { return dst_->delivered(); }

private:
  std::unique_ptr<PulseSyncSrc> src_;
  std::unique_ptr<LevelSync>    fwd_;   // dst domain
  std::unique_ptr<PulseSyncDst> dst_;
  std::unique_ptr<LevelSync>    back_;  // src domain
};

} // namespace xclk
