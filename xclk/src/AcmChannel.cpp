// **********************************************************************
// xclk/src/AcmChannel.cpp
// **********************************************************************
// xclk maintainers Oct 11 2026
/*
Wiring only.  Every ready and valid handed between two parts of the same
domain comes out of a register (or a same-cycle wire in sync mode), so
producer and consumer see the same valid & ready at each edge.
*/
#include "AcmChannel.hpp"

namespace xclk {

int AcmChannel::checkDepth(int fifo_depth) {
  assert_always(fifo_depth >= 0, "AcmChannel: negative FIFO depth %d", fifo_depth);
  return fifo_depth;
}

AcmChannel::AcmChannel(std::string name, Domain& sys, Domain& dev, bool sync, int fifo_depth,
                       SyncParams params, IMPL_CTOR)
  : sync_(requireShared(sys, dev, sync, "AcmChannel")),
    fifo_depth_(checkDepth(fifo_depth))
{
  if (!sync_) checkStages(params, "AcmChannel");   // nothing built yet

  if (fifo_depth_ > 0) {
    fin_  = std::make_unique<SyncFifo>(name + ".fin", sys, fifo_depth_);
    fout_ = std::make_unique<SyncFifo>(name + ".fout", sys, fifo_depth_);
  }

  // sys -> dev: user (or fin) feeds the core, the core feeds the engine
  auto hook_in = [&](auto& core) {
    if (fin_) {
      fin_->din     << in_item;        // we = valid, writable = ready
      fin_->we      << in_valid;
      in_ready      << fin_->writable;
      core.in_item  << fin_->dout;
      core.in_valid << fin_->readable;
      fin_->re      << core.in_ready;
    } else {
      core.in_item  << in_item;
      core.in_valid << in_valid;
      in_ready      << core.in_ready;
    }
    dev_in_item    << core.out_item;
    dev_in_valid   << core.out_valid;
    core.out_ready << dev_in_ready;
  };

  // dev -> sys: the engine feeds the core, the core feeds the user (or fout)
  auto hook_out = [&](auto& core) {
    core.in_item  << dev_out_item;
    core.in_valid << dev_out_valid;
    dev_out_ready << core.in_ready;
    if (fout_) {
      fout_->din     << core.out_item;
      fout_->we      << core.out_valid;
      core.out_ready << fout_->writable;
      out_item       << fout_->dout;
      out_valid      << fout_->readable;
      fout_->re      << out_ready;
    } else {
      out_item       << core.out_item;
      out_valid      << core.out_valid;
      core.out_ready << out_ready;
    }
  };

  if (sync_) {
    win_             = std::make_unique<StreamWire>(name + ".win", sys);
    wout_            = std::make_unique<StreamWire>(name + ".wout", sys);
    flush_now_wire_  = std::make_unique<LevelWire>(name + ".flush_now", sys);
    flush_time_wire_ = std::make_unique<LevelWire>(name + ".flush_time", sys);
    boot_wire_       = std::make_unique<LevelWire>(name + ".boot", sys);
    hook_in(*win_);
    hook_out(*wout_);
    flush_now_wire_->i  << in_flush_now;
    flush_time_wire_->i << in_flush_time;
    boot_wire_->i       << dev_bootloader;
    dev_flush_now  << flush_now_wire_->o;
    dev_flush_time << flush_time_wire_->o;
    bootloader_req << boot_wire_->o;
    return;
  }

  xin_        = std::make_unique<StreamXClk>(name + ".xin", sys, dev, params);
  xout_       = std::make_unique<StreamXClk>(name + ".xout", dev, sys, params);
  flush_now_  = std::make_unique<LevelSync>(name + ".flush_now", dev, params);
  flush_time_ = std::make_unique<LevelSync>(name + ".flush_time", dev, params);
  boot_       = std::make_unique<PulseSync>(name + ".boot", dev, sys, params);
  hook_in(*xin_);
  hook_out(*xout_);
  flush_now_->i  << in_flush_now;
  flush_time_->i << in_flush_time;
  boot_->i       << dev_bootloader;
  dev_flush_now  << flush_now_->o;
  dev_flush_time << flush_time_->o;
  bootloader_req << boot_->o;
}

} // namespace xclk
