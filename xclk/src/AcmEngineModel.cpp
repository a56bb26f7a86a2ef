// **********************************************************************
// xclk/src/AcmEngineModel.cpp
// **********************************************************************
// xclk maintainers Oct 15 2026

#include "AcmEngineModel.hpp"

namespace xclk {

static const char* reasonName(AcmEngineModel::FlushReason r) {
  switch (r) {
    case AcmEngineModel::FULL:    return "full";
    case AcmEngineModel::LAST:    return "last";
    case AcmEngineModel::NOW:     return "now";
    case AcmEngineModel::TIMEOUT: return "timeout";
  }
  return "?";
}

int AcmEngineModel::checkFlushTimeout(int cycles) {
  assert_always(cycles >= 1, "AcmEngineModel: flush timeout must be >= 1 (got %d)", cycles);
  return cycles;
}

AcmEngineModel::AcmEngineModel(std::string name, Domain& domain, const EngineConfig& cfg,
                               int flush_timeout, IMPL_CTOR)
  : cfg_(cfg), flush_timeout_(checkFlushTimeout(flush_timeout))
{
  tx_ = std::make_unique<ByteSource>(name + ".tx", domain);
  tx_->ready << out_ready;        // host -> device bytes straight off the inner source
  out_item   << tx_->item;
  out_valid  << tx_->valid;
  buf_.reserve(kMaxPacket);

  clk << domain.clk;
  UPDATE(update_out).writes(in_ready, bootloader);
  UPDATE(update_regs).reads(in_item, in_valid, flush_now, flush_time);
}

void AcmEngineModel::host_send(const std::vector<uint8_t>& bytes, bool last_on_final) {
  tx_->enqueue(bytes, last_on_final);
}

std::vector<uint8_t> AcmEngineModel::host_received() const {
  std::vector<uint8_t> out;
  for (const Packet& p : packets_) out.insert(out.end(), p.bytes.begin(), p.bytes.end());
  return out;
}

void AcmEngineModel::flush(FlushReason why) {
  Packet p;
  p.bytes  = buf_;
  p.reason = why;
  p.cyc    = cyc_;
  packets_.push_back(p);
  trace("packet of %u bytes to host (%s)", (unsigned)buf_.size(), reasonName(why));
  buf_.clear();
}

void AcmEngineModel::update_out() {
  in_ready   = true;
  bootloader = static_cast<bool>(boot_r);
}

void AcmEngineModel::update_regs() {
  cyc_++;
  // DFU detach: one cycle of bootloader per request
  boot_r = false;                       // pulse drops after one cycle
  if (detach_req_) {                    // if host asked for a detach since last edge
    detach_req_ = false;
    if (cfg_.no_dfu_rt()) {             // no DFU runtime interface: host can't reach us
      detach_ignored_++;
      trace("detach ignored, no DFU runtime interface");
    } else {
      boot_r = true;                    // bootloader high from next edge, for one cycle
      boot_requests_++;
      trace("detach, bootloader requested");
    }
  }

  // Device -> host packetizer (in_ready is always high)
  if (in_valid) {                       // *** byte arriving from the channel ***
    const StreamItem it = unpackItem(in_item);
    buf_.push_back(it.data);              // into the packet buffer
    idle = 0;                             // restart the timeout
    if (buf_.size() >= kMaxPacket) flush(FULL);   // max packet size reached
    else if (it.last)              flush(LAST);   // end of record
    return;
  }

  if (buf_.empty()) return;       // nothing waiting, nothing to time out

  const uint32_t n = idle;
  if (flush_now) {                      // *** no byte this cycle, partial packet waiting ***
    flush(NOW);                           // flush_now wins over the timeout
  } else if (flush_time) {              // timed flush enabled
    if (n + 1 >= static_cast<uint32_t>(flush_timeout_)) {
      flush(TIMEOUT);                     // idle long enough
      idle = 0;
    } else {
      idle = n + 1;                       // keep counting
    }
  }                                     // neither level: hold the partial packet
}

} // namespace xclk
