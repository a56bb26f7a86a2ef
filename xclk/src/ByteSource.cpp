// **********************************************************************
// xclk/src/ByteSource.cpp
// **********************************************************************
// xclk maintainers Oct 13 2026

#include "ByteSource.hpp"

namespace xclk {

ByteSource::ByteSource(std::string /*name*/, Domain& domain, IMPL_CTOR) {
  clk << domain.clk;
  UPDATE(update_out).writes(item, valid);
  UPDATE(update_regs).reads(ready);
}

void ByteSource::enqueue(const StreamItem& it) {
  script_.push_back(it);
}

void ByteSource::enqueue(const std::vector<uint8_t>& bytes, bool last_on_final) {
  for (size_t k = 0; k < bytes.size(); ++k) {
    StreamItem it;
    it.data = bytes[k];
    it.last = last_on_final && (k + 1 == bytes.size());
    script_.push_back(it);
  }
}

void ByteSource::update_out() {
  item  = static_cast<uint16_t>(item_r);
  valid = static_cast<bool>(valid_r);
}

void ByteSource::update_regs() {
  cyc_++;
  const bool v    = valid_r;
  const bool fire = v && ready;                 // consumer took the item this edge
  if (fire) {
    const StreamItem it = unpackItem(item_r);
    sent_++;
    last_sent_cyc_ = cyc_;
    trace("sent 0x%02x%s", it.data, it.last ? " (last)" : "");
  }

  if (v && !fire) return;                       // hold the current item until it is taken

  const uint32_t wait = fire ? static_cast<uint32_t>(gap_) : static_cast<uint32_t>(wait_r);
  if (wait > 0) {                               // idle out the gap
    valid_r = false;
    wait_r  = wait - 1;
    return;
  }
  wait_r = 0;
  if (pc_ < script_.size()) {                   // next item, presented from the next edge
    item_r  = packItem(script_[pc_++]);
    valid_r = true;
  } else {
    valid_r = false;
  }
}

} // namespace xclk
