// **********************************************************************
// xclk/src/ByteSource.hpp
// **********************************************************************
// xclk maintainers Oct 13 2026
/*
Scripted stream producer.  Presents one item at a time with valid and holds it
until ready; optionally idles for gap cycles after each accepted item.

   +--- ByteSource ---
   | item  (packItem) |-->
   | valid            |-->
   | ready            |<--
   +------------------
*/
#pragma once

#include "Domain.hpp"
#include "XclkTypes.hpp"
#include <vector>

namespace xclk {

class ByteSource : public Component {
  DECLARE_COMPONENT(ByteSource);
public:
  ByteSource(std::string name, Domain& domain, COMPONENT_CTOR);
  Clock(clk);
  Output(uint16_t, item);
  Output(bool,     valid);
  Input (bool,     ready);

  // Host helpers to build the script
  void enqueue(const StreamItem& it);
  void enqueue(const std::vector<uint8_t>& bytes, bool last_on_final = false);
  void set_gap(int cycles) { gap_ = cycles < 0 ? 0 : cycles; }

  bool     done()          const { return pc_ == script_.size() && !static_cast<bool>(valid_r); }
  size_t   pending()       const { return script_.size() - pc_; }
  uint64_t sent()          const { return sent_; }
  uint64_t last_sent_cyc() const { return last_sent_cyc_; }

private:
  Register(uint16_t, item_r);
  Register(bool,     valid_r);
  Register(uint32_t, wait_r);   // idle cycles left before the next item
  std::vector<StreamItem> script_;
  size_t   pc_            = 0;  // next script entry
  int      gap_           = 0;
  uint64_t cyc_           = 0;  // own cycle count
  uint64_t sent_          = 0;
  uint64_t last_sent_cyc_ = 0;

  void update_out();
  void update_regs();
};

} // namespace xclk
