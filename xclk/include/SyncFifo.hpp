// **********************************************************************
// xclk/include/SyncFifo.hpp
// **********************************************************************
// xclk maintainers Oct 7 2026
/*
Single-domain FIFO of 9-bit entries (packItem/unpackItem), first-word fall-through.

   +--- SyncFifo ---------------------------------+
-->| din, we   --> [ mem_ | depth entries ] --> dout |-->
<--| writable                           readable |-->
   |                                          re |<--
   +----------------------------------------------+

  writable = level < depth     readable = level > 0

Flags and dout come from latched state only, so producer and consumer in the
same domain agree on whether a transfer happens at this edge:
  write happens iff we & writable   (we = producer valid, writable = its ready)
  read  happens iff re & readable   (re = consumer ready, readable = its valid)
A full FIFO holds the producer off.  Nothing is ever dropped or overwritten.
*/
#pragma once

#include "Domain.hpp"
#include "XclkTypes.hpp"
#include <vector>

namespace xclk {

class SyncFifo : public Component {
  DECLARE_COMPONENT(SyncFifo);
public:
  SyncFifo(std::string name, Domain& domain, int depth, COMPONENT_CTOR);
  Clock(clk);
  Input (uint16_t, din);
  Input (bool,     we);
  Input (bool,     re);
  Output(bool,     writable);
  Output(bool,     readable);
  Output(uint16_t, dout);      // meaningful only while readable

  static int checkDepth(int depth);   // >= 1, returns depth

  int level() const { return static_cast<int>(static_cast<uint32_t>(count)); }
  int depth() const { return depth_; }
  int peak()  const { return peak_; }

  void reset();

private:
  const int             depth_;
  std::vector<uint16_t> mem_;   // written in place: a write never targets rd while readable
  Register(uint32_t, wr);
  Register(uint32_t, rd);
  Register(uint32_t, count);
  int peak_ = 0;                // high-water mark of count

  void update_out();
  void update_regs();
};

} // namespace xclk
