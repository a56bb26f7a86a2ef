// **********************************************************************
// xclk/src/EventCounter.hpp
// **********************************************************************
// xclk maintainers Oct 16 2026
/*
Watches one bit in its domain, once per cycle.

  high()  cycles the bit was high
  rises() low -> high transitions
  wide()  cycles the bit was high for the second (or later) cycle in a row;
          stays 0 for a clean single-cycle strobe
*/
#pragma once

#include "Domain.hpp"
#include <cstdint>

namespace xclk {

class EventCounter : public Component {
  DECLARE_COMPONENT(EventCounter);
public:
  EventCounter(std::string name, Domain& domain, COMPONENT_CTOR);
  Clock(clk);
  Input(bool, i);

  uint64_t high()  const { return high_; }
  uint64_t rises() const { return rises_; }
  uint64_t wide()  const { return wide_; }
  bool     level() const { return prev_; }  // value seen at the last edge

  void reset();

private:
  bool     prev_  = false;
  uint64_t high_  = 0;
  uint64_t rises_ = 0;
  uint64_t wide_  = 0;

  void update();
};

} // namespace xclk
