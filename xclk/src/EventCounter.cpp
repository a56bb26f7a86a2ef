// **********************************************************************
// xclk/src/EventCounter.cpp
// **********************************************************************
// xclk maintainers Oct 16 2026

#include "EventCounter.hpp"

namespace xclk {

EventCounter::EventCounter(std::string /*name*/, Domain& domain, IMPL_CTOR) {
  clk << domain.clk;
  UPDATE(update).reads(i);
}

void EventCounter::reset() {
  prev_  = false;
  high_  = 0;
  rises_ = 0;
  wide_  = 0;
}

void EventCounter::update() {
  const bool v = i;
  if (v) {
    high_++;
    if (prev_) wide_++;
    else       rises_++;
  }
  prev_ = v;
}

} // namespace xclk
