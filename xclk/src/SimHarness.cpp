// **********************************************************************
// xclk/src/SimHarness.cpp
// **********************************************************************
// xclk maintainers Oct 12 2026

#include "SimHarness.hpp"
#include <cascade/Cascade.hpp>
#include <cascade/SimGlobals.hpp>

namespace xclk {

uint64_t now_ps() { return Sim::simTime; }

void run_for(uint64_t ps) { Sim::run(ps); }

bool run_until(const std::function<bool()>& pred, uint64_t limit_ps, uint64_t step_ps) {
  const uint64_t stop = now_ps() + limit_ps;
  while (!pred()) {
    if (now_ps() >= stop) return false;
    Sim::run(step_ps);
  }
  return true;
}

} // namespace xclk
