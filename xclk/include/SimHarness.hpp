// **********************************************************************
// xclk/include/SimHarness.hpp
// **********************************************************************
// xclk maintainers Oct 12 2026
/*
Thin helpers for driving a Cascade simulation from a testbench: advance time
and wait for a condition.  Clocks come from Domain::generateClock().
*/
#pragma once

#include <cstdint>
#include <functional>

namespace xclk {

uint64_t now_ps();
void     run_for(uint64_t ps);

// Advance in step_ps chunks until pred() holds.  Returns false if limit_ps
// elapsed first.
bool run_until(const std::function<bool()>& pred, uint64_t limit_ps, uint64_t step_ps = 1000);

} // namespace xclk
