// **********************************************************************
// xclk/src/Domain.cpp
// **********************************************************************
// xclk maintainers Oct 3 2026

#include "Domain.hpp"

namespace xclk {

void Domain::generateClock(int period_ps) {
  assert_always(period_ps > 0, "Domain %s: clock period must be positive (got %d)",
                name_.c_str(), period_ps);
  assert_always(period_ps_ == 0, "Domain %s: clock already generated (%d ps)",
                name_.c_str(), period_ps_);
  period_ps_ = period_ps;
  clk.generateClock(period_ps);   // free-running, no phase offset
}

bool requireShared(const Domain& a, const Domain& b, bool sync, const char* who) {
  assert_always(!sync || &a == &b,
                "%s: synchronous mode needs one shared domain (got %s and %s)",
                who, a.name().c_str(), b.name().c_str());
  return sync;
}

} // namespace xclk
