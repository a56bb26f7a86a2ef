// **********************************************************************
// xclk/include/Domain.hpp
// **********************************************************************
// xclk maintainers Oct 3 2026
/*
A clock domain: a name plus the Cascade Clock that every component living in
the domain is hooked to.

Each crossing primitive is split into per-domain halves (Components with their
own Clock(clk) port).  A half takes the Domain it lives in and connects
clk << dom.clk in its constructor, so which domain owns a register is fixed by
construction and shows up in the component hierarchy and in dumps.

Two Domains are unrelated even when they run at the same period.  The
synchronous fast paths need the *same* Domain on both sides.
*/
#pragma once

#include <cascade/Cascade.hpp>
#include <cascade/Clock.hpp>
#include <string>

namespace xclk {

class Domain {
public:
  explicit Domain(std::string name) : name_(std::move(name)) {}
  Domain(const Domain&)            = delete;
  Domain& operator=(const Domain&) = delete;

  Clock clk;                            // components of this domain: comp.clk << dom.clk

  void generateClock(int period_ps);    // once, before Sim::init()
  const std::string& name()      const { return name_; }
  int                period_ps() const { return period_ps_; } // 0 until generated

private:
  std::string name_;
  int         period_ps_ = 0;
};

// Synchronous mode is only legal when both sides are the same Domain.
// Throws (assert_always) otherwise; returns sync so it can sit in an init list.
bool requireShared(const Domain& a, const Domain& b, bool sync, const char* who);

} // namespace xclk
