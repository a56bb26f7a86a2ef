// **********************************************************************
// xclk/src/LevelSource.hpp
// **********************************************************************
// xclk maintainers Oct 16 2026
/*
Host-driven level.  set() between Sim::run() calls; o follows from the next
edge of the domain on.
*/
#pragma once

#include "Domain.hpp"

namespace xclk {

class LevelSource : public Component {
  DECLARE_COMPONENT(LevelSource);
public:
  LevelSource(std::string name, Domain& domain, bool initial = false, COMPONENT_CTOR);
  Clock(clk);
  Output(bool, o);

  void set(bool v) { level_ = v; }
  bool get() const { return level_; }

private:
  bool level_;
  void update();
};

} // namespace xclk
