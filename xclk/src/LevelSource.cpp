// **********************************************************************
// xclk/src/LevelSource.cpp
// **********************************************************************
// xclk maintainers Oct 16 2026

#include "LevelSource.hpp"

namespace xclk {

LevelSource::LevelSource(std::string /*name*/, Domain& domain, bool initial, IMPL_CTOR)
  : level_(initial)
{
  clk << domain.clk;
  UPDATE(update).writes(o);
}

void LevelSource::update() { o = level_; }

} // namespace xclk
