// **********************************************************************
// xclk/src/LevelSync.cpp
// **********************************************************************
// xclk maintainers Oct 4 2026

#include "LevelSync.hpp"

namespace xclk {

int checkStages(const SyncParams& params, const char* who) {
  assert_always(params.stages >= 2 && params.stages <= kMaxStages,
                "%s: synchronizer needs 2..%d stages (got %d)", who, kMaxStages, params.stages);
  return params.stages;
}

namespace {

// One dst edge worth of shifting: s0 <- in, s1 <- s0, ... up to stage n-1.
template <typename T, typename Reg>
void shiftChain(T in, int n, Reg& s0, Reg& s1, Reg& s2, Reg& s3) {
  const T a = s0;  // current (latched) values
  const T b = s1;
  const T c = s2;
  s0 = in;
  s1 = a;
  if (n > 2) s2 = b;
  if (n > 3) s3 = c; // stages past n are never written and stay at reset
}

template <typename T, typename Reg>
T chainOut(int n, const Reg& s1, const Reg& s2, const Reg& s3) {
  if (n == 2) return s1;
  if (n == 3) return s2;
  return s3;
}

} // namespace

// ----- LevelSync -----

LevelSync::LevelSync(std::string /*name*/, Domain& dst, SyncParams params, IMPL_CTOR)
  : stages_(checkStages(params, "LevelSync"))
{
  clk << dst.clk;
  UPDATE(update_out).writes(o);   // o straight off the last stage
  UPDATE(update_regs).reads(i);   // sample and shift
}

bool LevelSync::last() const { return chainOut<bool>(stages_, s1, s2, s3); }

void LevelSync::update_out() { o = last(); }

void LevelSync::update_regs() { shiftChain<bool>(i, stages_, s0, s1, s2, s3); }

// ----- WordSync -----

WordSync::WordSync(std::string /*name*/, Domain& dst, SyncParams params, IMPL_CTOR)
  : stages_(checkStages(params, "WordSync"))
{
  clk << dst.clk;
  UPDATE(update_out).writes(o);
  UPDATE(update_regs).reads(i);
}

uint32_t WordSync::last() const { return chainOut<uint32_t>(stages_, s1, s2, s3); }

void WordSync::update_out() { o = last(); }

void WordSync::update_regs() { shiftChain<uint32_t>(i, stages_, s0, s1, s2, s3); }

} // namespace xclk
