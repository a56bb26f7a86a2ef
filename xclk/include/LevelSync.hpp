// **********************************************************************
// xclk/include/LevelSync.hpp
// **********************************************************************
// xclk maintainers Oct 4 2026
/*
Multi-register synchronizer for slowly changing levels.  Every register is in
the destination domain.

   +--- LevelSync (dst) -------------------------+
-->| i --> [s0] --> [s1] --> [s2] --> [s3] --> o |-->
   +---------------------------------------------+
          \_____ first `stages` registers used __/

o is the last used stage: the value i had `stages` dst cycles earlier.  No
change detection is done.  A level that changes again before it settled may
be seen with a glitch or not at all; callers must hold levels long enough.

LevelSync carries one bit, WordSync a multi-bit level (each bit through its own
chain, so a word that is still changing may show a mix of old and new bits).
*/
#pragma once

#include "Domain.hpp"
#include "XclkTypes.hpp"
#include <cstdint>

namespace xclk {

// Validates a synchronizer depth; returns it so it can sit in an init list.
int checkStages(const SyncParams& params, const char* who);

class LevelSync : public Component {
  DECLARE_COMPONENT(LevelSync);
public:
  LevelSync(std::string name, Domain& dst, SyncParams params = SyncParams(), COMPONENT_CTOR);
  Clock(clk);
  Input (bool, i);
  Output(bool, o);

  int stages() const { return stages_; }

private:
  const int stages_;
  Register(bool, s0);
  Register(bool, s1);
  Register(bool, s2);
  Register(bool, s3);

  bool last() const;
  void update_out();
  void update_regs();
};

class WordSync : public Component {
  DECLARE_COMPONENT(WordSync);
public:
  WordSync(std::string name, Domain& dst, SyncParams params = SyncParams(), COMPONENT_CTOR);
  Clock(clk);
  Input (uint32_t, i);
  Output(uint32_t, o);

  int stages() const { return stages_; }

private:
  const int stages_;
  Register(uint32_t, s0);
  Register(uint32_t, s1);
  Register(uint32_t, s2);
  Register(uint32_t, s3);

  uint32_t last() const;
  void update_out();
  void update_regs();
};

} // namespace xclk
