// **********************************************************************
// xclk/src/tb_level_sync.cpp
// **********************************************************************
// xclk maintainers Oct 18 2026
/*
LevelSync / WordSync:
  - exact latency: driven from the dst domain itself, a change shows up on o
    exactly `stages` dst cycles later (2, 3 and 4 stages)
  - settling across unrelated clocks: a word held long enough is always
    reflected, and o only ever shows values the input actually had
  - stage counts outside 2..4 are rejected
*/
#include "Domain.hpp"
#include "LevelSync.hpp"
#include "SimHarness.hpp"
#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>
#include <descore/Parameter.hpp>
#include <descore/assert.hpp>
#include <cstdio>
#include <memory>
#include <set>
#include <string>
#include <vector>

using namespace xclk;

IntParameter(hold_cycles, 40, "Src cycles each level is held in the settling rigs");

static int failures = 0;

static void check(bool ok, const std::string& rig, const char* what) {
  if (!ok) {
    printf("FAIL [%s] %s\n", rig.c_str(), what);
    failures++;
  }
}

// Flips its level every 16 cycles and times how long o takes to follow
class Toggler : public Component {
  DECLARE_COMPONENT(Toggler);
public:
  Toggler(std::string /*name*/, Domain& d, COMPONENT_CTOR) {
    clk << d.clk;
    UPDATE(update_out).writes(level);
    UPDATE(update_regs).reads(o);
  }
  Clock(clk);
  Output(bool, level);
  Input (bool, o);          // LevelSync output, same domain

  std::vector<uint64_t> latencies;

private:
  Register(bool, level_r);
  uint64_t cyc_        = 0;
  uint64_t changed_at_ = 0;
  bool     prev_o_     = false;

  void update_out() { level = static_cast<bool>(level_r); }
  void update_regs() {
    cyc_++;
    const bool seen = o;
    if (seen != prev_o_) latencies.push_back(cyc_ - changed_at_);
    prev_o_ = seen;
    if (cyc_ % 16 == 5) {
      level_r     = !static_cast<bool>(level_r);
      changed_at_ = cyc_ + 1;   // level shows on the port from the next cycle
    }
  }
};

struct LatencyRig {
  std::string name;
  Domain      dom;
  LevelSync   ls;
  Toggler     tog;

  LatencyRig(const std::string& n, int nstages)
    : name(n), dom(n), ls(n + ".ls", dom, SyncParams{nstages}), tog(n + ".tog", dom)
  {
    ls.i  << tog.level;
    tog.o << ls.o;
  }
};

// src side of a settle rig: holds a word for `hold` cycles, then checks it arrived
class WordWriter : public Component {
  DECLARE_COMPONENT(WordWriter);
public:
  WordWriter(std::string /*name*/, Domain& d, int hold, std::set<uint32_t>& written, COMPONENT_CTOR)
    : hold_(hold), written_(written)
  {
    clk << d.clk;
    written_.insert(0);
    UPDATE(update_out).writes(level);
    UPDATE(update_regs).reads(synced);
  }
  Clock(clk);
  Output(uint32_t, level);
  Input (uint32_t, synced);  // WordSync output, foreign domain

  uint64_t checks   = 0;
  bool     mismatch = false;

private:
  const int           hold_;
  std::set<uint32_t>& written_;
  Register(uint32_t,  level_r);
  uint64_t            cyc_ = 0;

  void update_out() { level = static_cast<uint32_t>(level_r); }
  void update_regs() {
    cyc_++;
    if (cyc_ % static_cast<uint64_t>(hold_) != 0) return;
    const uint32_t cur = level_r;
    if (static_cast<uint32_t>(synced) != cur) mismatch = true;
    checks++;
    const uint32_t v = (cur * 37u + 11u) & 0xffu;
    written_.insert(v);
    level_r = v;
  }
};

// dst side: every value seen on o must be one the writer produced
class WordWatcher : public Component {
  DECLARE_COMPONENT(WordWatcher);
public:
  WordWatcher(std::string /*name*/, Domain& d, const std::set<uint32_t>& written, COMPONENT_CTOR)
    : written_(written)
  {
    clk << d.clk;
    UPDATE(update).reads(synced);
  }
  Clock(clk);
  Input(uint32_t, synced);

  bool invented = false;

private:
  const std::set<uint32_t>& written_;
  void update() { if (!written_.count(synced)) invented = true; }
};

struct SettleRig {
  std::string        name;
  int                src_ps, dst_ps;
  std::set<uint32_t> written;
  Domain             src;
  Domain             dst;
  WordSync           ws;
  WordWriter         wr;
  WordWatcher        watch;

  SettleRig(const std::string& n, int sp, int dp, int hold)
    : name(n), src_ps(sp), dst_ps(dp), src(n + ".src"), dst(n + ".dst"),
      ws(n + ".ws", dst), wr(n + ".wr", src, hold, written), watch(n + ".watch", dst, written)
  {
    ws.i     << wr.level;
    wr.synced << ws.o;
    watch.synced << ws.o;
  }
};

static bool stagesRejected(int n) {
  try {
    checkStages(SyncParams{n}, "tb_level_sync");
  } catch (descore::runtime_error&) {
    return true;
  }
  return false;
}

int main(int argc, char* argv[]) {
  // **************
  // Step 1: Parse tracing, parameters, and dump options
  // **************
  descore::parseTraces(argc, argv);
  Parameter::parseCommandLine(argc, argv);
  Sim::parseDumps(argc, argv);

  // stage-count validation, before anything is built
  check(stagesRejected(1), "params", "one-stage synchronizer accepted");
  check(stagesRejected(5), "params", "five-stage synchronizer accepted");
  check(!stagesRejected(2) && !stagesRejected(kMaxStages), "params", "valid stage count rejected");

  // **************
  // Step 2: Create rigs
  // **************
  std::vector<std::unique_ptr<LatencyRig>> lat;
  for (int s = 2; s <= kMaxStages; ++s) lat.push_back(std::make_unique<LatencyRig>("lat" + std::to_string(s), s));

  const int hold = static_cast<int>(hold_cycles);
  const int ratios[][2] = { {1000, 4000}, {4000, 1000}, {2000, 2000}, {1000, 7300} };
  std::vector<std::unique_ptr<SettleRig>> settle;
  for (const auto& r : ratios) {
    const int h = hold * ((r[1] + r[0] - 1) / r[0]);  // window covers the sync depth in dst cycles
    settle.push_back(std::make_unique<SettleRig>("ws_" + std::to_string(r[0]) + "_" + std::to_string(r[1]),
                                                 r[0], r[1], h));
  }

  // **************
  // Step 3: Start clocks and initialize & reset simulator
  // **************
  for (auto& r : lat) r->dom.generateClock(1000);
  for (auto& r : settle) {
    r->src.generateClock(r->src_ps);
    r->dst.generateClock(r->dst_ps);
  }
  Sim::init();
  Sim::reset();

  // **************
  // Step 4: Run and check
  // **************
  run_for(20000000ull);

  for (size_t k = 0; k < lat.size(); ++k) {
    LatencyRig& r = *lat[k];
    const uint64_t want = static_cast<uint64_t>(r.ls.stages());
    const std::vector<uint64_t>& l = r.tog.latencies;
    bool exact = !l.empty();
    for (uint64_t v : l) exact = exact && (v == want);
    printf("[%s] %u changes, latency %llu cycles\n", r.name.c_str(), (unsigned)l.size(),
           l.empty() ? 0ull : (unsigned long long)l[0]);
    check(exact, r.name, "output latency differs from stage count");
  }
  for (auto& r : settle) {
    printf("[%s] %llu settle checks\n", r->name.c_str(), (unsigned long long)r->wr.checks);
    check(r->wr.checks > 10, r->name, "too few settle checks");
    check(!r->wr.mismatch, r->name, "word not reflected after hold window");
    check(!r->watch.invented, r->name, "output showed a value the input never had");
  }

  if (failures) {
    printf("tb_level_sync: %d failure(s)\n", failures);
    return 1;
  }
  printf("tb_level_sync passed\n");
  return 0;
}
