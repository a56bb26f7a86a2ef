// **********************************************************************
// xclk/src/tb_stream_xclk.cpp
// **********************************************************************
// xclk maintainers Oct 18 2026
/*
StreamXClk from a ByteSource to a ByteSink:
  - [0x41, 0x42, 0x43+last] into a 4x slower domain with ready always high:
    exactly those three items, in order, one record
  - random streams with random end-of-record markers, fast->slow, slow->fast and
    equal clocks, with producer gaps and consumer backpressure, with 2- and
    3-stage synchronizers: the sink gets the same sequence, nothing lost or
    repeated, and out_item never changes while out_valid waits for ready
*/
#include "ByteSink.hpp"
#include "ByteSource.hpp"
#include "Domain.hpp"
#include "SimHarness.hpp"
#include "StreamXClk.hpp"
#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>
#include <descore/Parameter.hpp>
#include <cstdio>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace xclk;

IntParameter(stream_len, 300, "Items per random stream");
IntParameter(seed, 11, "Random seed");
IntParameter(stages, 2, "Synchronizer stages");

static int failures = 0;

static void check(bool ok, const std::string& rig, const char* what) {
  if (!ok) {
    printf("FAIL [%s] %s\n", rig.c_str(), what);
    failures++;
  }
}

// Egress-side monitor: an offered item must not change until it is taken
class HoldMonitor : public Component {
  DECLARE_COMPONENT(HoldMonitor);
public:
  HoldMonitor(std::string /*name*/, Domain& d, COMPONENT_CTOR) {
    clk << d.clk;
    UPDATE(update).reads(item, valid, ready);
  }
  Clock(clk);
  Input(uint16_t, item);
  Input(bool,     valid);
  Input(bool,     ready);

  bool unstable = false;

private:
  bool     holding_ = false;
  uint16_t held_    = 0;

  void update() {
    if (!valid) return;
    const uint16_t it = item;
    if (!holding_) {
      held_    = it;
      holding_ = true;
    } else if (it != held_) {
      unstable = true;
    }
    if (ready) holding_ = false;
  }
};

struct StreamRig {
  std::string             name;
  int                     in_ps, out_ps;
  Domain                  in;
  Domain                  out;
  StreamXClk              x;
  ByteSource              src;
  ByteSink                sink;
  HoldMonitor             mon;
  std::vector<StreamItem> sent;

  StreamRig(const std::string& n, int ip, int op, int gap, int stall, uint32_t s, SyncParams params)
    : name(n), in_ps(ip), out_ps(op), in(n + ".in"), out(n + ".out"),
      x(n + ".x", in, out, params), src(n + ".src", in), sink(n + ".sink", out, stall, s), mon(n + ".mon", out)
  {
    x.in_item   << src.item;
    x.in_valid  << src.valid;
    src.ready   << x.in_ready;
    sink.item   << x.out_item;
    sink.valid  << x.out_valid;
    x.out_ready << sink.ready;
    mon.item    << x.out_item;
    mon.valid   << x.out_valid;
    mon.ready   << sink.ready;
    src.set_gap(gap);
  }

  void push(uint8_t data, bool last) {
    StreamItem it;
    it.data = data;
    it.last = last;
    src.enqueue(it);
    sent.push_back(it);
  }

  void clock() {
    in.generateClock(in_ps);
    out.generateClock(out_ps);
  }

  bool finished() const { return src.done() && sink.received().size() >= sent.size(); }

  void verify() {
    const std::vector<StreamItem>& got = sink.received();
    size_t first_bad = got.size();
    for (size_t k = 0; k < got.size() && k < sent.size(); ++k)
      if (got[k] != sent[k]) { first_bad = k; break; }
    printf("[%s] sent %u received %u transfers %llu\n", name.c_str(), (unsigned)sent.size(),
           (unsigned)got.size(), (unsigned long long)x.transfers());
    if (first_bad < got.size())
      printf("  [%s] first mismatch at #%u: got 0x%02x/%d want 0x%02x/%d\n", name.c_str(), (unsigned)first_bad,
             got[first_bad].data, got[first_bad].last, sent[first_bad].data, sent[first_bad].last);
    check(got.size() == sent.size(), name, "item count differs (lost or duplicated)");
    check(first_bad == got.size(), name, "items out of order or corrupted");
    check(x.transfers() == sent.size(), name, "transfer counter");
    check(src.sent() == sent.size(), name, "source accept count");
    check(!mon.unstable, name, "out_item changed while waiting for ready");
  }
};

int main(int argc, char* argv[]) {
  // **************
  // Step 1: Parse tracing, parameters, and dump options
  // **************
  descore::parseTraces(argc, argv);
  Parameter::parseCommandLine(argc, argv);
  Sim::parseDumps(argc, argv);

  SyncParams sp;
  sp.stages = static_cast<int>(stages);
  SyncParams sp3;
  sp3.stages = 3;

  // **************
  // Step 2: Create rigs
  // **************
  std::vector<std::unique_ptr<StreamRig>> rigs;

  // concrete: three bytes into a 4x slower domain, ready always high
  rigs.push_back(std::make_unique<StreamRig>("abc", 1000, 4000, 0, 0, 1, sp));
  StreamRig& abc = *rigs.back();
  abc.push(0x41, false);
  abc.push(0x42, false);
  abc.push(0x43, true);

  // in period, out period, producer gap, consumer stall percent, stages
  const int cases[][5] = {
    { 1000, 9000, 0,  0, 0 },   // A much faster than B
    { 9000, 1000, 0,  0, 0 },   // A much slower than B
    { 2000, 2000, 0,  0, 0 },
    { 1000, 7300, 3, 30, 0 },
    { 7300, 1000, 1, 50, 0 },
    { 2000, 2000, 2, 25, 0 },
    { 1000, 3000, 0, 20, 3 },
    { 3000, 1000, 1, 40, 3 },
  };
  std::mt19937 rng(static_cast<uint32_t>(static_cast<int>(seed)));
  for (const auto& c : cases) {
    const SyncParams& p = c[4] == 3 ? sp3 : sp;
    const std::string name = "sx" + std::string(c[4] == 3 ? "3_" : "_") + std::to_string(c[0]) + "_" +
                             std::to_string(c[1]) + "_g" + std::to_string(c[2]) + "_s" + std::to_string(c[3]);
    rigs.push_back(std::make_unique<StreamRig>(name, c[0], c[1], c[2], c[3], rng(), p));
    for (int k = 0; k < static_cast<int>(stream_len); ++k) rigs.back()->push((uint8_t)rng(), rng() % 8 == 0);
  }

  // **************
  // Step 3: Start clocks and initialize & reset simulator
  // **************
  for (auto& r : rigs) r->clock();
  Sim::init();
  Sim::reset();

  // **************
  // Step 4: Run until every stream is through, then check
  // **************
  const bool done = run_until([&] {
    for (auto& r : rigs) if (!r->finished()) return false;
    return true;
  }, 500000000ull, 10000);
  run_for(200000); // anything extra would show up now
  check(done, "all", "streams did not finish");

  for (auto& r : rigs) r->verify();
  check(abc.sink.records() == 1, "abc", "one end-of-record marker");
  check(abc.sink.bytes() == std::vector<uint8_t>({0x41, 0x42, 0x43}), "abc", "payload");

  if (failures) {
    printf("tb_stream_xclk: %d failure(s)\n", failures);
    return 1;
  }
  printf("tb_stream_xclk passed\n");
  return 0;
}
