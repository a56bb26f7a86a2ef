// **********************************************************************
// xclk/src/tb_sync_fifo.cpp
// **********************************************************************
// xclk maintainers Oct 18 2026
/*
SyncFifo between a ByteSource and a ByteSink in one domain:
  - order and end-of-record markers preserved through the 9-bit entries
  - level stays within [0, depth] and a stalled consumer fills it to depth
  - first-word fall-through: with no stalls a depth >= 2 FIFO passes one item
    per cycle
  - a producer that never stops fills it to depth and is held off there
  - depth < 1 is rejected
*/
#include "ByteSink.hpp"
#include "ByteSource.hpp"
#include "Domain.hpp"
#include "LevelSource.hpp"
#include "SimHarness.hpp"
#include "SyncFifo.hpp"
#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>
#include <descore/Parameter.hpp>
#include <descore/assert.hpp>
#include <cstdio>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace xclk;

IntParameter(stream_len, 200, "Items per rig");
IntParameter(seed, 3, "Random seed");

static int failures = 0;

static void check(bool ok, const std::string& rig, const char* what) {
  if (!ok) {
    printf("FAIL [%s] %s\n", rig.c_str(), what);
    failures++;
  }
}

// Samples the FIFO's level once per cycle
class LevelWatch : public Component {
  DECLARE_COMPONENT(LevelWatch);
public:
  LevelWatch(std::string /*name*/, Domain& d, const SyncFifo& fifo, COMPONENT_CTOR)
    : fifo_(fifo)
  {
    clk << d.clk;
    UPDATE(update);
  }
  Clock(clk);

  bool bad_level = false;

private:
  const SyncFifo& fifo_;
  void update() { if (fifo_.level() < 0 || fifo_.level() > fifo_.depth()) bad_level = true; }
};

struct FifoRig {
  std::string             name;
  int                     stall;
  Domain                  dom;
  SyncFifo                fifo;
  ByteSource              src;
  ByteSink                sink;
  LevelWatch              watch;
  std::vector<StreamItem> sent;

  FifoRig(const std::string& n, int depth, int gap, int st, uint32_t s)
    : name(n), stall(st), dom(n), fifo(n + ".fifo", dom, depth), src(n + ".src", dom),
      sink(n + ".sink", dom, st, s), watch(n + ".watch", dom, fifo)
  {
    fifo.din   << src.item;
    fifo.we    << src.valid;      // write iff valid & writable
    src.ready  << fifo.writable;
    sink.item  << fifo.dout;
    sink.valid << fifo.readable;
    fifo.re    << sink.ready;     // read iff ready & readable
    src.set_gap(gap);
  }

  void fill(int n, std::mt19937& rng) {
    for (int k = 0; k < n; ++k) {
      StreamItem it;
      it.data = (uint8_t)rng();
      it.last = rng() % 5 == 0;
      src.enqueue(it);
      sent.push_back(it);
    }
  }

  bool finished() const { return src.done() && sink.received().size() >= sent.size(); }
};

// Offers a write every cycle, never reads
struct PushRig {
  Domain      dom;
  SyncFifo    fifo;
  LevelSource push;

  PushRig() : dom("push"), fifo("push.fifo", dom, 4), push("push.we", dom, true) {
    fifo.we << push.o;
    fifo.din.wireToZero();
    fifo.re.wireToZero();
    fifo.writable.sendToBitBucket();
    fifo.readable.sendToBitBucket();
    fifo.dout.sendToBitBucket();
  }
};

static bool depthRejected(int depth) {
  try {
    SyncFifo::checkDepth(depth);
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

  // depth must be at least one
  check(depthRejected(0), "depth", "zero-depth FIFO accepted");
  check(depthRejected(-3), "depth", "negative depth accepted");
  check(!depthRejected(1), "depth", "depth 1 rejected");

  // **************
  // Step 2: Create rigs
  // **************
  std::mt19937 rng(static_cast<uint32_t>(static_cast<int>(seed)));
  std::vector<std::unique_ptr<FifoRig>> rigs;

  // depth, producer gap, consumer stall percent
  const int cases[][3] = { {1, 0, 0}, {4, 0, 0}, {16, 0, 0}, {4, 0, 80}, {16, 2, 40}, {2, 0, 60} };
  for (const auto& c : cases) {
    const std::string name = "fifo_d" + std::to_string(c[0]) + "_g" + std::to_string(c[1]) + "_s" + std::to_string(c[2]);
    rigs.push_back(std::make_unique<FifoRig>(name, c[0], c[1], c[2], rng()));
    rigs.back()->fill(static_cast<int>(stream_len), rng);
  }

  PushRig full;

  // **************
  // Step 3: Start clocks and initialize & reset simulator
  // **************
  for (auto& r : rigs) r->dom.generateClock(1000);
  full.dom.generateClock(1000);
  Sim::init();
  Sim::reset();

  // **************
  // Step 4: Run and check
  // **************
  const bool done = run_until([&] {
    for (auto& r : rigs) if (!r->finished()) return false;
    return true;
  }, 100000000ull, 10000);
  check(done, "all", "rigs did not finish");

  for (auto& r : rigs) {
    const std::vector<StreamItem>& got = r->sink.received();
    bool same = got.size() == r->sent.size();
    for (size_t k = 0; same && k < got.size(); ++k) same = got[k] == r->sent[k];
    printf("[%s] %u items, peak level %d/%d, last item at cycle %llu\n", r->name.c_str(), (unsigned)got.size(),
           r->fifo.peak(), r->fifo.depth(), (unsigned long long)r->sink.last_recv_cyc());
    check(same, r->name, "received sequence differs from sent");
    check(!r->watch.bad_level, r->name, "level out of range");
    check(r->fifo.level() == 0, r->name, "FIFO not drained");
    if (r->stall >= 60) check(r->fifo.peak() == r->fifo.depth(), r->name, "stalled consumer never filled the FIFO");
  }

  // depth 4 and 16, no gap, no stall: one item per cycle plus fill latency
  for (int k = 1; k <= 2; ++k) {
    const FifoRig& r = *rigs[k];
    check(r.sink.last_recv_cyc() <= static_cast<uint64_t>(static_cast<int>(stream_len)) + 4, r.name, "no full-rate streaming");
  }

  // the endless producer stops at depth, nothing past it
  printf("[push] level %d peak %d\n", full.fifo.level(), full.fifo.peak());
  check(full.fifo.level() == full.fifo.depth(), "push", "FIFO not full");
  check(full.fifo.peak() == full.fifo.depth(), "push", "level went past depth");

  if (failures) {
    printf("tb_sync_fifo: %d failure(s)\n", failures);
    return 1;
  }
  printf("tb_sync_fifo passed\n");
  return 0;
}
