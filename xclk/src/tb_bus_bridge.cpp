// **********************************************************************
// xclk/src/tb_bus_bridge.cpp
// **********************************************************************
// xclk maintainers Oct 18 2026
/*
BusBridge between a scripted master (sys) and the register model (dev):
  - read 0x04 then write 0x10 = 0xDEADBEEF: the write waits for the read's ack,
    lands as 0xBEEF, and the read returns the register contents
  - random reads/writes against a shadow copy, across four clock ratios, with
    and without back-to-back requests, and with 3-stage synchronizers: every
    read returns the last write (16 bits, zero-extended) and never more than
    one request is in flight
  - an initiator that changes its request while one is pending: the latched
    request is served first
  - synchronous mode on one domain: same results, lower latency
  - synchronous mode with two domains, and bad widths/stages, are rejected
*/
#include "BusBridge.hpp"
#include "BusMaster.hpp"
#include "CoreRegsModel.hpp"
#include "Domain.hpp"
#include "SimHarness.hpp"
#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>
#include <descore/Parameter.hpp>
#include <descore/assert.hpp>
#include <cstdio>
#include <functional>
#include <memory>
#include <random>
#include <string>
#include <vector>

using namespace xclk;

IntParameter(num_ops, 200, "Random transactions per rig");
IntParameter(seed, 7, "Random seed");

static int failures = 0;

static void check(bool ok, const std::string& rig, const char* what) {
  if (!ok) {
    printf("FAIL [%s] %s\n", rig.c_str(), what);
    failures++;
  }
}

static bool rejected(const std::function<void()>& fn) {
  try {
    fn();
  } catch (descore::runtime_error&) {
    return true;
  }
  return false;
}

struct BusRig {
  std::string             name;
  int                     sys_ps, dev_ps;
  bool                    sync;
  Domain                  sys;
  std::unique_ptr<Domain> dev_own;   // only in asynchronous mode
  Domain&                 dev;
  BusBridge               bridge;
  BusMaster               master;
  CoreRegsModel           core;

  std::vector<uint16_t> shadow;
  std::vector<uint32_t> expect;   // data expected in each result record

  BusRig(const std::string& n, int sp, int dp, bool s, int latency, BridgeParams params = BridgeParams())
    : name(n), sys_ps(sp), dev_ps(dp), sync(s), sys(n + ".sys"),
      dev_own(s ? nullptr : std::make_unique<Domain>(n + ".dev")), dev(s ? sys : *dev_own),
      bridge(n + ".bridge", sys, dev, s, params), master(n + ".master", sys), core(n + ".core", dev, latency),
      shadow(1u << CoreRegsModel::kAddrBits, 0)
  {
    bridge.cyc   << master.cyc;
    bridge.adr   << master.adr;
    bridge.dat_w << master.dat_w;
    bridge.we    << master.we;
    master.ack   << bridge.ack;
    master.dat_r << bridge.dat_r;

    core.cyc     << bridge.dev_cyc;
    core.adr     << bridge.dev_adr;
    core.dat_w   << bridge.dev_dat_w;
    core.we      << bridge.dev_we;
    bridge.dev_ack   << core.ack;
    bridge.dev_dat_r << core.dat_r;
    core.irq.sendToBitBucket();
    core.sof.sendToBitBucket();
  }

  void poke(uint32_t addr, uint16_t v) {
    core.poke(addr, v);
    shadow[addr & 0xfffu] = v;
  }
  void write(uint32_t addr, uint32_t data) {
    master.enqueue_write(addr, data);
    shadow[addr & 0xfffu] = (uint16_t)data;
    expect.push_back(data);
  }
  void read(uint32_t addr) {
    master.enqueue_read(addr);
    expect.push_back(shadow[addr & 0xfffu]);
  }

  void random_script(int n, uint32_t s) {
    std::mt19937 rng(s);
    for (uint32_t a = 0; a < 64; ++a) poke(a * 4, (uint16_t)rng());
    for (int k = 0; k < n; ++k) {
      // small window so reads hit earlier writes; high bits exercise masking
      const uint32_t addr = (rng() & 0xfff00000u) | ((rng() % 64u) * 4u);
      if (rng() % 2) write(addr, rng());
      else           read(addr);
    }
  }

  void clock() {
    sys.generateClock(sys_ps);
    if (dev_own) dev_own->generateClock(dev_ps);
  }

  double mean_latency_cyc() const {
    if (master.results().empty()) return 0.0;
    double sum = 0.0;
    for (const BusMaster::Ev& e : master.results()) sum += (double)(e.ack_cyc - e.issue_cyc);
    return sum / (double)master.results().size();
  }

  void verify() {
    const std::vector<BusMaster::Ev>& res = master.results();
    const std::vector<CoreRegsModel::Access>& acc = core.accesses();
    check(res.size() == expect.size(), name, "not every transaction completed");
    check(acc.size() == res.size(), name, "core saw a different number of accesses");
    size_t bad = 0;
    for (size_t k = 0; k < res.size() && k < expect.size(); ++k)
      if (res[k].data != expect[k]) {
        if (bad++ < 4)
          printf("  [%s] #%u %s 0x%08x: got 0x%08x want 0x%08x\n", name.c_str(), (unsigned)k,
                 res[k].we ? "wr" : "rd", res[k].addr, res[k].data, expect[k]);
      }
    check(bad == 0, name, "data mismatch against shadow registers");

    // one in flight: access k lands after ack k-1 and before ack k
    bool single = true;
    for (size_t k = 0; k < acc.size() && k < res.size(); ++k) {
      if (acc[k].ps >= res[k].ack_ps) single = false;
      if (k > 0 && acc[k].ps <= res[k - 1].ack_ps) single = false;
    }
    check(single, name, "more than one transaction in flight");
    for (size_t k = 1; k < res.size(); ++k)
      if (res[k].issue_ps < res[k - 1].ack_ps) { check(false, name, "request issued before previous ack"); break; }

    check(bridge.issued() == res.size() && bridge.completed() == res.size(), name, "issue/complete counters");
    check(!bridge.outstanding(), name, "bridge still outstanding at rest");
    printf("[%s] %u transactions, mean latency %.1f sys cycles\n", name.c_str(), (unsigned)res.size(),
           mean_latency_cyc());
  }
};

// Initiator that switches to a write while its read is still pending (cyc held
// high throughout).  The bridge must serve the latched read, then issue the write.
class HoldOffDriver : public Component {
  DECLARE_COMPONENT(HoldOffDriver);
public:
  HoldOffDriver(std::string /*name*/, Domain& d, const BusBridge& bridge, COMPONENT_CTOR)
    : bridge_(bridge)
  {
    clk << d.clk;
    UPDATE(update_out).writes(cyc, adr, dat_w, we);
    UPDATE(update_regs).reads(ack, dat_r);
  }
  Clock(clk);
  Output(bool,     cyc);
  Output(uint32_t, adr);
  Output(uint32_t, dat_w);
  Output(bool,     we);
  Input (bool,     ack);
  Input (uint32_t, dat_r);

  int      acks          = 0;
  uint32_t read_data     = 0;
  uint64_t read_ack_ps   = 0;
  uint64_t issued_at_ack = 0;   // bridge issue count when the read completed

private:
  const BusBridge& bridge_;
  Register(bool,     cyc_r);
  Register(uint32_t, adr_r);
  Register(uint32_t, dat_w_r);
  Register(bool,     we_r);
  uint64_t cyc_ = 0;

  void update_out() {
    cyc   = static_cast<bool>(cyc_r);
    adr   = static_cast<uint32_t>(adr_r);
    dat_w = static_cast<uint32_t>(dat_w_r);
    we    = static_cast<bool>(we_r);
  }
  void update_regs() {
    cyc_++;
    if (cyc_ == 5) { cyc_r = true; adr_r = 0x04u; we_r = false; }
    if (cyc_ == 7) { adr_r = 0x10u; dat_w_r = 0xDEADBEEFu; we_r = true; }  // read still pending
    if (!ack) return;
    if (++acks == 1) {
      read_data     = dat_r;
      read_ack_ps   = now_ps();
      issued_at_ack = bridge_.issued();
    } else {
      cyc_r = false;
    }
  }
};

struct HoldOffRig {
  Domain        sys;
  Domain        dev;
  BusBridge     bridge;
  CoreRegsModel core;
  HoldOffDriver drv;

  HoldOffRig()
    : sys("holdoff.sys"), dev("holdoff.dev"), bridge("holdoff.bridge", sys, dev, false),
      core("holdoff.core", dev, 3), drv("holdoff.drv", sys, bridge)
  {
    bridge.cyc   << drv.cyc;
    bridge.adr   << drv.adr;
    bridge.dat_w << drv.dat_w;
    bridge.we    << drv.we;
    drv.ack      << bridge.ack;
    drv.dat_r    << bridge.dat_r;
    core.cyc     << bridge.dev_cyc;
    core.adr     << bridge.dev_adr;
    core.dat_w   << bridge.dev_dat_w;
    core.we      << bridge.dev_we;
    bridge.dev_ack   << core.ack;
    bridge.dev_dat_r << core.dat_r;
    core.irq.sendToBitBucket();
    core.sof.sendToBitBucket();
    core.poke(0x04, 0x0404);
  }
};

int main(int argc, char* argv[]) {
  // **************
  // Step 1: Parse tracing, parameters, and dump options
  // **************
  descore::parseTraces(argc, argv);
  Parameter::parseCommandLine(argc, argv);
  Sim::parseDumps(argc, argv);

  // **************
  // Step 2: Reject bad configurations before anything is built
  // **************
  {
    Domain a("reject.a");
    Domain b("reject.b");
    check(rejected([&] { requireShared(a, b, true, "BusBridge"); }), "reject",
          "synchronous bridge accepted two domains");
    check(!rejected([&] { requireShared(a, a, true, "BusBridge"); }), "reject",
          "synchronous bridge refused one shared domain");
    BridgeParams narrow;
    narrow.dev_data_bits = 0;
    check(rejected([&] { BusBridge::checkParams(narrow); }), "reject", "zero data width accepted");
    BridgeParams wide;
    wide.dev_addr_bits = 33;
    check(rejected([&] { BusBridge::checkParams(wide); }), "reject", "33-bit address accepted");
    BridgeParams shallow;
    shallow.stages = 1;
    check(rejected([&] { BusBridge::checkParams(shallow); }), "reject", "one-stage handshake accepted");
  }

  // **************
  // Step 3: Create rigs
  // **************
  std::vector<std::unique_ptr<BusRig>> rigs;
  const uint32_t s0 = static_cast<uint32_t>(static_cast<int>(seed));

  // concrete: read 0x04, then write 0x10 = 0xDEADBEEF
  rigs.push_back(std::make_unique<BusRig>("concrete", 1000, 3000, false, 2));
  BusRig& concrete = *rigs.back();
  concrete.poke(0x04, 0x1234);
  concrete.read(0x04);
  concrete.write(0x10, 0xDEADBEEFu);

  const int ratios[][2] = { {1000, 4000}, {4000, 1000}, {2000, 2000}, {1000, 7300} };
  for (const auto& r : ratios) {
    for (int gap = 0; gap <= 3; gap += 3) {
      const std::string name = "bb_" + std::to_string(r[0]) + "_" + std::to_string(r[1]) + "_gap" + std::to_string(gap);
      rigs.push_back(std::make_unique<BusRig>(name, r[0], r[1], false, 1 + gap));
      rigs.back()->master.set_gap(gap);
      rigs.back()->random_script(static_cast<int>(num_ops), s0 + (uint32_t)rigs.size());
    }
  }

  // 3-stage handshakes, both directions of ratio
  BridgeParams deep;
  deep.stages = 3;
  rigs.push_back(std::make_unique<BusRig>("bb3_1000_3000", 1000, 3000, false, 1, deep));
  rigs.back()->random_script(static_cast<int>(num_ops), s0 + 101);
  rigs.push_back(std::make_unique<BusRig>("bb3_3000_1000", 3000, 1000, false, 2, deep));
  rigs.back()->master.set_gap(2);
  rigs.back()->random_script(static_cast<int>(num_ops), s0 + 102);

  // the same script, synchronous and asynchronous at the same period
  rigs.push_back(std::make_unique<BusRig>("sync_1000", 1000, 1000, true, 1));
  BusRig& fast = *rigs.back();
  rigs.push_back(std::make_unique<BusRig>("async_1000_1000", 1000, 1000, false, 1));
  BusRig& slow = *rigs.back();
  fast.random_script(static_cast<int>(num_ops), s0);
  slow.random_script(static_cast<int>(num_ops), s0);

  HoldOffRig hold;

  // **************
  // Step 4: Start clocks and initialize & reset simulator
  // **************
  for (auto& r : rigs) r->clock();
  hold.sys.generateClock(1000);
  hold.dev.generateClock(4000);
  Sim::init();
  Sim::reset();

  // **************
  // Step 5: Run until every master is done, then check
  // **************
  const bool done = run_until([&] {
    for (auto& r : rigs) if (!r->master.done()) return false;
    return hold.drv.acks >= 2;
  }, 200000000ull, 10000);
  check(done, "all", "masters did not finish");
  run_for(100000);  // let the final acks clear the bridges

  for (auto& r : rigs) r->verify();

  // concrete scenario details
  {
    const std::vector<BusMaster::Ev>& res = concrete.master.results();
    if (res.size() == 2) {
      check(!res[0].we && res[0].data == 0x1234, "concrete", "read 0x04 returned the register value");
      check(res[1].we && res[1].issue_ps >= res[0].ack_ps, "concrete", "write issued only after the read ack");
    }
    const std::vector<CoreRegsModel::Access>& acc = concrete.core.accesses();
    check(acc.size() == 2, "concrete", "core saw two accesses");
    if (acc.size() == 2) {
      check(!acc[0].we && acc[0].addr == 0x04, "concrete", "first core access is the read");
      check(acc[1].we && acc[1].addr == 0x10 && acc[1].data == 0xBEEF, "concrete", "write reaches the core as 0xBEEF");
    }
    check(concrete.core.peek(0x10) == 0xBEEF, "concrete", "register 0x10 holds the masked write");
  }

  // bridge-level hold-off
  {
    const std::vector<CoreRegsModel::Access>& acc = hold.core.accesses();
    printf("[holdoff] read acked at %llu ps\n", (unsigned long long)hold.drv.read_ack_ps);
    check(hold.drv.acks == 2 && acc.size() == 2, "holdoff", "two transactions");
    if (acc.size() == 2) {
      check(!acc[0].we && acc[0].addr == 0x04, "holdoff", "pending read kept its latched request");
      check(acc[1].we && acc[1].addr == 0x10 && acc[1].data == 0xBEEF, "holdoff", "write served second");
      check(acc[1].ps > hold.drv.read_ack_ps, "holdoff", "write reached the core before the read ack");
    }
    check(hold.drv.read_data == 0x0404, "holdoff", "read data");
    check(hold.drv.issued_at_ack == 1, "holdoff", "write issued before the read ack");
    const BusRequest last = hold.bridge.request();
    check(last.we && last.addr == 0x10 && last.wdata == 0xBEEF, "holdoff", "last latched request is the masked write");
  }

  check(fast.mean_latency_cyc() < slow.mean_latency_cyc(), "sync_1000", "synchronous mode not faster");
  check(fast.bridge.synchronous() && !slow.bridge.synchronous(), "sync_1000", "mode flags");

  if (failures) {
    printf("tb_bus_bridge: %d failure(s)\n", failures);
    return 1;
  }
  printf("tb_bus_bridge passed\n");
  return 0;
}
