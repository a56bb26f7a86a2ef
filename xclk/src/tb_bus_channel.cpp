// **********************************************************************
// xclk/src/tb_bus_channel.cpp
// **********************************************************************
// xclk maintainers Oct 19 2026
/*
BusChannel with a scripted master (sys) and the register model (dev):
  - register reads/writes through the channel's bridge
  - irq: a write to the irq register raises the sys-side irq level, a second
    write clears it
  - sof: every start-of-frame pulse of the core shows up once in sys
*/
#include "BusChannel.hpp"
#include "BusMaster.hpp"
#include "CoreRegsModel.hpp"
#include "Domain.hpp"
#include "EventCounter.hpp"
#include "SimHarness.hpp"
#include <cascade/Clock.hpp>
#include <cascade/SimDefs.hpp>
#include <cascade/SimGlobals.hpp>
#include <descore/Parameter.hpp>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>

using namespace xclk;

IntParameter(sof_period, 50, "Device cycles between start-of-frame pulses");

static int failures = 0;

static void check(bool ok, const std::string& rig, const char* what) {
  if (!ok) {
    printf("FAIL [%s] %s\n", rig.c_str(), what);
    failures++;
  }
}

struct ChanRig {
  std::string             name;
  int                     sys_ps, dev_ps;
  Domain                  sys;
  std::unique_ptr<Domain> dev_own;   // only in asynchronous mode
  Domain&                 dev;
  BusChannel              ch;
  BusMaster               master;
  CoreRegsModel           core;
  EventCounter            irq;       // sys view of the irq level
  EventCounter            sof;       // sys view of the frame pulses

  ChanRig(const std::string& n, int sp, int dp, bool sync, int sof_cyc)
    : name(n), sys_ps(sp), dev_ps(dp), sys(n + ".sys"),
      dev_own(sync ? nullptr : std::make_unique<Domain>(n + ".dev")), dev(sync ? sys : *dev_own),
      ch(n + ".ch", sys, dev, sync), master(n + ".master", sys), core(n + ".core", dev, 2, sof_cyc),
      irq(n + ".irq", sys), sof(n + ".sof", sys)
  {
    ch.cyc       << master.cyc;
    ch.adr       << master.adr;
    ch.dat_w     << master.dat_w;
    ch.we        << master.we;
    master.ack   << ch.ack;
    master.dat_r << ch.dat_r;

    core.cyc     << ch.dev_cyc;
    core.adr     << ch.dev_adr;
    core.dat_w   << ch.dev_dat_w;
    core.we      << ch.dev_we;
    ch.dev_ack   << core.ack;
    ch.dev_dat_r << core.dat_r;
    ch.dev_irq   << core.irq;
    ch.dev_sof   << core.sof;

    irq.i << ch.irq;
    sof.i << ch.sof;
  }

  void clock() {
    sys.generateClock(sys_ps);
    if (dev_own) dev_own->generateClock(dev_ps);
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
  // Step 2: Create rigs and script the register traffic
  // **************
  const int sof_cyc = static_cast<int>(sof_period);
  std::vector<std::unique_ptr<ChanRig>> rigs;
  rigs.push_back(std::make_unique<ChanRig>("bc_1000_4000", 1000, 4000, false, sof_cyc));
  rigs.push_back(std::make_unique<ChanRig>("bc_4000_1000", 4000, 1000, false, sof_cyc));
  rigs.push_back(std::make_unique<ChanRig>("bc_41667_20833", 41667, 20833, false, sof_cyc));
  rigs.push_back(std::make_unique<ChanRig>("bc_sync_2000", 2000, 2000, true, sof_cyc));

  for (auto& r : rigs) {
    r->master.enqueue_write(0x020, 0xCAFE);
    r->master.enqueue_write(0x024, 0x12345678);
    r->master.enqueue_read(0x020);
    r->master.enqueue_read(0x024);
    r->master.enqueue_write(CoreRegsModel::kIrqAddr, 1);
  }

  // **************
  // Step 3: Start clocks and initialize & reset simulator
  // **************
  for (auto& r : rigs) r->clock();
  Sim::init();
  Sim::reset();

  // **************
  // Step 4: Register traffic, ending with the irq raise
  // **************
  bool done = run_until([&] {
    for (auto& r : rigs) if (!r->master.done()) return false;
    return true;
  }, 100000000ull, 10000);
  check(done, "all", "register traffic did not complete");
  run_for(2000000);

  for (auto& r : rigs) {
    const std::vector<BusMaster::Ev>& res = r->master.results();
    check(res.size() == 5, r->name, "five transactions");
    if (res.size() == 5) {
      check(res[2].data == 0xCAFE, r->name, "read back 0x020");
      check(res[3].data == 0x5678, r->name, "read back 0x024 truncated to 16 bits");
    }
    check(r->irq.level() && r->irq.rises() == 1, r->name, "irq not raised in sys");
    check(r->ch.synchronous() == (r->dev_own == nullptr), r->name, "mode flag");
    r->master.enqueue_write(CoreRegsModel::kIrqAddr, 0);
  }

  // **************
  // Step 5: irq clear, and a run of frames
  // **************
  done = run_until([&] {
    for (auto& r : rigs) if (!r->master.done()) return false;
    return true;
  }, 100000000ull, 10000);
  check(done, "all", "irq clear did not complete");
  run_for(50000000);

  for (auto& r : rigs) {
    printf("[%s] sof: core %llu, sys %llu; irq rises %llu\n", r->name.c_str(),
           (unsigned long long)r->core.sofs(), (unsigned long long)r->sof.high(),
           (unsigned long long)r->irq.rises());
    check(!r->irq.level(), r->name, "irq not cleared in sys");
    check(r->core.sofs() > 10, r->name, "too few frames");
    check(r->sof.wide() == 0, r->name, "start-of-frame wider than one sys cycle");
    // the newest frame may still be crossing
    check(r->sof.high() <= r->core.sofs() && r->sof.high() + 1 >= r->core.sofs(), r->name,
          "start-of-frame pulses lost or duplicated");
  }

  if (failures) {
    printf("tb_bus_channel: %d failure(s)\n", failures);
    return 1;
  }
  printf("tb_bus_channel passed\n");
  return 0;
}
