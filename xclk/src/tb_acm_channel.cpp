// **********************************************************************
// xclk/src/tb_acm_channel.cpp
// **********************************************************************
// xclk maintainers Oct 19 2026
/*
AcmChannel end to end, sys ByteSource/ByteSink on one side, AcmEngineModel on
the other, asynchronous and synchronous, unbuffered and buffered:
  - sys -> host: every byte reaches the host, full packets flushed at 64 bytes
  - host -> sys: every byte reaches the sys sink, also under backpressure
  - flush_now level crosses and flushes a partial packet
  - a DFU detach gives exactly one bootloader_req pulse in sys, none with no_dfu_rt
  - with a deep buffer the sys producer finishes well before the unbuffered one
  - synchronous mode with two domains, a negative depth and a zero flush
    timeout are rejected; the simulation built afterwards runs normally
*/
#include "AcmChannel.hpp"
#include "AcmEngineModel.hpp"
#include "ByteSink.hpp"
#include "ByteSource.hpp"
#include "Domain.hpp"
#include "EngineConfig.hpp"
#include "EventCounter.hpp"
#include "LevelSource.hpp"
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

IntParameter(to_host_len, 150, "Bytes sent from sys to the host per rig");
IntParameter(from_host_len, 100, "Bytes sent from the host to sys per rig");
IntParameter(seed, 5, "Random seed");

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

struct AcmRig {
  std::string             name;
  int                     sys_ps, dev_ps;
  Domain                  sys;
  std::unique_ptr<Domain> dev_own;   // only in asynchronous mode
  Domain&                 dev;
  AcmChannel              ch;
  AcmEngineModel          engine;
  ByteSource              src;
  ByteSink                sink;
  LevelSource             flush_now;
  LevelSource             flush_time;
  EventCounter            boot;

  std::vector<uint8_t> to_host;
  std::vector<uint8_t> from_host;

  AcmRig(const std::string& n, int sp, int dp, bool sync, int depth, const EngineConfig& cfg,
         int stall, uint32_t s)
    : name(n), sys_ps(sp), dev_ps(dp), sys(n + ".sys"),
      dev_own(sync ? nullptr : std::make_unique<Domain>(n + ".dev")), dev(sync ? sys : *dev_own),
      ch(n + ".ch", sys, dev, sync, depth), engine(n + ".engine", dev, cfg, 200),
      src(n + ".src", sys), sink(n + ".sink", sys, stall, s),
      flush_now(n + ".flush_now", sys, false), flush_time(n + ".flush_time", sys, true),
      boot(n + ".boot", sys)
  {
    // sys side
    ch.in_item       << src.item;
    ch.in_valid      << src.valid;
    src.ready        << ch.in_ready;
    sink.item        << ch.out_item;
    sink.valid       << ch.out_valid;
    ch.out_ready     << sink.ready;
    ch.in_flush_now  << flush_now.o;
    ch.in_flush_time << flush_time.o;
    boot.i           << ch.bootloader_req;

    // device side
    engine.in_item    << ch.dev_in_item;
    engine.in_valid   << ch.dev_in_valid;
    ch.dev_in_ready   << engine.in_ready;
    ch.dev_out_item   << engine.out_item;
    ch.dev_out_valid  << engine.out_valid;
    engine.out_ready  << ch.dev_out_ready;
    engine.flush_now  << ch.dev_flush_now;
    engine.flush_time << ch.dev_flush_time;
    ch.dev_bootloader << engine.bootloader;
  }

  void script(int n_to, int n_from, std::mt19937& rng) {
    for (int k = 0; k < n_to; ++k) to_host.push_back((uint8_t)rng());
    for (int k = 0; k < n_from; ++k) from_host.push_back((uint8_t)rng());
    src.enqueue(to_host);
    engine.host_send(from_host);
  }

  void clock() {
    sys.generateClock(sys_ps);
    if (dev_own) dev_own->generateClock(dev_ps);
  }

  bool delivered() const {
    return sink.received().size() >= from_host.size() &&
           engine.host_received().size() + engine.unflushed() >= to_host.size();
  }

  void verify_data() {
    const std::vector<uint8_t> host = engine.host_received();
    size_t full = 0;
    for (const AcmEngineModel::Packet& p : engine.packets())
      if (p.reason == AcmEngineModel::FULL) {
        full++;
        check(p.bytes.size() == AcmEngineModel::kMaxPacket, name, "full packet of the wrong size");
      }
    printf("[%s] to host %u/%u in %u packets (%u full), from host %u/%u\n", name.c_str(),
           (unsigned)host.size(), (unsigned)to_host.size(), (unsigned)engine.packets().size(), (unsigned)full,
           (unsigned)sink.received().size(), (unsigned)from_host.size());
    check(host == to_host, name, "host did not receive the sys byte stream");
    check(sink.bytes() == from_host, name, "sys did not receive the host byte stream");
    check(full == to_host.size() / AcmEngineModel::kMaxPacket, name, "full packets at 64 bytes");
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
    check(rejected([&] { requireShared(a, b, true, "AcmChannel"); }), "reject",
          "synchronous channel accepted two domains");
    check(rejected([] { AcmChannel::checkDepth(-1); }), "reject", "negative FIFO depth accepted");
    check(!rejected([] { AcmChannel::checkDepth(0); }), "reject", "unbuffered channel refused");
    check(rejected([] { AcmEngineModel::checkFlushTimeout(0); }), "reject", "zero flush timeout accepted");
  }

  // **************
  // Step 3: Create rigs
  // **************
  std::mt19937 rng(static_cast<uint32_t>(static_cast<int>(seed)));
  std::vector<std::unique_ptr<AcmRig>> rigs;
  EngineConfig dflt;

  struct Case { const char* name; int sys_ps, dev_ps; bool sync; int depth; int stall; };
  const Case cases[] = {
    { "async_1000_4000_d0",     1000,  4000,  false, 0,   0  },
    { "async_1000_4000_d4",     1000,  4000,  false, 4,   30 },
    { "async_4000_1000_d0",     4000,  1000,  false, 0,   30 },
    { "async_4000_1000_d4",     4000,  1000,  false, 4,   0  },
    { "async_2000_2000_d16",    2000,  2000,  false, 16,  50 },
    { "async_41667_20833_d256", 41667, 20833, false, 256, 0  },
    { "sync_2000_d0",           2000,  2000,  true,  0,   0  },
    { "sync_2000_d4",           2000,  2000,  true,  4,   30 },
  };
  for (const Case& c : cases) {
    rigs.push_back(std::make_unique<AcmRig>(c.name, c.sys_ps, c.dev_ps, c.sync, c.depth, dflt, c.stall, rng()));
    rigs.back()->script(static_cast<int>(to_host_len), static_cast<int>(from_host_len), rng);
  }

  // DFU runtime interface removed: detach must not reach sys
  EngineConfig nodfu;
  nodfu.set_product("xclk test").set_no_dfu_rt(true);
  rigs.push_back(std::make_unique<AcmRig>("no_dfu_rt", 1000, 3000, false, 0, nodfu, 0, rng()));
  AcmRig& no_dfu = *rigs.back();
  no_dfu.script(10, 10, rng);

  // no timed flush: a partial packet waits for flush_now
  rigs.push_back(std::make_unique<AcmRig>("flush_now", 1000, 3000, false, 0, dflt, 0, rng()));
  AcmRig& fnow = *rigs.back();
  fnow.flush_time.set(false);
  fnow.script(10, 0, rng);

  // throughput: same clocks and payload, unbuffered vs deep buffer
  rigs.push_back(std::make_unique<AcmRig>("tp_unbuffered", 1000, 3000, false, 0, dflt, 0, rng()));
  AcmRig& unbuf = *rigs.back();
  rigs.push_back(std::make_unique<AcmRig>("tp_buffered", 1000, 3000, false, 256, dflt, 0, rng()));
  AcmRig& buf = *rigs.back();
  {
    std::mt19937 same(99);
    unbuf.script(200, 0, same);
    std::mt19937 again(99);
    buf.script(200, 0, again);
  }

  // **************
  // Step 4: Start clocks and initialize & reset simulator
  // **************
  for (auto& r : rigs) r->clock();
  Sim::init();
  Sim::reset();

  // **************
  // Step 5: Data both ways
  // **************
  const bool done = run_until([&] {
    for (auto& r : rigs) if (!r->delivered()) return false;
    return true;
  }, 2000000000ull, 10000);
  check(done, "all", "data did not get through");
  run_for(20000000); // idle: timed flushes complete

  for (auto& r : rigs) {
    if (r.get() == &fnow) continue;
    r->verify_data();
  }

  check(fnow.engine.packets().empty() && fnow.engine.unflushed() == 10, "flush_now",
        "partial packet flushed without flush_now or flush_time");

  // **************
  // Step 6: flush_now
  // **************
  fnow.flush_now.set(true);
  run_for(200000);
  fnow.flush_now.set(false);
  check(fnow.engine.packets().size() == 1 && fnow.engine.packets()[0].reason == AcmEngineModel::NOW &&
        fnow.engine.host_received() == fnow.to_host, "flush_now", "flush_now did not flush the partial packet");

  // **************
  // Step 7: Buffered producer finishes earlier
  // **************
  printf("[throughput] unbuffered source done at sys cycle %llu, buffered at %llu (fifo peak %d)\n",
         (unsigned long long)unbuf.src.last_sent_cyc(), (unsigned long long)buf.src.last_sent_cyc(),
         buf.ch.fifo_in()->peak());
  check(buf.src.last_sent_cyc() * 2 < unbuf.src.last_sent_cyc(), "throughput", "deep buffer did not absorb the burst");
  check(buf.ch.buffered() && !unbuf.ch.buffered(), "throughput", "buffered flags");

  // **************
  // Step 8: DFU detach
  // **************
  for (auto& r : rigs) r->engine.host_detach();
  run_for(5000000);
  for (auto& r : rigs) {
    const uint64_t want = r->engine.config().no_dfu_rt() ? 0 : 1;
    printf("[%s] bootloader_req pulses: %llu\n", r->name.c_str(), (unsigned long long)r->boot.rises());
    check(r->boot.rises() == want, r->name, "bootloader_req pulse count");
    check(r->boot.wide() == 0, r->name, "bootloader_req wider than one sys cycle");
  }
  check(no_dfu.engine.detach_ignored() == 1, "no_dfu_rt", "detach not ignored");
  check(no_dfu.engine.config().has(EngineConfig::PRODUCT) && !no_dfu.engine.config().has(EngineConfig::VID),
        "no_dfu_rt", "configuration fields");

  if (failures) {
    printf("tb_acm_channel: %d failure(s)\n", failures);
    return 1;
  }
  printf("tb_acm_channel passed\n");
  return 0;
}
