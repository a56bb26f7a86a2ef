// **********************************************************************
// xclk/src/xclk_loopback.cpp
// **********************************************************************
// xclk maintainers Oct 17 2026
/*
Loopback demo.  A system domain echoes every byte it receives from the device
back to the device, through an AcmChannel.  The engine model's host sends a
message and the run checks that the host gets the same bytes back.

  host --> AcmEngineModel --dev_out--> AcmChannel --out--> EchoApp --in--> AcmChannel --dev_in--> AcmEngineModel --> host

Usage:  xclk_loopback [-sys_period ps] [-dev_period ps] [-sync_mode 1] [-fifo_depth n]
                      [-msg text] [-vid n] [-product text] [-no_dfu_rt 1] [-detach 1]
                      [-trace ...] [-dump ...]
*/
#include "AcmChannel.hpp"
#include "AcmEngineModel.hpp"
#include "EngineConfig.hpp"
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

// **************
// Parameters (CLI flags): name, default value, help text
// **************
IntParameter(sys_period, 41667, "System clock period in ps (24 MHz)");
IntParameter(dev_period, 20833, "Device clock period in ps (48 MHz)");
BoolParameter(sync_mode, false, "Run both sides on the system clock, no synchronizers");
IntParameter(fifo_depth, 256, "Elastic buffer depth per direction (0 = unbuffered)");
IntParameter(stages, 2, "Synchronizer stages per crossing");
StringParameter(msg, "Hello, world! Echoed across two clock domains.", "Message the host sends");
IntParameter(vid, -1, "USB vendor id override, 0..0xffff (-1 = engine default)");
IntParameter(pid, -1, "USB product id override, 0..0xffff (-1 = engine default)");
StringParameter(vendor, "", "Vendor string override");
StringParameter(product, "", "Product string override");
StringParameter(serial, "", "Serial string override");
BoolParameter(no_dfu_rt, false, "Remove the DFU runtime interface");
BoolParameter(detach, false, "Have the host issue a DFU detach after the echo");
IntParameter(flush_timeout, 16, "Engine idle cycles before a timed flush");
IntParameter(timeout_us, 2000, "Give up after this much simulated time (us)");

// System-side application: hands every received byte straight back and
// keeps the engine's timed flush enabled.
class EchoApp : public Component {
  DECLARE_COMPONENT(EchoApp);
public:
  EchoApp(std::string /*name*/, Domain& sys, COMPONENT_CTOR) {
    clk << sys.clk;
    UPDATE(update_fwd).reads(rx_item, rx_valid).writes(tx_item, tx_valid);
    UPDATE(update_bwd).reads(tx_ready).writes(rx_ready);
    UPDATE(update_levels).writes(flush_now, flush_time);
    UPDATE(update_boot).reads(boot);
  }
  Clock(clk);
  Input (uint16_t, rx_item);     // from the channel's out_*
  Input (bool,     rx_valid);
  Output(bool,     rx_ready);
  Output(uint16_t, tx_item);     // into the channel's in_*
  Output(bool,     tx_valid);
  Input (bool,     tx_ready);
  Output(bool,     flush_now);
  Output(bool,     flush_time);
  Input (bool,     boot);        // bootloader_req

  uint64_t boot_seen() const { return boot_seen_; }

private:
  uint64_t boot_seen_ = 0;

  void update_fwd() {
    tx_item  = static_cast<uint16_t>(rx_item);
    tx_valid = static_cast<bool>(rx_valid);
  }
  void update_bwd() { rx_ready = static_cast<bool>(tx_ready); } // a byte moves only when both sides can
  void update_levels() {
    flush_now  = false;
    flush_time = true;
  }
  void update_boot() { if (boot) boot_seen_++; }
};

int main(int argc, char* argv[]) {
  // **************
  // Step 1: Parse tracing, parameters, and dump options
  // **************
  descore::parseTraces(argc, argv);
  Parameter::parseCommandLine(argc, argv);
  Sim::parseDumps(argc, argv);

  EngineConfig cfg;
  if (static_cast<int>(vid) >= 0) cfg.set_vid(static_cast<int>(vid));   // range-checked, no silent wrap
  if (static_cast<int>(pid) >= 0) cfg.set_pid(static_cast<int>(pid));
  if (!std::string(vendor).empty())  cfg.set_vendor(std::string(vendor));
  if (!std::string(product).empty()) cfg.set_product(std::string(product));
  if (!std::string(serial).empty())  cfg.set_serial(std::string(serial));
  cfg.set_no_dfu_rt(no_dfu_rt);

  // **************
  // Step 2: Create components
  // **************
  const bool sync = sync_mode;
  Domain sys("sys");
  std::unique_ptr<Domain> dev_own;
  if (!sync) dev_own = std::make_unique<Domain>("dev");
  Domain& dev = sync ? sys : *dev_own;

  SyncParams sp;
  sp.stages = static_cast<int>(stages);
  AcmChannel ch("ch", sys, dev, sync, static_cast<int>(fifo_depth), sp);
  AcmEngineModel engine("engine", dev, cfg, static_cast<int>(flush_timeout));
  EchoApp app("app", sys);

  // system side: echo
  app.rx_item      << ch.out_item;
  app.rx_valid     << ch.out_valid;
  ch.out_ready     << app.rx_ready;
  ch.in_item       << app.tx_item;
  ch.in_valid      << app.tx_valid;
  app.tx_ready     << ch.in_ready;
  ch.in_flush_now  << app.flush_now;
  ch.in_flush_time << app.flush_time;
  app.boot         << ch.bootloader_req;

  // device side: engine
  engine.in_item    << ch.dev_in_item;
  engine.in_valid   << ch.dev_in_valid;
  ch.dev_in_ready   << engine.in_ready;
  ch.dev_out_item   << engine.out_item;
  ch.dev_out_valid  << engine.out_valid;
  engine.out_ready  << ch.dev_out_ready;
  engine.flush_now  << ch.dev_flush_now;
  engine.flush_time << ch.dev_flush_time;
  ch.dev_bootloader << engine.bootloader;

  // **************
  // Step 3: Start clocks and initialize & reset simulator
  // **************
  sys.generateClock(static_cast<int>(sys_period));
  if (!sync) dev_own->generateClock(static_cast<int>(dev_period));
  Sim::init();
  Sim::reset();

  printf("xclk_loopback: %s, fifo_depth=%d, sys=%d ps, dev=%d ps\n",
         sync ? "synchronous" : "asynchronous", static_cast<int>(fifo_depth),
         static_cast<int>(sys_period), dev.period_ps());
  printf("engine: %s\n", cfg.describe().c_str());

  // **************
  // Step 4: Host sends the message, run until it is echoed back
  // **************
  const std::string text = std::string(msg);
  const std::vector<uint8_t> want(text.begin(), text.end());
  engine.host_send(want);

  const uint64_t limit = static_cast<uint64_t>(static_cast<int>(timeout_us)) * 1000000ull;
  const bool echoed = run_until([&] { return engine.host_received().size() >= want.size(); }, limit, 100000);

  if (detach) {
    engine.host_detach();
    run_for(64ull * static_cast<int>(sys_period));
  }

  // **************
  // Step 5: Report
  // **************
  const std::vector<uint8_t> got = engine.host_received();
  printf("host received %u bytes in %u packets at %llu ps\n", (unsigned)got.size(),
         (unsigned)engine.packets().size(), (unsigned long long)now_ps());
  if (ch.buffered())
    printf("fifo peak: in=%d out=%d\n", ch.fifo_in()->peak(), ch.fifo_out()->peak());
  if (detach)
    printf("detach: engine requests=%llu ignored=%llu, bootloader_req seen %llu times\n",
           (unsigned long long)engine.boot_requests(), (unsigned long long)engine.detach_ignored(),
           (unsigned long long)app.boot_seen());

  if (detach && app.boot_seen() != engine.boot_requests()) {
    printf("Loopback FAILED: bootloader request lost or duplicated\n");
    return 1;
  }
  if (!echoed || got != want) {
    printf("Loopback FAILED: expected \"%s\", got \"%s\"\n", text.c_str(), std::string(got.begin(), got.end()).c_str());
    return 1;
  }
  printf("Loopback successful!\n");
  return 0;
}
