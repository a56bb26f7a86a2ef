// **********************************************************************
// xclk/src/tb_engine_config.cpp
// **********************************************************************
// xclk maintainers Oct 19 2026
/*
EngineConfig field validation and description, no simulation:
  - strings: empty, longer than 126 characters, or with a character outside
    0x20..0x7e are rejected and leave the config untouched
  - ids: anything outside 0..0xffff is rejected, never wrapped
  - a fully populated config reports every field and describes itself
*/
#include "EngineConfig.hpp"
#include <cascade/Cascade.hpp>
#include <descore/Parameter.hpp>
#include <descore/assert.hpp>
#include <cstdio>
#include <functional>
#include <string>

using namespace xclk;

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
  } catch (descore::runtime_error& e) {
    printf("  rejected: %s\n", e.what());
    return true;
  }
  return false;
}

int main(int argc, char* argv[]) {
  // **************
  // Step 1: Parse tracing and parameters
  // **************
  descore::parseTraces(argc, argv);
  Parameter::parseCommandLine(argc, argv);

  // **************
  // Step 2: Strings
  // **************
  {
    EngineConfig cfg;
    check(rejected([&] { cfg.set_vendor(""); }), "strings", "empty vendor accepted");
    check(!cfg.has(EngineConfig::VENDOR), "strings", "rejected vendor marked present");

    const std::string longest(EngineConfig::kMaxStringLen, 'x');
    check(rejected([&] { cfg.set_product(longest + "x"); }), "strings", "127-character product accepted");
    check(!cfg.has(EngineConfig::PRODUCT), "strings", "rejected product marked present");
    check(!rejected([&] { cfg.set_product(longest); }), "strings", "126-character product refused");
    check(cfg.product() == longest, "strings", "126-character product stored");

    check(rejected([&] { cfg.set_serial(std::string("SN\x01" "42")); }), "strings", "control character accepted");
    check(rejected([&] { cfg.set_serial(std::string("SN\x7f")); }), "strings", "DEL accepted");
    check(rejected([&] { cfg.set_serial(std::string("caf\xc3\xa9")); }), "strings", "non-ASCII byte accepted");
    check(!cfg.has(EngineConfig::SERIAL), "strings", "rejected serial marked present");
    check(!rejected([&] { cfg.set_serial(" ~"); }), "strings", "printable edge characters refused");
  }

  // **************
  // Step 3: Ids
  // **************
  {
    EngineConfig cfg;
    check(rejected([&] { cfg.set_vid(0x10000); }), "ids", "vid 0x10000 accepted");
    check(rejected([&] { cfg.set_pid(-5); }), "ids", "negative pid accepted");
    check(!cfg.has(EngineConfig::VID) && !cfg.has(EngineConfig::PID), "ids", "rejected id marked present");
    check(!rejected([&] { cfg.set_vid(0xffff).set_pid(0); }), "ids", "edge ids refused");
    check(cfg.vid() == 0xffff && cfg.pid() == 0, "ids", "edge ids stored");
  }

  // **************
  // Step 4: Full config
  // **************
  {
    EngineConfig dflt;
    check(dflt.present() == 0, "describe", "default config has fields");
    check(dflt.describe() == "dfu_rt=on", "describe", "default description");

    EngineConfig cfg;
    cfg.set_vid(0x1209).set_pid(0x0001).set_vendor("xclk").set_product("ACM bridge")
       .set_serial("0001").set_no_dfu_rt(true);
    const EngineConfig::Field all[] = { EngineConfig::VID, EngineConfig::PID, EngineConfig::VENDOR,
                                        EngineConfig::PRODUCT, EngineConfig::SERIAL };
    for (EngineConfig::Field f : all) check(cfg.has(f), "describe", "field missing from full config");
    check(cfg.present() == 0x1fu, "describe", "present mask");
    const std::string want = "vid=1209 pid=0001 vendor=\"xclk\" product=\"ACM bridge\" serial=\"0001\" dfu_rt=off";
    printf("[describe] %s\n", cfg.describe().c_str());
    check(cfg.describe() == want, "describe", "full description");
  }

  if (failures) {
    printf("tb_engine_config: %d failure(s)\n", failures);
    return 1;
  }
  printf("tb_engine_config passed\n");
  return 0;
}
