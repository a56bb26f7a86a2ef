// **********************************************************************
// xclk/src/AcmEngineModel.hpp
// **********************************************************************
// xclk maintainers Oct 15 2026
/*
Behavioral model of the device-side ACM protocol engine (dev domain).

Device -> host (the channel's sys -> dev stream): bytes collect in a packet
buffer that is handed to the host log when
  - it reaches kMaxPacket bytes                          (FULL)
  - an item carries the end-of-record marker              (LAST)
  - flush_now is high                                     (NOW)
  - flush_time is high and no byte arrived for timeout    (TIMEOUT)

Host -> device: bytes scripted with host_send() are presented on out_* with
ready/valid by an inner ByteSource.

host_detach() models a DFU detach request: bootloader pulses for one dev cycle,
unless the configuration removed the DFU runtime interface (no_dfu_rt).

   +--- AcmEngineModel ----------------+
-->| in_item, in_valid      out_item  |-->
<--| in_ready               out_valid |-->
-->| flush_now, flush_time  out_ready |<--
   |                       bootloader |-->
   +-----------------------------------+
*/
#pragma once

#include "ByteSource.hpp"
#include "Domain.hpp"
#include "EngineConfig.hpp"
#include "XclkTypes.hpp"
#include <memory>
#include <vector>

namespace xclk {

class AcmEngineModel : public Component {
  DECLARE_COMPONENT(AcmEngineModel);
public:
  static constexpr size_t kMaxPacket = 64;

  enum FlushReason : uint8_t { FULL = 0, LAST = 1, NOW = 2, TIMEOUT = 3 };
  struct Packet { std::vector<uint8_t> bytes; FlushReason reason; uint64_t cyc; };

  AcmEngineModel(std::string name, Domain& domain, const EngineConfig& cfg = EngineConfig(),
                 int flush_timeout = 16, COMPONENT_CTOR);
  Clock(clk);
  // Channel facing, dev domain
  Input (uint16_t, in_item);
  Input (bool,     in_valid);
  Output(bool,     in_ready);     // always high: the packet buffer never stalls
  Output(uint16_t, out_item);
  Output(bool,     out_valid);
  Input (bool,     out_ready);
  Input (bool,     flush_now);
  Input (bool,     flush_time);
  Output(bool,     bootloader);

  static int checkFlushTimeout(int cycles);   // >= 1, returns cycles

  // Host side
  void host_send(const std::vector<uint8_t>& bytes, bool last_on_final = false);
  void host_detach() { detach_req_ = true; }

  const std::vector<Packet>& packets()        const { return packets_; }
  std::vector<uint8_t>       host_received()  const;
  bool                       host_sent_all()  const { return tx_->done(); }
  size_t                     unflushed()      const { return buf_.size(); }
  uint64_t                   boot_requests()  const { return boot_requests_; }
  uint64_t                   detach_ignored() const { return detach_ignored_; }
  const EngineConfig&        config()         const { return cfg_; }

private:
  const EngineConfig          cfg_;
  const int                   flush_timeout_;
  std::unique_ptr<ByteSource> tx_;     // built once the parameters checked out
  Register(bool,     boot_r);
  Register(uint32_t, idle);            // dev cycles since the last byte
  std::vector<uint8_t> buf_;
  std::vector<Packet>  packets_;
  uint64_t             cyc_            = 0;
  bool                 detach_req_     = false;
  uint64_t             boot_requests_  = 0;
  uint64_t             detach_ignored_ = 0;

  void flush(FlushReason why);
  void update_out();
  void update_regs();
};

} // namespace xclk
