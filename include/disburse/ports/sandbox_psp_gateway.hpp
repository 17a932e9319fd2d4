#pragma once

#include <disburse/ports/psp_gateway.hpp>

#include <atomic>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace disburse::ports {

/// In-process gateway that settles every request immediately.
///
/// Used by the command line simulator; transfers are remembered by
/// idempotency key so a retried request returns the original transfer.
class sandbox_psp_gateway final : public psp_gateway {
 public:
  std::string_view provider() const override;
  intent_response create_intent(const intent_request& request) override;
  transfer_response capture_and_transfer(
      const transfer_request& request) override;
  refund_response refund(const refund_request& request) override;

  uint64_t transfer_count() const;

 private:
  mutable std::mutex mutex_;
  std::atomic<uint64_t> sequence_{};
  std::map<std::string, transfer_response> transfers_;
};

}  // namespace disburse::ports
