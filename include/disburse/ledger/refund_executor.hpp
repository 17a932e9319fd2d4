#pragma once

#include <disburse/jobs/runner.hpp>
#include <disburse/ports/event_publisher_port.hpp>
#include <disburse/ports/psp_gateway.hpp>
#include <disburse/ports/time_source.hpp>
#include <disburse/schema/job.hpp>
#include <disburse/storage/state_store.hpp>

#include <stop_token>

namespace disburse::ledger {

/// Handler for `escrow.refund` jobs: returns a refunded escrow's funds to
/// the payer and marks the originating transaction refunded.
class refund_executor final {
 public:
  refund_executor(storage::state_store& store,
                  ports::psp_gateway& gateway,
                  ports::event_publisher_port& events,
                  ports::time_source_t clock);

  jobs::handler_result operator()(const schema::job_t& job,
                                  std::stop_token stop);

 private:
  storage::state_store& store_;
  ports::psp_gateway& gateway_;
  ports::event_publisher_port& events_;
  ports::time_source_t clock_;
};

}  // namespace disburse::ledger
