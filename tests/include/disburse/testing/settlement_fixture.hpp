#pragma once

#include <disburse/jobs/queue.hpp>
#include <disburse/jobs/registry.hpp>
#include <disburse/ledger/escrow_ledger.hpp>
#include <disburse/ledger/refund_executor.hpp>
#include <disburse/milestone/state_machine.hpp>
#include <disburse/payout/executor.hpp>
#include <disburse/payout/scheduler.hpp>
#include <disburse/ports/access_policy.hpp>
#include <disburse/ports/id_generator.hpp>
#include <disburse/split/calculator.hpp>
#include <disburse/storage/memory/state_store.hpp>
#include <disburse/testing/common.hpp>
#include <disburse/testing/recording_ports.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace disburse::testing {

/// The settlement components wired by hand, without the engine facade, so
/// tests can drive each one directly. Records are seeded straight into the
/// store.
class settlement_fixture final {
 public:
  explicit settlement_fixture(
      const disburse::schema::placeholder_policy_t policy =
          disburse::schema::placeholder_policy_t::withhold)
      : ids_{disburse::ports::sequential_id_generator()},
        registry_{disburse::jobs::make_default_registry()},
        queue_{registry_, clock_.source(), ids_, [] { return 0.0; },
               disburse::jobs::backoff_policy{1'000, 8'000, 0.0}},
        ledger_{store_, clock_.source(), ids_},
        milestones_{store_,         ledger_, access_,        queue_,
                    notifications_, events_, clock_.source()},
        scheduler_{store_,  calculator_, queue_,          notifications_,
                   events_, ids_,        clock_.source(), policy},
        executor_{store_, gateway_, notifications_, events_, clock_.source()},
        refunds_{store_, gateway_, events_, clock_.source()} {
    queue_.on_dead_letter(
        std::string{disburse::payout::kExecuteJobType},
        [this](const disburse::schema::job_t& job) { executor_.give_up(job); });
  }

  settlement_fixture(const settlement_fixture&) = delete;
  settlement_fixture& operator=(const settlement_fixture&) = delete;
  settlement_fixture(settlement_fixture&&) = delete;
  settlement_fixture& operator=(settlement_fixture&&) = delete;

  disburse::storage::memory_state_store& store() { return store_; }
  manual_clock& clock() { return clock_; }
  scripted_gateway& gateway() { return gateway_; }
  recording_notifications& notifications() { return notifications_; }
  recording_events& events() { return events_; }
  disburse::jobs::queue& queue() { return queue_; }
  const disburse::ledger::escrow_ledger& ledger() const { return ledger_; }
  disburse::milestone::state_machine& milestones() { return milestones_; }
  disburse::payout::scheduler& scheduler() { return scheduler_; }
  disburse::payout::executor& executor() { return executor_; }
  disburse::ledger::refund_executor& refunds() { return refunds_; }

  disburse::schema::project_t seed_project(
      std::vector<disburse::schema::revenue_split_t> splits) {
    auto project = disburse::schema::project_t{};
    project.project_id = ids_("prj");
    project.owner_id = "owner";
    project.member_ids = {"alice", "bob"};
    project.splits = std::move(splits);
    insert(project);
    return project;
  }

  disburse::schema::milestone_t seed_milestone(
      const disburse::schema::project_t& project,
      const disburse::schema::amount_t amount) {
    auto milestone = disburse::schema::milestone_t{};
    milestone.milestone_id = ids_("ms");
    milestone.project_id = project.project_id;
    milestone.title = "Delivery";
    milestone.amount = amount;
    milestone.currency = "USD";
    insert(milestone);
    return milestone;
  }

  disburse::schema::payment_transaction_t seed_payment(
      const disburse::schema::milestone_t& milestone,
      const disburse::schema::transaction_status_t status =
          disburse::schema::transaction_status_t::succeeded) {
    auto transaction = disburse::schema::payment_transaction_t{};
    transaction.transaction_id = ids_("pay");
    transaction.project_id = milestone.project_id;
    transaction.milestone_id = milestone.milestone_id;
    transaction.payer_id = "payer";
    transaction.provider = "scripted";
    transaction.provider_intent_id = "pi_" + transaction.transaction_id;
    transaction.provider_payment_id = "ch_" + transaction.transaction_id;
    transaction.amount = milestone.amount;
    transaction.currency = milestone.currency;
    transaction.status = status;
    insert(transaction);
    return transaction;
  }

  /// Milestone funded through the state machine; returns its escrow.
  disburse::schema::escrow_t funded(const disburse::schema::project_t& project,
                                    const disburse::schema::amount_t amount) {
    auto milestone = seed_milestone(project, amount);
    auto payment = seed_payment(milestone);
    auto result = milestones_.fund(milestone.milestone_id, payment);
    if (!result.ok()) {
      throw std::runtime_error{result.info};
    }
    return *result.value->escrow;
  }

  /// Escrow taken through complete and approve, i.e. released.
  disburse::schema::escrow_t released(
      const disburse::schema::project_t& project,
      const disburse::schema::amount_t amount) {
    auto escrow = funded(project, amount);
    auto completed = milestones_.complete(escrow.milestone_id, "alice");
    if (!completed.ok()) {
      throw std::runtime_error{completed.info};
    }
    auto approved = milestones_.approve(escrow.milestone_id, "owner");
    if (!approved.ok()) {
      throw std::runtime_error{approved.info};
    }
    return *approved.value->escrow;
  }

  disburse::payout::schedule_request request_for(
      const disburse::schema::escrow_t& escrow) const {
    auto request = disburse::payout::schedule_request{};
    request.escrow_id = escrow.escrow_id;
    request.project_id = escrow.project_id;
    request.milestone_id = escrow.milestone_id;
    request.amount = escrow.amount;
    request.currency = escrow.currency;
    return request;
  }

  template <typename T>
  void insert(T& record) {
    auto status = disburse::storage::write_one(
        store_, disburse::storage::write_mode_t::insert, record);
    if (status != disburse::storage::write_status_t::ok) {
      throw std::runtime_error{
          std::string{disburse::storage::to_string(status)}};
    }
  }

 private:
  manual_clock clock_;
  disburse::ports::id_generator_t ids_;
  disburse::storage::memory_state_store store_;
  scripted_gateway gateway_;
  recording_notifications notifications_;
  recording_events events_;
  disburse::ports::project_access_policy access_;
  disburse::split::calculator calculator_;
  disburse::jobs::registry registry_;
  disburse::jobs::queue queue_;
  disburse::ledger::escrow_ledger ledger_;
  disburse::milestone::state_machine milestones_;
  disburse::payout::scheduler scheduler_;
  disburse::payout::executor executor_;
  disburse::ledger::refund_executor refunds_;
};

}  // namespace disburse::testing
