#pragma once

#include <disburse/config/engine_config.hpp>
#include <disburse/execution/engine.hpp>
#include <disburse/ports/access_policy.hpp>
#include <disburse/ports/id_generator.hpp>
#include <disburse/storage/memory/state_store.hpp>
#include <disburse/testing/common.hpp>
#include <disburse/testing/recording_ports.hpp>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace disburse::testing {

inline disburse::config::engine_config make_test_config() {
  auto config = disburse::config::engine_config{};
  config.backoff.base = 1'000;
  config.backoff.cap = 8'000;
  config.backoff.jitter_ratio = 0.0;
  config.worker_count = 2;
  config.poll_interval = std::chrono::milliseconds{10};
  return config;
}

/// Whole engine over an in-memory store, a scripted gateway and a clock
/// that only moves when the test says so. Projects are owned by "owner"
/// with "alice" and "bob" as members.
class engine_fixture final {
 public:
  explicit engine_fixture(
      disburse::config::engine_config config = make_test_config())
      : engine_{std::move(config),
                disburse::execution::engine_ports{
                    .store = store_,
                    .gateway = gateway_,
                    .notifications = notifications_,
                    .events = events_,
                    .access = access_,
                    .clock = clock_.source(),
                    .ids = disburse::ports::sequential_id_generator(),
                    .random = [] { return 0.0; },
                    .verifier = {}}} {}

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  disburse::execution::engine& engine() { return engine_; }
  disburse::storage::memory_state_store& store() { return store_; }
  scripted_gateway& gateway() { return gateway_; }
  recording_notifications& notifications() { return notifications_; }
  recording_events& events() { return events_; }
  manual_clock& clock() { return clock_; }

  disburse::schema::project_t create_project(
      std::vector<disburse::schema::revenue_split_t> splits) {
    auto created =
        engine_.create_project("owner", {"alice", "bob"}, std::move(splits));
    if (!created.ok()) {
      throw std::runtime_error{created.info};
    }
    return *created.value;
  }

  disburse::schema::milestone_t create_milestone(
      const std::string_view project_id,
      const disburse::schema::amount_t amount,
      const std::string_view currency = "USD") {
    auto created = engine_.create_milestone(project_id, "owner", "Delivery",
                                            amount, currency);
    if (!created.ok()) {
      throw std::runtime_error{created.info};
    }
    return *created.value;
  }

  /// Open a payment intent for the milestone and deliver the provider's
  /// success webhook. Returns the payment transaction.
  disburse::schema::payment_transaction_t fund(
      const std::string_view project_id,
      const std::string_view milestone_id) {
    auto intent =
        engine_.create_payment_intent(project_id, milestone_id, "payer");
    if (!intent.ok()) {
      throw std::runtime_error{intent.info};
    }
    const auto& transaction = intent.value->transaction;
    auto delivered = engine_.receive_webhook(
        "scripted",
        payment_webhook("payment_intent.succeeded",
                        transaction.provider_intent_id,
                        transaction.transaction_id),
        "sig");
    if (!delivered.ok()) {
      throw std::runtime_error{delivered.info};
    }
    return *store_.find_transaction(transaction.transaction_id);
  }

  /// Project, funded and completed milestone, ready for approval.
  disburse::schema::milestone_t completed_milestone(
      std::vector<disburse::schema::revenue_split_t> splits,
      const disburse::schema::amount_t amount) {
    auto project = create_project(std::move(splits));
    auto milestone = create_milestone(project.project_id, amount);
    fund(project.project_id, milestone.milestone_id);
    auto completed =
        engine_.complete_milestone(milestone.milestone_id, "alice");
    if (!completed.ok()) {
      throw std::runtime_error{completed.info};
    }
    return completed.value->milestone;
  }

 private:
  manual_clock clock_;
  disburse::storage::memory_state_store store_;
  scripted_gateway gateway_;
  recording_notifications notifications_;
  recording_events events_;
  disburse::ports::project_access_policy access_;
  disburse::execution::engine engine_;
};

}  // namespace disburse::testing
