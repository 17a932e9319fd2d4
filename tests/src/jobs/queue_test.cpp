#include <gtest/gtest.h>
#include <disburse/jobs/queue.hpp>
#include <disburse/testing/common.hpp>

#include <string>
#include <vector>

namespace {

disburse::schema::job_payload_t payout_payload(const std::string& batch_id) {
  return disburse::schema::job_payload_t{
      {"batch_id", batch_id}, {"escrow_id", std::string{"esc_" + batch_id}}};
}

disburse::schema::job_payload_t refund_payload(const std::string& escrow_id) {
  return disburse::schema::job_payload_t{{"escrow_id", escrow_id}};
}

class queue_harness final {
 public:
  queue_harness()
      : registry_{disburse::jobs::make_default_registry()},
        queue_{registry_,
               clock_.source(),
               disburse::ports::sequential_id_generator(),
               [] { return 0.0; },
               disburse::jobs::backoff_policy{1'000, 8'000, 0.0},
               5'000} {}

  disburse::jobs::queue& queue() { return queue_; }
  disburse::testing::manual_clock& clock() { return clock_; }

 private:
  disburse::testing::manual_clock clock_;
  disburse::jobs::registry registry_;
  disburse::jobs::queue queue_;
};

}  // namespace

TEST(queue, enqueue_validates_and_applies_registered_policy) {
  auto harness = queue_harness{};
  auto job = harness.queue().enqueue("payout.execute", payout_payload("b1"));
  ASSERT_TRUE(job.ok()) << job.info;
  EXPECT_EQ(job.value->status, disburse::schema::job_status_t::queued);
  EXPECT_EQ(job.value->max_attempts, 10u);
  EXPECT_EQ(job.value->attempt, 0u);
  EXPECT_EQ(job.value->priority, disburse::schema::kDefaultJobPriority);
  EXPECT_EQ(job.value->next_run_at, harness.clock().now());

  auto rejected = harness.queue().enqueue(
      "payout.execute", disburse::schema::job_payload_t{});
  EXPECT_EQ(rejected.code,
            disburse::schema::error_code::schema_validation_failed);
  auto unknown = harness.queue().enqueue("mail.send", payout_payload("b2"));
  EXPECT_EQ(unknown.code, disburse::schema::error_code::job_type_not_found);
  EXPECT_EQ(harness.queue().list().size(), 1u);
}

TEST(queue, leases_by_priority_then_due_time_then_age) {
  auto harness = queue_harness{};
  auto& jobs = harness.queue();
  auto low = jobs.enqueue("payout.execute", payout_payload("low"), 10);
  harness.clock().advance(1);
  auto first = jobs.enqueue("payout.execute", payout_payload("first"));
  auto second = jobs.enqueue("payout.execute", payout_payload("second"));
  auto urgent = jobs.enqueue("escrow.refund", refund_payload("esc_9"), 90);
  harness.clock().advance(1);

  EXPECT_EQ(jobs.lease("w")->job_id, urgent.value->job_id);
  EXPECT_EQ(jobs.lease("w")->job_id, first.value->job_id);
  EXPECT_EQ(jobs.lease("w")->job_id, second.value->job_id);
  EXPECT_EQ(jobs.lease("w")->job_id, low.value->job_id);
  EXPECT_FALSE(jobs.lease("w").has_value());
}

TEST(queue, lease_is_exclusive_and_timed) {
  auto harness = queue_harness{};
  auto& jobs = harness.queue();
  jobs.enqueue("payout.execute", payout_payload("b1"));

  auto leased = jobs.lease("worker-a");
  ASSERT_TRUE(leased.has_value());
  EXPECT_EQ(leased->status, disburse::schema::job_status_t::leased);
  EXPECT_EQ(leased->worker_id, "worker-a");
  EXPECT_EQ(leased->lease_expires_at, harness.clock().now() + 65'000);
  EXPECT_FALSE(jobs.lease("worker-b").has_value());
}

TEST(queue, success_needs_the_leasing_worker) {
  auto harness = queue_harness{};
  auto& jobs = harness.queue();
  auto job = jobs.enqueue("payout.execute", payout_payload("b1"));
  jobs.lease("worker-a");

  auto stolen = jobs.report_success(job.value->job_id, "worker-b");
  EXPECT_EQ(stolen.code, disburse::schema::error_code::job_not_leased);
  auto missing = jobs.report_success("job_missing", "worker-a");
  EXPECT_EQ(missing.code, disburse::schema::error_code::job_not_found);

  auto done = jobs.report_success(job.value->job_id, "worker-a");
  ASSERT_TRUE(done.ok()) << done.info;
  EXPECT_EQ(done.value->status, disburse::schema::job_status_t::succeeded);
  EXPECT_FALSE(done.value->worker_id.has_value());

  // A second report against a finished job is refused.
  EXPECT_EQ(jobs.report_success(job.value->job_id, "worker-a").code,
            disburse::schema::error_code::job_not_leased);
}

TEST(queue, failures_back_off_exponentially) {
  auto harness = queue_harness{};
  auto& jobs = harness.queue();
  auto job = jobs.enqueue("payout.execute", payout_payload("b1"));
  const auto& id = job.value->job_id;

  jobs.lease("w");
  auto failed = jobs.report_failure(id, "w", "gateway timeout");
  ASSERT_TRUE(failed.ok()) << failed.info;
  EXPECT_EQ(failed.value->status, disburse::schema::job_status_t::queued);
  EXPECT_EQ(failed.value->attempt, 1u);
  EXPECT_EQ(failed.value->last_error, "gateway timeout");
  EXPECT_EQ(failed.value->next_run_at, harness.clock().now() + 1'000);

  // Not runnable until the backoff has passed.
  EXPECT_FALSE(jobs.lease("w").has_value());
  EXPECT_EQ(jobs.next_due(), harness.clock().now() + 1'000);
  harness.clock().advance(1'000);
  ASSERT_TRUE(jobs.lease("w").has_value());
  failed = jobs.report_failure(id, "w", "gateway timeout");
  EXPECT_EQ(failed.value->next_run_at, harness.clock().now() + 2'000);
}

TEST(queue, exhausted_attempts_move_to_dead_letter) {
  auto harness = queue_harness{};
  auto& jobs = harness.queue();
  auto job = jobs.enqueue("escrow.refund", refund_payload("esc_1"));
  const auto& id = job.value->job_id;

  for (uint32_t attempt = 1; attempt <= 5; ++attempt) {
    ASSERT_TRUE(jobs.lease("w").has_value()) << "attempt " << attempt;
    auto failed = jobs.report_failure(id, "w", "declined");
    ASSERT_TRUE(failed.ok());
    EXPECT_EQ(failed.value->attempt, attempt);
    harness.clock().advance(8'000);
  }
  auto dead = jobs.find(id);
  EXPECT_EQ(dead->status, disburse::schema::job_status_t::dlq);
  EXPECT_FALSE(jobs.lease("w").has_value());
  EXPECT_EQ(jobs.list(disburse::schema::job_status_t::dlq).size(), 1u);
}

TEST(queue, permanent_failure_skips_retries) {
  auto harness = queue_harness{};
  auto& jobs = harness.queue();
  auto job = jobs.enqueue("payout.execute", payout_payload("b1"));
  jobs.lease("w");
  auto failed = jobs.report_failure(job.value->job_id, "w", "no handler", true);
  EXPECT_EQ(failed.value->status, disburse::schema::job_status_t::dlq);
  EXPECT_EQ(failed.value->attempt, 1u);
}

TEST(queue, expired_lease_is_reclaimed_as_a_failed_attempt) {
  auto harness = queue_harness{};
  auto& jobs = harness.queue();
  auto job = jobs.enqueue("payout.execute", payout_payload("b1"));
  jobs.lease("stuck");

  harness.clock().advance(65'000);
  // Reclaimed, but still inside its backoff window.
  EXPECT_FALSE(jobs.lease("fresh").has_value());
  auto reclaimed = jobs.find(job.value->job_id);
  EXPECT_EQ(reclaimed->status, disburse::schema::job_status_t::queued);
  EXPECT_EQ(reclaimed->attempt, 1u);
  EXPECT_EQ(reclaimed->last_error, "lease expired");

  harness.clock().advance(1'000);
  auto retaken = jobs.lease("fresh");
  ASSERT_TRUE(retaken.has_value());
  EXPECT_EQ(retaken->worker_id, "fresh");
  EXPECT_EQ(jobs.report_success(job.value->job_id, "stuck").code,
            disburse::schema::error_code::job_not_leased);
}

TEST(queue, concurrency_limit_caps_leases_per_type) {
  auto harness = queue_harness{};
  auto& jobs = harness.queue();
  for (int i = 0; i < 3; ++i) {
    jobs.enqueue("escrow.refund", refund_payload("esc_" + std::to_string(i)));
  }
  auto payout = jobs.enqueue("payout.execute", payout_payload("b1"), 10);

  auto first = jobs.lease("w1");
  auto second = jobs.lease("w2");
  ASSERT_TRUE(first && second);
  EXPECT_EQ(first->type, "escrow.refund");
  EXPECT_EQ(second->type, "escrow.refund");
  // The third refund waits; the lower priority payout runs instead.
  EXPECT_EQ(jobs.lease("w3")->job_id, payout.value->job_id);
  EXPECT_FALSE(jobs.lease("w4").has_value());

  jobs.report_success(first->job_id, "w1");
  auto third = jobs.lease("w4");
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(third->type, "escrow.refund");
}

TEST(queue, dead_letter_can_be_requeued) {
  auto harness = queue_harness{};
  auto& jobs = harness.queue();
  auto job = jobs.enqueue("payout.execute", payout_payload("b1"));
  const auto& id = job.value->job_id;

  EXPECT_EQ(jobs.requeue_dead_letter(id).code,
            disburse::schema::error_code::invalid_transition);
  EXPECT_EQ(jobs.requeue_dead_letter("job_missing").code,
            disburse::schema::error_code::job_not_found);

  jobs.lease("w");
  jobs.report_failure(id, "w", "bad account", true);
  auto requeued = jobs.requeue_dead_letter(id);
  ASSERT_TRUE(requeued.ok()) << requeued.info;
  EXPECT_EQ(requeued.value->status, disburse::schema::job_status_t::queued);
  EXPECT_EQ(requeued.value->attempt, 0u);
  EXPECT_EQ(jobs.lease("w")->job_id, id);
}

TEST(queue, extend_lease_keeps_the_holder) {
  auto harness = queue_harness{};
  auto& jobs = harness.queue();
  auto job = jobs.enqueue("payout.execute", payout_payload("b1"));
  jobs.lease("w1");

  harness.clock().advance(50'000);
  auto extended = jobs.extend_lease(job.value->job_id, "w1");
  ASSERT_TRUE(extended.ok()) << extended.info;
  harness.clock().advance(50'000);
  EXPECT_FALSE(jobs.lease("w2").has_value());
  EXPECT_EQ(jobs.find(job.value->job_id)->attempt, 0u);
  EXPECT_EQ(jobs.extend_lease(job.value->job_id, "w2").code,
            disburse::schema::error_code::job_not_leased);
}

TEST(queue, dead_letter_hook_fires_for_reclaimed_leases) {
  auto harness = queue_harness{};
  auto& jobs = harness.queue();
  auto dead = std::vector<disburse::schema::job_t>{};
  jobs.on_dead_letter("escrow.refund", [&dead](const auto& job) {
    dead.push_back(job);
  });
  auto job = jobs.enqueue("escrow.refund", refund_payload("esc_1"));

  for (int i = 0; i < 20 && dead.empty(); ++i) {
    jobs.lease("stuck");
    harness.clock().advance(70'000);
  }
  ASSERT_EQ(dead.size(), 1u);
  EXPECT_EQ(dead.front().job_id, job.value->job_id);
  EXPECT_EQ(dead.front().attempt, 5u);
  EXPECT_EQ(dead.front().last_error, "lease expired");
  EXPECT_EQ(jobs.find(job.value->job_id)->status,
            disburse::schema::job_status_t::dlq);
}
