#include <gtest/gtest.h>
#include <disburse/testing/settlement_fixture.hpp>

#include <stop_token>

namespace {

using disburse::testing::make_split;

/// Funded milestone disputed and then rejected; returns the refund job.
disburse::schema::job_t rejected_refund_job(
    disburse::testing::settlement_fixture& fixture,
    disburse::schema::escrow_t& escrow) {
  auto project = fixture.seed_project({make_split("alice", "100")});
  escrow = fixture.funded(project, 8'000);
  auto disputed =
      fixture.milestones().dispute(escrow.milestone_id, "alice", "no show");
  EXPECT_TRUE(disputed.ok()) << disputed.info;
  auto rejected =
      fixture.milestones().reject(escrow.milestone_id, "owner", "no show");
  EXPECT_TRUE(rejected.ok()) << rejected.info;
  auto job = fixture.queue().lease("test");
  EXPECT_TRUE(job.has_value());
  return *job;
}

}  // namespace

TEST(refund_executor, returns_funds_and_marks_transaction_refunded) {
  auto fixture = disburse::testing::settlement_fixture{};
  auto escrow = disburse::schema::escrow_t{};
  auto job = rejected_refund_job(fixture, escrow);
  EXPECT_EQ(job.type, "escrow.refund");

  auto result = fixture.refunds()(job, std::stop_token{});
  EXPECT_EQ(result.status, disburse::jobs::handler_status_t::succeeded)
      << result.message;

  auto refunds = fixture.gateway().refunds();
  ASSERT_EQ(refunds.size(), 1u);
  EXPECT_EQ(refunds[0].amount, 8'000);
  EXPECT_EQ(refunds[0].provider_payment_id, escrow.provider_reference);
  EXPECT_EQ(refunds[0].idempotency_key, "refund:" + escrow.escrow_id);
  EXPECT_EQ(refunds[0].reason, "no show");

  EXPECT_EQ(fixture.store().find_transaction(escrow.transaction_id)->status,
            disburse::schema::transaction_status_t::refunded);
  auto event = fixture.events().last("escrow.refunded");
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->attributes.at("provider_refund_id"), "re_1");
}

TEST(refund_executor, provider_rejection_is_retried) {
  auto fixture = disburse::testing::settlement_fixture{};
  auto escrow = disburse::schema::escrow_t{};
  auto job = rejected_refund_job(fixture, escrow);
  fixture.gateway().refund_status(disburse::ports::psp_status_t::failed);

  auto result = fixture.refunds()(job, std::stop_token{});
  EXPECT_EQ(result.status, disburse::jobs::handler_status_t::retry);
  EXPECT_EQ(fixture.store().find_transaction(escrow.transaction_id)->status,
            disburse::schema::transaction_status_t::succeeded);
  EXPECT_EQ(fixture.events().count("escrow.refunded"), 0u);
}

TEST(refund_executor, refuses_an_escrow_that_was_not_refunded) {
  auto fixture = disburse::testing::settlement_fixture{};
  auto project = fixture.seed_project({make_split("alice", "100")});
  auto escrow = fixture.funded(project, 8'000);

  auto job = disburse::schema::job_t{};
  job.job_id = "job_manual";
  job.type = "escrow.refund";
  job.payload = {{"escrow_id", escrow.escrow_id}};
  auto result = fixture.refunds()(job, std::stop_token{});
  EXPECT_EQ(result.status,
            disburse::jobs::handler_status_t::permanent_failure);
  EXPECT_TRUE(fixture.gateway().refunds().empty());

  job.payload = {{"escrow_id", std::string{"esc_missing"}}};
  EXPECT_EQ(fixture.refunds()(job, std::stop_token{}).status,
            disburse::jobs::handler_status_t::permanent_failure);
}
