#include <gtest/gtest.h>
#include <disburse/payment/intent_service.hpp>
#include <disburse/testing/settlement_fixture.hpp>

namespace {

using disburse::testing::make_split;

disburse::payment::intent_service make_service(
    disburse::testing::settlement_fixture& fixture) {
  return disburse::payment::intent_service{
      fixture.store(), fixture.gateway(), fixture.events(),
      disburse::ports::sequential_id_generator(), fixture.clock().source()};
}

}  // namespace

TEST(intent_service, records_created_transaction_for_milestone_amount) {
  auto fixture = disburse::testing::settlement_fixture{};
  auto service = make_service(fixture);
  auto project = fixture.seed_project({make_split("alice", "100")});
  auto milestone = fixture.seed_milestone(project, 42'000);

  auto intent = service.create(project.project_id, milestone.milestone_id,
                               "payer");
  ASSERT_TRUE(intent.ok()) << intent.info;
  const auto& transaction = intent.value->transaction;
  EXPECT_EQ(transaction.status,
            disburse::schema::transaction_status_t::created);
  EXPECT_EQ(transaction.amount, 42'000);
  EXPECT_EQ(transaction.currency, "USD");
  EXPECT_EQ(transaction.provider, "scripted");
  EXPECT_EQ(transaction.provider_intent_id, "pi_1");
  EXPECT_EQ(intent.value->client_secret, "secret_1");
  EXPECT_EQ(intent.value->checkout_url, "https://checkout.test/pi_1");

  auto stored = fixture.store().find_transaction(transaction.transaction_id);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->payer_id, "payer");
  EXPECT_EQ(stored->milestone_id, milestone.milestone_id);
  EXPECT_EQ(fixture.events().count("payment.intent.created"), 1u);

  // The milestone stays pending until the provider confirms payment.
  EXPECT_EQ(fixture.store().find_milestone(milestone.milestone_id)->status,
            disburse::schema::milestone_status_t::pending);
}

TEST(intent_service, validates_provider_and_milestone) {
  auto fixture = disburse::testing::settlement_fixture{};
  auto service = make_service(fixture);
  auto project = fixture.seed_project({make_split("alice", "100")});
  auto milestone = fixture.seed_milestone(project, 42'000);

  EXPECT_EQ(service
                .create(project.project_id, milestone.milestone_id, "payer",
                        "paypal")
                .code,
            disburse::schema::error_code::invalid_argument);
  EXPECT_TRUE(service
                  .create(project.project_id, milestone.milestone_id, "payer",
                          "scripted")
                  .ok());
  EXPECT_EQ(service.create(project.project_id, "ms_missing", "payer").code,
            disburse::schema::error_code::milestone_not_found);
  EXPECT_EQ(service.create("prj_other", milestone.milestone_id, "payer").code,
            disburse::schema::error_code::invalid_argument);
}

TEST(intent_service, funded_milestone_takes_no_new_payment) {
  auto fixture = disburse::testing::settlement_fixture{};
  auto service = make_service(fixture);
  auto project = fixture.seed_project({make_split("alice", "100")});
  auto escrow = fixture.funded(project, 1'000);

  auto result =
      service.create(project.project_id, escrow.milestone_id, "payer");
  EXPECT_EQ(result.code, disburse::schema::error_code::invalid_transition);
}

TEST(intent_service, gateway_failure_records_nothing) {
  auto fixture = disburse::testing::settlement_fixture{};
  auto service = make_service(fixture);
  auto project = fixture.seed_project({make_split("alice", "100")});
  auto milestone = fixture.seed_milestone(project, 1'000);
  fixture.gateway().fail_intents(true);

  auto result =
      service.create(project.project_id, milestone.milestone_id, "payer");
  EXPECT_EQ(result.code, disburse::schema::error_code::gateway_request_failed);
  EXPECT_EQ(result.info, "provider unavailable");
  EXPECT_EQ(disburse::schema::category_of(result.code),
            disburse::schema::error_category_t::gateway);
  EXPECT_EQ(fixture.events().count("payment.intent.created"), 0u);
}
