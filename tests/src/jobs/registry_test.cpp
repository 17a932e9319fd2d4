#include <gtest/gtest.h>
#include <disburse/jobs/registry.hpp>

#include <string>

namespace {

disburse::schema::job_payload_t payout_payload() {
  return disburse::schema::job_payload_t{
      {"batch_id", std::string{"pob_1"}},
      {"escrow_id", std::string{"esc_1"}},
      {"is_retry", false}};
}

}  // namespace

TEST(registry, default_registry_declares_settlement_jobs) {
  auto registry = disburse::jobs::make_default_registry();
  EXPECT_EQ(registry.types(),
            (std::vector<std::string>{"escrow.refund", "payout.execute"}));

  const auto* payout = registry.find("payout.execute");
  ASSERT_NE(payout, nullptr);
  EXPECT_EQ(payout->policy.max_attempts, 10u);
  EXPECT_EQ(payout->policy.timeout_seconds, 60u);
  EXPECT_EQ(payout->policy.concurrency_limit, 5u);
  EXPECT_EQ(registry.find("payout.unknown"), nullptr);
}

TEST(registry, accepts_a_complete_payload) {
  auto registry = disburse::jobs::make_default_registry();
  auto result = registry.validate("payout.execute", payout_payload());
  ASSERT_TRUE(result.ok()) << result.info;
  EXPECT_EQ(result.value->max_attempts, 10u);

  // Optional fields may be left out and undeclared ones are tolerated.
  auto payload = payout_payload();
  payload.erase("is_retry");
  payload.emplace("trace", std::string{"abc"});
  EXPECT_TRUE(registry.validate("payout.execute", payload).ok());
}

TEST(registry, names_the_missing_required_field) {
  auto registry = disburse::jobs::make_default_registry();
  auto payload = payout_payload();
  payload.erase("batch_id");
  auto result = registry.validate("payout.execute", payload);
  EXPECT_EQ(result.code,
            disburse::schema::error_code::schema_validation_failed);
  EXPECT_EQ(result.info, "Missing required field: batch_id");
  EXPECT_FALSE(result.value.has_value());
}

TEST(registry, names_every_missing_required_field) {
  auto registry = disburse::jobs::make_default_registry();
  auto result = registry.validate("payout.execute",
                                  disburse::schema::job_payload_t{});
  EXPECT_EQ(result.code,
            disburse::schema::error_code::schema_validation_failed);
  EXPECT_NE(result.info.find("Missing required field: batch_id"),
            std::string::npos);
  EXPECT_NE(result.info.find("Missing required field: escrow_id"),
            std::string::npos);
}

TEST(registry, reports_fields_of_the_wrong_kind) {
  auto registry = disburse::jobs::make_default_registry();
  auto payload = payout_payload();
  payload["is_retry"] = std::string{"yes"};
  payload["escrow_id"] = int64_t{7};
  auto result = registry.validate("payout.execute", payload);
  EXPECT_EQ(result.code,
            disburse::schema::error_code::schema_validation_failed);
  EXPECT_EQ(result.info,
            "Invalid type for field: escrow_id (expected string, got "
            "integer); Invalid type for field: is_retry (expected boolean, "
            "got string)");
}

TEST(registry, unknown_type_is_not_found) {
  auto registry = disburse::jobs::make_default_registry();
  auto result = registry.validate("mail.send", payout_payload());
  EXPECT_EQ(result.code, disburse::schema::error_code::job_type_not_found);
  EXPECT_EQ(disburse::schema::category_of(result.code),
            disburse::schema::error_category_t::job);
}

TEST(registry, add_replaces_an_existing_definition) {
  auto registry = disburse::jobs::registry{};
  registry.add(disburse::jobs::job_definition{
      .type = "report.render",
      .fields = {},
      .policy = disburse::jobs::job_policy{.max_attempts = 1}});
  registry.add(disburse::jobs::job_definition{
      .type = "report.render",
      .fields = {disburse::jobs::field_spec{
          "tags", disburse::schema::payload_kind_t::string_list, true}},
      .policy = disburse::jobs::job_policy{.max_attempts = 3}});

  EXPECT_EQ(registry.types().size(), 1u);
  auto result = registry.validate(
      "report.render",
      disburse::schema::job_payload_t{
          {"tags", std::vector<std::string>{"q1", "q2"}}});
  ASSERT_TRUE(result.ok()) << result.info;
  EXPECT_EQ(result.value->max_attempts, 3u);
}
