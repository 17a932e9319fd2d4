#include <gtest/gtest.h>
#include <disburse/schema/error_code.hpp>
#include <disburse/schema/milestone_status.hpp>
#include <disburse/schema/payout_batch.hpp>
#include <disburse/schema/placeholder_policy.hpp>
#include <disburse/schema/primitives.hpp>

TEST(primitives, try_parse_percent_is_exact) {
  EXPECT_EQ(disburse::schema::try_parse_percent("33.33"), 333'300);
  EXPECT_EQ(disburse::schema::try_parse_percent("100"), 1'000'000);
  EXPECT_EQ(disburse::schema::try_parse_percent("0.0001"), 1);
  EXPECT_EQ(disburse::schema::try_parse_percent(".5"), 5'000);
  EXPECT_EQ(disburse::schema::try_parse_percent("12."), 120'000);
}

TEST(primitives, try_parse_percent_rejects_malformed_text) {
  EXPECT_FALSE(disburse::schema::try_parse_percent("").has_value());
  EXPECT_FALSE(disburse::schema::try_parse_percent(".").has_value());
  EXPECT_FALSE(disburse::schema::try_parse_percent("-5").has_value());
  EXPECT_FALSE(disburse::schema::try_parse_percent("1e2").has_value());
  EXPECT_FALSE(disburse::schema::try_parse_percent("33.33333").has_value());
  EXPECT_FALSE(disburse::schema::try_parse_percent("3 3").has_value());
}

TEST(primitives, try_percent_from_double_rounds_half_up) {
  EXPECT_EQ(disburse::schema::try_percent_from_double(33.33), 333'300);
  EXPECT_EQ(disburse::schema::try_percent_from_double(0.00006), 1);
  EXPECT_FALSE(disburse::schema::try_percent_from_double(-1.0).has_value());
}

TEST(primitives, format_percent_and_amount_render_decimals) {
  EXPECT_EQ(disburse::schema::format_percent(333'300), "33.33");
  EXPECT_EQ(disburse::schema::format_percent(1'000'000), "100");
  EXPECT_EQ(disburse::schema::format_amount(12'345), "123.45");
  EXPECT_EQ(disburse::schema::format_amount(5), "0.05");
  EXPECT_EQ(disburse::schema::format_amount(-250), "-2.50");
}

TEST(primitives, currency_codes_are_three_upper_case_letters) {
  EXPECT_TRUE(disburse::schema::is_valid_currency("USD"));
  EXPECT_FALSE(disburse::schema::is_valid_currency("usd"));
  EXPECT_FALSE(disburse::schema::is_valid_currency("USDT"));
  EXPECT_FALSE(disburse::schema::is_valid_currency("U1D"));
}

TEST(primitives, error_codes_carry_names_and_categories) {
  EXPECT_EQ(disburse::schema::to_string(
                disburse::schema::error_code::split_sum_invalid),
            "split_sum_invalid");
  EXPECT_EQ(disburse::schema::try_from_string<disburse::schema::error_code>(
                "already_scheduled"),
            disburse::schema::error_code::already_scheduled);
  EXPECT_EQ(disburse::schema::category_of(
                disburse::schema::error_code::escrow_already_active),
            disburse::schema::error_category_t::conflict);
  EXPECT_EQ(disburse::schema::category_of(
                disburse::schema::error_code::batch_not_found),
            disburse::schema::error_category_t::not_found);
  EXPECT_EQ(disburse::schema::category_of(
                disburse::schema::error_code::schema_validation_failed),
            disburse::schema::error_category_t::job);
}

TEST(primitives, enum_mappings_round_trip_names) {
  EXPECT_EQ(disburse::schema::try_from_string<
                disburse::schema::milestone_status_t>("disputed"),
            disburse::schema::milestone_status_t::disputed);
  EXPECT_FALSE(disburse::schema::try_from_string<
                   disburse::schema::placeholder_policy_t>("split")
                   .has_value());
  EXPECT_EQ(disburse::schema::join_names(
                disburse::schema::kPlaceholderPolicyMappings),
            "withhold|renormalize");
}

TEST(primitives, batch_status_follows_items) {
  auto batch = disburse::schema::payout_batch_t{};
  batch.items.resize(2);
  EXPECT_EQ(disburse::schema::derive_batch_status(batch),
            disburse::schema::payout_status_t::scheduled);

  batch.items[0].status = disburse::schema::payout_status_t::paid;
  batch.items[0].attempts = 1;
  EXPECT_EQ(disburse::schema::derive_batch_status(batch),
            disburse::schema::payout_status_t::processing);

  batch.items[1].status = disburse::schema::payout_status_t::paid;
  EXPECT_EQ(disburse::schema::derive_batch_status(batch),
            disburse::schema::payout_status_t::paid);
}
