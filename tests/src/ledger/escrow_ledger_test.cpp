#include <gtest/gtest.h>
#include <disburse/ledger/escrow_ledger.hpp>
#include <disburse/ports/id_generator.hpp>
#include <disburse/storage/memory/state_store.hpp>
#include <disburse/testing/common.hpp>

namespace {

class ledger_harness final {
 public:
  ledger_harness()
      : ledger_{store_, clock_.source(),
                disburse::ports::sequential_id_generator()} {}

  disburse::storage::memory_state_store& store() { return store_; }
  disburse::testing::manual_clock& clock() { return clock_; }
  const disburse::ledger::escrow_ledger& ledger() const { return ledger_; }

 private:
  disburse::testing::manual_clock clock_;
  disburse::storage::memory_state_store store_;
  disburse::ledger::escrow_ledger ledger_;
};

disburse::schema::milestone_t make_milestone() {
  auto milestone = disburse::schema::milestone_t{};
  milestone.milestone_id = "ms_1";
  milestone.project_id = "prj_1";
  milestone.amount = 25'000;
  milestone.currency = "EUR";
  return milestone;
}

disburse::schema::payment_transaction_t make_payment() {
  auto transaction = disburse::schema::payment_transaction_t{};
  transaction.transaction_id = "pay_1";
  transaction.milestone_id = "ms_1";
  transaction.payer_id = "payer";
  transaction.provider = "sandbox";
  transaction.provider_intent_id = "pi_1";
  transaction.provider_payment_id = "ch_1";
  transaction.amount = 25'000;
  transaction.currency = "EUR";
  transaction.status = disburse::schema::transaction_status_t::succeeded;
  return transaction;
}

}  // namespace

TEST(escrow_ledger, open_locks_the_transaction_amount) {
  auto harness = ledger_harness{};
  auto escrow = harness.ledger().open(make_milestone(), make_payment());
  EXPECT_FALSE(escrow.escrow_id.empty());
  EXPECT_EQ(escrow.status, disburse::schema::escrow_status_t::locked);
  EXPECT_EQ(escrow.amount, 25'000);
  EXPECT_EQ(escrow.currency, "EUR");
  EXPECT_EQ(escrow.payer_id, "payer");
  EXPECT_EQ(escrow.transaction_id, "pay_1");
  EXPECT_EQ(escrow.provider_reference, "ch_1");
  EXPECT_EQ(escrow.locked_at, harness.clock().now());

  // Without a captured charge the intent is the refund reference.
  auto payment = make_payment();
  payment.provider_payment_id.clear();
  EXPECT_EQ(harness.ledger().open(make_milestone(), payment).provider_reference,
            "pi_1");
}

TEST(escrow_ledger, hold_and_unhold_toggle_a_live_escrow) {
  auto harness = ledger_harness{};
  auto escrow = harness.ledger().open(make_milestone(), make_payment());

  auto held = harness.ledger().plan_hold(escrow);
  ASSERT_TRUE(held.ok()) << held.info;
  EXPECT_EQ(held.value->status, disburse::schema::escrow_status_t::held);
  EXPECT_EQ(harness.ledger().plan_hold(*held.value).code,
            disburse::schema::error_code::invalid_transition);

  auto unheld = harness.ledger().plan_unhold(*held.value);
  ASSERT_TRUE(unheld.ok()) << unheld.info;
  EXPECT_EQ(unheld.value->status, disburse::schema::escrow_status_t::locked);
  EXPECT_EQ(harness.ledger().plan_unhold(*unheld.value).code,
            disburse::schema::error_code::invalid_transition);
}

TEST(escrow_ledger, release_only_from_locked) {
  auto harness = ledger_harness{};
  auto escrow = harness.ledger().open(make_milestone(), make_payment());
  harness.clock().advance(500);

  auto released = harness.ledger().plan_release(escrow);
  ASSERT_TRUE(released.ok()) << released.info;
  EXPECT_EQ(released.value->status,
            disburse::schema::escrow_status_t::released);
  EXPECT_EQ(released.value->released_at, harness.clock().now());

  auto held = *harness.ledger().plan_hold(escrow).value;
  auto refused = harness.ledger().plan_release(held);
  EXPECT_EQ(refused.code, disburse::schema::error_code::invalid_transition);
  EXPECT_EQ(refused.codespace, disburse::ledger::kCodespace);
}

TEST(escrow_ledger, final_states_accept_nothing) {
  auto harness = ledger_harness{};
  auto escrow = harness.ledger().open(make_milestone(), make_payment());
  auto held = *harness.ledger().plan_hold(escrow).value;

  auto refunded = harness.ledger().plan_refund(held);
  ASSERT_TRUE(refunded.ok()) << refunded.info;
  EXPECT_TRUE(refunded.value->refunded_at.has_value());
  auto released = *harness.ledger().plan_release(escrow).value;

  for (const auto& final_escrow : {*refunded.value, released}) {
    EXPECT_FALSE(harness.ledger().plan_hold(final_escrow).ok());
    EXPECT_FALSE(harness.ledger().plan_unhold(final_escrow).ok());
    EXPECT_FALSE(harness.ledger().plan_release(final_escrow).ok());
    EXPECT_FALSE(harness.ledger().plan_refund(final_escrow).ok());
  }
}

TEST(escrow_ledger, plans_do_not_touch_the_store) {
  auto harness = ledger_harness{};
  auto escrow = harness.ledger().open(make_milestone(), make_payment());
  EXPECT_FALSE(harness.ledger().find(escrow.escrow_id).has_value());

  ASSERT_EQ(disburse::storage::write_one(
                harness.store(), disburse::storage::write_mode_t::insert,
                escrow),
            disburse::storage::write_status_t::ok);
  auto released = harness.ledger().plan_release(escrow);
  ASSERT_TRUE(released.ok());
  EXPECT_EQ(harness.ledger().active_for("ms_1")->status,
            disburse::schema::escrow_status_t::locked);
  EXPECT_EQ(harness.ledger().find(escrow.escrow_id)->revision, 1u);
}
