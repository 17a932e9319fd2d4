#include <disburse/schema/encoding/scale/records.hpp>

using namespace disburse::schema;

namespace disburse::schema::encoding::scale {

void encode(revenue_split<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.recipient_id, encoder);
  encode(o.placeholder, encoder);
  encode(o.percentage, encoder);
  encode(o.fixed_amount, encoder);
}

void decode(revenue_split<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.recipient_id, decoder);
  decode(o.placeholder, decoder);
  decode(o.percentage, decoder);
  decode(o.fixed_amount, decoder);
}

void encode(project<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.project_id, encoder);
  encode(o.owner_id, encoder);
  encode(o.member_ids, encoder);
  encode(o.splits, encoder);
  encode(o.revision, encoder);
  encode(o.created_at, encoder);
  encode(o.updated_at, encoder);
}

void decode(project<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.project_id, decoder);
  decode(o.owner_id, decoder);
  decode(o.member_ids, decoder);
  decode(o.splits, decoder);
  decode(o.revision, decoder);
  decode(o.created_at, decoder);
  decode(o.updated_at, decoder);
}

void encode(milestone<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.milestone_id, encoder);
  encode(o.project_id, encoder);
  encode(o.title, encoder);
  encode(o.amount, encoder);
  encode(o.currency, encoder);
  encode(o.status, encoder);
  encode(o.escrow_id, encoder);
  encode(o.dispute_reason, encoder);
  encode(o.revision, encoder);
  encode(o.created_at, encoder);
  encode(o.updated_at, encoder);
}

void decode(milestone<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.milestone_id, decoder);
  decode(o.project_id, decoder);
  decode(o.title, decoder);
  decode(o.amount, decoder);
  decode(o.currency, decoder);
  decode(o.status, decoder);
  decode(o.escrow_id, decoder);
  decode(o.dispute_reason, decoder);
  decode(o.revision, decoder);
  decode(o.created_at, decoder);
  decode(o.updated_at, decoder);
}

void encode(escrow<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.escrow_id, encoder);
  encode(o.project_id, encoder);
  encode(o.milestone_id, encoder);
  encode(o.payer_id, encoder);
  encode(o.transaction_id, encoder);
  encode(o.amount, encoder);
  encode(o.currency, encoder);
  encode(o.provider, encoder);
  encode(o.provider_reference, encoder);
  encode(o.status, encoder);
  encode(o.revision, encoder);
  encode(o.locked_at, encoder);
  encode(o.released_at, encoder);
  encode(o.refunded_at, encoder);
}

void decode(escrow<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.escrow_id, decoder);
  decode(o.project_id, decoder);
  decode(o.milestone_id, decoder);
  decode(o.payer_id, decoder);
  decode(o.transaction_id, decoder);
  decode(o.amount, decoder);
  decode(o.currency, decoder);
  decode(o.provider, decoder);
  decode(o.provider_reference, decoder);
  decode(o.status, decoder);
  decode(o.revision, decoder);
  decode(o.locked_at, decoder);
  decode(o.released_at, decoder);
  decode(o.refunded_at, decoder);
}

void encode(payment_transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
  encode(o.project_id, encoder);
  encode(o.milestone_id, encoder);
  encode(o.payer_id, encoder);
  encode(o.provider, encoder);
  encode(o.provider_intent_id, encoder);
  encode(o.provider_payment_id, encoder);
  encode(o.amount, encoder);
  encode(o.currency, encoder);
  encode(o.status, encoder);
  encode(o.failure_reason, encoder);
  encode(o.revision, encoder);
  encode(o.created_at, encoder);
  encode(o.updated_at, encoder);
}

void decode(payment_transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
  decode(o.project_id, decoder);
  decode(o.milestone_id, decoder);
  decode(o.payer_id, decoder);
  decode(o.provider, decoder);
  decode(o.provider_intent_id, decoder);
  decode(o.provider_payment_id, decoder);
  decode(o.amount, decoder);
  decode(o.currency, decoder);
  decode(o.status, decoder);
  decode(o.failure_reason, decoder);
  decode(o.revision, decoder);
  decode(o.created_at, decoder);
  decode(o.updated_at, decoder);
}

void encode(payout_item<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.recipient_id, encoder);
  encode(o.percentage, encoder);
  encode(o.gross_share, encoder);
  encode(o.fee_share, encoder);
  encode(o.tax_withheld, encoder);
  encode(o.net_amount, encoder);
  encode(o.status, encoder);
  encode(o.provider_transfer_id, encoder);
  encode(o.failure_reason, encoder);
  encode(o.attempts, encoder);
  encode(o.transfer_round, encoder);
}

void decode(payout_item<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.recipient_id, decoder);
  decode(o.percentage, decoder);
  decode(o.gross_share, decoder);
  decode(o.fee_share, decoder);
  decode(o.tax_withheld, decoder);
  decode(o.net_amount, decoder);
  decode(o.status, decoder);
  decode(o.provider_transfer_id, decoder);
  decode(o.failure_reason, decoder);
  decode(o.attempts, decoder);
  decode(o.transfer_round, decoder);
}

void encode(payout_batch<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.batch_id, encoder);
  encode(o.escrow_id, encoder);
  encode(o.project_id, encoder);
  encode(o.milestone_id, encoder);
  encode(o.currency, encoder);
  encode(o.gross_amount, encoder);
  encode(o.platform_fee, encoder);
  encode(o.total_net, encoder);
  encode(o.withheld_amount, encoder);
  encode(o.placeholder_policy, encoder);
  encode(o.status, encoder);
  encode(o.items, encoder);
  encode(o.job_id, encoder);
  encode(o.revision, encoder);
  encode(o.created_at, encoder);
  encode(o.updated_at, encoder);
}

void decode(payout_batch<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.batch_id, decoder);
  decode(o.escrow_id, decoder);
  decode(o.project_id, decoder);
  decode(o.milestone_id, decoder);
  decode(o.currency, decoder);
  decode(o.gross_amount, decoder);
  decode(o.platform_fee, decoder);
  decode(o.total_net, decoder);
  decode(o.withheld_amount, decoder);
  decode(o.placeholder_policy, decoder);
  decode(o.status, decoder);
  decode(o.items, decoder);
  decode(o.job_id, decoder);
  decode(o.revision, decoder);
  decode(o.created_at, decoder);
  decode(o.updated_at, decoder);
}

}  // namespace disburse::schema::encoding::scale
