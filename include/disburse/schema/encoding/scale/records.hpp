#pragma once
#include <disburse/schema/escrow.hpp>
#include <disburse/schema/milestone.hpp>
#include <disburse/schema/payment_transaction.hpp>
#include <disburse/schema/payout_batch.hpp>
#include <disburse/schema/project.hpp>
#include <disburse/schema/revenue_split.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// Field order is the persisted layout. Append new fields at the end and bump
// the record's schema version.
namespace disburse::schema::encoding::scale {

void encode(revenue_split<1>&& o, ::scale::Encoder& encoder);
void decode(revenue_split<1>&& o, ::scale::Decoder& decoder);

void encode(project<1>&& o, ::scale::Encoder& encoder);
void decode(project<1>&& o, ::scale::Decoder& decoder);

void encode(milestone<1>&& o, ::scale::Encoder& encoder);
void decode(milestone<1>&& o, ::scale::Decoder& decoder);

void encode(escrow<1>&& o, ::scale::Encoder& encoder);
void decode(escrow<1>&& o, ::scale::Decoder& decoder);

void encode(payment_transaction<1>&& o, ::scale::Encoder& encoder);
void decode(payment_transaction<1>&& o, ::scale::Decoder& decoder);

void encode(payout_item<1>&& o, ::scale::Encoder& encoder);
void decode(payout_item<1>&& o, ::scale::Decoder& decoder);

void encode(payout_batch<1>&& o, ::scale::Encoder& encoder);
void decode(payout_batch<1>&& o, ::scale::Decoder& decoder);

}  // namespace disburse::schema::encoding::scale
