#include <fmt/format.h>
#include <json/json.h>
#include <spdlog/spdlog.h>
#include <disburse/webhook/event.hpp>
#include <algorithm>
#include <array>
#include <memory>
#include <string_view>

using namespace disburse::schema;

namespace disburse::webhook {

namespace {

const auto kPaymentFailedTypes = std::array<std::string_view, 4>{
    "payment_intent.payment_failed", "payment.failed", "order.payment_failed",
    "charge.failed"};

const auto kCorrelationFields =
    std::array<const char*, 2>{"internal_intent_id", "internalIntentId"};

std::optional<std::string> string_member(const Json::Value& object,
                                         const char* name) {
  if (!object.isObject() || !object.isMember(name)) {
    return std::nullopt;
  }
  const auto& value = object[name];
  if (!value.isString()) {
    return std::nullopt;
  }
  auto text = value.asString();
  if (text.empty()) {
    return std::nullopt;
  }
  return text;
}

}  // namespace

event_kind_t classify(const std::string_view type) {
  if (type == "transfer.paid") {
    return event_kind_t::transfer_paid;
  }
  if (type == "transfer.failed") {
    return event_kind_t::transfer_failed;
  }
  if (type == "payment_intent.succeeded" || type == "order.paid") {
    return event_kind_t::payment_succeeded;
  }
  if (std::ranges::find(kPaymentFailedTypes, type) !=
      std::end(kPaymentFailedTypes)) {
    return event_kind_t::payment_failed;
  }
  return event_kind_t::unrecognized;
}

operation_result<event_t> decode(const std::string_view raw_body) {
  auto root = Json::Value{};
  auto errors = std::string{};
  auto builder = Json::CharReaderBuilder{};
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  if (!reader->parse(raw_body.data(), raw_body.data() + raw_body.size(), &root,
                     &errors)) {
    spdlog::warn("Rejecting webhook body: {}", errors);
    return make_failure<event_t>(error_code::malformed_webhook, kCodespace,
                                 fmt::format("invalid JSON: {}", errors));
  }
  if (!root.isObject()) {
    return make_failure<event_t>(error_code::malformed_webhook, kCodespace,
                                 "webhook body must be a JSON object");
  }

  auto type = string_member(root, "type");
  if (!type) {
    return make_failure<event_t>(error_code::malformed_webhook, kCodespace,
                                 "webhook body has no event type");
  }

  auto out = event_t{};
  out.type = *type;
  out.kind = classify(out.type);

  auto object = Json::Value{};
  const auto& data = root["data"];
  if (data.isObject() && data.isMember("object")) {
    object = data["object"];
  }
  if (!object.isNull() && !object.isObject()) {
    return make_failure<event_t>(error_code::malformed_webhook, kCodespace,
                                 "data.object must be a JSON object");
  }
  out.provider_object_id = string_member(object, "id").value_or("");
  out.failure_reason = string_member(object, "failure_message").value_or("");

  auto metadata =
      object.isObject() ? object.get("metadata", Json::Value{}) : Json::Value{};
  for (const auto* field : kCorrelationFields) {
    if (auto value = string_member(metadata, field)) {
      out.correlation_id = std::move(value);
      break;
    }
  }
  return make_success(std::move(out), kCodespace);
}

}  // namespace disburse::webhook
