#include <fmt/format.h>
#include <json/json.h>
#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <disburse/config/engine_config.hpp>
#include <disburse/execution/engine.hpp>
#include <disburse/ports/access_policy.hpp>
#include <disburse/ports/event_publisher_port.hpp>
#include <disburse/ports/id_generator.hpp>
#include <disburse/ports/notification_port.hpp>
#include <disburse/ports/sandbox_psp_gateway.hpp>
#include <disburse/ports/time_source.hpp>
#include <disburse/schema/revenue_split.hpp>
#include <disburse/storage/memory/state_store.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;
using namespace disburse;

namespace {

std::optional<schema::revenue_split_t> parse_split(const std::string& text) {
  auto separator = text.rfind(':');
  if (separator == std::string::npos || separator == 0) {
    return std::nullopt;
  }
  auto percentage = schema::try_parse_percent(
      std::string_view{text}.substr(separator + 1));
  if (!percentage) {
    return std::nullopt;
  }
  auto split = schema::revenue_split_t{};
  split.percentage = percentage;
  auto who = text.substr(0, separator);
  constexpr auto kPlaceholderPrefix = std::string_view{"placeholder:"};
  if (who.starts_with(kPlaceholderPrefix)) {
    split.placeholder = who.substr(kPlaceholderPrefix.size());
  } else {
    split.recipient_id = who;
  }
  return split;
}

void print_breakdown(const schema::split_breakdown_t& breakdown) {
  fmt::print("gross {} {}  fee {} ({} bps)  net {}\n",
             schema::format_amount(breakdown.gross_amount), breakdown.currency,
             schema::format_amount(breakdown.platform_fee),
             breakdown.fee_rate_bps, schema::format_amount(breakdown.net_pool));
  for (const auto& share : breakdown.shares) {
    fmt::print("  {:<24} {:>8}%  net {:>12}  fee {:>10}\n",
               share.recipient_id ? *share.recipient_id
                                  : fmt::format("<{}>", share.placeholder),
               schema::format_percent(share.percentage),
               schema::format_amount(share.net_amount),
               schema::format_amount(share.platform_fee_share));
  }
}

void print_batch(const schema::payout_batch_t& batch) {
  fmt::print("batch {} ({})  escrow {}  policy {}\n", batch.batch_id,
             schema::to_string(batch.status), batch.escrow_id,
             schema::to_string(batch.placeholder_policy));
  fmt::print("  gross {} {}  fee {}  net {}  withheld {}\n",
             schema::format_amount(batch.gross_amount), batch.currency,
             schema::format_amount(batch.platform_fee),
             schema::format_amount(batch.total_net),
             schema::format_amount(batch.withheld_amount));
  for (const auto& item : batch.items) {
    fmt::print("  {:<24} {:>12}  {:<10} {} (attempts {})\n", item.recipient_id,
               schema::format_amount(item.net_amount),
               schema::to_string(item.status), item.provider_transfer_id,
               item.attempts);
  }
}

std::string payment_succeeded_body(const payment::intent_t& intent) {
  auto body = Json::Value{};
  body["type"] = "payment_intent.succeeded";
  body["data"]["object"]["id"] = intent.transaction.provider_intent_id;
  body["data"]["object"]["metadata"]["internal_intent_id"] =
      intent.transaction.transaction_id;
  auto writer = Json::StreamWriterBuilder{};
  writer["indentation"] = "";
  return Json::writeString(writer, body);
}

template <typename T>
bool report(const schema::operation_result<T>& result, std::string_view step) {
  if (result.ok()) {
    return true;
  }
  spdlog::error("{} failed: [{}] {} {}", step, result.codespace, result.log,
                result.info);
  return false;
}

int simulate(const config::engine_config& settings,
             const schema::amount_t amount,
             const std::string& currency,
             std::vector<schema::revenue_split_t> splits) {
  auto store = storage::memory_state_store{};
  auto gateway = ports::sandbox_psp_gateway{};
  auto notifications = ports::logging_notification_port{};
  auto events = ports::logging_event_publisher{};
  auto access = ports::project_access_policy{};
  auto engine = execution::engine{
      settings,
      execution::engine_ports{store, gateway, notifications, events, access,
                              ports::system_time_source(),
                              ports::random_id_generator(),
                              jobs::default_random_source(),
                              webhook::accept_all_verifier()}};

  auto owner = std::string{"owner"};
  auto members = std::vector<schema::entity_id_t>{};
  for (const auto& split : splits) {
    if (!schema::is_placeholder(split)) {
      members.push_back(*split.recipient_id);
    }
  }

  auto project = engine.create_project(owner, members, std::move(splits));
  if (!report(project, "create_project")) {
    return 1;
  }
  auto milestone = engine.create_milestone(project.value->project_id, owner,
                                           "Simulated delivery", amount,
                                           currency);
  if (!report(milestone, "create_milestone")) {
    return 1;
  }
  const auto& milestone_id = milestone.value->milestone_id;
  auto intent = engine.create_payment_intent(project.value->project_id,
                                             milestone_id, "payer");
  if (!report(intent, "create_payment_intent")) {
    return 1;
  }
  auto webhook = engine.receive_webhook(
      gateway.provider(), payment_succeeded_body(*intent.value), "sandbox");
  if (!report(webhook, "receive_webhook")) {
    return 1;
  }
  if (!report(engine.complete_milestone(milestone_id, owner),
              "complete_milestone")) {
    return 1;
  }
  auto approved = engine.approve_milestone(milestone_id, owner);
  if (!report(approved, "approve_milestone")) {
    return 1;
  }

  auto escrow_id = approved.value->escrow->escrow_id;
  engine.start_workers();
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds{10};
  auto batch = engine.store().find_batch_by_escrow(escrow_id);
  while (batch && batch->status != schema::payout_status_t::paid &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    batch = engine.store().find_batch_by_escrow(escrow_id);
  }
  engine.stop_workers();

  if (!batch) {
    spdlog::error("No payout batch for escrow {}: {}", escrow_id,
                  approved.info);
    return 1;
  }
  print_batch(*batch);
  return batch->status == schema::payout_status_t::paid ? 0 : 1;
}

}  // namespace

int main(int argc, char* argv[]) {
  spdlog::init_thread_pool(8192, 1);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::info);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>("disburse.log", false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "disburse", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);

  auto command = std::string{};
  auto config_path = std::string{};
  auto amount = schema::amount_t{};
  auto currency = std::string{};
  auto split_args = std::vector<std::string>{};

  auto engine_description = config::engine_options();
  auto description = po::options_description{"disburse"};
  description.add_options()("help,h", "Show the help message")(
      "command", po::value<std::string>(&command),
      "calculate | simulate")(
      "config,c", po::value<std::string>(&config_path),
      "INI file with engine options")(
      "amount,a", po::value<schema::amount_t>(&amount),
      "Gross amount in minor units")(
      "currency", po::value<std::string>(&currency)->default_value("USD"),
      "Three letter currency code")(
      "split,s", po::value<std::vector<std::string>>(&split_args),
      "recipient:percent or placeholder:label:percent, repeatable")(
      "verbose,v", "Enable verbose output");
  description.add(engine_description);

  auto positional = po::positional_options_description{};
  positional.add("command", 1);

  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(description)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& ex) {
    std::cerr << ex.what() << "\n" << description << std::endl;
    spdlog::shutdown();
    return 2;
  }

  if (vm.contains("help") || command.empty()) {
    std::cout << "usage: disburse <calculate|simulate> [options]\n"
              << description << std::endl;
    spdlog::shutdown();
    return vm.contains("help") ? 0 : 2;
  }
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  if (!config_path.empty()) {
    auto merged =
        config::merge_config_file(config_path, engine_description, vm);
    if (!report(merged, "config")) {
      spdlog::shutdown();
      return 2;
    }
  }
  auto settings = config::make_engine_config(vm);
  if (!report(settings, "config")) {
    spdlog::shutdown();
    return 2;
  }

  auto splits = std::vector<schema::revenue_split_t>{};
  for (const auto& arg : split_args) {
    auto split = parse_split(arg);
    if (!split) {
      spdlog::error("Cannot parse split '{}'", arg);
      spdlog::shutdown();
      return 2;
    }
    splits.push_back(std::move(*split));
  }

  auto rc = 0;
  if (command == "calculate") {
    auto calculator = split::calculator{settings.value->fee_rate_bps};
    auto breakdown = calculator.calculate(amount, currency, splits);
    if (report(breakdown, "calculate")) {
      print_breakdown(*breakdown.value);
    } else {
      rc = 1;
    }
  } else if (command == "simulate") {
    rc = simulate(*settings.value, amount, currency, std::move(splits));
  } else {
    spdlog::error("Unknown command '{}'", command);
    rc = 2;
  }

  spdlog::shutdown();
  return rc;
}
