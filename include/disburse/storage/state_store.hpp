#pragma once

#include <disburse/schema/enum_string.hpp>
#include <disburse/schema/escrow.hpp>
#include <disburse/schema/milestone.hpp>
#include <disburse/schema/payment_transaction.hpp>
#include <disburse/schema/payout_batch.hpp>
#include <disburse/schema/project.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace disburse::storage {

using record_t = std::variant<schema::project_t,
                              schema::milestone_t,
                              schema::escrow_t,
                              schema::payment_transaction_t,
                              schema::payout_batch_t>;

enum class write_mode_t : uint8_t { insert = 0, update = 1 };

/// One record write inside a change set.
///
/// `insert` requires the id to be unused. `update` requires the stored
/// record's revision to equal `record`'s revision (compare-and-swap).
struct change final {
  write_mode_t mode{write_mode_t::update};
  record_t record;
};

/// Writes applied all-or-nothing. On success every record's revision is
/// advanced to the stored value.
struct change_set final {
  std::vector<change> changes;

  change_set& insert(record_t record) {
    changes.push_back(change{write_mode_t::insert, std::move(record)});
    return *this;
  }

  change_set& update(record_t record) {
    changes.push_back(change{write_mode_t::update, std::move(record)});
    return *this;
  }

  template <typename T>
  const T& at(const std::size_t index) const {
    return std::get<T>(changes.at(index).record);
  }
};

enum class write_status_t : uint8_t {
  ok = 0,
  already_exists = 1,
  not_found = 2,
  revision_conflict = 3,
  escrow_already_active = 4,
  batch_already_exists = 5
};

inline constexpr auto kWriteStatusMappings = std::array{
    std::pair<std::string_view, write_status_t>{"ok", write_status_t::ok},
    std::pair<std::string_view, write_status_t>{"already_exists",
                                                write_status_t::already_exists},
    std::pair<std::string_view, write_status_t>{"not_found",
                                                write_status_t::not_found},
    std::pair<std::string_view, write_status_t>{
        "revision_conflict", write_status_t::revision_conflict},
    std::pair<std::string_view, write_status_t>{
        "escrow_already_active", write_status_t::escrow_already_active},
    std::pair<std::string_view, write_status_t>{
        "batch_already_exists", write_status_t::batch_already_exists}};

inline constexpr std::string_view to_string(const write_status_t value) {
  return schema::to_string(value, kWriteStatusMappings).value_or("unknown");
}

/// Authoritative state for every settlement aggregate.
///
/// Reads return copies. All mutation goes through `apply`, which checks every
/// precondition before writing anything and enforces two cross-record
/// invariants on insert: at most one active (locked or held) escrow per
/// milestone, and at most one payout batch per escrow.
class state_store {
 public:
  virtual ~state_store() = default;

  virtual std::optional<schema::project_t> find_project(
      std::string_view project_id) const = 0;
  virtual std::optional<schema::milestone_t> find_milestone(
      std::string_view milestone_id) const = 0;
  virtual std::optional<schema::escrow_t> find_escrow(
      std::string_view escrow_id) const = 0;
  virtual std::optional<schema::escrow_t> find_active_escrow(
      std::string_view milestone_id) const = 0;
  virtual std::optional<schema::payment_transaction_t> find_transaction(
      std::string_view transaction_id) const = 0;
  virtual std::optional<schema::payout_batch_t> find_batch(
      std::string_view batch_id) const = 0;
  virtual std::optional<schema::payout_batch_t> find_batch_by_escrow(
      std::string_view escrow_id) const = 0;
  virtual std::optional<schema::payout_batch_t> find_batch_by_transfer(
      std::string_view provider_transfer_id) const = 0;
  virtual std::vector<schema::milestone_t> list_milestones(
      std::string_view project_id) const = 0;

  virtual write_status_t apply(change_set& changes) = 0;
};

/// Single record write; `value` picks up the stored revision on success.
template <typename T>
write_status_t write_one(state_store& store,
                         const write_mode_t mode,
                         T& value) {
  auto changes = change_set{};
  changes.changes.push_back(change{mode, record_t{value}});
  auto status = store.apply(changes);
  if (status == write_status_t::ok) {
    value = changes.at<T>(0);
  }
  return status;
}

/// Read-modify-write loop for one record.
///
/// `load` returns the current record (std::nullopt when it is gone) and
/// `mutate` edits it in place, returning false to leave it untouched. The
/// write is retried against a fresh copy whenever it loses a revision race.
/// Returns the stored record, or std::nullopt when the record is missing,
/// `mutate` declined, or every attempt conflicted.
template <typename T, typename Load, typename Mutate>
std::optional<T> modify(state_store& store,
                        Load&& load,
                        Mutate&& mutate,
                        const int attempts = 8) {
  for (auto attempt = 0; attempt < attempts; ++attempt) {
    std::optional<T> current = load();
    if (!current) {
      return std::nullopt;
    }
    if (!mutate(*current)) {
      return std::nullopt;
    }
    auto status = write_one(store, write_mode_t::update, *current);
    if (status == write_status_t::ok) {
      return current;
    }
    if (status != write_status_t::revision_conflict) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

/// Identifier of whichever aggregate `record` holds.
const schema::entity_id_t& record_id(const record_t& record);
uint64_t& record_revision(record_t& record);

}  // namespace disburse::storage
