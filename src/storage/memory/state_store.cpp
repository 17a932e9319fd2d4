#include <spdlog/spdlog.h>
#include <disburse/storage/memory/state_store.hpp>
#include <algorithm>
#include <set>
#include <type_traits>

namespace disburse::storage {

template <typename T>
memory_state_store::table_t<T>& memory_state_store::table() {
  if constexpr (std::is_same_v<T, schema::project_t>) {
    return projects_;
  } else if constexpr (std::is_same_v<T, schema::milestone_t>) {
    return milestones_;
  } else if constexpr (std::is_same_v<T, schema::escrow_t>) {
    return escrows_;
  } else if constexpr (std::is_same_v<T, schema::payment_transaction_t>) {
    return transactions_;
  } else {
    static_assert(std::is_same_v<T, schema::payout_batch_t>);
    return batches_;
  }
}

template <typename T>
std::optional<T> memory_state_store::find_in(const table_t<T>& entries,
                                             std::string_view id) {
  auto found = entries.find(schema::entity_id_t{id});
  if (found == std::end(entries)) {
    return std::nullopt;
  }
  return found->second;
}

std::optional<schema::project_t> memory_state_store::find_project(
    std::string_view project_id) const {
  auto lock = std::scoped_lock{mutex_};
  return find_in(projects_, project_id);
}

std::optional<schema::milestone_t> memory_state_store::find_milestone(
    std::string_view milestone_id) const {
  auto lock = std::scoped_lock{mutex_};
  return find_in(milestones_, milestone_id);
}

std::optional<schema::escrow_t> memory_state_store::find_escrow(
    std::string_view escrow_id) const {
  auto lock = std::scoped_lock{mutex_};
  return find_in(escrows_, escrow_id);
}

std::optional<schema::escrow_t> memory_state_store::find_active_escrow(
    std::string_view milestone_id) const {
  auto lock = std::scoped_lock{mutex_};
  return active_escrow_locked(milestone_id);
}

std::optional<schema::escrow_t> memory_state_store::active_escrow_locked(
    std::string_view milestone_id) const {
  for (const auto& [id, escrow] : escrows_) {
    if (escrow.milestone_id == milestone_id && is_active(escrow.status)) {
      return escrow;
    }
  }
  return std::nullopt;
}

std::optional<schema::payment_transaction_t>
memory_state_store::find_transaction(std::string_view transaction_id) const {
  auto lock = std::scoped_lock{mutex_};
  return find_in(transactions_, transaction_id);
}

std::optional<schema::payout_batch_t> memory_state_store::find_batch(
    std::string_view batch_id) const {
  auto lock = std::scoped_lock{mutex_};
  return find_in(batches_, batch_id);
}

std::optional<schema::payout_batch_t> memory_state_store::find_batch_by_escrow(
    std::string_view escrow_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto found = batch_by_escrow_.find(schema::entity_id_t{escrow_id});
  if (found == std::end(batch_by_escrow_)) {
    return std::nullopt;
  }
  return find_in(batches_, found->second);
}

std::optional<schema::payout_batch_t>
memory_state_store::find_batch_by_transfer(
    std::string_view provider_transfer_id) const {
  auto lock = std::scoped_lock{mutex_};
  if (provider_transfer_id.empty()) {
    return std::nullopt;
  }
  for (const auto& [id, batch] : batches_) {
    auto matches = std::ranges::any_of(batch.items, [&](const auto& item) {
      return item.provider_transfer_id == provider_transfer_id;
    });
    if (matches) {
      return batch;
    }
  }
  return std::nullopt;
}

std::vector<schema::milestone_t> memory_state_store::list_milestones(
    std::string_view project_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto out = std::vector<schema::milestone_t>{};
  for (const auto& [id, milestone] : milestones_) {
    if (milestone.project_id == project_id) {
      out.push_back(milestone);
    }
  }
  std::ranges::sort(out, {}, &schema::milestone_t::created_at);
  return out;
}

write_status_t memory_state_store::apply(change_set& changes) {
  auto lock = std::scoped_lock{mutex_};

  // Active escrows and batch escrow keys claimed earlier in this change set.
  auto claimed_milestones = std::set<schema::entity_id_t>{};
  auto claimed_escrows = std::set<schema::entity_id_t>{};
  auto touched = std::set<schema::entity_id_t>{};

  for (const auto& entry : changes.changes) {
    auto status = std::visit(
        [&]<typename T>(const T& value) {
          const auto& entries = table<T>();
          const auto& id = record_id(entry.record);
          if (!touched.insert(id).second) {
            return write_status_t::already_exists;
          }
          auto found = entries.find(id);
          if (entry.mode == write_mode_t::insert) {
            if (found != std::end(entries)) {
              return write_status_t::already_exists;
            }
          } else {
            if (found == std::end(entries)) {
              return write_status_t::not_found;
            }
            if (found->second.revision != value.revision) {
              return write_status_t::revision_conflict;
            }
          }

          if constexpr (std::is_same_v<T, schema::escrow_t>) {
            if (is_active(value.status)) {
              auto active = active_escrow_locked(value.milestone_id);
              if ((active && active->escrow_id != value.escrow_id) ||
                  !claimed_milestones.insert(value.milestone_id).second) {
                return write_status_t::escrow_already_active;
              }
            }
          }
          if constexpr (std::is_same_v<T, schema::payout_batch_t>) {
            if (entry.mode == write_mode_t::insert &&
                (batch_by_escrow_.contains(value.escrow_id) ||
                 !claimed_escrows.insert(value.escrow_id).second)) {
              return write_status_t::batch_already_exists;
            }
          }
          return write_status_t::ok;
        },
        entry.record);
    if (status != write_status_t::ok) {
      spdlog::debug("State store rejected change for '{}': {}",
                    record_id(entry.record), to_string(status));
      return status;
    }
  }

  for (auto& entry : changes.changes) {
    std::visit(
        [&]<typename T>(T& value) {
          value.revision =
              entry.mode == write_mode_t::insert ? 1 : value.revision + 1;
          table<T>()[record_id(entry.record)] = value;
          if constexpr (std::is_same_v<T, schema::payout_batch_t>) {
            batch_by_escrow_[value.escrow_id] = value.batch_id;
          }
        },
        entry.record);
  }
  return write_status_t::ok;
}

}  // namespace disburse::storage
