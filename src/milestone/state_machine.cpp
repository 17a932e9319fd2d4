#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <disburse/milestone/state_machine.hpp>

using namespace disburse::schema;

namespace {

constexpr auto kMaxWriteAttempts = 8;

bool is_one_of(const milestone_status_t status,
               std::initializer_list<milestone_status_t> candidates) {
  for (const auto candidate : candidates) {
    if (candidate == status) {
      return true;
    }
  }
  return false;
}

std::string describe(const milestone_t& milestone) {
  return fmt::format("milestone {} is {}", milestone.milestone_id,
                     to_string(milestone.status));
}

}  // namespace

namespace disburse::milestone {

state_machine::state_machine(storage::state_store& store,
                             const ledger::escrow_ledger& ledger,
                             const ports::access_policy& access,
                             ports::job_queue_port& jobs,
                             ports::notification_port& notifications,
                             ports::event_publisher_port& events,
                             ports::time_source_t clock)
    : store_{store},
      ledger_{ledger},
      access_{access},
      jobs_{jobs},
      notifications_{notifications},
      events_{events},
      clock_{std::move(clock)} {}

operation_result<transition_t> state_machine::run(
    std::string_view milestone_id,
    std::string_view action,
    const step_t& step) {
  for (auto attempt = 0; attempt < kMaxWriteAttempts; ++attempt) {
    auto current = store_.find_milestone(milestone_id);
    if (!current) {
      return make_failure<transition_t>(
          error_code::milestone_not_found, kCodespace,
          fmt::format("milestone {} does not exist", milestone_id));
    }
    auto project = store_.find_project(current->project_id);
    if (!project) {
      return make_failure<transition_t>(
          error_code::project_not_found, kCodespace,
          fmt::format("project {} does not exist", current->project_id));
    }

    auto changes = storage::change_set{};
    if (auto rejected = step(*current, *project, changes)) {
      spdlog::warn("Rejected {} of milestone {}: {}", action, milestone_id,
                   rejected->info);
      return make_failure<transition_t>(rejected->code, kCodespace,
                                        std::move(rejected->info));
    }

    auto status = store_.apply(changes);
    if (status == storage::write_status_t::revision_conflict) {
      spdlog::debug("Retrying {} of milestone {} after concurrent write",
                    action, milestone_id);
      continue;
    }
    if (status == storage::write_status_t::escrow_already_active) {
      return make_failure<transition_t>(
          error_code::escrow_already_active, kCodespace,
          fmt::format("milestone {} already has an active escrow",
                      milestone_id));
    }
    if (status != storage::write_status_t::ok) {
      spdlog::error("State store refused {} of milestone {}: {}", action,
                    milestone_id, storage::to_string(status));
      return make_failure<transition_t>(error_code::version_conflict,
                                        kCodespace,
                                        std::string{storage::to_string(status)});
    }

    auto result = transition_t{};
    for (const auto& entry : changes.changes) {
      if (const auto* milestone = std::get_if<milestone_t>(&entry.record)) {
        result.milestone = *milestone;
      } else if (const auto* escrow = std::get_if<escrow_t>(&entry.record)) {
        result.escrow = *escrow;
      }
    }
    spdlog::info("Milestone {} {}: now {}{}", milestone_id, action,
                 to_string(result.milestone.status),
                 result.escrow ? fmt::format(", escrow {} {}",
                                             result.escrow->escrow_id,
                                             to_string(result.escrow->status))
                               : std::string{});
    announce(action, result);
    return make_success(std::move(result), kCodespace);
  }
  return make_failure<transition_t>(
      error_code::version_conflict, kCodespace,
      fmt::format("milestone {} kept changing during {}", milestone_id,
                  action));
}

void state_machine::announce(std::string_view action,
                             const transition_t& result) {
  auto attributes = ports::event_attributes_t{
      {"milestone_id", result.milestone.milestone_id},
      {"project_id", result.milestone.project_id},
      {"status", std::string{to_string(result.milestone.status)}}};
  if (result.escrow) {
    attributes.emplace("escrow_id", result.escrow->escrow_id);
    attributes.emplace("escrow_status",
                       std::string{to_string(result.escrow->status)});
  }
  events_.publish(fmt::format("milestone.{}", action), attributes);
}

operation_result<transition_t> state_machine::fund(
    std::string_view milestone_id,
    const payment_transaction_t& transaction) {
  return run(milestone_id, "funded",
             [&](const milestone_t& current, const project_t&,
                 storage::change_set& changes) -> std::optional<rejection> {
               if (auto active = ledger_.active_for(current.milestone_id)) {
                 return rejection{
                     error_code::escrow_already_active,
                     fmt::format("escrow {} is already {} for milestone {}",
                                 active->escrow_id, to_string(active->status),
                                 current.milestone_id)};
               }
               if (current.status != milestone_status_t::pending) {
                 return rejection{error_code::invalid_transition,
                                  describe(current)};
               }
               auto escrow = ledger_.open(current, transaction);
               auto next = current;
               next.status = milestone_status_t::funded;
               next.escrow_id = escrow.escrow_id;
               next.updated_at = clock_();
               changes.insert(std::move(escrow)).update(std::move(next));
               return std::nullopt;
             });
}

operation_result<transition_t> state_machine::complete(
    std::string_view milestone_id,
    std::string_view actor_id) {
  auto result = run(
      milestone_id, "completed",
      [&](const milestone_t& current, const project_t& project,
          storage::change_set& changes) -> std::optional<rejection> {
        if (!access_.is_member(project, actor_id)) {
          return rejection{error_code::permission_denied,
                           fmt::format("{} is not a member of project {}",
                                       actor_id, project.project_id)};
        }
        if (is_one_of(current.status, {milestone_status_t::completed,
                                       milestone_status_t::approved})) {
          return rejection{error_code::already_processed, describe(current)};
        }
        if (!is_one_of(current.status, {milestone_status_t::pending,
                                        milestone_status_t::funded})) {
          return rejection{error_code::invalid_transition, describe(current)};
        }
        auto next = current;
        next.status = milestone_status_t::completed;
        next.updated_at = clock_();
        changes.update(std::move(next));
        return std::nullopt;
      });
  if (result.ok()) {
    if (auto project = store_.find_project(result.value->milestone.project_id)) {
      notifications_.notify(
          project->owner_id, "milestone.completed",
          fmt::format("'{}' was marked complete by {}",
                      result.value->milestone.title, actor_id));
    }
  }
  return result;
}

operation_result<transition_t> state_machine::approve(
    std::string_view milestone_id,
    std::string_view actor_id) {
  auto result = run(
      milestone_id, "approved",
      [&](const milestone_t& current, const project_t& project,
          storage::change_set& changes) -> std::optional<rejection> {
        if (!access_.is_owner(project, actor_id)) {
          return rejection{error_code::permission_denied,
                           fmt::format("{} does not own project {}", actor_id,
                                       project.project_id)};
        }
        if (current.status == milestone_status_t::approved) {
          return rejection{error_code::already_processed, describe(current)};
        }
        if (is_one_of(current.status, {milestone_status_t::pending,
                                       milestone_status_t::funded})) {
          return rejection{error_code::milestone_not_completed,
                           describe(current)};
        }
        if (current.status == milestone_status_t::rejected) {
          return rejection{error_code::invalid_transition, describe(current)};
        }
        auto escrow = ledger_.active_for(current.milestone_id);
        if (!escrow) {
          return rejection{
              error_code::not_funded,
              fmt::format("milestone {} has no active escrow",
                          current.milestone_id)};
        }
        auto locked = *escrow;
        if (locked.status == escrow_status_t::held) {
          auto unheld = ledger_.plan_unhold(locked);
          if (!unheld.ok()) {
            return rejection{unheld.code, unheld.info};
          }
          locked = std::move(*unheld.value);
        }
        auto released = ledger_.plan_release(locked);
        if (!released.ok()) {
          return rejection{released.code, released.info};
        }
        auto next = current;
        next.status = milestone_status_t::approved;
        next.updated_at = clock_();
        changes.update(std::move(*released.value)).update(std::move(next));
        return std::nullopt;
      });
  if (result.ok()) {
    if (auto project = store_.find_project(result.value->milestone.project_id)) {
      for (const auto& member : project->member_ids) {
        notifications_.notify(
            member, "milestone.approved",
            fmt::format("'{}' was approved; payouts are being scheduled",
                        result.value->milestone.title));
      }
    }
  }
  return result;
}

operation_result<transition_t> state_machine::dispute(
    std::string_view milestone_id,
    std::string_view actor_id,
    std::string_view reason) {
  auto result = run(
      milestone_id, "disputed",
      [&](const milestone_t& current, const project_t& project,
          storage::change_set& changes) -> std::optional<rejection> {
        if (!access_.is_member(project, actor_id)) {
          return rejection{error_code::permission_denied,
                           fmt::format("{} is not a member of project {}",
                                       actor_id, project.project_id)};
        }
        if (is_one_of(current.status, {milestone_status_t::approved,
                                       milestone_status_t::disputed,
                                       milestone_status_t::rejected})) {
          return rejection{error_code::already_processed, describe(current)};
        }
        if (auto escrow = ledger_.active_for(current.milestone_id)) {
          auto held = ledger_.plan_hold(*escrow);
          if (!held.ok()) {
            return rejection{held.code, held.info};
          }
          changes.update(std::move(*held.value));
        }
        auto next = current;
        next.status = milestone_status_t::disputed;
        next.dispute_reason = std::string{reason};
        next.updated_at = clock_();
        changes.update(std::move(next));
        return std::nullopt;
      });
  if (result.ok()) {
    if (auto project = store_.find_project(result.value->milestone.project_id)) {
      notifications_.notify(
          project->owner_id, "milestone.disputed",
          fmt::format("'{}' was disputed by {}: {}",
                      result.value->milestone.title, actor_id, reason));
    }
  }
  return result;
}

operation_result<transition_t> state_machine::reject(
    std::string_view milestone_id,
    std::string_view actor_id,
    std::string_view reason) {
  auto result = run(
      milestone_id, "rejected",
      [&](const milestone_t& current, const project_t& project,
          storage::change_set& changes) -> std::optional<rejection> {
        if (!access_.is_owner(project, actor_id)) {
          return rejection{error_code::permission_denied,
                           fmt::format("{} does not own project {}", actor_id,
                                       project.project_id)};
        }
        if (current.status == milestone_status_t::rejected) {
          return rejection{error_code::already_processed, describe(current)};
        }
        if (current.status != milestone_status_t::disputed) {
          return rejection{error_code::invalid_transition, describe(current)};
        }
        if (auto escrow = ledger_.active_for(current.milestone_id)) {
          auto refunded = ledger_.plan_refund(*escrow);
          if (!refunded.ok()) {
            return rejection{refunded.code, refunded.info};
          }
          changes.update(std::move(*refunded.value));
        }
        auto next = current;
        next.status = milestone_status_t::rejected;
        if (!reason.empty()) {
          next.dispute_reason = std::string{reason};
        }
        next.updated_at = clock_();
        changes.update(std::move(next));
        return std::nullopt;
      });
  if (result.ok() && result.value->escrow) {
    const auto& escrow = *result.value->escrow;
    auto enqueued = enqueue_refund(escrow.escrow_id, reason);
    if (!enqueued.ok()) {
      // The rejection and the refunded escrow are committed; only the job
      // that moves the money back is missing.
      return make_failure<transition_t>(
          error_code::job_not_enqueued, kCodespace,
          fmt::format("milestone {} rejected and escrow {} refunded, but the "
                      "refund job was not enqueued ({}); retry with "
                      "requeue_refund",
                      milestone_id, escrow.escrow_id, enqueued.info));
    }
  }
  return result;
}

operation_result<job_t> state_machine::requeue_refund(
    std::string_view milestone_id,
    std::string_view actor_id) {
  auto milestone = store_.find_milestone(milestone_id);
  if (!milestone) {
    return make_failure<job_t>(
        error_code::milestone_not_found, kCodespace,
        fmt::format("milestone {} does not exist", milestone_id));
  }
  auto project = store_.find_project(milestone->project_id);
  if (!project) {
    return make_failure<job_t>(
        error_code::project_not_found, kCodespace,
        fmt::format("project {} does not exist", milestone->project_id));
  }
  if (!access_.is_owner(*project, actor_id)) {
    return make_failure<job_t>(
        error_code::permission_denied, kCodespace,
        fmt::format("{} does not own project {}", actor_id,
                    project->project_id));
  }
  if (milestone->status != milestone_status_t::rejected ||
      !milestone->escrow_id) {
    return make_failure<job_t>(error_code::invalid_transition, kCodespace,
                               describe(*milestone));
  }
  auto escrow = store_.find_escrow(*milestone->escrow_id);
  if (!escrow || escrow->status != escrow_status_t::refunded) {
    return make_failure<job_t>(
        error_code::invalid_transition, kCodespace,
        fmt::format("escrow {} is not refunded", *milestone->escrow_id));
  }
  return enqueue_refund(escrow->escrow_id, milestone->dispute_reason);
}

operation_result<job_t> state_machine::enqueue_refund(
    const std::string& escrow_id,
    std::string_view reason) {
  auto payload = job_payload_t{
      {"escrow_id", payload_value_t{escrow_id}},
      {"reason", payload_value_t{std::string{reason}}}};
  auto enqueued = jobs_.enqueue(kRefundJobType, std::move(payload));
  if (!enqueued.ok()) {
    spdlog::error("Failed to enqueue refund for escrow {}: {} {}", escrow_id,
                  enqueued.log, enqueued.info);
    return forward_failure<job_t>(enqueued);
  }
  spdlog::info("Refund of escrow {} queued as job {}", escrow_id,
               enqueued.value->job_id);
  return enqueued;
}

operation_result<transition_t> state_machine::resolve(
    std::string_view milestone_id,
    std::string_view actor_id) {
  return run(
      milestone_id, "resolved",
      [&](const milestone_t& current, const project_t& project,
          storage::change_set& changes) -> std::optional<rejection> {
        if (!access_.is_owner(project, actor_id)) {
          return rejection{error_code::permission_denied,
                           fmt::format("{} does not own project {}", actor_id,
                                       project.project_id)};
        }
        if (current.status != milestone_status_t::disputed) {
          return rejection{error_code::invalid_transition, describe(current)};
        }
        auto next = current;
        next.status = milestone_status_t::pending;
        if (auto escrow = ledger_.active_for(current.milestone_id)) {
          auto unheld = ledger_.plan_unhold(*escrow);
          if (!unheld.ok()) {
            return rejection{unheld.code, unheld.info};
          }
          changes.update(std::move(*unheld.value));
          next.status = milestone_status_t::funded;
        }
        next.dispute_reason.clear();
        next.updated_at = clock_();
        changes.update(std::move(next));
        return std::nullopt;
      });
}

}  // namespace disburse::milestone
