#include <spdlog/spdlog.h>
#include <algorithm>
#include <tally/archive/coordinator.hpp>
#include <tally/common/critical.hpp>

using namespace tally::schema;

namespace tally::archive {

coordinator::coordinator(const archive_options_t& options,
                         provisioner_t provisioner)
    : options_{options},
      provisioner_{std::move(provisioner)},
      resource_budget_{options.resource_budget} {
  if (options_.max_retry_backoff == 0) {
    options_.max_retry_backoff = 1;
  }
}

std::optional<migration_ticket> coordinator::prepare(
    const tally::execution::transaction_log& log,
    const bool force) {
  if (phase_ == migration_phase_t::migrating) {
    spdlog::debug("Archive migration already in flight; skipping trigger");
    return std::nullopt;
  }
  if (log.empty()) {
    return std::nullopt;
  }
  if (!force) {
    if (log.size() < options_.max_log_size) {
      return std::nullopt;
    }
    if (!backoff_elapsed()) {
      return std::nullopt;
    }
  }
  if (!ensure_bound()) {
    record_failure("archive provisioning failed");
    return std::nullopt;
  }

  phase_ = migration_phase_t::migrating;
  auto ticket = migration_ticket{};
  ticket.target = std::get<bound_t>(binding_).handle;
  ticket.batch = log.snapshot();
  ticket.first_index = stored_transactions_;
  spdlog::info("Migrating {} transaction(s) starting at index {} to archive",
               ticket.batch.size(), ticket.first_index);
  return ticket;
}

void coordinator::complete(const migration_ticket& ticket,
                           const bool succeeded,
                           const std::string_view error,
                           tally::execution::transaction_log& log,
                           const std::optional<uint64_t> archive_stored) {
  if (phase_ != migration_phase_t::migrating) {
    tally::common::critical("archive migration completed while idle");
  }
  phase_ = migration_phase_t::idle;
  if (ticket.first_index != stored_transactions_) {
    tally::common::critical("archive migration committed out of order");
  }

  if (succeeded) {
    settle(ticket.batch.size(), log);
    return;
  }

  auto covered = uint64_t{0};
  if (archive_stored && *archive_stored > ticket.first_index) {
    covered = std::min<uint64_t>(*archive_stored - ticket.first_index,
                                 ticket.batch.size());
  }
  if (covered == ticket.batch.size()) {
    spdlog::warn(
        "Archive reported an error ({}) but holds the whole batch; settling "
        "it as migrated",
        error);
    settle(covered, log);
    return;
  }
  if (covered > 0) {
    spdlog::warn("Archive holds {} of {} transaction(s) from a failed batch",
                 covered, ticket.batch.size());
    stored_transactions_ += covered;
    log.truncate_front(covered);
  }
  record_failure(error);
}

void coordinator::settle(const uint64_t count,
                         tally::execution::transaction_log& log) {
  stored_transactions_ += count;
  log.truncate_front(count);
  consecutive_failures_ = 0;
  commits_since_failure_ = 0;
  ++migrations_;
  spdlog::info("Archive now holds {} transaction(s); {} remain in the log",
               stored_transactions_, log.size());
}

uint64_t coordinator::stored_transactions() const {
  return stored_transactions_;
}

bool coordinator::bound() const {
  return std::holds_alternative<bound_t>(binding_);
}

std::shared_ptr<endpoint> coordinator::target() const {
  if (const auto* bound = std::get_if<bound_t>(&binding_)) {
    return bound->handle;
  }
  return nullptr;
}

migration_phase_t coordinator::phase() const {
  return phase_;
}

archive_status coordinator::status() const {
  return archive_status{.bound = bound(),
                        .phase = phase_,
                        .stored_transactions = stored_transactions_,
                        .consecutive_failures = consecutive_failures_,
                        .failed_attempts = failed_attempts_,
                        .migrations = migrations_,
                        .resource_budget = resource_budget_};
}

uint64_t coordinator::retry_delay() const {
  if (consecutive_failures_ == 0) {
    return 0;
  }
  auto exponent = std::min<uint64_t>(consecutive_failures_ - 1, 63);
  return std::min<uint64_t>(uint64_t{1} << exponent,
                            options_.max_retry_backoff);
}

bool coordinator::ensure_bound() {
  if (bound()) {
    return true;
  }
  if (resource_budget_ < options_.provisioning_cost) {
    spdlog::error(
        "Cannot provision archive: budget {} is below provisioning cost {}",
        resource_budget_, options_.provisioning_cost);
    return false;
  }
  if (!provisioner_) {
    spdlog::error("Cannot provision archive: no provisioner configured");
    return false;
  }
  auto handle = provisioner_();
  if (!handle) {
    spdlog::warn("Archive provisioner returned no endpoint");
    return false;
  }
  resource_budget_ -= options_.provisioning_cost;
  binding_ = bound_t{.handle = std::move(handle)};
  spdlog::info("Provisioned archive for {} units; remaining budget {}",
               options_.provisioning_cost, resource_budget_);
  return true;
}

bool coordinator::backoff_elapsed() {
  if (consecutive_failures_ == 0) {
    return true;
  }
  ++commits_since_failure_;
  return commits_since_failure_ >= retry_delay();
}

void coordinator::record_failure(const std::string_view reason) {
  ++consecutive_failures_;
  ++failed_attempts_;
  commits_since_failure_ = 0;
  if (consecutive_failures_ >= options_.failure_alert_threshold) {
    spdlog::error(
        "Archive migration failed {} time(s) in a row: {}; next attempt in {} "
        "commit(s)",
        consecutive_failures_, reason, retry_delay());
  } else {
    spdlog::warn("Archive migration failed: {}; next attempt in {} commit(s)",
                 reason, retry_delay());
  }
}

}  // namespace tally::archive
