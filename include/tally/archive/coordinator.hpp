#pragma once

#include <tally/archive/endpoint.hpp>
#include <tally/execution/transaction_log.hpp>
#include <tally/schema/ledger_config.hpp>
#include <tally/schema/primitives.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <variant>
#include <vector>

namespace tally::archive {

/// No archive allocated yet.
struct unbound_t final {};

/// Archive allocated and in use for the rest of the ledger's lifetime.
struct bound_t final {
  std::shared_ptr<endpoint> handle;
};

using binding_t = std::variant<unbound_t, bound_t>;

enum class migration_phase_t : uint8_t { idle = 0, migrating = 1 };

/// One in-flight migration: the batch copied out of the log and where it goes.
struct migration_ticket final {
  std::shared_ptr<endpoint> target;
  std::vector<tally::schema::transaction_t> batch;
  tally::schema::transaction_index_t first_index{};
};

struct archive_status final {
  bool bound{false};
  migration_phase_t phase{migration_phase_t::idle};
  uint64_t stored_transactions{};
  uint64_t consecutive_failures{};
  uint64_t failed_attempts{};
  uint64_t migrations{};
  uint64_t resource_budget{};
};

/// Moves full transaction logs into the archive.
///
/// Not thread-safe on its own: `prepare` and `complete` run under the
/// engine lock, the transmission of a ticket runs outside of it. At most one
/// ticket is outstanding at a time.
class coordinator final {
 public:
  coordinator(const tally::schema::archive_options_t& options,
              provisioner_t provisioner);

  /// Post-commit hook. Returns a ticket when the log reached capacity, no
  /// migration is in flight and the retry backoff has elapsed; provisions the
  /// archive on first use. `force` skips the capacity and backoff checks.
  std::optional<migration_ticket> prepare(
      const tally::execution::transaction_log& log,
      bool force = false);

  /// Apply the outcome of a transmitted ticket. On success advances the
  /// stored count and drops the batch from the log in one step.
  ///
  /// A failed append may still have been stored when only its confirmation
  /// was lost. `archive_stored` is the count the archive reported after the
  /// failure; whatever part of the batch it already covers is settled as
  /// committed, and only the rest is retried.
  void complete(const migration_ticket& ticket,
                bool succeeded,
                std::string_view error,
                tally::execution::transaction_log& log,
                std::optional<uint64_t> archive_stored = std::nullopt);

  uint64_t stored_transactions() const;
  bool bound() const;
  std::shared_ptr<endpoint> target() const;
  migration_phase_t phase() const;
  archive_status status() const;

  /// Commits to wait before the next attempt after the current failure run.
  uint64_t retry_delay() const;

 private:
  bool ensure_bound();
  bool backoff_elapsed();
  void record_failure(std::string_view reason);
  void settle(uint64_t count, tally::execution::transaction_log& log);

  tally::schema::archive_options_t options_;
  provisioner_t provisioner_;
  binding_t binding_{unbound_t{}};
  migration_phase_t phase_{migration_phase_t::idle};
  uint64_t stored_transactions_{};
  uint64_t resource_budget_{};
  uint64_t consecutive_failures_{};
  uint64_t commits_since_failure_{};
  uint64_t failed_attempts_{};
  uint64_t migrations_{};
};

}  // namespace tally::archive
