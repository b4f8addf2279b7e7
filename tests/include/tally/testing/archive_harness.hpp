#pragma once

#include <tally/archive/endpoint.hpp>
#include <tally/schema/primitives.hpp>

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

namespace tally::testing {

/// In-memory archive for engine tests.
///
/// Can be told to fail appends, and can hold the next append open until the
/// test releases it so other operations can run during a migration.
class memory_archive final : public tally::archive::endpoint {
 public:
  bool append(const std::vector<tally::schema::transaction_t>& batch,
              std::string& error) override {
    ++append_calls_;
    wait_at_gate();
    auto lock = std::scoped_lock{mutex_};
    if (throw_) {
      throw 42;
    }
    if (fail_) {
      error = "archive unavailable";
      return false;
    }
    if (batch.empty() || batch.front().index != stored_.size()) {
      error = "non-contiguous batch";
      return false;
    }
    stored_.insert(stored_.end(), batch.begin(), batch.end());
    if (lose_confirmation_) {
      error = "DEADLINE_EXCEEDED";
      return false;
    }
    return true;
  }

  std::optional<tally::schema::transaction_t> get_transaction(
      const tally::schema::transaction_index_t index) override {
    auto lock = std::scoped_lock{mutex_};
    if (index >= stored_.size()) {
      return std::nullopt;
    }
    return stored_[index];
  }

  std::vector<tally::schema::transaction_t> get_transactions(
      const tally::schema::transaction_index_t start,
      const uint64_t length) override {
    auto lock = std::scoped_lock{mutex_};
    if (start >= stored_.size()) {
      return {};
    }
    auto end = start + std::min<uint64_t>(length, stored_.size() - start);
    return {stored_.begin() + static_cast<std::ptrdiff_t>(start),
            stored_.begin() + static_cast<std::ptrdiff_t>(end)};
  }

  std::optional<tally::schema::archive_usage_t> usage() override {
    auto lock = std::scoped_lock{mutex_};
    auto usage = tally::schema::archive_usage_t{};
    usage.stored_transactions = stored_.size();
    usage.used_bytes = stored_.size() * tally::schema::kMaxTransactionSize;
    return usage;
  }

  void set_fail(const bool fail) {
    auto lock = std::scoped_lock{mutex_};
    fail_ = fail;
  }

  /// Appends are stored but reported as failed, as when the reply of a
  /// remote call is lost.
  void set_lose_confirmation(const bool lose) {
    auto lock = std::scoped_lock{mutex_};
    lose_confirmation_ = lose;
  }

  /// Appends throw something that is not a std::exception.
  void set_throw(const bool value) {
    auto lock = std::scoped_lock{mutex_};
    throw_ = value;
  }

  /// The next append blocks after being entered until `release()`.
  void hold_next_append() {
    auto lock = std::scoped_lock{gate_mutex_};
    held_ = true;
    entered_ = false;
  }

  void wait_until_entered() {
    auto lock = std::unique_lock{gate_mutex_};
    gate_.wait(lock, [this] { return entered_; });
  }

  void release() {
    {
      auto lock = std::scoped_lock{gate_mutex_};
      held_ = false;
    }
    gate_.notify_all();
  }

  uint64_t append_calls() const { return append_calls_; }

  uint64_t stored() const {
    auto lock = std::scoped_lock{mutex_};
    return stored_.size();
  }

 private:
  void wait_at_gate() {
    auto lock = std::unique_lock{gate_mutex_};
    if (!held_) {
      return;
    }
    entered_ = true;
    gate_.notify_all();
    gate_.wait(lock, [this] { return !held_; });
  }

  mutable std::mutex mutex_;
  std::vector<tally::schema::transaction_t> stored_;
  bool fail_{false};
  bool lose_confirmation_{false};
  bool throw_{false};
  std::atomic<uint64_t> append_calls_{0};

  std::mutex gate_mutex_;
  std::condition_variable gate_;
  bool held_{false};
  bool entered_{false};
};

}  // namespace tally::testing
