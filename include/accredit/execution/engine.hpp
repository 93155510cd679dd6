#pragma once

#include <accredit/registry/call_context.hpp>
#include <accredit/registry/components.hpp>
#include <accredit/schema/app_info.hpp>
#include <accredit/schema/block_result.hpp>
#include <accredit/schema/commit_result.hpp>
#include <accredit/schema/encoding/encoder.hpp>
#include <accredit/schema/primitives.hpp>
#include <accredit/schema/query_result.hpp>
#include <accredit/schema/registry_event.hpp>
#include <accredit/schema/transaction.hpp>
#include <accredit/schema/transaction_result.hpp>
#include <accredit/storage/overlay.hpp>
#include <accredit/storage/rocksdb/storage.hpp>
#include <cstdint>
#include <functional>
#include <limits>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace accredit::execution {

/// Parameters written to storage on the first start of a fresh database.
struct genesis_config final {
  accredit::schema::hash32_t chain_id{};
  std::optional<accredit::schema::account_id_t> owner;
};

/// Observer for committed notifications, called once per event in id order.
using event_listener_t =
    std::function<void(const accredit::schema::event_record_t&)>;

/// Upper bound on the number of records a single event range query returns.
inline constexpr uint64_t kMaxEventRange = 1000;

/// Last id of the widest range starting at `from_id`, saturating at the top
/// of the id space.
inline constexpr uint64_t max_event_range_end(const uint64_t from_id) {
  if (from_id > std::numeric_limits<uint64_t>::max() - (kMaxEventRange - 1)) {
    return std::numeric_limits<uint64_t>::max();
  }
  return from_id + kMaxEventRange - 1;
}

/// Deterministic registry state machine.
///
/// Every public entry point runs under one engine-wide mutex. Each
/// transaction executes in its own state overlay layered on the pending
/// block; a failed transaction discards its overlay, so it commits nothing.
class engine final {
 public:
  /// Construct the engine over encoder/storage backends.
  ///
  /// A fresh database is initialized from `genesis` (owner and chain id). An
  /// initialized database must have been created with the same chain id.
  explicit engine(
      accredit::schema::encoding::encoder<
          accredit::schema::encoding::scale_encoder_tag>& encoder,
      accredit::storage::storage<accredit::storage::rocksdb_storage_tag>&
          storage,
      const genesis_config& genesis);

  /// Admit a transaction (CheckTx semantics).
  ///
  /// Performs decode + envelope validation only; does not mutate state.
  accredit::schema::transaction_result_t check_transaction(
      const accredit::schema::bytes_view_t& raw_tx) const;

  /// Execute a candidate block at `block_time` and compute its state root.
  ///
  /// Transactions are processed in-order; per-tx results are returned even
  /// on failures. A previously finalized but uncommitted block is dropped.
  /// A height other than the last committed one plus one is rejected whole.
  accredit::schema::block_result_t finalize_block(
      uint64_t height,
      accredit::schema::timestamp_milliseconds_t block_time,
      const std::vector<accredit::schema::bytes_t>& txs);

  /// Atomically persist the finalized block and publish its notifications.
  accredit::schema::commit_result_t commit();

  /// Return application metadata (latest committed height and state_root).
  accredit::schema::app_info_t info() const;

  /// Execute a read-path query by route against committed state.
  accredit::schema::query_result_t query(
      std::string_view path,
      const accredit::schema::bytes_view_t& data) const;

  /// Committed notifications with ids in [from_id, to_id].
  std::vector<accredit::schema::event_record_t> events(uint64_t from_id,
                                                       uint64_t to_id) const;

  /// Install the committed-notification observer.
  void set_event_listener(event_listener_t listener);

  accredit::schema::hash32_t chain_id() const;

 private:
  accredit::schema::transaction_result_t validate_transaction(
      const accredit::schema::transaction_t& tx,
      std::string_view codespace) const;

  accredit::schema::transaction_result_t execute_operation(
      accredit::registry::components& registry,
      accredit::registry::call_context& context,
      const accredit::schema::transaction_t& tx);

  void record_events(
      accredit::storage::overlay& state,
      uint64_t height,
      uint32_t transaction_index,
      const std::vector<accredit::schema::registry_event_t>& events);

  std::vector<accredit::schema::event_record_t> load_events(
      uint64_t from_id,
      uint64_t to_id) const;

  void initialize_genesis(const genesis_config& genesis);
  void load_persisted_state();

  mutable std::mutex mutex_;
  accredit::schema::encoding::encoder<
      accredit::schema::encoding::scale_encoder_tag>& encoder_;
  accredit::storage::storage<accredit::storage::rocksdb_storage_tag>& storage_;
  accredit::schema::hash32_t chain_id_{};
  int64_t last_committed_height_{};
  accredit::schema::hash32_t last_committed_state_root_{};
  int64_t pending_height_{};
  accredit::schema::hash32_t pending_state_root_{};
  accredit::storage::overlay pending_state_;
  std::vector<accredit::schema::event_record_t> pending_events_;
  event_listener_t event_listener_;
};

}  // namespace accredit::execution
