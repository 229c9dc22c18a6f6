#pragma once

#include <warden/schema/audit_entry.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden::audit {

/// Result of walking a section of the chain.
struct chain_report final {
  bool intact{true};
  uint64_t entries_checked{};
  std::optional<uint64_t> first_broken_sequence;
  std::string reason;
};

/// Append-only, hash-linked audit log.
///
/// Appends are serialized; sequence numbers are dense and start at the
/// genesis entry (0). Every state change elsewhere in the system is committed
/// in the same write batch as the entry describing it.
class log final {
 public:
  /// Adds records to the batch that carries the entry. Runs under the append
  /// lock with the entry's sequence already assigned.
  using stage_fn_t =
      std::function<void(const warden::schema::audit_entry_t& entry,
                         warden::storage::write_batch_t& batch)>;

  log(warden::schema::encoding::scale_encoder_t& encoder,
      warden::storage::rocksdb_storage_t& storage,
      warden::schema::time_source_t clock);

  /// Append an entry on its own.
  warden::schema::audit_entry_t append(
      const warden::schema::audit_event_t& event);

  /// Append an entry and commit `batch` atomically with it.
  warden::schema::audit_entry_t append(
      const warden::schema::audit_event_t& event,
      warden::storage::write_batch_t batch);

  warden::schema::audit_entry_t append(
      const warden::schema::audit_event_t& event,
      const stage_fn_t& stage);

  /// Entries with from <= sequence <= to. Missing entries are skipped.
  std::vector<warden::schema::audit_entry_t> range(uint64_t from,
                                                   uint64_t to) const;

  std::optional<warden::schema::audit_entry_t> get(uint64_t sequence) const;

  /// Recompute hashes and linkage for from..to, including the link from
  /// from-1. A to past the tail is clamped to the tail.
  chain_report verify_chain(uint64_t from, uint64_t to) const;
  chain_report verify_chain() const;

  uint64_t tail_sequence() const;

  static warden::schema::hash32_t compute_entry_hash(
      warden::schema::encoding::scale_encoder_t& encoder,
      const warden::schema::audit_entry_t& entry);

 private:
  warden::schema::audit_entry_t next_entry(
      const warden::schema::audit_event_t& event) const;
  void load_or_create_genesis();

  mutable std::mutex mutex_;
  warden::schema::encoding::scale_encoder_t& encoder_;
  warden::storage::rocksdb_storage_t& storage_;
  warden::schema::time_source_t clock_;
  uint64_t tail_sequence_{};
  warden::schema::hash32_t tail_hash_{};
};

}  // namespace warden::audit
