#include <warden/audit/log.hpp>
#include <warden/blake3/hash.hpp>
#include <warden/common/critical.hpp>
#include <warden/schema/key/keyspace.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <tuple>
#include <utility>

using namespace warden::schema;

namespace warden::audit {

namespace {

inline constexpr auto kAuditDomain = std::string_view{"warden.audit.v1"};

using tail_record_t = std::tuple<uint64_t, hash32_t>;

}  // namespace

log::log(encoding::scale_encoder_t& encoder,
         warden::storage::rocksdb_storage_t& storage,
         time_source_t clock)
    : encoder_{encoder}, storage_{storage}, clock_{std::move(clock)} {
  auto lock = std::scoped_lock{mutex_};
  load_or_create_genesis();
}

hash32_t log::compute_entry_hash(encoding::scale_encoder_t& encoder,
                                 const audit_entry_t& entry) {
  auto encoded = encoder.encode(
      std::tuple{entry.version, entry.sequence, entry.previous_hash,
                 entry.type, entry.entity_kind, entry.entity_id,
                 entry.severity, entry.message, entry.payload,
                 entry.recorded_at});
  return warden::blake3::hash(kAuditDomain, encoded);
}

void log::load_or_create_genesis() {
  auto tail_key = key::make_prefix_key(key::kAuditTailKey);
  if (auto tail = storage_.get<tail_record_t>(encoder_, tail_key)) {
    tail_sequence_ = std::get<0>(*tail);
    tail_hash_ = std::get<1>(*tail);
    spdlog::info("Audit log resumed at sequence {}", tail_sequence_);
    return;
  }

  auto genesis = audit_entry_t{};
  genesis.sequence = 0;
  genesis.previous_hash = make_zero_hash();
  genesis.type = audit_event_type_t::genesis;
  genesis.entity_kind = entity_kind_t::system;
  genesis.message = "audit log genesis";
  genesis.recorded_at = clock_();
  genesis.entry_hash = compute_entry_hash(encoder_, genesis);

  auto batch = warden::storage::write_batch_t{};
  batch.puts.emplace_back(key::make_audit_entry_key(0),
                          encoder_.encode(genesis));
  batch.puts.emplace_back(tail_key,
                          encoder_.encode(tail_record_t{0, genesis.entry_hash}));
  storage_.commit(batch);

  tail_sequence_ = 0;
  tail_hash_ = genesis.entry_hash;
  spdlog::info("Audit log initialized with genesis entry");
}

audit_entry_t log::next_entry(const audit_event_t& event) const {
  auto entry = audit_entry_t{};
  entry.sequence = tail_sequence_ + 1;
  entry.previous_hash = tail_hash_;
  entry.type = event.type;
  entry.entity_kind = event.entity_kind;
  entry.entity_id = event.entity_id;
  entry.severity = event.severity;
  entry.message = event.message;
  entry.payload = event.payload;
  entry.recorded_at = clock_();
  entry.entry_hash = compute_entry_hash(encoder_, entry);
  return entry;
}

audit_entry_t log::append(const audit_event_t& event) {
  return append(event, warden::storage::write_batch_t{});
}

audit_entry_t log::append(const audit_event_t& event,
                          warden::storage::write_batch_t batch) {
  return append(event, [&batch](const audit_entry_t&,
                                warden::storage::write_batch_t& staged) {
    staged = std::move(batch);
  });
}

audit_entry_t log::append(const audit_event_t& event, const stage_fn_t& stage) {
  auto lock = std::scoped_lock{mutex_};
  auto entry = next_entry(event);

  auto batch = warden::storage::write_batch_t{};
  if (stage) {
    stage(entry, batch);
  }
  batch.puts.emplace_back(key::make_audit_entry_key(entry.sequence),
                          encoder_.encode(entry));
  batch.puts.emplace_back(
      key::make_prefix_key(key::kAuditTailKey),
      encoder_.encode(tail_record_t{entry.sequence, entry.entry_hash}));
  storage_.commit(batch);

  tail_sequence_ = entry.sequence;
  tail_hash_ = entry.entry_hash;

  switch (entry.severity) {
    case audit_severity_t::critical:
    case audit_severity_t::error:
      spdlog::error("audit #{} {} {}: {}", entry.sequence, to_string(entry.type),
                    to_hex(entry.entity_id), entry.message);
      break;
    case audit_severity_t::warning:
      spdlog::warn("audit #{} {} {}: {}", entry.sequence, to_string(entry.type),
                   to_hex(entry.entity_id), entry.message);
      break;
    case audit_severity_t::info:
      spdlog::debug("audit #{} {} {}: {}", entry.sequence,
                    to_string(entry.type), to_hex(entry.entity_id),
                    entry.message);
      break;
  }
  return entry;
}

std::optional<audit_entry_t> log::get(const uint64_t sequence) const {
  return storage_.get<audit_entry_t>(encoder_,
                                     key::make_audit_entry_key(sequence));
}

std::vector<audit_entry_t> log::range(const uint64_t from,
                                      const uint64_t to) const {
  auto entries = std::vector<audit_entry_t>{};
  if (from > to) {
    return entries;
  }
  auto last = std::min(to, tail_sequence());
  for (auto sequence = from; sequence <= last; ++sequence) {
    if (auto entry = get(sequence)) {
      entries.push_back(std::move(*entry));
    }
  }
  return entries;
}

uint64_t log::tail_sequence() const {
  auto lock = std::scoped_lock{mutex_};
  return tail_sequence_;
}

chain_report log::verify_chain() const {
  return verify_chain(0, tail_sequence());
}

chain_report log::verify_chain(const uint64_t from, uint64_t to) const {
  to = std::min(to, tail_sequence());
  auto report = chain_report{};
  auto broken = [&report](const uint64_t sequence, std::string reason) {
    report.intact = false;
    report.first_broken_sequence = sequence;
    report.reason = std::move(reason);
    return report;
  };

  if (from > to) {
    return report;
  }

  auto previous = std::optional<hash32_t>{};
  if (from == 0) {
    previous = make_zero_hash();
  } else if (auto before = get(from - 1)) {
    previous = before->entry_hash;
  } else {
    return broken(from - 1, "missing entry preceding range");
  }

  for (auto sequence = from; sequence <= to; ++sequence) {
    auto entry = get(sequence);
    if (!entry) {
      return broken(sequence, "missing entry");
    }
    if (entry->sequence != sequence) {
      return broken(sequence, "sequence does not match storage position");
    }
    if (entry->previous_hash != *previous) {
      return broken(sequence, "previous_hash does not link to prior entry");
    }
    if (compute_entry_hash(encoder_, *entry) != entry->entry_hash) {
      return broken(sequence, "entry_hash does not match contents");
    }
    previous = entry->entry_hash;
    ++report.entries_checked;
  }
  return report;
}

}  // namespace warden::audit
