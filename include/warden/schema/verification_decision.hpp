#pragma once
#include <warden/schema/enum_string.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string>
#include <vector>

// Schema type: verification decision.
// Consensus verdict over the builder results of one job, plus the byte-range
// diff reports used to investigate disagreement.
namespace warden::schema {

enum class verification_outcome_t : uint8_t {
  consensus = 0,
  no_consensus = 1,
  insufficient_builders = 2,
};

inline constexpr auto kVerificationOutcomeMappings =
    enum_mappings_t<verification_outcome_t, 3>{{
        {"consensus", verification_outcome_t::consensus},
        {"no_consensus", verification_outcome_t::no_consensus},
        {"insufficient_builders",
         verification_outcome_t::insufficient_builders},
    }};

inline constexpr std::string_view to_string(
    const verification_outcome_t value) {
  return to_string(value, kVerificationOutcomeMappings);
}

struct byte_range_t final {
  uint64_t offset{};
  uint64_t length{};
};

template <uint16_t Version>
struct diff_report;

template <>
struct diff_report<1> final {
  uint16_t version{1};
  hash32_t report_id;
  hash32_t left_digest;
  hash32_t right_digest;
  uint64_t left_size{};
  uint64_t right_size{};
  std::vector<byte_range_t> ranges;
  bool truncated{false};
  // false when either artifact could not be read back from the store
  bool complete{true};
};

using diff_report_t = diff_report<1>;

struct agreeing_result_t final {
  std::string builder_id;
  uint32_t attempt{};
};

struct disagreeing_result_t final {
  std::string builder_id;
  uint32_t attempt{};
  hash32_t digest;
  std::vector<hash32_t> diff_report_ids;
};

template <uint16_t Version>
struct verification_decision;

template <>
struct verification_decision<1> final {
  uint16_t version{1};
  hash32_t decision_id;
  hash32_t job_id;
  verification_outcome_t outcome{verification_outcome_t::no_consensus};
  std::optional<hash32_t> winning_digest;
  uint32_t n{};
  uint32_t k{};
  std::vector<agreeing_result_t> agreeing;
  std::vector<disagreeing_result_t> disagreeing;
  std::vector<std::string> failed_builders;
  std::vector<diff_report_t> diff_reports;
  timestamp_milliseconds_t decided_at{};
};

using verification_decision_t = verification_decision<1>;

}  // namespace warden::schema
