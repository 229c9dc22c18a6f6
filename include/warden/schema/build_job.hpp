#pragma once
#include <warden/schema/enum_string.hpp>
#include <warden/schema/error_code.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/source_ref.hpp>

#include <optional>
#include <string>
#include <vector>

// Schema type: build job and its lifecycle status.
namespace warden::schema {

struct recipe_parameter_t final {
  std::string name;
  std::string value;
};

template <uint16_t Version>
struct build_job;

/// Immutable once dispatched. `n` builders run the recipe, `k` of them must
/// agree on the artifact digest.
template <>
struct build_job<1> final {
  uint16_t version{1};
  std::string app_id;
  source_ref_t source;
  std::string recipe_id;
  std::vector<recipe_parameter_t> parameters;
  uint32_t n{3};
  uint32_t k{3};
};

using build_job_t = build_job<1>;

enum class job_state_t : uint8_t {
  submitted = 0,
  building = 1,
  verified = 2,
  rejected = 3,
  timed_out = 4,
};

inline constexpr auto kJobStateMappings = enum_mappings_t<job_state_t, 5>{{
    {"submitted", job_state_t::submitted},
    {"building", job_state_t::building},
    {"verified", job_state_t::verified},
    {"rejected", job_state_t::rejected},
    {"timed_out", job_state_t::timed_out},
}};

inline constexpr std::string_view to_string(const job_state_t value) {
  return to_string(value, kJobStateMappings);
}

inline constexpr bool is_terminal(const job_state_t value) {
  return value == job_state_t::verified || value == job_state_t::rejected ||
         value == job_state_t::timed_out;
}

template <uint16_t Version>
struct job_status;

template <>
struct job_status<1> final {
  uint16_t version{1};
  hash32_t job_id;
  uint64_t sequence{};
  job_state_t state{job_state_t::submitted};
  error_code_t reason{error_code_t::ok};
  std::string detail;
  timestamp_milliseconds_t submitted_at{};
  std::optional<timestamp_milliseconds_t> finished_at;
  std::optional<hash32_t> decision_id;
  std::vector<uint64_t> audit_refs;
};

using job_status_t = job_status<1>;

}  // namespace warden::schema
