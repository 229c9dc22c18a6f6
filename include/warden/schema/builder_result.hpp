#pragma once
#include <warden/schema/enum_string.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <string>

// Schema type: builder result.
// One attempt by one builder. Retries are appended as new results with a
// higher attempt number; results are never rewritten.
namespace warden::schema {

enum class builder_status_t : uint8_t {
  success = 0,
  failed = 1,
  timed_out = 2,
};

inline constexpr auto kBuilderStatusMappings =
    enum_mappings_t<builder_status_t, 3>{{
        {"success", builder_status_t::success},
        {"failed", builder_status_t::failed},
        {"timed_out", builder_status_t::timed_out},
    }};

inline constexpr std::string_view to_string(const builder_status_t value) {
  return to_string(value, kBuilderStatusMappings);
}

template <uint16_t Version>
struct builder_result;

template <>
struct builder_result<1> final {
  uint16_t version{1};
  hash32_t job_id;
  std::string builder_id;
  uint32_t attempt{};
  hash32_t sandbox_id;
  builder_status_t status{builder_status_t::failed};
  std::optional<hash32_t> artifact_digest;
  uint64_t artifact_size{};
  std::optional<hash32_t> log_digest;
  duration_milliseconds_t duration_ms{};
  std::string error;
  timestamp_milliseconds_t completed_at{};
};

using builder_result_t = builder_result<1>;

}  // namespace warden::schema
