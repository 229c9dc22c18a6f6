#pragma once

#include <warden/schema/build_job.hpp>
#include <warden/schema/builder_result.hpp>
#include <warden/schema/verification_decision.hpp>

#include <cstddef>
#include <functional>
#include <optional>
#include <vector>

namespace warden::verification {

/// Reads stored artifact bytes by digest. Only used for diff reports.
using artifact_reader_t = std::function<std::optional<warden::schema::bytes_t>(
    const warden::schema::hash32_t& digest)>;

inline constexpr std::size_t kMaxDiffRanges = 1024;

/// Render the consensus decision for one job.
///
/// Pure over its inputs: the same job, results and artifact bytes always
/// give the same decision, including the decision id. `decided_at` is left
/// zero for the caller to stamp. Only the latest attempt of each builder is
/// considered. A tie between the largest agreeing groups is NoConsensus.
warden::schema::verification_decision_t verify(
    const warden::schema::build_job_t& job,
    const warden::schema::hash32_t& job_id,
    const std::vector<warden::schema::builder_result_t>& results,
    const artifact_reader_t& read_artifact);

/// Byte-range deltas between two artifacts. Adjacent differing bytes are
/// coalesced; a length difference becomes a trailing range.
warden::schema::diff_report_t diff(const warden::schema::hash32_t& left_digest,
                                   const std::optional<warden::schema::bytes_t>& left,
                                   const warden::schema::hash32_t& right_digest,
                                   const std::optional<warden::schema::bytes_t>& right,
                                   std::size_t max_ranges = kMaxDiffRanges);

/// Latest attempt per builder, in builder id order.
std::vector<warden::schema::builder_result_t> latest_attempts(
    const std::vector<warden::schema::builder_result_t>& results);

}  // namespace warden::verification
