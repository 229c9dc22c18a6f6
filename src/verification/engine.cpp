#include <warden/blake3/hash.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/verification/engine.hpp>

#include <algorithm>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <utility>

using namespace warden::schema;

namespace warden::verification {

namespace {

inline constexpr auto kDiffDomain = std::string_view{"warden.diff.v1"};
inline constexpr auto kDecisionDomain = std::string_view{"warden.decision.v1"};

using encoder_t = encoding::scale_encoder_t;

void push_range(std::vector<byte_range_t>& ranges,
                const uint64_t offset,
                const uint64_t length) {
  if (!ranges.empty() &&
      ranges.back().offset + ranges.back().length == offset) {
    ranges.back().length += length;
    return;
  }
  ranges.push_back(byte_range_t{.offset = offset, .length = length});
}

hash32_t make_report_id(const hash32_t& left, const hash32_t& right) {
  auto encoder = encoder_t{};
  return warden::blake3::hash(kDiffDomain,
                              encoder.encode(std::tuple{left, right}));
}

hash32_t make_decision_id(const verification_decision_t& decision) {
  auto encoder = encoder_t{};
  auto content = decision;
  content.decision_id = make_zero_hash();
  content.decided_at = 0;
  return warden::blake3::hash(kDecisionDomain, encoder.encode(content));
}

}  // namespace

std::vector<builder_result_t> latest_attempts(
    const std::vector<builder_result_t>& results) {
  auto latest = std::map<std::string, const builder_result_t*>{};
  for (const auto& result : results) {
    auto& slot = latest[result.builder_id];
    if (slot == nullptr || result.attempt > slot->attempt) {
      slot = &result;
    }
  }
  auto out = std::vector<builder_result_t>{};
  out.reserve(latest.size());
  for (const auto& [builder_id, result] : latest) {
    out.push_back(*result);
  }
  return out;
}

diff_report_t diff(const hash32_t& left_digest,
                   const std::optional<bytes_t>& left,
                   const hash32_t& right_digest,
                   const std::optional<bytes_t>& right,
                   const std::size_t max_ranges) {
  auto report = diff_report_t{};
  report.report_id = make_report_id(left_digest, right_digest);
  report.left_digest = left_digest;
  report.right_digest = right_digest;
  if (!left || !right) {
    report.complete = false;
    report.left_size = left ? left->size() : 0;
    report.right_size = right ? right->size() : 0;
    return report;
  }

  report.left_size = left->size();
  report.right_size = right->size();
  const auto common = std::min(left->size(), right->size());
  for (std::size_t i = 0; i < common; ++i) {
    if ((*left)[i] == (*right)[i]) {
      continue;
    }
    if (report.ranges.size() == max_ranges &&
        report.ranges.back().offset + report.ranges.back().length != i) {
      report.truncated = true;
      return report;
    }
    push_range(report.ranges, i, 1);
  }
  if (left->size() != right->size()) {
    const auto longer = std::max(left->size(), right->size());
    if (report.ranges.size() == max_ranges &&
        report.ranges.back().offset + report.ranges.back().length != common) {
      report.truncated = true;
      return report;
    }
    push_range(report.ranges, common, longer - common);
  }
  return report;
}

verification_decision_t verify(const build_job_t& job,
                               const hash32_t& job_id,
                               const std::vector<builder_result_t>& results,
                               const artifact_reader_t& read_artifact) {
  auto decision = verification_decision_t{};
  decision.job_id = job_id;
  decision.n = job.n;
  decision.k = job.k;

  auto considered = latest_attempts(results);
  auto groups = std::map<hash32_t, std::vector<const builder_result_t*>>{};
  for (const auto& result : considered) {
    if (result.status == builder_status_t::success &&
        result.artifact_digest.has_value()) {
      groups[*result.artifact_digest].push_back(&result);
    } else {
      decision.failed_builders.push_back(result.builder_id);
    }
  }

  auto successes = std::size_t{};
  auto largest = std::size_t{};
  auto largest_count = std::size_t{};
  auto winner = std::optional<hash32_t>{};
  for (const auto& [digest, members] : groups) {
    successes += members.size();
    if (members.size() > largest) {
      largest = members.size();
      largest_count = 1;
      winner = digest;
    } else if (members.size() == largest) {
      ++largest_count;
    }
  }

  if (successes < job.k) {
    decision.outcome = verification_outcome_t::insufficient_builders;
  } else if (largest >= job.k && largest_count == 1) {
    decision.outcome = verification_outcome_t::consensus;
    decision.winning_digest = winner;
  } else {
    decision.outcome = verification_outcome_t::no_consensus;
  }

  // Diagnostic only. One report per distinct digest pair.
  auto artifact_cache = std::map<hash32_t, std::optional<bytes_t>>{};
  auto artifact = [&](const hash32_t& digest) -> const std::optional<bytes_t>& {
    auto it = artifact_cache.find(digest);
    if (it == artifact_cache.end()) {
      it = artifact_cache
               .emplace(digest, read_artifact ? read_artifact(digest)
                                              : std::optional<bytes_t>{})
               .first;
    }
    return it->second;
  };
  auto reports = std::map<std::pair<hash32_t, hash32_t>, hash32_t>{};
  auto report_for = [&](const hash32_t& left, const hash32_t& right) {
    auto key = std::minmax(left, right);
    auto ordered = std::pair<hash32_t, hash32_t>{key.first, key.second};
    auto it = reports.find(ordered);
    if (it != reports.end()) {
      return it->second;
    }
    auto report =
        diff(ordered.first, artifact(ordered.first), ordered.second,
             artifact(ordered.second));
    reports.emplace(ordered, report.report_id);
    decision.diff_reports.push_back(std::move(report));
    return decision.diff_reports.back().report_id;
  };

  for (const auto& [digest, members] : groups) {
    for (const auto* member : members) {
      // a lone group short of k still agrees with itself
      if (decision.winning_digest == digest || groups.size() == 1) {
        decision.agreeing.push_back(agreeing_result_t{
            .builder_id = member->builder_id, .attempt = member->attempt});
        continue;
      }
      auto disagreeing = disagreeing_result_t{.builder_id = member->builder_id,
                                              .attempt = member->attempt,
                                              .digest = digest,
                                              .diff_report_ids = {}};
      if (decision.winning_digest.has_value()) {
        disagreeing.diff_report_ids.push_back(
            report_for(*decision.winning_digest, digest));
      } else {
        for (const auto& entry : groups) {
          if (entry.first != digest) {
            disagreeing.diff_report_ids.push_back(
                report_for(digest, entry.first));
          }
        }
      }
      decision.disagreeing.push_back(std::move(disagreeing));
    }
  }

  decision.decision_id = make_decision_id(decision);
  return decision;
}

}  // namespace warden::verification
