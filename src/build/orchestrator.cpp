#include <warden/blake3/hash.hpp>
#include <warden/build/orchestrator.hpp>
#include <warden/build/source.hpp>
#include <warden/common/critical.hpp>
#include <warden/schema/key/keyspace.hpp>
#include <warden/verification/engine.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <future>
#include <tuple>
#include <utility>

using namespace warden::schema;

namespace warden::build {

namespace {

inline constexpr auto kJobDomain = std::string_view{"warden.job.v1"};
inline constexpr auto kDeadlineGraceMs = duration_milliseconds_t{5000};
inline constexpr auto kPollInterval = std::chrono::milliseconds{10};

bool is_safe_recipe_id(const std::string_view recipe_id) {
  return !recipe_id.empty() && recipe_id.front() != '.' &&
         recipe_id.find('/') == std::string_view::npos &&
         recipe_id.find('\0') == std::string_view::npos;
}

hash32_t make_job_id(encoding::scale_encoder_t& encoder,
                     const build_job_t& job,
                     const uint64_t sequence) {
  return warden::blake3::hash(kJobDomain,
                              encoder.encode(std::tuple{job, sequence}));
}

audit_event_t job_event(const audit_event_type_t type,
                        const hash32_t& job_id,
                        const audit_severity_t severity,
                        std::string message) {
  return audit_event_t{.type = type,
                       .entity_kind = entity_kind_t::build_job,
                       .entity_id = job_id,
                       .severity = severity,
                       .message = std::move(message),
                       .payload = {}};
}

}  // namespace

orchestrator::orchestrator(encoding::scale_encoder_t& encoder,
                           warden::storage::rocksdb_storage_t& storage,
                           warden::audit::log& audit,
                           sandbox_pool& sandboxes,
                           artifact_store& artifacts,
                           build_executor_t executor,
                           orchestrator_options options,
                           time_source_t clock)
    : encoder_{encoder},
      storage_{storage},
      audit_{audit},
      sandboxes_{sandboxes},
      artifacts_{artifacts},
      executor_{std::move(executor)},
      options_{std::move(options)},
      clock_{std::move(clock)} {
  spdlog::info(
      "Build orchestrator ready: {} builder(s), attempt timeout {} ms, retry "
      "budget {}",
      options_.builders.size(), options_.attempt_timeout_ms,
      options_.retry_budget);
}

orchestrator::~orchestrator() {
  auto runtimes = std::vector<job_runtime*>{};
  {
    auto lock = std::scoped_lock{mutex_};
    for (auto& [job_id, runtime] : running_) {
      runtime->cancelled = true;
      runtimes.push_back(runtime.get());
    }
  }
  for (auto* runtime : runtimes) {
    if (runtime->worker.joinable()) {
      runtime->worker.join();
    }
  }
}

void orchestrator::set_completion_callback(job_completion_callback_t callback) {
  auto lock = std::scoped_lock{mutex_};
  on_complete_ = std::move(callback);
}

status_t orchestrator::validate(const build_job_t& job) const {
  if (job.k == 0 || job.n == 0 || job.k > job.n) {
    return make_error<std::monostate>(error_code_t::invalid_request,
                                      "require 1 <= k <= n");
  }
  if (job.n > options_.builders.size()) {
    return make_error<std::monostate>(
        error_code_t::invalid_request,
        "n exceeds the number of configured builders (" +
            std::to_string(options_.builders.size()) + ")");
  }
  if (!is_safe_recipe_id(job.recipe_id)) {
    return make_error<std::monostate>(error_code_t::invalid_request,
                                      "invalid recipe id");
  }
  if (job.source.locator.empty() || job.source.commit.empty()) {
    return make_error<std::monostate>(error_code_t::invalid_request,
                                      "source locator and commit required");
  }
  if (job.app_id.empty()) {
    return make_error<std::monostate>(error_code_t::invalid_request,
                                      "application id required");
  }
  return make_ok();
}

std::chrono::milliseconds orchestrator::job_deadline() const {
  if (options_.job_deadline_ms != 0) {
    return std::chrono::milliseconds{options_.job_deadline_ms};
  }
  return std::chrono::milliseconds{
      options_.attempt_timeout_ms * (options_.retry_budget + 1) +
      kDeadlineGraceMs};
}

job_status_t orchestrator::commit_status(job_status_t status,
                                         const audit_event_t& event,
                                         warden::storage::write_batch_t batch) {
  audit_.append(event, [&](const audit_entry_t& entry,
                           warden::storage::write_batch_t& staged) {
    status.audit_refs.push_back(entry.sequence);
    staged = std::move(batch);
    staged.puts.emplace_back(key::make_job_status_key(status.job_id),
                             encoder_.encode(status));
  });
  return status;
}

outcome<hash32_t> orchestrator::submit(const build_job_t& job) {
  auto valid = validate(job);
  if (!valid.ok()) {
    spdlog::warn("Rejected build job for app '{}': {}", job.app_id, valid.log);
    return make_error<hash32_t>(valid.code, valid.log);
  }

  const auto source_ok =
      (!options_.require_signed_sources && !job.source.signature) ||
      verify_source(job.source, options_.trusted_source_signers);

  auto completion = job_completion_callback_t{};
  auto lock = std::unique_lock{mutex_};
  reap_finished();

  auto sequence_key = key::make_prefix_key(key::kJobSequenceKey);
  auto sequence =
      storage_.get<uint64_t>(encoder_, sequence_key).value_or(0) + 1;
  auto job_id = make_job_id(encoder_, job, sequence);

  auto status = job_status_t{};
  status.job_id = job_id;
  status.sequence = sequence;
  status.state = source_ok ? job_state_t::building : job_state_t::submitted;
  status.submitted_at = clock_();

  auto batch = warden::storage::write_batch_t{};
  batch.puts.emplace_back(sequence_key, encoder_.encode(sequence));
  batch.puts.emplace_back(key::make_job_key(job_id), encoder_.encode(job));
  status = commit_status(
      std::move(status),
      job_event(audit_event_type_t::job_submitted, job_id,
                audit_severity_t::info,
                "job #" + std::to_string(sequence) + " app '" + job.app_id +
                    "' recipe '" + job.recipe_id + "' commit " +
                    job.source.commit + " n=" + std::to_string(job.n) +
                    " k=" + std::to_string(job.k)),
      std::move(batch));

  if (!source_ok) {
    status.state = job_state_t::rejected;
    status.reason = error_code_t::source_verification_failed;
    status.detail = "source signature missing, untrusted or invalid";
    status.finished_at = clock_();
    status = commit_status(
        std::move(status),
        job_event(audit_event_type_t::source_verification_failed, job_id,
                  audit_severity_t::error,
                  "source " + job.source.locator + "@" + job.source.commit +
                      " failed verification"),
        {});
    completion = on_complete_;
    lock.unlock();
    terminal_cv_.notify_all();
    if (completion) {
      completion(status, std::nullopt);
    }
    auto result = make_error<hash32_t>(error_code_t::source_verification_failed,
                                       status.detail);
    result.value = job_id;
    return result;
  }

  auto runtime = std::make_unique<job_runtime>();
  auto& runtime_ref = *runtime;
  runtime->worker = std::thread{[this, job_id, job, &runtime_ref] {
    run_job(job_id, job, runtime_ref);
  }};
  running_.emplace(job_id, std::move(runtime));
  spdlog::info("Dispatched job {} to {} builder(s)", to_hex(job_id), job.n);
  return make_ok(job_id);
}

void orchestrator::run_job(hash32_t job_id,
                           build_job_t job,
                           job_runtime& runtime) {
  const auto deadline = std::chrono::steady_clock::now() + job_deadline();
  auto slots = std::vector<std::thread>{};
  slots.reserve(job.n);
  for (auto index = uint32_t{0}; index < job.n; ++index) {
    slots.emplace_back([&, index] {
      run_builder(job_id, job, index, deadline, runtime);
    });
  }
  for (auto& slot : slots) {
    slot.join();
  }
  finalize(job_id, job, runtime);
  runtime.finished = true;
}

void orchestrator::run_builder(const hash32_t& job_id,
                               const build_job_t& job,
                               const uint32_t builder_index,
                               const std::chrono::steady_clock::time_point
                                   job_deadline,
                               job_runtime& runtime) {
  const auto& builder_id = options_.builders[builder_index];
  const auto attempts = options_.retry_budget + 1;
  for (auto attempt = uint32_t{1}; attempt <= attempts; ++attempt) {
    if (runtime.cancelled) {
      return;
    }
    if (std::chrono::steady_clock::now() >= job_deadline) {
      runtime.deadline_passed = true;
      return;
    }

    auto result =
        run_attempt(job_id, job, builder_id, attempt, job_deadline, runtime);
    record_result(result, builder_index, runtime);
    if (result.status == builder_status_t::success || runtime.cancelled ||
        runtime.deadline_passed) {
      return;
    }
    spdlog::info("Builder '{}' attempt {} for job {} ended {}{}", builder_id,
                 attempt, to_hex(job_id), to_string(result.status),
                 attempt < attempts ? "; retrying in a fresh sandbox"
                                    : "; retry budget exhausted");
  }
}

builder_result_t orchestrator::run_attempt(
    const hash32_t& job_id,
    const build_job_t& job,
    const std::string& builder_id,
    const uint32_t attempt,
    const std::chrono::steady_clock::time_point job_deadline,
    job_runtime& runtime) {
  auto result = builder_result_t{};
  result.job_id = job_id;
  result.builder_id = builder_id;
  result.attempt = attempt;

  const auto started = std::chrono::steady_clock::now();
  auto elapsed_ms = [&started] {
    return static_cast<duration_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started)
            .count());
  };

  auto lease = sandboxes_.provision(builder_id);
  if (!lease.ok()) {
    result.status = builder_status_t::failed;
    result.error = lease.log;
    result.completed_at = clock_();
    return result;
  }
  result.sandbox_id = lease.value->id();

  const auto attempt_deadline = std::min(
      started + std::chrono::milliseconds{options_.attempt_timeout_ms},
      job_deadline);
  auto attempt_cancelled = std::atomic<bool>{false};
  const auto context = execution_context_t{
      .lease = *lease.value,
      .job = job,
      .timeout_ms = static_cast<duration_milliseconds_t>(
          std::chrono::duration_cast<std::chrono::milliseconds>(
              attempt_deadline - started)
              .count()),
      .cancelled = attempt_cancelled};

  auto pending = std::async(std::launch::async,
                            [this, &context] { return executor_(context); });
  auto timed_out = false;
  while (pending.wait_for(kPollInterval) != std::future_status::ready) {
    if (runtime.cancelled) {
      attempt_cancelled = true;
      break;
    }
    auto now = std::chrono::steady_clock::now();
    if (now >= attempt_deadline) {
      timed_out = true;
      if (now >= job_deadline) {
        runtime.deadline_passed = true;
      }
      attempt_cancelled = true;
      break;
    }
  }
  auto executed = pending.get();

  if (timed_out || executed.status == builder_status_t::timed_out) {
    result.status = builder_status_t::timed_out;
    result.error = "attempt exceeded wall-clock limit";
  } else if (runtime.cancelled) {
    result.status = builder_status_t::failed;
    result.error = "job cancelled";
  } else if (executed.status == builder_status_t::success) {
    auto stored = executed.artifact ? artifacts_.put_file(*executed.artifact)
                                    : std::nullopt;
    if (stored) {
      result.status = builder_status_t::success;
      result.artifact_digest = stored->digest;
      result.artifact_size = stored->size;
    } else {
      result.status = builder_status_t::failed;
      result.error = "artifact could not be collected";
    }
  } else {
    result.status = builder_status_t::failed;
    result.error = executed.error;
  }

  if (auto log = artifacts_.put(make_bytes_view(executed.log))) {
    result.log_digest = log->digest;
  }

  lease.value->release();
  result.duration_ms = elapsed_ms();
  result.completed_at = clock_();
  return result;
}

void orchestrator::record_result(const builder_result_t& result,
                                 const uint32_t builder_index,
                                 job_runtime& runtime) {
  auto lock = std::scoped_lock{runtime.mutex};
  auto current = status(result.job_id);
  if (!current) {
    warden::common::critical("job status missing while recording result");
  }

  auto batch = warden::storage::write_batch_t{};
  batch.puts.emplace_back(
      key::make_result_key(result.job_id, builder_index, result.attempt),
      encoder_.encode(result));

  auto message = "builder '" + result.builder_id + "' attempt " +
                 std::to_string(result.attempt) + " " +
                 std::string{to_string(result.status)};
  if (result.artifact_digest) {
    message += " digest " + to_hex(*result.artifact_digest);
  }
  if (!result.error.empty()) {
    message += ": " + result.error;
  }
  auto event = audit_event_t{
      .type = audit_event_type_t::builder_result_recorded,
      .entity_kind = entity_kind_t::build_job,
      .entity_id = result.job_id,
      .severity = result.status == builder_status_t::success
                      ? audit_severity_t::info
                      : audit_severity_t::warning,
      .message = std::move(message),
      .payload = encoder_.encode(std::tuple{builder_index, result.attempt})};
  commit_status(std::move(*current), event, std::move(batch));
}

void orchestrator::finalize(const hash32_t& job_id,
                            const build_job_t& job,
                            job_runtime& runtime) {
  auto decision = std::optional<verification_decision_t>{};
  auto final_status = job_status_t{};
  {
    auto lock = std::scoped_lock{runtime.mutex};
    auto current = status(job_id);
    if (!current) {
      warden::common::critical("job status missing at finalization");
    }
    auto next = std::move(*current);
    auto batch = warden::storage::write_batch_t{};
    auto event = audit_event_t{};

    if (runtime.cancelled) {
      next.state = job_state_t::rejected;
      next.reason = error_code_t::job_cancelled;
      next.detail = "cancelled before consensus";
      event = job_event(audit_event_type_t::job_cancelled, job_id,
                        audit_severity_t::warning, next.detail);
    } else if (runtime.deadline_passed) {
      next.state = job_state_t::timed_out;
      next.reason = error_code_t::builder_timeout;
      next.detail = "job deadline passed before all builders finished";
      event = job_event(audit_event_type_t::job_timed_out, job_id,
                        audit_severity_t::error, next.detail);
    } else {
      decision = warden::verification::verify(
          job, job_id, results(job_id),
          [this](const hash32_t& digest) { return artifacts_.read(digest); });
      decision->decided_at = clock_();
      next.decision_id = decision->decision_id;

      auto message = std::string{to_string(decision->outcome)} + " " +
                     std::to_string(decision->agreeing.size()) + " agree, " +
                     std::to_string(decision->disagreeing.size()) +
                     " disagree, " +
                     std::to_string(decision->failed_builders.size()) +
                     " failed, " +
                     std::to_string(decision->diff_reports.size()) +
                     " diff report(s)";
      switch (decision->outcome) {
        case verification_outcome_t::consensus:
          next.state = job_state_t::verified;
          next.reason = error_code_t::ok;
          message += ", winner " + to_hex(*decision->winning_digest);
          break;
        case verification_outcome_t::no_consensus:
          next.state = job_state_t::rejected;
          next.reason = error_code_t::no_consensus;
          break;
        case verification_outcome_t::insufficient_builders:
          next.state = job_state_t::rejected;
          next.reason = error_code_t::insufficient_builders;
          break;
      }
      next.detail = message;
      batch.puts.emplace_back(key::make_decision_key(decision->decision_id),
                              encoder_.encode(*decision));
      event = audit_event_t{
          .type = audit_event_type_t::verification_decided,
          .entity_kind = entity_kind_t::verification_decision,
          .entity_id = decision->decision_id,
          .severity = next.state == job_state_t::verified
                          ? audit_severity_t::info
                          : audit_severity_t::error,
          .message = std::move(message),
          .payload = encoder_.encode(job_id)};
    }

    next.finished_at = clock_();
    runtime.finalized = true;
    final_status = commit_status(std::move(next), event, std::move(batch));
  }

  auto completion = job_completion_callback_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    completion = on_complete_;
  }
  terminal_cv_.notify_all();
  spdlog::info("Job {} finished {} ({})", to_hex(job_id),
               to_string(final_status.state), to_string(final_status.reason));
  if (completion) {
    completion(final_status, decision);
  }
}

status_t orchestrator::cancel(const hash32_t& job_id) {
  auto lock = std::scoped_lock{mutex_};
  auto it = running_.find(job_id);
  if (it == running_.end()) {
    auto current = status(job_id);
    if (!current) {
      return make_error<std::monostate>(error_code_t::not_found,
                                        "unknown job");
    }
    return make_error<std::monostate>(error_code_t::job_finalized,
                                      "job already terminal");
  }
  auto runtime_lock = std::scoped_lock{it->second->mutex};
  if (it->second->finalized) {
    return make_error<std::monostate>(error_code_t::job_finalized,
                                      "job already terminal");
  }
  it->second->cancelled = true;
  spdlog::info("Cancellation requested for job {}", to_hex(job_id));
  return make_ok();
}

std::optional<job_status_t> orchestrator::status(const hash32_t& job_id) const {
  return storage_.get<job_status_t>(encoder_, key::make_job_status_key(job_id));
}

std::optional<job_status_t> orchestrator::wait(
    const hash32_t& job_id,
    const std::chrono::milliseconds timeout) const {
  auto lock = std::unique_lock{mutex_};
  terminal_cv_.wait_for(lock, timeout, [&] {
    auto current = status(job_id);
    return !current || is_terminal(current->state);
  });
  return status(job_id);
}

std::optional<build_job_t> orchestrator::job(const hash32_t& job_id) const {
  return storage_.get<build_job_t>(encoder_, key::make_job_key(job_id));
}

std::vector<builder_result_t> orchestrator::results(
    const hash32_t& job_id) const {
  auto out = std::vector<builder_result_t>{};
  for (const auto& entry :
       storage_.list_by_prefix(key::make_result_prefix_key(job_id))) {
    out.push_back(encoder_.decode<builder_result_t>(entry.second));
  }
  return out;
}

std::optional<verification_decision_t> orchestrator::decision(
    const hash32_t& job_id) const {
  auto current = status(job_id);
  if (!current || !current->decision_id) {
    return std::nullopt;
  }
  return storage_.get<verification_decision_t>(
      encoder_, key::make_decision_key(*current->decision_id));
}

std::optional<bytes_t> orchestrator::read_artifact(
    const hash32_t& digest) const {
  return artifacts_.read(digest);
}

void orchestrator::reap_finished() {
  for (auto it = running_.begin(); it != running_.end();) {
    if (it->second->finished) {
      it->second->worker.join();
      it = running_.erase(it);
    } else {
      ++it;
    }
  }
}

}  // namespace warden::build
