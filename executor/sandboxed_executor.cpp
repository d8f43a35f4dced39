#include "executor/sandboxed_executor.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>

#include "glog/logging.h"
#include "harness/harness.hpp"
#include "language/language.hpp"

namespace executor {

namespace {

size_t NumSlots(int32_t max_concurrent_executions) {
  if (max_concurrent_executions > 0) return max_concurrent_executions;
  return std::max(1U, std::thread::hardware_concurrency());
}

}  // namespace

SandboxedExecutor::SandboxedExecutor(ExecutorOptions options,
                                     std::unique_ptr<sandbox::Sandbox> sandbox,
                                     std::vector<std::string> available)
    : options_(options),
      sandbox_(std::move(sandbox)),
      available_(std::move(available)),
      normalizer_(options.max_error_stderr),
      slots_(NumSlots(options.max_concurrent_executions)) {
  LOG(INFO) << "Executor ready: "
            << (sandbox_ ? sandbox_->Name() : "no") << " sandbox, "
            << slots_.MaxSlots() << " concurrent executions";
}

int64_t SandboxedExecutor::DeadlineMillis(
    const proto::ExecutionRequest& request) const {
  int64_t timeout =
      request.timeout() > 0 ? request.timeout() : options_.default_timeout;
  timeout = std::min<int64_t>(timeout, options_.max_timeout);
  // A zero wall limit would disable the deadline.
  return std::max<int64_t>(timeout, 1) * 1000;
}

proto::ExecutionResult SandboxedExecutor::Execute(
    const proto::ExecutionRequest& request) {
  proto::ExecutionResult result;
  try {
    result = Run(request);
  } catch (const std::exception& e) {
    LOG(ERROR) << "Execution failed: " << e.what();
    result = ResultNormalizer::Failed(proto::INFRA_FAILURE, e.what());
  }
  LOG(INFO) << "Executed " << request.language() << " code for problem "
            << request.problem_id() << " against "
            << request.test_cases_size() << " test cases in "
            << result.execution_time() << "s: "
            << (result.success() ? "success" : result.error().value());
  return result;
}

proto::ExecutionResult SandboxedExecutor::Run(
    const proto::ExecutionRequest& request) {
  const language::Language* language = language::Find(request.language());
  if (language == nullptr) {
    return ResultNormalizer::Failed(proto::UNSUPPORTED_LANGUAGE,
                                    request.language());
  }
  harness::Harness harness;
  try {
    harness = harness::Synthesize(request);
  } catch (const harness::unsupported_language&) {
    return ResultNormalizer::Failed(proto::UNSUPPORTED_LANGUAGE,
                                    request.language());
  } catch (const harness::synthesis_error& e) {
    return ResultNormalizer::Failed(proto::SYNTHESIS_ERROR, e.what());
  }
  if (!sandbox_) {
    return ResultNormalizer::Failed(proto::INFRA_FAILURE,
                                    "no sandbox available");
  }

  int64_t deadline_millis = DeadlineMillis(request);
  sandbox::RunResult run;
  std::string error_msg;
  bool started;
  double execution_time;
  {
    ExecutionSlots::Guard guard(&slots_);
    auto start = std::chrono::steady_clock::now();
    started = sandbox_->Execute(*language, harness, deadline_millis, &run,
                                &error_msg);
    execution_time = std::chrono::duration<double>(
                         std::chrono::steady_clock::now() - start)
                         .count();
  }
  proto::ExecutionResult result =
      started ? normalizer_.Normalize(request, run)
              : ResultNormalizer::Failed(proto::INFRA_FAILURE, error_msg);
  result.set_execution_time(execution_time);
  return result;
}

proto::BatchResult SandboxedExecutor::ExecuteBatch(
    const proto::BatchRequest& batch) {
  proto::BatchResult result;
  const int num_requests = batch.requests_size();
  for (int i = 0; i < num_requests; i++) result.add_results();

  // Each worker writes only to the results of the requests it takes.
  std::atomic<int> next_request{0};
  size_t num_workers =
      std::min<size_t>(num_requests, slots_.MaxSlots());
  std::vector<std::thread> workers;
  for (size_t i = 0; i < num_workers; i++) {
    workers.emplace_back([this, &batch, &result, &next_request,
                          num_requests]() {
      for (int request = next_request++; request < num_requests;
           request = next_request++) {
        *result.mutable_results(request) = Execute(batch.requests(request));
      }
    });
  }
  for (std::thread& worker : workers) worker.join();

  for (const proto::ExecutionResult& execution : result.results()) {
    if (execution.success()) {
      result.set_processed(result.processed() + 1);
    } else {
      result.set_failed(result.failed() + 1);
    }
  }
  LOG(INFO) << "Batch of " << num_requests << " requests: "
            << result.processed() << " processed, " << result.failed()
            << " failed";
  return result;
}

proto::LanguageList SandboxedExecutor::SupportedLanguages() const {
  proto::LanguageList languages;
  for (const language::Language& language : language::All()) {
    language.ToProto(languages.add_languages());
  }
  return languages;
}

proto::HealthStatus SandboxedExecutor::Health() const {
  auto is_available = [this](const std::string& name) {
    return std::find(available_.begin(), available_.end(), name) !=
           available_.end();
  };
  proto::HealthStatus health;
  health.set_container_available(is_available("container"));
  health.set_local_available(is_available("local"));
  for (const language::Language& language : language::All()) {
    health.add_supported_languages(language.value);
  }
  if (!sandbox_) {
    health.set_status("unhealthy");
    health.set_backend("none");
    return health;
  }
  health.set_backend(sandbox_->Name());
  bool can_run = false;
  for (const language::Language& language : language::All()) {
    if (sandbox_->CanRun(language)) can_run = true;
  }
  if (!can_run) {
    health.set_status("unhealthy");
  } else if (health.backend() == "local" && !health.container_available()) {
    health.set_status("degraded");
  } else {
    health.set_status("healthy");
  }
  return health;
}

SandboxedExecutor::ExecutionSlots::Guard::Guard(ExecutionSlots* slots)
    : slots_(slots) {
  std::unique_lock<std::mutex> lck(slots_->mutex_);
  slots_->released_.wait(
      lck, [this]() { return slots_->used_slots_ < slots_->max_slots_; });
  slots_->used_slots_++;
}

SandboxedExecutor::ExecutionSlots::Guard::~Guard() {
  {
    std::lock_guard<std::mutex> lck(slots_->mutex_);
    slots_->used_slots_--;
  }
  slots_->released_.notify_one();
}

}  // namespace executor
