#ifndef EXECUTOR_SANDBOXED_EXECUTOR_HPP
#define EXECUTOR_SANDBOXED_EXECUTOR_HPP

#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "executor/executor.hpp"
#include "executor/result_normalizer.hpp"
#include "sandbox/sandbox.hpp"

namespace executor {

// Synthesizes the harness of a request, runs it in the sandbox under a
// deadline and normalizes the outcome.
class SandboxedExecutor : public Executor {
 public:
  // sandbox may be null, in which case every execution fails with an
  // infrastructure failure. available lists the names of the usable sandboxes,
  // as reported by sandbox::Sandbox::Create.
  SandboxedExecutor(ExecutorOptions options,
                    std::unique_ptr<sandbox::Sandbox> sandbox,
                    std::vector<std::string> available);
  ~SandboxedExecutor() override = default;

  proto::ExecutionResult Execute(
      const proto::ExecutionRequest& request) override;
  proto::BatchResult ExecuteBatch(const proto::BatchRequest& batch) override;
  proto::LanguageList SupportedLanguages() const override;
  proto::HealthStatus Health() const override;

  // Timeout in milliseconds applied to a request.
  int64_t DeadlineMillis(const proto::ExecutionRequest& request) const;

 private:
  // Bounds the number of running executions. Callers above the bound block
  // until a slot is released.
  class ExecutionSlots {
   public:
    explicit ExecutionSlots(size_t max_slots) : max_slots_(max_slots) {}

    class Guard {
     public:
      explicit Guard(ExecutionSlots* slots);
      ~Guard();
      Guard(const Guard&) = delete;
      Guard& operator=(const Guard&) = delete;
      Guard(Guard&&) = delete;
      Guard& operator=(Guard&&) = delete;

     private:
      ExecutionSlots* slots_;
    };

    size_t MaxSlots() const { return max_slots_; }

   private:
    size_t max_slots_;
    size_t used_slots_ = 0;
    std::mutex mutex_;
    std::condition_variable released_;
  };

  proto::ExecutionResult Run(const proto::ExecutionRequest& request);

  ExecutorOptions options_;
  std::unique_ptr<sandbox::Sandbox> sandbox_;
  std::vector<std::string> available_;
  ResultNormalizer normalizer_;
  ExecutionSlots slots_;
};

}  // namespace executor

#endif
