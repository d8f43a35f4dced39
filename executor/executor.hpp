#ifndef EXECUTOR_EXECUTOR_HPP
#define EXECUTOR_EXECUTOR_HPP

#include <stdint.h>

#include <string>

#include "proto/execution.pb.h"

namespace executor {

struct ExecutorOptions {
  // Seconds, used when a request does not carry a positive timeout.
  int32_t default_timeout = 10;
  // Seconds, upper bound on the timeout of every request.
  int32_t max_timeout = 30;
  // Executions that may run at the same time. 0 means one per core.
  int32_t max_concurrent_executions = 0;
  // Longest excerpt of stderr embedded in an error.
  size_t max_error_stderr = 2048;
};

// Runs untrusted code against test cases. Every method is thread safe and
// never throws for a bad request: failures are reported in the result.
class Executor {
 public:
  virtual proto::ExecutionResult Execute(
      const proto::ExecutionRequest& request) = 0;

  // Runs each request independently, returning the results in request order.
  virtual proto::BatchResult ExecuteBatch(const proto::BatchRequest& batch) = 0;

  virtual proto::LanguageList SupportedLanguages() const = 0;
  virtual proto::HealthStatus Health() const = 0;

  Executor() = default;
  virtual ~Executor() = default;
  Executor(const Executor&) = delete;
  Executor& operator=(const Executor&) = delete;
  Executor(Executor&&) = delete;
  Executor& operator=(Executor&&) = delete;
};

}  // namespace executor

#endif
