#ifndef EXECUTOR_RESULT_NORMALIZER_HPP
#define EXECUTOR_RESULT_NORMALIZER_HPP

#include <string>

#include "proto/execution.pb.h"
#include "sandbox/sandbox.hpp"

namespace executor {

// Maps the raw outcome of a sandboxed run into an ExecutionResult.
class ResultNormalizer {
 public:
  // stderr embedded in errors is truncated to max_stderr_size bytes.
  explicit ResultNormalizer(size_t max_stderr_size)
      : max_stderr_size_(max_stderr_size) {}

  // Failed result of the given category. detail is the unsupported language
  // for UNSUPPORTED_LANGUAGE, and is ignored for TIMEOUT.
  static proto::ExecutionResult Failed(proto::Failure failure,
                                       const std::string& detail);

  // Classifies a completed run of the harness built for request. A run that
  // exited normally must print exactly one summary, with one result per test
  // case numbered from 1; input and expected are taken from the request and
  // passed is recomputed.
  proto::ExecutionResult Normalize(const proto::ExecutionRequest& request,
                                   const sandbox::RunResult& run) const;

 private:
  std::string Excerpt(const std::string& stderr_data) const;
  // "(status): excerpt", or "(status)" when stderr is empty.
  std::string ExitDetail(const std::string& status,
                         const std::string& stderr_data) const;

  size_t max_stderr_size_;
};

}  // namespace executor

#endif
