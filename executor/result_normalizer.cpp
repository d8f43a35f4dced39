#include "executor/result_normalizer.hpp"

#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "google/protobuf/util/json_util.h"

namespace executor {

namespace {

std::string ErrorMessage(proto::Failure failure, const std::string& detail) {
  switch (failure) {
    case proto::UNSUPPORTED_LANGUAGE:
      return absl::StrCat("language ", detail, " not supported");
    case proto::SYNTHESIS_ERROR:
      return absl::StrCat("synthesis error: ", detail);
    case proto::TIMEOUT:
      return "execution timed out";
    case proto::NONZERO_EXIT:
      return absl::StrCat("execution failed ", detail);
    case proto::MALFORMED_OUTPUT:
      return absl::StrCat("malformed output: ", detail);
    case proto::INFRA_FAILURE:
      return absl::StrCat("infrastructure failure: ", detail);
    default:
      return detail;
  }
}

}  // namespace

proto::ExecutionResult ResultNormalizer::Failed(proto::Failure failure,
                                                const std::string& detail) {
  proto::ExecutionResult result;
  result.set_success(false);
  result.set_failure(failure);
  result.mutable_error()->set_value(ErrorMessage(failure, detail));
  return result;
}

std::string ResultNormalizer::Excerpt(const std::string& stderr_data) const {
  std::string excerpt(absl::StripAsciiWhitespace(stderr_data));
  if (excerpt.size() > max_stderr_size_) {
    excerpt.resize(max_stderr_size_);
    excerpt += "... (truncated)";
  }
  return excerpt;
}

std::string ResultNormalizer::ExitDetail(const std::string& status,
                                         const std::string& stderr_data) const {
  std::string excerpt = Excerpt(stderr_data);
  if (excerpt.empty()) return absl::StrCat("(", status, ")");
  return absl::StrCat("(", status, "): ", excerpt);
}

proto::ExecutionResult ResultNormalizer::Normalize(
    const proto::ExecutionRequest& request,
    const sandbox::RunResult& run) const {
  if (run.timed_out) return Failed(proto::TIMEOUT, "");
  if (run.signal != 0) {
    return Failed(proto::NONZERO_EXIT,
                  ExitDetail(absl::StrCat("signal ", run.signal),
                             run.stderr_data));
  }
  if (run.status_code != 0) {
    return Failed(proto::NONZERO_EXIT,
                  ExitDetail(absl::StrCat("exit code ", run.status_code),
                             run.stderr_data));
  }
  if (run.stdout_truncated) {
    return Failed(proto::MALFORMED_OUTPUT,
                  absl::StrCat("output exceeds ", run.stdout_data.size() / 1024,
                               " KB"));
  }

  std::string summary_json(absl::StripAsciiWhitespace(run.stdout_data));
  if (summary_json.empty()) {
    return Failed(proto::MALFORMED_OUTPUT, "empty output");
  }
  proto::ExecutionResult summary;
  auto status =
      google::protobuf::util::JsonStringToMessage(summary_json, &summary);
  if (!status.ok()) {
    return Failed(proto::MALFORMED_OUTPUT, status.ToString());
  }
  if (!summary.success()) {
    return Failed(proto::MALFORMED_OUTPUT, "summary does not report success");
  }
  if (summary.test_results_size() != request.test_cases_size()) {
    return Failed(proto::MALFORMED_OUTPUT,
                  absl::StrCat("expected ", request.test_cases_size(),
                               " test results, got ",
                               summary.test_results_size()));
  }

  proto::ExecutionResult result;
  result.set_success(true);
  result.set_failure(proto::NONE);
  for (int i = 0; i < summary.test_results_size(); i++) {
    const proto::TestResult& reported = summary.test_results(i);
    if (reported.test_case() != i + 1) {
      return Failed(proto::MALFORMED_OUTPUT,
                    absl::StrCat("test result ", i + 1, " is numbered ",
                                 reported.test_case()));
    }
    const proto::TestCase& test_case = request.test_cases(i);
    proto::TestResult* test_result = result.add_test_results();
    test_result->set_test_case(i + 1);
    test_result->set_input(test_case.input());
    test_result->set_expected(test_case.expected());
    if (reported.has_output()) {
      *test_result->mutable_output() = reported.output();
    }
    if (reported.has_error()) {
      *test_result->mutable_error() = reported.error();
    }
    test_result->set_passed(reported.has_output() &&
                            reported.output().value() == test_case.expected());
  }
  return result;
}

}  // namespace executor
