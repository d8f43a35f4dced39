#include "executor/result_normalizer.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

using namespace executor;

proto::ExecutionRequest TwoSumRequest() {
  proto::ExecutionRequest request;
  request.set_language("python");
  request.set_problem_id(1);
  proto::TestCase* first = request.add_test_cases();
  first->set_input("[2,7,11,15], 9");
  first->set_expected("[0,1]");
  proto::TestCase* second = request.add_test_cases();
  second->set_input("[3,3], 6");
  second->set_expected("[0,1]");
  return request;
}

sandbox::RunResult Exited(const std::string& stdout_data) {
  sandbox::RunResult run;
  run.stdout_data = stdout_data;
  return run;
}

TEST(ResultNormalizerTest, TestSuccess) {
  ResultNormalizer normalizer(100);
  proto::ExecutionResult result = normalizer.Normalize(
      TwoSumRequest(),
      Exited("{\"success\":true,\"test_results\":["
             "{\"testCase\":1,\"input\":\"x\",\"expected\":\"y\","
             "\"output\":\"[0,1]\",\"passed\":true,\"error\":null},"
             "{\"testCase\":2,\"input\":\"x\",\"expected\":\"y\","
             "\"output\":\"[1,0]\",\"passed\":true,\"error\":null}]}\n"));
  ASSERT_TRUE(result.success()) << result.error().value();
  EXPECT_FALSE(result.has_error());
  EXPECT_EQ(result.failure(), proto::NONE);
  ASSERT_EQ(result.test_results_size(), 2);
  const proto::TestResult& first = result.test_results(0);
  EXPECT_EQ(first.test_case(), 1);
  EXPECT_EQ(first.input(), "[2,7,11,15], 9");
  EXPECT_EQ(first.expected(), "[0,1]");
  EXPECT_EQ(first.output().value(), "[0,1]");
  EXPECT_TRUE(first.passed());
  // passed is recomputed from the request.
  const proto::TestResult& second = result.test_results(1);
  EXPECT_EQ(second.output().value(), "[1,0]");
  EXPECT_FALSE(second.passed());
}

TEST(ResultNormalizerTest, TestPerTestError) {
  ResultNormalizer normalizer(100);
  proto::ExecutionRequest request = TwoSumRequest();
  request.mutable_test_cases()->RemoveLast();
  proto::ExecutionResult result = normalizer.Normalize(
      request, Exited("{\"success\":true,\"test_results\":["
                      "{\"testCase\":1,\"output\":null,\"passed\":false,"
                      "\"error\":\"name 'two_sum' is not defined\"}]}"));
  ASSERT_TRUE(result.success());
  ASSERT_EQ(result.test_results_size(), 1);
  EXPECT_FALSE(result.test_results(0).has_output());
  EXPECT_FALSE(result.test_results(0).passed());
  EXPECT_EQ(result.test_results(0).error().value(),
            "name 'two_sum' is not defined");
}

TEST(ResultNormalizerTest, TestTimeout) {
  ResultNormalizer normalizer(100);
  sandbox::RunResult run;
  run.timed_out = true;
  run.signal = 9;
  proto::ExecutionResult result = normalizer.Normalize(TwoSumRequest(), run);
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.error().value(), "execution timed out");
  EXPECT_EQ(result.failure(), proto::TIMEOUT);
  EXPECT_EQ(result.test_results_size(), 0);
}

TEST(ResultNormalizerTest, TestNonZeroExit) {
  ResultNormalizer normalizer(100);
  sandbox::RunResult run;
  run.status_code = 1;
  run.stderr_data = "  SyntaxError: invalid syntax\n";
  proto::ExecutionResult result = normalizer.Normalize(TwoSumRequest(), run);
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.error().value(),
            "execution failed (exit code 1): SyntaxError: invalid syntax");
  EXPECT_EQ(result.failure(), proto::NONZERO_EXIT);
}

TEST(ResultNormalizerTest, TestSignal) {
  ResultNormalizer normalizer(100);
  sandbox::RunResult run;
  run.signal = 11;
  proto::ExecutionResult result = normalizer.Normalize(TwoSumRequest(), run);
  EXPECT_THAT(result.error().value(),
              StartsWith("execution failed (signal 11)"));
  EXPECT_EQ(result.failure(), proto::NONZERO_EXIT);
}

TEST(ResultNormalizerTest, TestNonZeroExitWithoutStderr) {
  ResultNormalizer normalizer(100);
  sandbox::RunResult run;
  run.status_code = 2;
  run.stderr_data = " \n";
  EXPECT_EQ(normalizer.Normalize(TwoSumRequest(), run).error().value(),
            "execution failed (exit code 2)");
  run.status_code = 0;
  run.signal = 9;
  EXPECT_EQ(normalizer.Normalize(TwoSumRequest(), run).error().value(),
            "execution failed (signal 9)");
}

TEST(ResultNormalizerTest, TestOutputTooLong) {
  ResultNormalizer normalizer(100);
  sandbox::RunResult run =
      Exited("{\"success\":true,\"test_results\":[" +
             std::string(64 * 1024 - 32, ' '));
  run.stdout_truncated = true;
  proto::ExecutionResult result = normalizer.Normalize(TwoSumRequest(), run);
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.failure(), proto::MALFORMED_OUTPUT);
  EXPECT_EQ(result.error().value(), "malformed output: output exceeds 64 KB");
}

TEST(ResultNormalizerTest, TestStderrIsTruncated) {
  ResultNormalizer normalizer(10);
  sandbox::RunResult run;
  run.status_code = 2;
  run.stderr_data = std::string(1000, 'e');
  proto::ExecutionResult result = normalizer.Normalize(TwoSumRequest(), run);
  EXPECT_THAT(result.error().value(), HasSubstr("): eeeeeeeeee..."));
  EXPECT_LT(result.error().value().size(), 100);
}

TEST(ResultNormalizerTest, TestMalformedOutput) {
  ResultNormalizer normalizer(100);
  for (const char* output :
       {"", "not json", "debug print\n{\"success\":true,\"test_results\":[]}",
        "{\"success\":false,\"test_results\":[]}",
        "{\"success\":true,\"test_results\":[{\"testCase\":1}]}",
        "{\"success\":true,\"test_results\":[{\"testCase\":1},"
        "{\"testCase\":3}]}",
        "{\"success\":true,\"unknown\":1}"}) {
    proto::ExecutionResult result =
        normalizer.Normalize(TwoSumRequest(), Exited(output));
    EXPECT_FALSE(result.success()) << output;
    EXPECT_EQ(result.failure(), proto::MALFORMED_OUTPUT) << output;
    EXPECT_THAT(result.error().value(), StartsWith("malformed output: "))
        << output;
    EXPECT_EQ(result.test_results_size(), 0) << output;
  }
}

TEST(ResultNormalizerTest, TestFailed) {
  EXPECT_EQ(ResultNormalizer::Failed(proto::UNSUPPORTED_LANGUAGE, "ruby")
                .error()
                .value(),
            "language ruby not supported");
  EXPECT_EQ(
      ResultNormalizer::Failed(proto::SYNTHESIS_ERROR, "no dispatch").error()
          .value(),
      "synthesis error: no dispatch");
  proto::ExecutionResult result =
      ResultNormalizer::Failed(proto::INFRA_FAILURE, "fork: no memory");
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.failure(), proto::INFRA_FAILURE);
  EXPECT_EQ(result.error().value(), "infrastructure failure: fork: no memory");
}

}  // namespace
