#include "harness/harness.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "harness/templates.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

using namespace harness;

proto::ExecutionRequest Request(const std::string& language,
                                const std::string& code) {
  proto::ExecutionRequest request;
  request.set_language(language);
  request.set_code(code);
  request.set_problem_id(kTwoSum);
  proto::TestCase* test_case = request.add_test_cases();
  test_case->set_input("[2,7,11,15], 9");
  test_case->set_expected("[0,1]");
  return request;
}

TEST(HarnessTest, TestFileNames) {
  EXPECT_EQ(Synthesize(Request("javascript", "")).file_name, "main.js");
  EXPECT_EQ(Synthesize(Request("python", "")).file_name, "main.py");
  EXPECT_EQ(Synthesize(Request("java", "")).file_name,
            "CodeRunnerHarness.java");
  EXPECT_EQ(Synthesize(Request("cpp", "")).file_name, "main.cpp");
  EXPECT_EQ(Synthesize(Request("c", "")).file_name, "main.c");
}

TEST(HarnessTest, TestCodeIsEmbeddedVerbatim) {
  const std::string code = "def two_sum(nums, target):\n    return [0, 1]\n";
  EXPECT_THAT(Synthesize(Request("python", code)).source, HasSubstr(code));
}

TEST(HarnessTest, TestUnsupportedLanguage) {
  try {
    Synthesize(Request("cobol", ""));
    FAIL() << "cobol is supported";
  } catch (const unsupported_language& e) {
    EXPECT_STREQ(e.what(), "language cobol not supported");
  }
}

TEST(HarnessTest, TestUnknownProblem) {
  proto::ExecutionRequest request = Request("python", "");
  request.set_problem_id(42);
  EXPECT_THROW(Synthesize(request), synthesis_error);
}

TEST(HarnessTest, TestEveryLanguageHasEveryProblem) {
  for (const char* language : {"javascript", "python", "java", "cpp", "c"}) {
    const Template* tmpl = Template::Get(language);
    ASSERT_NE(tmpl, nullptr) << language;
    EXPECT_TRUE(tmpl->HasProblem(kTwoSum)) << language;
    EXPECT_TRUE(tmpl->HasProblem(kReverseString)) << language;
    EXPECT_FALSE(tmpl->HasProblem(0)) << language;
  }
}

TEST(HarnessTest, TestHostileDataStaysInLiterals) {
  const std::string hostile = "\"\"\"); __import__('os').system('x') #\n";
  for (const char* language : {"python", "java", "cpp", "c"}) {
    proto::ExecutionRequest request = Request(language, "");
    request.mutable_test_cases(0)->set_expected(hostile);
    std::string source = Synthesize(request).source;
    EXPECT_THAT(source, Not(HasSubstr(hostile))) << language;
  }
}

TEST(HarnessTest, TestJavaScriptTestCasesAreJson) {
  proto::ExecutionRequest request = Request("javascript", "");
  request.mutable_test_cases(0)->set_expected("`${process.exit(1)}`");
  std::string source = Synthesize(request).source;
  EXPECT_THAT(source,
              HasSubstr("\"expected\":\"`${process.exit(1)}`\""));
}

TEST(HarnessTest, TestTestCasesToJson) {
  TestCases test_cases;
  proto::TestCase* test_case = test_cases.Add();
  test_case->set_expected("\n");
  // Empty fields are kept, so that every test case has both keys.
  EXPECT_THAT(
      TestCasesToJson(test_cases),
      HasSubstr("\"test_cases\":[{\"input\":\"\",\"expected\":\"\\n\"}]"));
}

TEST(HarnessTest, TestSummaryShape) {
  std::string source = Synthesize(Request("python", "")).source;
  EXPECT_THAT(source, HasSubstr("\"success\": True"));
  EXPECT_THAT(source, HasSubstr("\"test_results\": results"));
  EXPECT_THAT(source, StartsWith("import json"));
}

}  // namespace
