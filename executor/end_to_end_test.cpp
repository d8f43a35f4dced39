#include <dirent.h>

#include <map>
#include <thread>

#include "executor/sandboxed_executor.hpp"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "sandbox/local.hpp"
#include "util/file.hpp"
#include "util/which.hpp"

namespace {

using ::testing::HasSubstr;
using ::testing::StartsWith;

using namespace executor;

const constexpr char* kTestDir = "/tmp/code_runner_testdir";

// Correct solutions of both problems.
const std::map<std::string, std::string>& Solutions() {
  static const std::map<std::string, std::string>* solutions =
      new std::map<std::string, std::string>{
          {"javascript", R"(
function twoSum(nums, target) {
  const seen = new Map();
  for (let i = 0; i < nums.length; i++) {
    if (seen.has(target - nums[i])) return [seen.get(target - nums[i]), i];
    seen.set(nums[i], i);
  }
  return [];
}
function reverseString(s) { s.reverse(); }
const results = "user state";
)"},
          {"python", R"(
def two_sum(nums, target):
    seen = {}
    for i, n in enumerate(nums):
        if target - n in seen:
            return [seen[target - n], i]
        seen[n] = i
    return []

def reverse_string(s):
    s.reverse()

results = "user state"
)"},
          {"java", R"(
class Solution {
  public int[] twoSum(int[] nums, int target) {
    Map<Integer, Integer> seen = new HashMap<>();
    for (int i = 0; i < nums.length; i++) {
      Integer j = seen.get(target - nums[i]);
      if (j != null) return new int[] {j, i};
      seen.put(nums[i], i);
    }
    return new int[0];
  }
  public void reverseString(char[] s) {
    for (int i = 0, j = s.length - 1; i < j; i++, j--) {
      char c = s[i]; s[i] = s[j]; s[j] = c;
    }
  }
}
)"},
          {"cpp", R"(
class Solution {
 public:
  vector<int> twoSum(vector<int>& nums, int target) {
    unordered_map<int, int> seen;
    for (int i = 0; i < (int)nums.size(); i++) {
      auto it = seen.find(target - nums[i]);
      if (it != seen.end()) return {it->second, i};
      seen[nums[i]] = i;
    }
    return {};
  }
  void reverseString(vector<char>& s) { reverse(s.begin(), s.end()); }
};
int results = 0;
)"},
          {"c", R"(
int* twoSum(int* nums, int numsSize, int target, int* returnSize) {
  for (int i = 0; i < numsSize; i++) {
    for (int j = i + 1; j < numsSize; j++) {
      if (nums[i] + nums[j] == target) {
        int* result = malloc(2 * sizeof(int));
        result[0] = i;
        result[1] = j;
        *returnSize = 2;
        return result;
      }
    }
  }
  *returnSize = 0;
  return malloc(1);
}
void reverseString(char* s, int sSize) {
  for (int i = 0, j = sSize - 1; i < j; i++, j--) {
    char c = s[i]; s[i] = s[j]; s[j] = c;
  }
}
int results = 0;
)"},
      };
  return *solutions;
}

// reverseString solutions that put a character with no UTF-8 encoding in
// the result of two-element inputs.
const std::map<std::string, std::string>& InvalidUtf8Solutions() {
  static const std::map<std::string, std::string>* solutions =
      new std::map<std::string, std::string>{
          {"javascript", R"(
function reverseString(s) {
  s.reverse();
  if (s.length === 2) s[0] = "\ud800";
}
)"},
          {"python", R"(
def reverse_string(s):
    s.reverse()
    if len(s) == 2:
        s[0] = chr(0xD800)
)"},
          {"java", R"(
class Solution {
  public void reverseString(char[] s) {
    for (int i = 0, j = s.length - 1; i < j; i++, j--) {
      char c = s[i]; s[i] = s[j]; s[j] = c;
    }
    if (s.length == 2) s[0] = (char) 0xD800;
  }
}
)"},
          {"cpp", R"(
class Solution {
 public:
  void reverseString(vector<char>& s) {
    reverse(s.begin(), s.end());
    if (s.size() == 2) s[0] = (char)0xC8;
  }
};
)"},
          {"c", R"(
void reverseString(char* s, int sSize) {
  for (int i = 0, j = sSize - 1; i < j; i++, j--) {
    char c = s[i]; s[i] = s[j]; s[j] = c;
  }
  if (sSize == 2) s[0] = (char)0xC8;
}
)"},
      };
  return *solutions;
}

// reverseString solutions that fail two-element inputs with an error message
// that is not valid UTF-8. C has no exceptions.
const std::map<std::string, std::string>& InvalidUtf8ErrorSolutions() {
  static const std::map<std::string, std::string>* solutions =
      new std::map<std::string, std::string>{
          {"javascript", R"(
function reverseString(s) {
  if (s.length === 2) throw new Error("bad \udc00 value");
  s.reverse();
}
)"},
          {"python", R"(
def reverse_string(s):
    if len(s) == 2:
        raise ValueError("bad " + chr(0xDC00) + " value")
    s.reverse()
)"},
          {"java", R"(
class Solution {
  public void reverseString(char[] s) {
    if (s.length == 2) {
      throw new IllegalStateException("bad " + (char) 0xDC00 + " value");
    }
    for (int i = 0, j = s.length - 1; i < j; i++, j--) {
      char c = s[i]; s[i] = s[j]; s[j] = c;
    }
  }
}
)"},
          {"cpp", R"(
class Solution {
 public:
  void reverseString(vector<char>& s) {
    if (s.size() == 2) throw runtime_error("bad \xc8 value");
    reverse(s.begin(), s.end());
  }
};
)"},
      };
  return *solutions;
}

class EndToEndTest : public ::testing::TestWithParam<std::string> {
 protected:
  void SetUp() override {
    for (const std::string& command :
         language::Find(GetParam())->toolchain) {
      if (util::which(command).empty()) {
        GTEST_SKIP() << command << " not installed";
      }
    }
    sandbox::SandboxConfig config;
    config.temp_directory = tmp_.Path();
    ExecutorOptions options;
    options.default_timeout = 30;
    options.max_timeout = 30;
    executor_.reset(new SandboxedExecutor(
        options,
        std::unique_ptr<sandbox::Sandbox>(new sandbox::LocalSandbox(config)),
        {"local"}));
  }

  proto::ExecutionRequest Request(int32_t problem_id) const {
    proto::ExecutionRequest request;
    request.set_language(GetParam());
    request.set_code(Solutions().at(GetParam()));
    request.set_problem_id(problem_id);
    return request;
  }

  static void AddTestCase(proto::ExecutionRequest* request,
                          const std::string& input,
                          const std::string& expected) {
    proto::TestCase* test_case = request->add_test_cases();
    test_case->set_input(input);
    test_case->set_expected(expected);
  }

  util::TempDir tmp_{kTestDir};
  std::unique_ptr<SandboxedExecutor> executor_;
};

TEST_P(EndToEndTest, TestTwoSum) {
  proto::ExecutionRequest request = Request(1);
  AddTestCase(&request, "[2,7,11,15], 9", "[0,1]");
  AddTestCase(&request, "[3,2,4], 6", "[1,2]");
  AddTestCase(&request, "[3,3], 6", "[1,0]");
  proto::ExecutionResult result = executor_->Execute(request);
  ASSERT_TRUE(result.success()) << result.error().value();
  ASSERT_EQ(result.test_results_size(), 3);
  EXPECT_TRUE(result.test_results(0).passed());
  EXPECT_TRUE(result.test_results(1).passed());
  EXPECT_EQ(result.test_results(1).output().value(), "[1,2]");
  EXPECT_FALSE(result.test_results(2).passed());
  EXPECT_EQ(result.test_results(2).output().value(), "[0,1]");
  EXPECT_FALSE(result.test_results(2).has_error());
  EXPECT_GT(result.execution_time(), 0);
}

TEST_P(EndToEndTest, TestReverseString) {
  proto::ExecutionRequest request = Request(2);
  AddTestCase(&request, "[\"h\",\"e\",\"l\",\"l\",\"o\"]",
              "[\"o\",\"l\",\"l\",\"e\",\"h\"]");
  AddTestCase(&request, "[\"\\\"\",\"\\\\\"]", "[\"\\\\\",\"\\\"\"]");
  AddTestCase(&request, "[]", "[]");
  proto::ExecutionResult result = executor_->Execute(request);
  ASSERT_TRUE(result.success()) << result.error().value();
  ASSERT_EQ(result.test_results_size(), 3);
  for (const proto::TestResult& test_result : result.test_results()) {
    EXPECT_TRUE(test_result.passed())
        << test_result.test_case() << ": " << test_result.output().value()
        << " " << test_result.error().value();
  }
}

TEST_P(EndToEndTest, TestBadInputIsContained) {
  proto::ExecutionRequest request = Request(1);
  AddTestCase(&request, "not an input", "[0,1]");
  AddTestCase(&request, "[2,7,11,15], 9", "[0,1]");
  proto::ExecutionResult result = executor_->Execute(request);
  ASSERT_TRUE(result.success()) << result.error().value();
  ASSERT_EQ(result.test_results_size(), 2);
  EXPECT_FALSE(result.test_results(0).passed());
  EXPECT_FALSE(result.test_results(0).has_output());
  EXPECT_TRUE(result.test_results(0).has_error());
  EXPECT_TRUE(result.test_results(1).passed());
}

TEST_P(EndToEndTest, TestHostileTestData) {
  proto::ExecutionRequest request = Request(1);
  const std::string hostile =
      "\"\"\"'''`${x}`\\\n\r\t??/ */ // </script> \\u0022 \xc3\xa9";
  AddTestCase(&request, "[2,7,11,15], 9", hostile);
  AddTestCase(&request, hostile, "[0,1]");
  proto::ExecutionResult result = executor_->Execute(request);
  ASSERT_TRUE(result.success()) << result.error().value();
  ASSERT_EQ(result.test_results_size(), 2);
  EXPECT_EQ(result.test_results(0).expected(), hostile);
  EXPECT_FALSE(result.test_results(0).passed());
  EXPECT_EQ(result.test_results(0).output().value(), "[0,1]");
  EXPECT_EQ(result.test_results(1).input(), hostile);
  EXPECT_TRUE(result.test_results(1).has_error());
}

TEST_P(EndToEndTest, TestInvalidUtf8OutputIsContained) {
  proto::ExecutionRequest request = Request(2);
  request.set_code(InvalidUtf8Solutions().at(GetParam()));
  AddTestCase(&request, "[\"a\",\"b\"]", "[\"b\",\"a\"]");
  AddTestCase(&request, "[\"a\",\"b\",\"c\"]", "[\"c\",\"b\",\"a\"]");
  proto::ExecutionResult result = executor_->Execute(request);
  ASSERT_TRUE(result.success()) << result.error().value();
  ASSERT_EQ(result.test_results_size(), 2);
  EXPECT_FALSE(result.test_results(0).passed());
  if (GetParam() != "javascript") {
    // JSON.stringify already escapes lone surrogates.
    EXPECT_FALSE(result.test_results(0).has_output());
    EXPECT_EQ(result.test_results(0).error().value(),
              "output is not valid UTF-8");
  }
  EXPECT_TRUE(result.test_results(1).passed())
      << result.test_results(1).error().value();
}

TEST_P(EndToEndTest, TestInvalidUtf8ErrorIsContained) {
  if (GetParam() == "c") GTEST_SKIP() << "no exceptions in C";
  proto::ExecutionRequest request = Request(2);
  request.set_code(InvalidUtf8ErrorSolutions().at(GetParam()));
  AddTestCase(&request, "[\"a\",\"b\"]", "[\"b\",\"a\"]");
  AddTestCase(&request, "[\"a\",\"b\",\"c\"]", "[\"c\",\"b\",\"a\"]");
  proto::ExecutionResult result = executor_->Execute(request);
  ASSERT_TRUE(result.success()) << result.error().value();
  ASSERT_EQ(result.test_results_size(), 2);
  EXPECT_FALSE(result.test_results(0).passed());
  EXPECT_FALSE(result.test_results(0).has_output());
  EXPECT_THAT(result.test_results(0).error().value(), HasSubstr("bad "));
  EXPECT_THAT(result.test_results(0).error().value(), HasSubstr(" value"));
  EXPECT_TRUE(result.test_results(1).passed())
      << result.test_results(1).error().value();
}

TEST_P(EndToEndTest, TestInvalidUnicodeEscape) {
  proto::ExecutionRequest request = Request(2);
  AddTestCase(&request, "[\"\\uzzzz\"]", "[\"z\"]");
  AddTestCase(&request, "[\"\\u0041\"]", "[\"A\"]");
  proto::ExecutionResult result = executor_->Execute(request);
  ASSERT_TRUE(result.success()) << result.error().value();
  ASSERT_EQ(result.test_results_size(), 2);
  EXPECT_FALSE(result.test_results(0).passed());
  EXPECT_FALSE(result.test_results(0).has_output());
  EXPECT_TRUE(result.test_results(0).has_error());
  EXPECT_TRUE(result.test_results(1).passed())
      << result.test_results(1).error().value();
}

TEST_P(EndToEndTest, TestNonAsciiCharacter) {
  proto::ExecutionRequest request = Request(2);
  AddTestCase(&request, "[\"\xc3\xa9\",\"a\"]", "[\"a\",\"\xc3\xa9\"]");
  proto::ExecutionResult result = executor_->Execute(request);
  ASSERT_TRUE(result.success()) << result.error().value();
  ASSERT_EQ(result.test_results_size(), 1);
  if (GetParam() == "c" || GetParam() == "cpp") {
    // char holds a single byte.
    EXPECT_EQ(result.test_results(0).error().value(),
              "expected one-character ASCII strings");
  } else {
    EXPECT_TRUE(result.test_results(0).passed())
        << result.test_results(0).output().value() << " "
        << result.test_results(0).error().value();
  }
}

TEST_P(EndToEndTest, TestNoTestCases) {
  proto::ExecutionResult result = executor_->Execute(Request(1));
  ASSERT_TRUE(result.success()) << result.error().value();
  EXPECT_EQ(result.test_results_size(), 0);
}

INSTANTIATE_TEST_SUITE_P(Languages, EndToEndTest,
                         ::testing::Values("javascript", "python", "java",
                                           "cpp", "c"));

class PythonEndToEndTest : public ::testing::Test {
 protected:
  void SetUp() override {
    if (util::which("python3").empty()) {
      GTEST_SKIP() << "python3 not installed";
    }
    config_.temp_directory = tmp_.Path();
  }

  std::unique_ptr<SandboxedExecutor> MakeExecutor(ExecutorOptions options) {
    return std::unique_ptr<SandboxedExecutor>(new SandboxedExecutor(
        options,
        std::unique_ptr<sandbox::Sandbox>(new sandbox::LocalSandbox(config_)),
        {"local"}));
  }

  static proto::ExecutionRequest Request(const std::string& code) {
    proto::ExecutionRequest request;
    request.set_language("python");
    request.set_code(code);
    request.set_problem_id(1);
    proto::TestCase* test_case = request.add_test_cases();
    test_case->set_input("[2,7,11,15], 9");
    test_case->set_expected("[0,1]");
    return request;
  }

  int CountEntries() const {
    DIR* dir = opendir(tmp_.Path().c_str());
    if (dir == nullptr) return -1;
    int count = 0;
    while (struct dirent* entry = readdir(dir)) {
      std::string name = entry->d_name;
      if (name != "." && name != "..") count++;
    }
    closedir(dir);
    return count;
  }

  util::TempDir tmp_{kTestDir};
  sandbox::SandboxConfig config_;
};

TEST_F(PythonEndToEndTest, TestInfiniteLoopTimesOut) {
  auto executor = MakeExecutor(ExecutorOptions());
  proto::ExecutionRequest request =
      Request("def two_sum(nums, target):\n    while True:\n        pass\n");
  request.set_timeout(1);
  proto::ExecutionResult result = executor->Execute(request);
  EXPECT_FALSE(result.success());
  EXPECT_EQ(result.error().value(), "execution timed out");
  EXPECT_EQ(result.test_results_size(), 0);
  EXPECT_GE(result.execution_time(), 1.0);
  EXPECT_LE(result.execution_time(), 2.0);
  EXPECT_EQ(CountEntries(), 0);
}

TEST_F(PythonEndToEndTest, TestSyntaxError) {
  auto executor = MakeExecutor(ExecutorOptions());
  proto::ExecutionResult result =
      executor->Execute(Request("def two_sum(nums, target)\n"));
  EXPECT_FALSE(result.success());
  EXPECT_THAT(result.error().value(),
              StartsWith("execution failed (exit code 1): "));
  EXPECT_THAT(result.error().value(), HasSubstr("SyntaxError"));
}

TEST_F(PythonEndToEndTest, TestMissingFunction) {
  auto executor = MakeExecutor(ExecutorOptions());
  proto::ExecutionResult result = executor->Execute(Request("x = 1\n"));
  ASSERT_TRUE(result.success()) << result.error().value();
  ASSERT_EQ(result.test_results_size(), 1);
  EXPECT_FALSE(result.test_results(0).passed());
  EXPECT_THAT(result.test_results(0).error().value(), HasSubstr("two_sum"));
}

TEST_F(PythonEndToEndTest, TestPrintBreaksTheSummary) {
  auto executor = MakeExecutor(ExecutorOptions());
  proto::ExecutionResult result = executor->Execute(
      Request("print('debug')\ndef two_sum(nums, target):\n"
              "    return [0, 1]\n"));
  EXPECT_FALSE(result.success());
  EXPECT_THAT(result.error().value(), StartsWith("malformed output: "));
}

TEST_F(PythonEndToEndTest, TestExitInUserCode) {
  auto executor = MakeExecutor(ExecutorOptions());
  proto::ExecutionResult result = executor->Execute(
      Request("import sys\nsys.exit(3)\n"));
  EXPECT_FALSE(result.success());
  EXPECT_THAT(result.error().value(),
              StartsWith("execution failed (exit code 3)"));
}

TEST_F(PythonEndToEndTest, TestConcurrentInvocationsCleanUp) {
  ExecutorOptions options;
  options.max_concurrent_executions = 2;
  auto executor = MakeExecutor(options);
  const std::string code =
      "def two_sum(nums, target):\n    return [0, 1]\n";
  std::vector<std::thread> callers;
  for (int i = 0; i < 6; i++) {
    callers.emplace_back([&executor, &code]() {
      proto::ExecutionResult result = executor->Execute(Request(code));
      EXPECT_TRUE(result.success()) << result.error().value();
    });
  }
  for (std::thread& caller : callers) caller.join();
  EXPECT_EQ(CountEntries(), 0);
}

TEST_F(PythonEndToEndTest, TestResultsAreIdempotent) {
  auto executor = MakeExecutor(ExecutorOptions());
  proto::ExecutionRequest request =
      Request("def two_sum(nums, target):\n    return [1, 0]\n");
  proto::ExecutionResult first = executor->Execute(request);
  proto::ExecutionResult second = executor->Execute(request);
  first.clear_execution_time();
  second.clear_execution_time();
  EXPECT_EQ(first.SerializeAsString(), second.SerializeAsString());
}

}  // namespace
