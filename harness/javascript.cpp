#include "absl/strings/str_cat.h"
#include "harness/templates.hpp"

namespace harness {

std::string JavaScriptTemplate::EncodeTestCases(
    const TestCases& test_cases) const {
  // JSON text is a valid JavaScript expression.
  return TestCasesToJson(test_cases);
}

const std::map<int32_t, std::string>& JavaScriptTemplate::Dispatch() const {
  static const std::map<int32_t, std::string>* dispatch =
      new std::map<int32_t, std::string>{
          {kTwoSum, R"js(
  const __harnessArgs = JSON.parse("[" + __harnessInput + "]");
  if (typeof twoSum !== "function") {
    throw new Error("twoSum is not defined");
  }
  return twoSum(__harnessArgs[0], __harnessArgs[1]);
)js"},
          {kReverseString, R"js(
  const __harnessChars = JSON.parse(__harnessInput);
  if (!Array.isArray(__harnessChars)) {
    throw new Error("input is not an array");
  }
  if (typeof reverseString !== "function") {
    throw new Error("reverseString is not defined");
  }
  reverseString(__harnessChars);
  return __harnessChars;
)js"},
      };
  return *dispatch;
}

std::string JavaScriptTemplate::Assemble(const std::string& code,
                                         const std::string& test_cases,
                                         const std::string& dispatch) const {
  return absl::StrCat(code, "\n\n",
                      "const __harnessTestCases = (", test_cases,
                      ").test_cases;\n",
                      "\nfunction __harnessRun(__harnessInput) {", dispatch,
                      "}\n",
                      R"js(
// Replaces unpaired surrogates, which have no UTF-8 encoding.
function __harnessWellFormed(text) {
  return text.replace(
      /[\ud800-\udbff](?![\udc00-\udfff])|(?<![\ud800-\udbff])[\udc00-\udfff]/g,
      "\ufffd");
}

(function __harnessMain() {
  const results = [];
  __harnessTestCases.forEach(function (testCase, index) {
    const entry = {
      testCase: index + 1,
      input: testCase.input,
      expected: testCase.expected,
      output: null,
      passed: false,
      error: null,
    };
    try {
      const output = JSON.stringify(__harnessRun(testCase.input));
      if (typeof output !== "string") {
        throw new Error("the result cannot be serialized to JSON");
      }
      if (__harnessWellFormed(output) !== output) {
        throw new Error("output is not valid UTF-8");
      }
      entry.output = output;
      entry.passed = output === testCase.expected;
    } catch (error) {
      entry.output = null;
      entry.passed = false;
      entry.error = __harnessWellFormed(
          error instanceof Error ? error.message : String(error));
    }
    results.push(entry);
  });
  process.stdout.write(
      JSON.stringify({success: true, test_results: results}) + "\n");
})();
)js");
}

}  // namespace harness
