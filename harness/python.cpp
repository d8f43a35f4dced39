#include "absl/strings/str_cat.h"
#include "harness/escape.hpp"
#include "harness/templates.hpp"

namespace harness {

std::string PythonTemplate::EncodeTestCases(const TestCases& test_cases) const {
  return absl::StrCat("__harness_json.loads(",
                      PythonBytesLiteral(TestCasesToJson(test_cases)),
                      ".decode(\"utf-8\"))[\"test_cases\"]");
}

const std::map<int32_t, std::string>& PythonTemplate::Dispatch() const {
  static const std::map<int32_t, std::string>* dispatch =
      new std::map<int32_t, std::string>{
          {kTwoSum, R"py(
    nums, target = __harness_json.loads("[" + test_input + "]")
    return two_sum(nums, target)
)py"},
          {kReverseString, R"py(
    chars = __harness_json.loads(test_input)
    if not isinstance(chars, list):
        raise TypeError("input is not a list")
    reverse_string(chars)
    return chars
)py"},
      };
  return *dispatch;
}

std::string PythonTemplate::Assemble(const std::string& code,
                                     const std::string& test_cases,
                                     const std::string& dispatch) const {
  return absl::StrCat("import json\nimport sys\n\n", code, "\n\n",
                      "import json as __harness_json\n"
                      "import sys as __harness_sys\n\n"
                      "__harness_test_cases = ",
                      test_cases, "\n\n",
                      "\ndef __harness_run(test_input):", dispatch, "\n",
                      R"py(
def __harness_main():
    results = []
    for index, test_case in enumerate(__harness_test_cases, 1):
        entry = {
            "testCase": index,
            "input": test_case["input"],
            "expected": test_case["expected"],
            "output": None,
            "passed": False,
            "error": None,
        }
        try:
            output = __harness_json.dumps(
                __harness_run(test_case["input"]),
                separators=(",", ":"),
                ensure_ascii=False,
            )
            try:
                output.encode("utf-8")
            except UnicodeEncodeError:
                raise ValueError("output is not valid UTF-8")
            entry["output"] = output
            entry["passed"] = output == test_case["expected"]
        except Exception as error:
            message = str(error) or type(error).__name__
            entry["output"] = None
            entry["passed"] = False
            entry["error"] = message.encode("utf-8", "backslashreplace").decode(
                "utf-8"
            )
        results.append(entry)
    __harness_sys.stdout.write(
        __harness_json.dumps({"success": True, "test_results": results}) + "\n"
    )
    __harness_sys.stdout.flush()


__harness_main()
)py");
}

}  // namespace harness
