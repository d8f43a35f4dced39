#ifndef HARNESS_HARNESS_HPP
#define HARNESS_HARNESS_HPP

#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "language/language.hpp"
#include "proto/execution.pb.h"

namespace harness {

class unsupported_language : public std::runtime_error {
 public:
  explicit unsupported_language(const std::string& language)
      : std::runtime_error("language " + language + " not supported") {}
};

class synthesis_error : public std::runtime_error {
 public:
  explicit synthesis_error(const std::string& msg)
      : std::runtime_error(msg) {}
};

// Known problems. The value is the problem_id of the requests.
enum Problem : int32_t { kTwoSum = 1, kReverseString = 2 };

using TestCases = google::protobuf::RepeatedPtrField<proto::TestCase>;

// A self-contained program, ready to be written to file_name.
struct Harness {
  std::string file_name;
  std::string source;
};

// Builds the harness program of a language. A template embeds the user code
// verbatim, the test cases through the language's escaping contract and the
// dispatch code of the requested problem, which decodes the input of a test
// case, calls the user entry point and returns the result.
class Template {
 public:
  // Throws synthesis_error if the problem has no dispatch code.
  std::string Render(const std::string& code, const TestCases& test_cases,
                     int32_t problem_id) const;

  bool HasProblem(int32_t problem_id) const {
    return Dispatch().count(problem_id) != 0;
  }

  // Returns the template of a language, or nullptr.
  static const Template* Get(const std::string& language);

  virtual ~Template() = default;
  Template() = default;
  Template(const Template&) = delete;
  Template& operator=(const Template&) = delete;

 protected:
  // Serialized form of the test cases, as an expression or initializer of the
  // target language.
  virtual std::string EncodeTestCases(const TestCases& test_cases) const = 0;

  // Problem id -> dispatch code.
  virtual const std::map<int32_t, std::string>& Dispatch() const = 0;

  virtual std::string Assemble(const std::string& code,
                               const std::string& test_cases,
                               const std::string& dispatch) const = 0;
};

// Builds the harness for a request. Throws unsupported_language if the
// language is not in the registry and synthesis_error if the harness cannot be
// built.
Harness Synthesize(const proto::ExecutionRequest& request);

}  // namespace harness

#endif
