#ifndef HARNESS_TEMPLATES_HPP
#define HARNESS_TEMPLATES_HPP

#include "harness/harness.hpp"

namespace harness {

class JavaScriptTemplate : public Template {
 protected:
  std::string EncodeTestCases(const TestCases& test_cases) const override;
  const std::map<int32_t, std::string>& Dispatch() const override;
  std::string Assemble(const std::string& code, const std::string& test_cases,
                       const std::string& dispatch) const override;
};

class PythonTemplate : public Template {
 protected:
  std::string EncodeTestCases(const TestCases& test_cases) const override;
  const std::map<int32_t, std::string>& Dispatch() const override;
  std::string Assemble(const std::string& code, const std::string& test_cases,
                       const std::string& dispatch) const override;
};

class JavaTemplate : public Template {
 protected:
  std::string EncodeTestCases(const TestCases& test_cases) const override;
  const std::map<int32_t, std::string>& Dispatch() const override;
  std::string Assemble(const std::string& code, const std::string& test_cases,
                       const std::string& dispatch) const override;
};

class CppTemplate : public Template {
 protected:
  std::string EncodeTestCases(const TestCases& test_cases) const override;
  const std::map<int32_t, std::string>& Dispatch() const override;
  std::string Assemble(const std::string& code, const std::string& test_cases,
                       const std::string& dispatch) const override;
};

class CTemplate : public Template {
 protected:
  std::string EncodeTestCases(const TestCases& test_cases) const override;
  const std::map<int32_t, std::string>& Dispatch() const override;
  std::string Assemble(const std::string& code, const std::string& test_cases,
                       const std::string& dispatch) const override;
};

// JSON text of the test cases, {"test_cases":[{"input":..,"expected":..}]}.
std::string TestCasesToJson(const TestCases& test_cases);

}  // namespace harness

#endif
