#include "harness/harness.hpp"

#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "harness/templates.hpp"

namespace harness {

std::string Template::Render(const std::string& code,
                             const TestCases& test_cases,
                             int32_t problem_id) const {
  auto dispatch = Dispatch().find(problem_id);
  if (dispatch == Dispatch().end()) {
    throw synthesis_error("no dispatch logic for problem " +
                          std::to_string(problem_id));
  }
  return Assemble(code, EncodeTestCases(test_cases), dispatch->second);
}

const Template* Template::Get(const std::string& language) {
  static const std::map<std::string, std::unique_ptr<Template>>* templates =
      [] {
        auto* templates = new std::map<std::string, std::unique_ptr<Template>>;
        templates->emplace("javascript",
                           std::unique_ptr<Template>(new JavaScriptTemplate));
        templates->emplace("python",
                           std::unique_ptr<Template>(new PythonTemplate));
        templates->emplace("java", std::unique_ptr<Template>(new JavaTemplate));
        templates->emplace("cpp", std::unique_ptr<Template>(new CppTemplate));
        templates->emplace("c", std::unique_ptr<Template>(new CTemplate));
        return templates;
      }();
  auto it = templates->find(language);
  if (it == templates->end()) return nullptr;
  return it->second.get();
}

std::string TestCasesToJson(const TestCases& test_cases) {
  proto::ExecutionRequest suite;
  *suite.mutable_test_cases() = test_cases;
  google::protobuf::util::JsonPrintOptions options;
  // Empty inputs must still be present in the harness.
  options.always_print_primitive_fields = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(suite, &json, options);
  if (!status.ok()) {
    throw synthesis_error("cannot serialize test cases: " +
                          status.ToString());
  }
  return json;
}

Harness Synthesize(const proto::ExecutionRequest& request) {
  const language::Language* language = language::Find(request.language());
  const Template* tmpl = Template::Get(request.language());
  if (language == nullptr || tmpl == nullptr) {
    throw unsupported_language(request.language());
  }
  Harness harness;
  harness.file_name = language->source_file;
  harness.source =
      tmpl->Render(request.code(), request.test_cases(), request.problem_id());
  VLOG(2) << "Synthesized " << harness.file_name << " ("
          << harness.source.size() << " bytes) for problem "
          << request.problem_id();
  return harness;
}

}  // namespace harness
