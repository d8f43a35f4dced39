#include <iostream>
#include <iterator>
#include <memory>
#include <string>

#include "executor/executor_builder.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "google/protobuf/util/json_util.h"
#include "util/file.hpp"
#include "util/flags.hpp"

DEFINE_string(request, "-",
              "JSON file with the request to execute, - for stdin");
DEFINE_bool(batch, false,
            "The request is a batch: {\"requests\": [...]}");
DEFINE_bool(languages, false, "Print the supported languages and exit");
DEFINE_bool(health, false, "Print the health of the executor and exit");

namespace {

std::string ReadRequest(const std::string& path) {
  if (path == "-") {
    return std::string(std::istreambuf_iterator<char>(std::cin),
                       std::istreambuf_iterator<char>());
  }
  return util::File::Read(path);
}

// Prints message as JSON on stdout. Returns false on error.
bool Print(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.always_print_primitive_fields = true;
  std::string json;
  auto status =
      google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    LOG(ERROR) << "Cannot serialize the response: " << status.ToString();
    return false;
  }
  std::cout << json << std::endl;
  return true;
}

bool Parse(const std::string& json, google::protobuf::Message* message) {
  auto status = google::protobuf::util::JsonStringToMessage(json, message);
  if (!status.ok()) {
    LOG(ERROR) << "Invalid request: " << status.ToString();
    return false;
  }
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  gflags::SetUsageMessage(
      "Runs code against test cases in a sandbox and prints the result");
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  FLAGS_logtostderr = true;

  try {
    std::unique_ptr<executor::Executor> executor =
        executor::ExecutorBuilder::Get(
            executor::ExecutorBuilder::OptionsFromFlags(),
            executor::ExecutorBuilder::SandboxConfigFromFlags());
    if (FLAGS_languages) return Print(executor->SupportedLanguages()) ? 0 : 1;
    if (FLAGS_health) return Print(executor->Health()) ? 0 : 1;

    std::string json = ReadRequest(FLAGS_request);
    if (FLAGS_batch) {
      proto::BatchRequest batch;
      if (!Parse(json, &batch)) return 1;
      return Print(executor->ExecuteBatch(batch)) ? 0 : 1;
    }
    proto::ExecutionRequest request;
    if (!Parse(json, &request)) return 1;
    return Print(executor->Execute(request)) ? 0 : 1;
  } catch (std::exception& e) {
    LOG(ERROR) << e.what();
    return 1;
  }
}
