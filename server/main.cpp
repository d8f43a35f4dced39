#include <memory>
#include <string>

#include "executor/executor_builder.hpp"
#include "gflags/gflags.h"
#include "glog/logging.h"
#include "grpc++/security/server_credentials.h"
#include "grpc++/server.h"
#include "grpc++/server_builder.h"
#include "server/service.hpp"
#include "util/flags.hpp"

DEFINE_string(address, "0.0.0.0", "address to listen on");  // NOLINT
DEFINE_int32(port, 7070, "port to listen on");              // NOLINT

int main(int argc, char** argv) {
  gflags::ParseCommandLineFlags(&argc, &argv, true);
  google::InitGoogleLogging(argv[0]);  // NOLINT
  google::InstallFailureSignalHandler();

  std::unique_ptr<executor::Executor> executor =
      executor::ExecutorBuilder::Get(
          executor::ExecutorBuilder::OptionsFromFlags(),
          executor::ExecutorBuilder::SandboxConfigFromFlags());
  LOG(INFO) << "Health: " << executor->Health().status();

  std::string server_address = FLAGS_address + ":" + std::to_string(FLAGS_port);
  server::CodeRunnerService service(executor.get());
  grpc::ServerBuilder builder;
  builder.AddListeningPort(server_address, grpc::InsecureServerCredentials());
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
  if (!server) {
    LOG(ERROR) << "Cannot listen on " << server_address;
    return 1;
  }
  LOG(INFO) << "Server listening on " << server_address;
  server->Wait();
}
