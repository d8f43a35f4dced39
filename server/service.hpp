#ifndef SERVER_SERVICE_HPP
#define SERVER_SERVICE_HPP

#include "executor/executor.hpp"
#include "grpc++/server_context.h"
#include "proto/code_runner.grpc.pb.h"

namespace server {

// Exposes an executor over gRPC. Failed executions are successful RPCs whose
// result carries the error; RPC errors are reserved for bad requests and
// internal faults.
class CodeRunnerService : public proto::CodeRunner::Service {
 public:
  explicit CodeRunnerService(executor::Executor* executor)
      : executor_(executor) {}

  grpc::Status Execute(grpc::ServerContext* context,
                       const proto::ExecutionRequest* request,
                       proto::ExecutionResult* response) override;
  grpc::Status ExecuteBatch(grpc::ServerContext* context,
                            const proto::BatchRequest* request,
                            proto::BatchResult* response) override;
  grpc::Status ListLanguages(grpc::ServerContext* context,
                             const google::protobuf::Empty* request,
                             proto::LanguageList* response) override;
  grpc::Status Health(grpc::ServerContext* context,
                      const google::protobuf::Empty* request,
                      proto::HealthStatus* response) override;

 private:
  executor::Executor* executor_;
};

}  // namespace server

#endif
