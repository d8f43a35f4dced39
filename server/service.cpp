#include "server/service.hpp"

#include "glog/logging.h"

namespace server {

grpc::Status CodeRunnerService::Execute(grpc::ServerContext* context,
                                        const proto::ExecutionRequest* request,
                                        proto::ExecutionResult* response) {
  VLOG(1) << "Execute " << request->language() << " code";
  try {
    *response = executor_->Execute(*request);
    return grpc::Status::OK;
  } catch (std::exception& e) {
    LOG(ERROR) << "Execute: " << e.what();
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
}

grpc::Status CodeRunnerService::ExecuteBatch(
    grpc::ServerContext* context, const proto::BatchRequest* request,
    proto::BatchResult* response) {
  VLOG(1) << "ExecuteBatch of " << request->requests_size() << " requests";
  if (request->requests_size() == 0) {
    return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "Empty batch");
  }
  try {
    *response = executor_->ExecuteBatch(*request);
    return grpc::Status::OK;
  } catch (std::exception& e) {
    LOG(ERROR) << "ExecuteBatch: " << e.what();
    return grpc::Status(grpc::StatusCode::INTERNAL, e.what());
  }
}

grpc::Status CodeRunnerService::ListLanguages(
    grpc::ServerContext* context, const google::protobuf::Empty* request,
    proto::LanguageList* response) {
  *response = executor_->SupportedLanguages();
  return grpc::Status::OK;
}

grpc::Status CodeRunnerService::Health(grpc::ServerContext* context,
                                       const google::protobuf::Empty* request,
                                       proto::HealthStatus* response) {
  *response = executor_->Health();
  return grpc::Status::OK;
}

}  // namespace server
