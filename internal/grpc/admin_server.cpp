#include "admin_server.hpp"

#include "grpc_error.hpp"

namespace glucolumin::grpc {

using namespace glucolumin::v1;

AdminServer::AdminServer(std::shared_ptr<glucolumin::service::AdminService> svc) : service_(std::move(svc)) {
}

::grpc::Status AdminServer::GetHealth(::grpc::ServerContext*, const GetHealthRequest* req, GetHealthResponse* resp) {
  try {
    *resp = service_->GetHealth(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ReloadModel(::grpc::ServerContext*, const ReloadModelRequest* req, ReloadModelResponse* resp) {
  try {
    *resp = service_->ReloadModel(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status AdminServer::ListInvalidScans(::grpc::ServerContext*, const ListInvalidScansRequest* req, ListInvalidScansResponse* resp) {
  try {
    *resp = service_->ListInvalidScans(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace glucolumin::grpc
