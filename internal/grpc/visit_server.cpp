#include "visit_server.hpp"

#include "grpc_error.hpp"

namespace glucolumin::grpc {

using namespace glucolumin::v1;

VisitServer::VisitServer(std::shared_ptr<glucolumin::service::VisitService> svc) : service_(std::move(svc)) {
}

::grpc::Status VisitServer::RegisterPatient(::grpc::ServerContext*, const RegisterPatientRequest* req, RegisterPatientResponse* resp) {
  try {
    *resp = service_->RegisterPatient(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VisitServer::UploadRaw(::grpc::ServerContext*, const UploadRawRequest* req, UploadRawResponse* resp) {
  try {
    *resp = service_->UploadRaw(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VisitServer::EndScan(::grpc::ServerContext*, const EndScanRequest* req, EndScanResponse* resp) {
  try {
    *resp = service_->EndScan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VisitServer::GetResult(::grpc::ServerContext*, const GetResultRequest* req, GetResultResponse* resp) {
  try {
    *resp = service_->GetResult(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status VisitServer::ReportInvalidScan(::grpc::ServerContext*, const ReportInvalidScanRequest* req, ReportInvalidScanResponse* resp) {
  try {
    *resp = service_->ReportInvalidScan(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace glucolumin::grpc
