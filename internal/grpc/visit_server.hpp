#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "glucolumin/v1/visit_service.grpc.pb.h"
#include "internal/service/visit_service.hpp"

namespace glucolumin::grpc {

class VisitServer final : public glucolumin::v1::VisitService::Service {
public:
  explicit VisitServer(std::shared_ptr<glucolumin::service::VisitService> svc);

  ::grpc::Status RegisterPatient(::grpc::ServerContext*,
                                 const glucolumin::v1::RegisterPatientRequest*,
                                 glucolumin::v1::RegisterPatientResponse*) override;

  ::grpc::Status UploadRaw(::grpc::ServerContext*,
                           const glucolumin::v1::UploadRawRequest*,
                           glucolumin::v1::UploadRawResponse*) override;

  ::grpc::Status EndScan(::grpc::ServerContext*,
                         const glucolumin::v1::EndScanRequest*,
                         glucolumin::v1::EndScanResponse*) override;

  ::grpc::Status GetResult(::grpc::ServerContext*,
                           const glucolumin::v1::GetResultRequest*,
                           glucolumin::v1::GetResultResponse*) override;

  ::grpc::Status ReportInvalidScan(::grpc::ServerContext*,
                                   const glucolumin::v1::ReportInvalidScanRequest*,
                                   glucolumin::v1::ReportInvalidScanResponse*) override;

private:
  std::shared_ptr<glucolumin::service::VisitService> service_;
};

}
