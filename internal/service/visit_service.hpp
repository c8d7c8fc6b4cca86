#pragma once

#include "glucolumin/v1/visit_service.pb.h"
#include "service_context.hpp"

namespace glucolumin::service {

/*
  Patient registration, sample upload and result polling.

  Transport independent: requests and responses are the wire messages,
  errors are the util:: exception taxonomy.
*/
class VisitService {
public:
  explicit VisitService(ServiceContext ctx);

  glucolumin::v1::RegisterPatientResponse
  RegisterPatient(const glucolumin::v1::RegisterPatientRequest& req);

  glucolumin::v1::UploadRawResponse
  UploadRaw(const glucolumin::v1::UploadRawRequest& req);

  glucolumin::v1::EndScanResponse
  EndScan(const glucolumin::v1::EndScanRequest& req);

  glucolumin::v1::GetResultResponse
  GetResult(const glucolumin::v1::GetResultRequest& req);

  glucolumin::v1::ReportInvalidScanResponse
  ReportInvalidScan(const glucolumin::v1::ReportInvalidScanRequest& req);

private:
  ServiceContext ctx_;
};

}
