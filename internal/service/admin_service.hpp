#pragma once

#include "glucolumin/v1/admin_service.pb.h"
#include "service_context.hpp"

namespace glucolumin::service {

class AdminService {
public:
  explicit AdminService(ServiceContext ctx);

  glucolumin::v1::GetHealthResponse
  GetHealth(const glucolumin::v1::GetHealthRequest& req);

  glucolumin::v1::ReloadModelResponse
  ReloadModel(const glucolumin::v1::ReloadModelRequest& req);

  glucolumin::v1::ListInvalidScansResponse
  ListInvalidScans(const glucolumin::v1::ListInvalidScansRequest& req);

private:
  ServiceContext ctx_;
};

}
