#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "glucolumin/v1/admin_service.grpc.pb.h"
#include "internal/service/admin_service.hpp"

namespace glucolumin::grpc {

class AdminServer final : public glucolumin::v1::AdminService::Service {
public:
  explicit AdminServer(std::shared_ptr<glucolumin::service::AdminService> svc);

  ::grpc::Status GetHealth(::grpc::ServerContext*,
                           const glucolumin::v1::GetHealthRequest*,
                           glucolumin::v1::GetHealthResponse*) override;

  ::grpc::Status ReloadModel(::grpc::ServerContext*,
                             const glucolumin::v1::ReloadModelRequest*,
                             glucolumin::v1::ReloadModelResponse*) override;

  ::grpc::Status ListInvalidScans(::grpc::ServerContext*,
                                  const glucolumin::v1::ListInvalidScansRequest*,
                                  glucolumin::v1::ListInvalidScansResponse*) override;

private:
  std::shared_ptr<glucolumin::service::AdminService> service_;
};

}
