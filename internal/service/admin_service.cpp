#include "admin_service.hpp"

#include "internal/calibration/model_registry.hpp"
#include "internal/core/visit_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/model/visit_state.hpp"
#include "internal/service/rpc_observer.hpp"
#include "internal/util/time.hpp"

namespace glucolumin::service {

using namespace glucolumin::v1;

AdminService::AdminService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

GetHealthResponse AdminService::GetHealth(const GetHealthRequest&) {
  return ObserveRpc("AdminService.GetHealth", "", [&] {
    GetHealthResponse resp;
    resp.set_repository_backend(ctx_.repository->BackendName());

    if (auto artifact = ctx_.models->Current()) {
      resp.set_model_loaded(true);
      resp.set_model_version(artifact->version);
    }

    auto& counts = *resp.mutable_visits_by_status();
    for (const auto& [status, count] : ctx_.manager->CountByStatus()) {
      counts[std::string(model::StatusLabel(status))] = count;
    }

    resp.set_timestamp(util::ToIso8601(util::Now()));
    return resp;
  });
}

ReloadModelResponse AdminService::ReloadModel(const ReloadModelRequest& req) {
  return ObserveRpc("AdminService.ReloadModel", "", [&] {
    const auto artifact = req.artifact_path().empty() ? ctx_.models->Reload() : ctx_.models->Load(req.artifact_path());

    ReloadModelResponse resp;
    resp.set_model_version(artifact->version);
    resp.set_feature_count(static_cast<uint32_t>(artifact->features.size()));
    return resp;
  });
}

ListInvalidScansResponse AdminService::ListInvalidScans(const ListInvalidScansRequest& req) {
  return ObserveRpc("AdminService.ListInvalidScans", req.visit_id(), [&] {
    std::optional<std::string> visit_id;
    if (!req.visit_id().empty()) {
      visit_id = req.visit_id();
    }

    ListInvalidScansResponse resp;
    for (const auto& record : ctx_.manager->ListInvalidScans(visit_id, req.limit())) {
      auto* scan = resp.add_scans();
      scan->set_visit_id(record.visit_id);
      scan->set_reason(record.reason);
      scan->set_value(record.value);
      *scan->mutable_recorded_at() = util::ToProto(util::FromUnixMillis(record.recorded_at_ms));
    }
    return resp;
  });
}

} // namespace glucolumin::service
