#include "visit_service.hpp"

#include "internal/core/sample_parser.hpp"
#include "internal/core/visit_manager.hpp"
#include "internal/model/patient.hpp"
#include "internal/service/rpc_observer.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace glucolumin::service {

using namespace glucolumin::v1;

namespace {

void RequireVisitId(const std::string& visit_id) {
  if (visit_id.empty()) {
    throw util::ValidationError("visit_id: must not be empty");
  }
}

model::PatientProfile ToProfile(const RegisterPatientRequest& req) {
  model::PatientProfile profile;
  profile.name           = req.patient_name();
  profile.age            = req.age();
  profile.sex            = req.sex();
  profile.height_cm      = req.height_cm();
  profile.weight_kg      = req.weight_kg();
  profile.skin_tone      = req.skin_tone();
  profile.blood_pressure = req.blood_pressure();
  profile.had_food       = model::ParseYesNo("had_food", req.had_food());
  profile.family_diabetic_history =
      req.family_diabetic_history().empty() ? false : model::ParseYesNo("family_diabetic_history", req.family_diabetic_history());
  return profile;
}

} // namespace

VisitService::VisitService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

RegisterPatientResponse VisitService::RegisterPatient(const RegisterPatientRequest& req) {
  return ObserveRpc("VisitService.RegisterPatient", "", [&] {
    const auto visit = ctx_.manager->Register(ToProfile(req));

    RegisterPatientResponse resp;
    resp.set_visit_id(visit.visit_id);
    resp.set_patient_id(visit.patient_id);
    resp.set_status("registered");
    return resp;
  });
}

UploadRawResponse VisitService::UploadRaw(const UploadRawRequest& req) {
  return ObserveRpc("VisitService.UploadRaw", req.visit_id(), [&] {
    RequireVisitId(req.visit_id());
    if (req.lines_size() > 0 && req.samples_size() > 0) {
      throw util::ValidationError("upload: send either lines or samples, not both");
    }

    std::vector<model::RawSample> samples;
    if (req.lines_size() > 0) {
      samples = core::ParseSampleLines(req.visit_id(), {req.lines().begin(), req.lines().end()});
    } else {
      samples.reserve(req.samples_size());
      for (const auto& sample : req.samples()) {
        samples.push_back({sample.sample_index(), sample.value()});
      }
    }

    UploadRawResponse resp;
    resp.set_visit_id(req.visit_id());

    if (!samples.empty()) {
      const auto outcome = ctx_.manager->AppendSamples(req.visit_id(), samples);
      resp.set_accepted_samples(outcome.accepted);
    } else if (!req.end_of_scan()) {
      throw util::ValidationError("upload: no samples and no end_of_scan marker");
    }

    if (req.end_of_scan()) {
      resp.set_processing_triggered(ctx_.manager->EndScan(req.visit_id()));
    }

    const auto visit = ctx_.manager->GetVisit(req.visit_id());
    resp.set_total_samples(visit.sample_count);
    resp.set_status(visit.status);
    return resp;
  });
}

EndScanResponse VisitService::EndScan(const EndScanRequest& req) {
  return ObserveRpc("VisitService.EndScan", req.visit_id(), [&] {
    RequireVisitId(req.visit_id());

    EndScanResponse resp;
    resp.set_visit_id(req.visit_id());
    resp.set_triggered(ctx_.manager->EndScan(req.visit_id()));
    resp.set_status(ctx_.manager->GetVisit(req.visit_id()).status);
    return resp;
  });
}

GetResultResponse VisitService::GetResult(const GetResultRequest& req) {
  return ObserveRpc("VisitService.GetResult", req.visit_id(), [&] {
    RequireVisitId(req.visit_id());
    const auto visit = ctx_.manager->GetVisit(req.visit_id());

    GetResultResponse resp;
    resp.set_visit_id(visit.visit_id);
    resp.set_status(visit.status);
    resp.set_status_label(std::string(model::StatusLabel(visit.status)));

    if (visit.status == VISIT_STATUS_DONE && visit.result) {
      resp.set_has_result(true);
      resp.set_glucose(visit.result->glucose_mg_dl);
      resp.set_classification(visit.result->label);
      resp.set_diet_advice(visit.result->advice);
      resp.set_timestamp(util::ToIso8601(visit.result->computed_at));
      resp.set_model_version(visit.result->model_version);

      if (req.include_features()) {
        for (const auto& feature : ctx_.manager->GetFeatures(visit.visit_id)) {
          auto* out = resp.add_features();
          out->set_name(feature.name);
          out->set_value(feature.value);
        }
      }
    } else if (visit.status == VISIT_STATUS_FAILED) {
      resp.set_failure_reason(visit.failure_reason);
    }
    return resp;
  });
}

ReportInvalidScanResponse VisitService::ReportInvalidScan(const ReportInvalidScanRequest& req) {
  return ObserveRpc("VisitService.ReportInvalidScan", req.visit_id(), [&] {
    RequireVisitId(req.visit_id());
    const auto record = ctx_.manager->ReportInvalidScan(req.visit_id(), req.error_message(), req.value());

    ReportInvalidScanResponse resp;
    resp.set_visit_id(record.visit_id);
    resp.set_status("logged");
    auto* scan = resp.mutable_scan();
    scan->set_visit_id(record.visit_id);
    scan->set_reason(record.reason);
    scan->set_value(record.value);
    *scan->mutable_recorded_at() = util::ToProto(util::FromUnixMillis(record.recorded_at_ms));
    return resp;
  });
}

} // namespace glucolumin::service
