#include <grpcpp/grpcpp.h>

#include <chrono>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <map>
#include <string>
#include <thread>

#include "glucolumin/v1.hpp"
#include "glucolumin/v1/admin_service.grpc.pb.h"
#include "glucolumin/v1/visit_service.grpc.pb.h"

using namespace glucolumin::v1;

namespace {

constexpr int kUploadBatch = 256;

void Usage() {
  std::cout << "Usage:\n"
            << "  glucoctl <addr> register name=<n> age=<years> sex=<Male|Female> height=<cm> weight=<kg>\n"
            << "                           skin=<tone> bp=<sys/dia> food=<yes|no> [family=<yes|no>]\n"
            << "  glucoctl <addr> upload <visit_id> <file> [--end]\n"
            << "  glucoctl <addr> end-scan <visit_id>\n"
            << "  glucoctl <addr> result <visit_id> [--features]\n"
            << "  glucoctl <addr> report-invalid <visit_id> [message] [value]\n"
            << "  glucoctl <addr> wait <visit_id> [timeout_ms]\n"
            << "  glucoctl <addr> health\n"
            << "  glucoctl <addr> reload-model [artifact_path]\n"
            << "  glucoctl <addr> invalid-scans [visit_id] [limit]\n";
}

int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

std::map<std::string, std::string> ParseKeyValues(int argc, char** argv, int first) {
  std::map<std::string, std::string> out;
  for (int i = first; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto        eq  = arg.find('=');
    if (eq == std::string::npos) {
      std::cerr << "expected key=value, got '" << arg << "'\n";
      std::exit(1);
    }
    out[arg.substr(0, eq)] = arg.substr(eq + 1);
  }
  return out;
}

std::string Require(const std::map<std::string, std::string>& kv, const std::string& key) {
  auto it = kv.find(key);
  if (it == kv.end()) {
    std::cerr << "missing " << key << "=\n";
    std::exit(1);
  }
  return it->second;
}

double ParseNumber(const std::string& key, const std::string& value) {
  char*        end    = nullptr;
  const double parsed = std::strtod(value.c_str(), &end);
  if (value.empty() || *end != '\0') {
    std::cerr << "invalid number for " << key << ": '" << value << "'\n";
    std::exit(1);
  }
  return parsed;
}

void PrintResult(const GetResultResponse& resp) {
  std::cout << "visit_id=" << resp.visit_id() << "\n";
  std::cout << "status=" << resp.status_label() << "\n";
  if (resp.has_result()) {
    std::cout << "glucose=" << resp.glucose() << "\n";
    std::cout << "classification=" << resp.classification() << "\n";
    std::cout << "diet_advice=" << resp.diet_advice() << "\n";
    std::cout << "timestamp=" << resp.timestamp() << "\n";
    std::cout << "model_version=" << resp.model_version() << "\n";
  }
  if (!resp.failure_reason().empty()) {
    std::cout << "failure_reason=" << resp.failure_reason() << "\n";
  }
  for (const auto& feature : resp.features()) {
    std::cout << "feature." << feature.name() << "=" << feature.value() << "\n";
  }
}

bool IsTerminal(VisitStatus status) {
  return status == VISIT_STATUS_DONE || status == VISIT_STATUS_FAILED;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto visit_stub = VisitService::NewStub(channel);
  auto admin_stub = AdminService::NewStub(channel);

  // ------------------------------------------------------------

  if (cmd == "register") {
    const auto kv = ParseKeyValues(argc, argv, 3);

    RegisterPatientRequest req;
    req.set_patient_name(Require(kv, "name"));
    req.set_age(static_cast<int32_t>(ParseNumber("age", Require(kv, "age"))));
    req.set_sex(Require(kv, "sex"));
    req.set_height_cm(ParseNumber("height", Require(kv, "height")));
    req.set_weight_kg(ParseNumber("weight", Require(kv, "weight")));
    req.set_skin_tone(Require(kv, "skin"));
    req.set_blood_pressure(Require(kv, "bp"));
    req.set_had_food(Require(kv, "food"));
    if (auto it = kv.find("family"); it != kv.end()) {
      req.set_family_diabetic_history(it->second);
    }

    grpc::ClientContext     ctx;
    RegisterPatientResponse resp;
    auto                    status = visit_stub->RegisterPatient(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "visit_id=" << resp.visit_id() << "\n";
    std::cout << "patient_id=" << resp.patient_id() << "\n";
    std::cout << "status=" << resp.status() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "upload") {
    if (argc < 5) {
      Usage();
      return 1;
    }

    const std::string visit_id = argv[3];
    const bool        end_scan = argc >= 6 && std::string(argv[5]) == "--end";

    std::ifstream in(argv[4]);
    if (!in) {
      std::cerr << "cannot open " << argv[4] << "\n";
      return 1;
    }

    UploadRawRequest  req;
    UploadRawResponse resp;
    uint64_t          accepted = 0;

    auto flush = [&](bool last) {
      req.set_visit_id(visit_id);
      req.set_end_of_scan(last && end_scan);
      if (req.lines_size() == 0 && !req.end_of_scan()) return grpc::Status::OK;

      grpc::ClientContext ctx;
      auto                status = visit_stub->UploadRaw(&ctx, req, &resp);
      if (status.ok()) accepted += resp.accepted_samples();
      req.Clear();
      return status;
    };

    std::string line;
    while (std::getline(in, line)) {
      if (line.empty()) continue;
      req.add_lines(line);
      if (req.lines_size() >= kUploadBatch) {
        auto status = flush(false);
        if (!status.ok()) return Fail(status);
      }
    }
    auto status = flush(true);
    if (!status.ok()) return Fail(status);

    std::cout << "accepted=" << accepted << "\n";
    std::cout << "total=" << resp.total_samples() << "\n";
    std::cout << "processing_triggered=" << (resp.processing_triggered() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "end-scan") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    EndScanRequest req;
    req.set_visit_id(argv[3]);

    grpc::ClientContext ctx;
    EndScanResponse     resp;
    auto                status = visit_stub->EndScan(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "triggered=" << (resp.triggered() ? "true" : "false") << "\n";
    std::cout << "status=" << VisitStatus_Name(resp.status()) << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "result") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    GetResultRequest req;
    req.set_visit_id(argv[3]);
    req.set_include_features(argc >= 5 && std::string(argv[4]) == "--features");

    grpc::ClientContext ctx;
    GetResultResponse   resp;
    auto                status = visit_stub->GetResult(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    PrintResult(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "report-invalid") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    ReportInvalidScanRequest req;
    req.set_visit_id(argv[3]);
    if (argc >= 5) req.set_error_message(argv[4]);
    if (argc >= 6) req.set_value(std::stod(argv[5]));

    grpc::ClientContext       ctx;
    ReportInvalidScanResponse resp;
    auto                      status = visit_stub->ReportInvalidScan(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "status=" << resp.status() << "\n";
    std::cout << "reason=" << resp.scan().reason() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "wait") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    const auto timeout  = std::chrono::milliseconds(argc >= 5 ? std::stoull(argv[4]) : 60000);
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    GetResultRequest req;
    req.set_visit_id(argv[3]);

    while (true) {
      grpc::ClientContext ctx;
      GetResultResponse   resp;
      auto                status = visit_stub->GetResult(&ctx, req, &resp);
      if (!status.ok()) return Fail(status);

      if (IsTerminal(resp.status())) {
        PrintResult(resp);
        return resp.status() == VISIT_STATUS_DONE ? 0 : 3;
      }
      if (std::chrono::steady_clock::now() >= deadline) {
        std::cerr << "timed out waiting for " << argv[3] << " (status=" << resp.status_label() << ")\n";
        return 4;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(250));
    }
  }

  // ------------------------------------------------------------

  if (cmd == "health") {
    grpc::ClientContext ctx;
    GetHealthRequest    req;
    GetHealthResponse   resp;
    auto                status = admin_stub->GetHealth(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "backend=" << resp.repository_backend() << "\n";
    std::cout << "model_loaded=" << (resp.model_loaded() ? "true" : "false") << "\n";
    std::cout << "model_version=" << resp.model_version() << "\n";
    for (const auto& [label, count] : resp.visits_by_status()) {
      std::cout << "visits." << label << "=" << count << "\n";
    }
    std::cout << "timestamp=" << resp.timestamp() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "reload-model") {
    ReloadModelRequest req;
    if (argc >= 4) req.set_artifact_path(argv[3]);

    grpc::ClientContext ctx;
    ReloadModelResponse resp;
    auto                status = admin_stub->ReloadModel(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "model_version=" << resp.model_version() << "\n";
    std::cout << "feature_count=" << resp.feature_count() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "invalid-scans") {
    ListInvalidScansRequest req;
    if (argc >= 4) req.set_visit_id(argv[3]);
    if (argc >= 5) req.set_limit(static_cast<uint32_t>(std::stoul(argv[4])));

    grpc::ClientContext      ctx;
    ListInvalidScansResponse resp;
    auto                     status = admin_stub->ListInvalidScans(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& scan : resp.scans()) {
      std::cout << scan.recorded_at().seconds() << " " << scan.visit_id() << " " << scan.reason() << " " << scan.value() << "\n";
    }
    return 0;
  }

  Usage();
  return 1;
}
