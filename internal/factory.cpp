#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/calibration/model_registry.hpp"
#include "internal/core/visit_manager.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/pipeline/glucose_pipeline.hpp"
#include "internal/pipeline/pipeline_scheduler.hpp"
#include "internal/pipeline/pipeline_worker.hpp"
#include "internal/pipeline/visit_watchdog.hpp"
#include "internal/service/admin_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/service/visit_service.hpp"

namespace glucolumin::factory {

using glucolumin::runtime::config::RuntimeConfig;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    auto sqlite_db  = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    auto repository = std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
    repository->Bootstrap();
    return repository;
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

signal::SignalConditioningOptions ConditioningOptions(const RuntimeConfig& config) {
  const auto&                       stages = config.pipeline();
  signal::SignalConditioningOptions options;
  options.min_samples             = stages.min_samples();
  options.savgol.window_length    = stages.savgol().window_length();
  options.savgol.poly_order       = stages.savgol().poly_order();
  options.wavelet_levels          = stages.wavelet_levels();
  options.low_magnitude_threshold = stages.low_magnitude_threshold();
  options.low_magnitude_gain      = stages.low_magnitude_gain();
  return options;
}

core::VisitManagerOptions ManagerOptions(const RuntimeConfig& config) {
  const auto&               pipeline = config.pipeline();
  core::VisitManagerOptions options;
  options.max_samples_per_visit   = pipeline.max_samples_per_visit();
  options.collection_window       = std::chrono::milliseconds(pipeline.collection_window_ms());
  options.max_processing          = std::chrono::milliseconds(pipeline.max_processing_ms());
  options.signal_quality.enabled  = pipeline.signal_quality().enabled();
  options.signal_quality.min_mean = pipeline.signal_quality().min_mean();
  options.signal_quality.max_mean = pipeline.signal_quality().max_mean();
  options.signal_quality.min_std  = pipeline.signal_quality().min_std();
  return options;
}

} // namespace

void Application::Stop() {
  if (watchdog) watchdog->Stop();
  if (workers) workers->Stop();
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Result store
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Model + pipeline
  // ------------------------------------------------------------------
  app.models    = std::make_shared<calibration::ModelRegistry>();
  auto glucose_pipeline = std::make_shared<pipeline::GlucosePipeline>(ConditioningOptions(config), app.models);
  app.models->ExpectFeatures(glucose_pipeline->Extractor().FeatureNames());

  const auto& artifact_path = config.model().artifact_path();
  if (artifact_path.empty()) {
    GLUCOLUMIN_LOG_WARN("no model artifact configured; visits will fail until a model is loaded");
  } else {
    try {
      app.models->Load(artifact_path);
    } catch (const std::exception& e) {
      GLUCOLUMIN_LOG_ERROR("model artifact unavailable; starting without a model",
                           {observability::StringField("path", artifact_path), observability::StringField("error", e.what())});
    }
  }

  // ------------------------------------------------------------------
  // Visit state machine + recovery
  // ------------------------------------------------------------------
  app.scheduler = std::make_shared<pipeline::PipelineScheduler>();
  app.manager   = std::make_shared<core::VisitManager>(app.repository, glucose_pipeline, app.scheduler, ManagerOptions(config));
  app.manager->HydrateCaches();

  // ------------------------------------------------------------------
  // Background workers
  // ------------------------------------------------------------------
  app.workers  = std::make_shared<pipeline::PipelineWorker>(app.scheduler, app.manager, config.pipeline().workers());
  app.watchdog = std::make_shared<pipeline::VisitWatchdog>(app.manager, std::chrono::milliseconds(config.pipeline().sweep_interval_ms()));
  app.workers->Start();
  app.watchdog->Start();

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.manager    = app.manager;
  ctx.models     = app.models;
  ctx.repository = app.repository;

  app.visit_service = std::make_shared<service::VisitService>(ctx);
  app.admin_service = std::make_shared<service::AdminService>(ctx);

  return app;
}

} // namespace glucolumin::factory
