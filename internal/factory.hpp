#pragma once

#include <memory>

#include "config/config.pb.h"

namespace glucolumin::db { class Repository; }
namespace glucolumin::calibration { class ModelRegistry; }
namespace glucolumin::core { class VisitManager; }
namespace glucolumin::pipeline {
class PipelineScheduler;
class PipelineWorker;
class VisitWatchdog;
}
namespace glucolumin::service {
class VisitService;
class AdminService;
}

namespace glucolumin::factory {

/*
  Application

  Owns all long-lived objects of the server. Transport adapters are
  layered on top of the services by the executable.
*/
struct Application {
  std::shared_ptr<db::Repository>           repository;
  std::shared_ptr<calibration::ModelRegistry> models;
  std::shared_ptr<core::VisitManager>       manager;

  std::shared_ptr<service::VisitService> visit_service;
  std::shared_ptr<service::AdminService> admin_service;

  std::shared_ptr<pipeline::PipelineScheduler> scheduler;
  std::shared_ptr<pipeline::PipelineWorker>    workers;
  std::shared_ptr<pipeline::VisitWatchdog>     watchdog;

  // Stops the watchdog, then drains and joins the pipeline workers.
  void Stop();
};

/*
  Build

  Constructs the entire backend based on runtime config, recovers
  unfinished visits and starts background workers.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const glucolumin::runtime::config::RuntimeConfig& config);

}
