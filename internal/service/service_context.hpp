#pragma once

#include <memory>

namespace glucolumin::core { class VisitManager; }
namespace glucolumin::calibration { class ModelRegistry; }
namespace glucolumin::db { class Repository; }

namespace glucolumin::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<glucolumin::core::VisitManager> manager;
  std::shared_ptr<glucolumin::calibration::ModelRegistry> models;
  std::shared_ptr<glucolumin::db::Repository> repository;
};

}
