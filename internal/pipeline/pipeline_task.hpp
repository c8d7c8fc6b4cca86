#pragma once

#include <string>

#include "internal/model/visit_state.hpp"
#include "internal/util/time.hpp"

namespace glucolumin::pipeline {

/*
  A visit whose collection has ended and which is waiting for a worker.
*/
struct PipelineTask {
  std::string visit_id;

  model::ProcessingTrigger trigger = glucolumin::v1::PROCESSING_TRIGGER_UNSPECIFIED;

  util::TimePoint enqueued_at{};
};

} // namespace glucolumin::pipeline
