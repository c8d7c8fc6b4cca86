#pragma once

#include <string_view>

#include "glucolumin/v1/types.pb.h"

namespace glucolumin::model {

using VisitStatus       = glucolumin::v1::VisitStatus;
using ProcessingTrigger = glucolumin::v1::ProcessingTrigger;

constexpr bool IsTerminal(VisitStatus status) {
  return status == glucolumin::v1::VISIT_STATUS_DONE || status == glucolumin::v1::VISIT_STATUS_FAILED;
}

constexpr bool AcceptsSamples(VisitStatus status) {
  return status == glucolumin::v1::VISIT_STATUS_REGISTERED || status == glucolumin::v1::VISIT_STATUS_COLLECTING;
}

/*
  REGISTERED -> COLLECTING -> PROCESSING -> {DONE, FAILED}

  REGISTERED may go straight to PROCESSING when the end-of-scan marker
  arrives before any sample. COLLECTING -> COLLECTING is the append step.
*/
constexpr bool CanTransition(VisitStatus from, VisitStatus to) {
  using namespace glucolumin::v1;

  if (IsTerminal(from)) {
    return false;
  }

  switch (to) {
    case VISIT_STATUS_COLLECTING:
      return from == VISIT_STATUS_REGISTERED || from == VISIT_STATUS_COLLECTING;
    case VISIT_STATUS_PROCESSING:
      return from == VISIT_STATUS_REGISTERED || from == VISIT_STATUS_COLLECTING;
    case VISIT_STATUS_DONE:
    case VISIT_STATUS_FAILED:
      return from == VISIT_STATUS_PROCESSING;
    default:
      return false;
  }
}

constexpr std::string_view StatusLabel(VisitStatus status) {
  switch (status) {
    case glucolumin::v1::VISIT_STATUS_REGISTERED:
      return "REGISTERED";
    case glucolumin::v1::VISIT_STATUS_COLLECTING:
      return "COLLECTING";
    case glucolumin::v1::VISIT_STATUS_PROCESSING:
      return "PROCESSING";
    case glucolumin::v1::VISIT_STATUS_DONE:
      return "DONE";
    case glucolumin::v1::VISIT_STATUS_FAILED:
      return "FAILED";
    default:
      return "UNSPECIFIED";
  }
}

constexpr std::string_view TriggerLabel(ProcessingTrigger trigger) {
  switch (trigger) {
    case glucolumin::v1::PROCESSING_TRIGGER_END_OF_SCAN:
      return "end_of_scan";
    case glucolumin::v1::PROCESSING_TRIGGER_COLLECTION_TIMEOUT:
      return "collection_timeout";
    case glucolumin::v1::PROCESSING_TRIGGER_RECOVERY:
      return "recovery";
    default:
      return "unspecified";
  }
}

} // namespace glucolumin::model
