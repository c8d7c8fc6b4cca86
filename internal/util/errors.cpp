#include "errors.hpp"

namespace glucolumin::util {

std::string ErrorKind(const std::exception& e) {
  if (dynamic_cast<const ValidationError*>(&e)) return "ValidationError";
  if (dynamic_cast<const DuplicateVisitError*>(&e)) return "DuplicateVisitError";
  if (dynamic_cast<const InsufficientSamplesError*>(&e)) return "InsufficientSamplesError";
  if (dynamic_cast<const SignalProcessingError*>(&e)) return "SignalProcessingError";
  if (dynamic_cast<const ModelUnavailableError*>(&e)) return "ModelUnavailableError";
  if (dynamic_cast<const NotFoundError*>(&e)) return "NotFoundError";
  if (dynamic_cast<const ProcessingTimeoutError*>(&e)) return "ProcessingTimeoutError";
  if (dynamic_cast<const InvalidStateError*>(&e)) return "InvalidStateError";
  if (dynamic_cast<const ResourceExhaustedError*>(&e)) return "ResourceExhaustedError";
  return "InternalError";
}

std::string DescribeFailure(const std::exception& e) {
  return ErrorKind(e) + ": " + e.what();
}

} // namespace glucolumin::util
