#pragma once

#include <stdexcept>
#include <string>

namespace glucolumin::util {

/*
  Central error types.

  Pipeline errors are recorded as a visit's failure reason by the state
  machine; everything else is translated to gRPC status codes at the
  transport edge.
*/

class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DuplicateVisitError : public std::runtime_error {
 public:
  explicit DuplicateVisitError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientSamplesError : public std::runtime_error {
 public:
  explicit InsufficientSamplesError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class SignalProcessingError : public std::runtime_error {
 public:
  explicit SignalProcessingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ModelUnavailableError : public std::runtime_error {
 public:
  explicit ModelUnavailableError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFoundError : public std::runtime_error {
 public:
  explicit NotFoundError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProcessingTimeoutError : public std::runtime_error {
 public:
  explicit ProcessingTimeoutError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidStateError : public std::runtime_error {
 public:
  explicit InvalidStateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhaustedError : public std::runtime_error {
 public:
  explicit ResourceExhaustedError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Short kind name used as the prefix of a recorded failure reason.
std::string ErrorKind(const std::exception& e);

// "<Kind>: <what>"
std::string DescribeFailure(const std::exception& e);

} // namespace glucolumin::util
