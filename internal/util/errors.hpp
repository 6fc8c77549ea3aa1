#pragma once

#include <stdexcept>
#include <string>

namespace jobprobe::util {

/*
  Central error types.

  Everything raised by the probe core derives from std::runtime_error and
  surfaces to ProbeRunner, which turns it into a single error document.
*/

class InputValidationError : public std::runtime_error {
 public:
  explicit InputValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MultipleMatchError : public std::runtime_error {
 public:
  explicit MultipleMatchError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MandatoryEvidenceMissingError : public std::runtime_error {
 public:
  explicit MandatoryEvidenceMissingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class MalformedLogError : public std::runtime_error {
 public:
  explicit MalformedLogError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Collaborator call failed, as opposed to a clean "not found".
class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PreconditionFailed : public std::runtime_error {
 public:
  explicit PreconditionFailed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ResourceExhausted : public std::runtime_error {
 public:
  explicit ResourceExhausted(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace jobprobe::util
