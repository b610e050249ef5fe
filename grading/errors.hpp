#ifndef GRADING_ERRORS_HPP
#define GRADING_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace grading {

// The submission was rejected before anything ran.
class InvalidSubmission : public std::runtime_error {
 public:
  explicit InvalidSubmission(const std::string& msg)
      : std::runtime_error(msg) {}
};

// The reported attempt does not match a fresh run. The message is generic on
// purpose; the details only go to the logs.
class ValidationMismatch : public std::runtime_error {
 public:
  ValidationMismatch() : std::runtime_error("Submission failed validation") {}
};

// The progress record kept changing under us. Transient, the caller may retry.
class PersistenceConflict : public std::runtime_error {
 public:
  explicit PersistenceConflict(const std::string& msg)
      : std::runtime_error(msg) {}
};

// The progress store failed. Nothing can be assumed about what was written.
class PersistenceUnavailable : public std::runtime_error {
 public:
  explicit PersistenceUnavailable(const std::string& msg)
      : std::runtime_error(msg) {}
};

}  // namespace grading

#endif
