#ifndef INCLUDE_ARBITER_ERRORS_H_
#define INCLUDE_ARBITER_ERRORS_H_

#include <stdexcept>

// Errors that abort a judging job.
// Failing commands, timeouts and OOM are results, not errors.
class JudgeError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
  // whether the job layer should schedule another attempt
  virtual bool Retryable() const { return true; }
};

// container provisioning / engine failures
class SandboxError : public JudgeError {
 public:
  using JudgeError::JudgeError;
};

// artifact or log store transport failures
class StorageError : public JudgeError {
 public:
  using JudgeError::JudgeError;
};

// missing submission, match, challenge or artifact
class NotFoundError : public JudgeError {
 public:
  using JudgeError::JudgeError;
  bool Retryable() const override { return false; }
};

// malformed rubric or request
class InvalidInputError : public JudgeError {
 public:
  using JudgeError::JudgeError;
  bool Retryable() const override { return false; }
};

// any exception not derived from JudgeError is treated as retryable
bool IsRetryable(const std::exception&);

#endif  // INCLUDE_ARBITER_ERRORS_H_
