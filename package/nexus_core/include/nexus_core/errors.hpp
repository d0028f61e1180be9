#pragma once

#include <stdexcept>
#include <string>

namespace nexus_core {

enum class ErrorKind {
  InvalidInput,
  Infeasible,
  Cancelled,
  PoolExhausted,
  InternalInvariant
};

inline const char *to_string(ErrorKind k) {
  switch (k) {
  case ErrorKind::InvalidInput: return "InvalidInput";
  case ErrorKind::Infeasible: return "Infeasible";
  case ErrorKind::Cancelled: return "Cancelled";
  case ErrorKind::PoolExhausted: return "PoolExhausted";
  case ErrorKind::InternalInvariant: return "InternalInvariant";
  }
  return "Unknown";
}

class OptimizerError : public std::runtime_error {
public:
  OptimizerError(ErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

class InvalidInputError : public OptimizerError {
public:
  explicit InvalidInputError(const std::string &what)
      : OptimizerError(ErrorKind::InvalidInput, what) {}
};

class CancelledError : public OptimizerError {
public:
  explicit CancelledError(const std::string &what)
      : OptimizerError(ErrorKind::Cancelled, what) {}
};

class InternalInvariantError : public OptimizerError {
public:
  explicit InternalInvariantError(const std::string &what)
      : OptimizerError(ErrorKind::InternalInvariant, what) {}
};

// Thrown by a single construction attempt that could not fill a slot.
// The generation loops count it as a failed attempt.
class BuildFailure : public OptimizerError {
public:
  explicit BuildFailure(const std::string &what)
      : OptimizerError(ErrorKind::Infeasible, what) {}
};

} // namespace nexus_core
