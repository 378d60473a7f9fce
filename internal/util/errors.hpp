#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace rulegraph::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class EntityNotFound : public NotFound {
 public:
  explicit EntityNotFound(const std::string& msg) : NotFound(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Expression exceeds the configured depth limit.
class FormulaTooComplex : public std::runtime_error {
 public:
  explicit FormulaTooComplex(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Operator applied to incompatible operands, or a malformed node / patch.
class EvaluationError : public std::runtime_error {
 public:
  explicit EvaluationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class CircularDependency : public std::runtime_error {
 public:
  CircularDependency(const std::string& msg, std::vector<std::string> path)
      : std::runtime_error(msg), path_(std::move(path)) {
  }

  const std::vector<std::string>& path() const {
    return path_;
  }

 private:
  std::vector<std::string> path_;
};

class ForbiddenPath : public std::runtime_error {
 public:
  ForbiddenPath(const std::string& msg, std::string path) : std::runtime_error(msg), path_(std::move(path)) {
  }

  const std::string& path() const {
    return path_;
  }

 private:
  std::string path_;
};

class OptimisticLockConflict : public std::runtime_error {
 public:
  explicit OptimisticLockConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// I/O failure from the store or cache.
class StoreUnavailable : public std::runtime_error {
 public:
  explicit StoreUnavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace rulegraph::util
