#pragma once

#include <stdexcept>
#include <string>

namespace systock::util {

/*
  Central error types.

  The coordinator is the only layer that catches these per entity;
  everything below it propagates.
*/

// A required raw snapshot or stored star-schema table does not exist.
class MissingSourceError : public std::runtime_error {
 public:
  explicit MissingSourceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Input shape is wrong: missing column, unexpected type, bad configuration value.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransformError : public std::runtime_error {
 public:
  explicit TransformError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Warehouse write failed. Batches committed before the failure stay committed.
class LoadError : public std::runtime_error {
 public:
  explicit LoadError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace systock::util
