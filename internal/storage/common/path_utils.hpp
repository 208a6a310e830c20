#pragma once

#include <string>
#include <string_view>

#include "internal/util/errors.hpp"

namespace systock::storage::common {

// Entity and table names become single path components.
inline void ValidateComponent(std::string_view kind, const std::string& name) {
  if (name.empty()) {
    throw util::ValidationError(std::string(kind) + " name must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::ValidationError(std::string(kind) + " name contains invalid character: " + name);
    }
  }
  if (name == "." || name == "..") {
    throw util::ValidationError(std::string(kind) + " name must not be a relative path component");
  }
}

inline std::string JoinPath(const std::string& base, const std::string& component) {
  if (base.empty()) {
    return component;
  }
  if (base.back() == '/') {
    return base + component;
  }
  return base + "/" + component;
}

inline bool HasParquetExtension(std::string_view path) {
  constexpr std::string_view kExtension = ".parquet";
  return path.size() > kExtension.size() && path.substr(path.size() - kExtension.size()) == kExtension;
}

} // namespace systock::storage::common
