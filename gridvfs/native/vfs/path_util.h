#pragma once

#include <string>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace gridvfs {

constexpr char kPathSeparatorChar = '/';

// Returns the canonical form of an absolute backend path: repeated
// separators collapse, "." components vanish, ".." consumes its
// predecessor and trailing separators are dropped. "/" stays "/".
absl::StatusOr<std::string> NormalizePath(absl::string_view path);

// Joins a normalized parent path and a single path component.
absl::StatusOr<std::string> JoinPath(absl::string_view parent,
                                     absl::string_view name);

// Fails unless `name` is usable as a single path component.
absl::Status ValidateName(absl::string_view name);

// Both expect a normalized path.
std::string ParentPath(absl::string_view path);
std::string BaseName(absl::string_view path);

}  // namespace gridvfs
