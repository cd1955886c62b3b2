#include "path_util.h"

#include <vector>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

namespace gridvfs {

absl::StatusOr<std::string> NormalizePath(absl::string_view path) {
  if (path.empty() || path.front() != kPathSeparatorChar) {
    return absl::InvalidArgumentError(
        absl::StrCat("path is not absolute: '", path, "'"));
  }

  std::vector<absl::string_view> components;
  for (absl::string_view component :
       absl::StrSplit(path, kPathSeparatorChar, absl::SkipEmpty())) {
    if (component == ".") {
      continue;
    }
    if (component == "..") {
      if (components.empty()) {
        return absl::InvalidArgumentError(
            absl::StrCat("path escapes the root: '", path, "'"));
      }
      components.pop_back();
      continue;
    }
    components.push_back(component);
  }

  return absl::StrCat("/", absl::StrJoin(components, "/"));
}

absl::Status ValidateName(absl::string_view name) {
  if (name.empty()) {
    return absl::InvalidArgumentError("empty name");
  }
  if (name == "." || name == "..") {
    return absl::InvalidArgumentError(
        absl::StrCat("reserved name: '", name, "'"));
  }
  if (name.find(kPathSeparatorChar) != absl::string_view::npos) {
    return absl::InvalidArgumentError(
        absl::StrCat("name contains a separator: '", name, "'"));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::string> JoinPath(absl::string_view parent,
                                     absl::string_view name) {
  auto status = ValidateName(name);
  if (!status.ok()) {
    return status;
  }
  if (parent == "/") {
    return NormalizePath(absl::StrCat("/", name));
  }
  return NormalizePath(absl::StrCat(parent, "/", name));
}

std::string ParentPath(absl::string_view path) {
  const auto pos = path.rfind(kPathSeparatorChar);
  if (pos == absl::string_view::npos || pos == 0) {
    return "/";
  }
  return std::string{path.substr(0, pos)};
}

std::string BaseName(absl::string_view path) {
  const auto pos = path.rfind(kPathSeparatorChar);
  if (pos == absl::string_view::npos) {
    return std::string{path};
  }
  return std::string{path.substr(pos + 1)};
}

}  // namespace gridvfs
