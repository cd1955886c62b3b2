#pragma once

#include <string>

#include "absl/status/status.h"
#include "absl/strings/string_view.h"

namespace gridvfs {

constexpr absl::string_view kIoFailurePrefix = "I/O failure: ";

// I/O failures cover every backend or translation error that has no more
// specific canonical code.
absl::Status IoFailure(absl::string_view message);
bool IsIoFailure(const absl::Status& status);

// Re-labels any non-ok status as an I/O failure, keeping its message.
absl::Status AsIoFailure(const absl::Status& status, absl::string_view context);

// Keeps NotFound, AlreadyExists and PermissionDenied and folds everything
// else into an I/O failure.
absl::Status TranslateBackendStatus(const absl::Status& status,
                                    absl::string_view context);

// errno codes for the FUSE boundary.
int ToErrno(const absl::Status& status);
absl::Status FromErrno(int err, absl::string_view context);

}  // namespace gridvfs
