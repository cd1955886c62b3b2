#include "status_util.h"

#include <cerrno>
#include <cstring>

#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"

namespace gridvfs {

absl::Status IoFailure(absl::string_view message) {
  return absl::InternalError(absl::StrCat(kIoFailurePrefix, message));
}

bool IsIoFailure(const absl::Status& status) {
  return status.code() == absl::StatusCode::kInternal &&
         absl::StartsWith(status.message(), kIoFailurePrefix);
}

absl::Status AsIoFailure(const absl::Status& status,
                         absl::string_view context) {
  if (status.ok() || IsIoFailure(status)) {
    return status;
  }
  return IoFailure(absl::StrCat(context, ": ", status.ToString()));
}

absl::Status TranslateBackendStatus(const absl::Status& status,
                                    absl::string_view context) {
  switch (status.code()) {
    case absl::StatusCode::kOk:
    case absl::StatusCode::kNotFound:
    case absl::StatusCode::kAlreadyExists:
    case absl::StatusCode::kPermissionDenied:
      return status;
    default:
      return AsIoFailure(status, context);
  }
}

int ToErrno(const absl::Status& status) {
  switch (status.code()) {
    case absl::StatusCode::kOk:
      return 0;
    case absl::StatusCode::kNotFound:
      return ENOENT;
    case absl::StatusCode::kAlreadyExists:
      return EEXIST;
    case absl::StatusCode::kPermissionDenied:
      return EACCES;
    case absl::StatusCode::kInvalidArgument:
      return EINVAL;
    case absl::StatusCode::kUnimplemented:
      return ENOSYS;
    default:
      return EIO;
  }
}

absl::Status FromErrno(int err, absl::string_view context) {
  const auto message = absl::StrCat(context, ": ", strerror(err));
  switch (err) {
    case 0:
      return absl::OkStatus();
    case ENOENT:
    case ENOTDIR:
      return absl::NotFoundError(message);
    case EEXIST:
      return absl::AlreadyExistsError(message);
    case EACCES:
    case EPERM:
    case EROFS:
      return absl::PermissionDeniedError(message);
    case EINVAL:
    case ENAMETOOLONG:
      return absl::InvalidArgumentError(message);
    default:
      return IoFailure(message);
  }
}

}  // namespace gridvfs
