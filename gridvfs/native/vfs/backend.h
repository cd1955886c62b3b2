#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/time/time.h"

namespace gridvfs {

enum class ObjectKind {
  kRegular,
  kDirectory,
};

absl::string_view ObjectKindName(const ObjectKind kind);

// Metadata the backend keeps for a single object.
struct ObjectStat {
  ObjectKind kind{ObjectKind::kRegular};
  uint64_t size{0};
  std::string owner_name;
  std::string owner_zone;
  absl::Time created_at;
  absl::Time modified_at;
};

// Result of probing the connected user's rights on one object.
struct AccessProbe {
  bool read{false};
  bool write{false};
  bool execute{false};
};

struct Capacity {
  uint64_t total_bytes{0};
  uint64_t free_bytes{0};
};

// One connection to the backend. Destroying the session releases it, so a
// session held in a std::unique_ptr is released on every exit path.
//
// Implementations report a missing object as NotFound, a name clash as
// AlreadyExists and a refusal as PermissionDenied; any other code is
// treated as an I/O failure by callers.
class BackendSession {
 public:
  virtual ~BackendSession() = default;

  virtual absl::StatusOr<ObjectStat> Stat(absl::string_view path) = 0;
  virtual absl::StatusOr<AccessProbe> ProbeAccess(absl::string_view path) = 0;
  virtual absl::Status CreateObject(absl::string_view path,
                                    const ObjectKind kind) = 0;
  // Absolute paths of the immediate children of `path`.
  virtual absl::StatusOr<std::vector<std::string>> ListChildren(
      absl::string_view path) = 0;
  // `qualified_name` is "name#zone". The id comes back in its decimal
  // string form, exactly as the identity directory stores it.
  virtual absl::StatusOr<std::string> LookupUserId(
      absl::string_view qualified_name) = 0;
  virtual absl::StatusOr<Capacity> QueryCapacity() = 0;
};

// Source of sessions. Must be safe to call from many threads at once.
class Backend {
 public:
  virtual ~Backend() = default;

  virtual absl::StatusOr<std::unique_ptr<BackendSession>> Connect() = 0;
};

}  // namespace gridvfs
