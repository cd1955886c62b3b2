#include "backend.h"

namespace gridvfs {

absl::string_view ObjectKindName(const ObjectKind kind) {
  switch (kind) {
    case ObjectKind::kRegular:
      return "regular";
    case ObjectKind::kDirectory:
      return "directory";
  }
  return "unknown";
}

}  // namespace gridvfs
