#pragma once

#include <atomic>
#include <memory>
#include <string>

#include "annotations.h"
#include "backend.h"

namespace gridvfs {

// Serves a directory of the local filesystem as if it were the grid. The
// backend path "/" is `host_root`; owners are the host's users, all placed
// in `zone`.
class LocalBackend : public Backend {
 public:
  LocalBackend(const std::string& host_root, const std::string& zone);
  DISALLOW_COPY_AND_ASSIGN(LocalBackend);
  DISALLOW_MOVE(LocalBackend);

  absl::StatusOr<std::unique_ptr<BackendSession>> Connect() override;

  size_t OpenSessions() const;

 protected:
  friend class LocalSession;

  std::string HostPath(absl::string_view path) const;
  std::string BackendPath(absl::string_view parent,
                          absl::string_view name) const;
  const std::string& Zone() const;
  void ReleaseSession();

 private:
  const std::string host_root_;
  const std::string zone_;
  std::atomic<size_t> open_sessions_{0};
};

}  // namespace gridvfs
