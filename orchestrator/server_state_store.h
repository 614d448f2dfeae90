#pragma once

#include "orchestrator/server_types.h"

#include <filesystem>
#include <map>
#include <string>

namespace infergate {

// The server table on disk: {"servers": {<model_id>: ServerInstance}}.
class ServerStateStore {
public:
  explicit ServerStateStore(std::filesystem::path path);

  // Missing or unreadable files yield an empty table (logged).
  std::map<std::string, ServerInstance> Load() const;
  // Writes to a temp file and renames it over the old table.
  bool Save(const std::map<std::string, ServerInstance> &servers) const;
  // Removes the file; a missing file counts as success.
  bool Clear() const;

  const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace infergate
