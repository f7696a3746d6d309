#pragma once

#include "toolsmith/common/result.hpp"
#include "toolsmith/tools/tool.hpp"

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace toolsmith::tools {

/// Directory of `<name>.lua` files: the persistent source of truth for tool
/// sources. Origins are tracked in a sidecar `.origins` index. Every write goes
/// through a temp file and rename, so readers never see a partial file.
class ToolStore {
public:
  explicit ToolStore(std::filesystem::path directory);

  [[nodiscard]] common::Status ensure() const;

  /// All tools, sorted by name. Hidden and temp files are skipped.
  [[nodiscard]] common::Result<std::vector<ToolSource>> load_all() const;
  [[nodiscard]] common::Result<ToolSource> load(const std::string &name) const;
  [[nodiscard]] bool contains(const std::string &name) const;

  /// Create or overwrite. The previous source is not kept.
  [[nodiscard]] common::Status save(const ToolSource &tool);
  /// Fails NotFound when the tool does not exist.
  [[nodiscard]] common::Status remove(const std::string &name);

  [[nodiscard]] const std::filesystem::path &directory() const { return directory_; }
  [[nodiscard]] std::filesystem::path path_for(const std::string &name) const;

private:
  [[nodiscard]] std::map<std::string, OriginKind> read_origins() const;
  [[nodiscard]] common::Status write_origins(const std::map<std::string, OriginKind> &origins) const;

  std::filesystem::path directory_;
  mutable std::mutex index_mutex_;
};

} // namespace toolsmith::tools
