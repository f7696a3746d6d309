#include "toolsmith/tools/store.hpp"

#include "toolsmith/common/fs.hpp"

#include <algorithm>
#include <sstream>

namespace toolsmith::tools {

namespace {

constexpr const char *kOriginsFile = ".origins";

std::string tool_name_from_path(const std::filesystem::path &path) {
  if (path.extension() != kToolFileExtension) {
    return "";
  }
  const std::string stem = path.stem().string();
  if (stem.empty() || stem.front() == '.') {
    return "";
  }
  return stem;
}

} // namespace

ToolStore::ToolStore(std::filesystem::path directory) : directory_(std::move(directory)) {}

common::Status ToolStore::ensure() const {
  const auto created = common::ensure_dir(directory_);
  if (!created.ok()) {
    return created.status();
  }
  return common::Status::success();
}

std::filesystem::path ToolStore::path_for(const std::string &name) const {
  return directory_ / (name + std::string(kToolFileExtension));
}

std::map<std::string, OriginKind> ToolStore::read_origins() const {
  std::map<std::string, OriginKind> origins;
  const auto content = common::read_text_file(directory_ / kOriginsFile);
  if (!content.ok()) {
    return origins;
  }
  std::istringstream stream(content.value());
  std::string line;
  while (std::getline(stream, line)) {
    const auto eq = line.find('=');
    if (eq == std::string::npos) {
      continue;
    }
    const auto origin = origin_from_string(common::trim(line.substr(eq + 1)));
    if (origin.has_value()) {
      origins[common::trim(line.substr(0, eq))] = *origin;
    }
  }
  return origins;
}

common::Status ToolStore::write_origins(const std::map<std::string, OriginKind> &origins) const {
  std::string content;
  for (const auto &[name, origin] : origins) {
    if (origin == OriginKind::Local) {
      continue;
    }
    content += name + "=" + std::string(origin_to_string(origin)) + "\n";
  }
  return common::write_file_atomic(directory_ / kOriginsFile, content);
}

common::Result<std::vector<ToolSource>> ToolStore::load_all() const {
  using ResultT = common::Result<std::vector<ToolSource>>;
  std::vector<ToolSource> tools;

  std::error_code ec;
  if (!std::filesystem::exists(directory_, ec)) {
    return ResultT::success(std::move(tools));
  }

  std::filesystem::directory_iterator it(directory_, ec);
  if (ec) {
    return ResultT::failure(common::ErrorCode::IOError,
                            "cannot list " + directory_.string() + ": " + ec.message());
  }

  std::map<std::string, OriginKind> origins;
  {
    std::lock_guard<std::mutex> lock(index_mutex_);
    origins = read_origins();
  }

  for (const auto &entry : it) {
    if (!entry.is_regular_file(ec)) {
      continue;
    }
    const std::string name = tool_name_from_path(entry.path());
    if (name.empty() || !validate_tool_name(name).ok()) {
      continue;
    }
    auto content = common::read_text_file(entry.path());
    if (!content.ok()) {
      return ResultT::failure(content.status());
    }
    ToolSource tool;
    tool.name = name;
    tool.source = std::move(content.value());
    if (const auto found = origins.find(name); found != origins.end()) {
      tool.origin = found->second;
    }
    tools.push_back(std::move(tool));
  }

  std::sort(tools.begin(), tools.end(),
            [](const ToolSource &a, const ToolSource &b) { return a.name < b.name; });
  return ResultT::success(std::move(tools));
}

common::Result<ToolSource> ToolStore::load(const std::string &name) const {
  const auto path = path_for(name);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return common::Result<ToolSource>::failure(common::ErrorCode::NotFound,
                                               "tool not found: " + name);
  }
  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<ToolSource>::failure(content.status());
  }

  ToolSource tool;
  tool.name = name;
  tool.source = std::move(content.value());
  std::lock_guard<std::mutex> lock(index_mutex_);
  const auto origins = read_origins();
  if (const auto found = origins.find(name); found != origins.end()) {
    tool.origin = found->second;
  }
  return common::Result<ToolSource>::success(std::move(tool));
}

bool ToolStore::contains(const std::string &name) const {
  std::error_code ec;
  return std::filesystem::is_regular_file(path_for(name), ec);
}

common::Status ToolStore::save(const ToolSource &tool) {
  if (auto valid = validate_tool_name(tool.name); !valid.ok()) {
    return valid;
  }
  if (auto ready = ensure(); !ready.ok()) {
    return ready;
  }
  if (auto written = common::write_file_atomic(path_for(tool.name), tool.source); !written.ok()) {
    return written;
  }

  std::lock_guard<std::mutex> lock(index_mutex_);
  auto origins = read_origins();
  const auto existing = origins.find(tool.name);
  const bool was_remote = existing != origins.end() && existing->second == OriginKind::Remote;
  if (was_remote == (tool.origin == OriginKind::Remote)) {
    return common::Status::success();
  }
  origins[tool.name] = tool.origin;
  return write_origins(origins);
}

common::Status ToolStore::remove(const std::string &name) {
  const auto path = path_for(name);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return common::Status::error(common::ErrorCode::NotFound, "tool not found: " + name);
  }
  if (!std::filesystem::remove(path, ec) || ec) {
    return common::Status::error(common::ErrorCode::IOError,
                                 "failed to delete " + path.string() +
                                     (ec ? ": " + ec.message() : std::string()));
  }

  std::lock_guard<std::mutex> lock(index_mutex_);
  auto origins = read_origins();
  if (origins.erase(name) == 0) {
    return common::Status::success();
  }
  return write_origins(origins);
}

} // namespace toolsmith::tools
