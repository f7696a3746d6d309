#include "toolsmith/tools/builtin/clone_agent.hpp"

#include "toolsmith/common/deadline.hpp"
#include "toolsmith/common/fs.hpp"

namespace toolsmith::tools {

namespace {

common::Result<std::filesystem::path> resolve_executable(const std::filesystem::path &configured) {
  if (!configured.empty()) {
    return common::Result<std::filesystem::path>::success(configured);
  }
  std::error_code ec;
  auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
  if (ec) {
    return common::Result<std::filesystem::path>::failure(
        common::ErrorCode::IOError, "cannot resolve running executable: " + ec.message());
  }
  return common::Result<std::filesystem::path>::success(std::move(self));
}

common::Status copy_one_file(const std::filesystem::path &from, const std::filesystem::path &to) {
  std::error_code ec;
  std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::IOError, "failed to copy " + from.string() +
                                                                 " to " + to.string() + ": " +
                                                                 ec.message());
  }
  return common::Status::success();
}

} // namespace

common::Status clone_agent(const std::filesystem::path &target, const CloneSources &sources) {
  if (target.empty()) {
    return common::Status::error(common::ErrorCode::IOError, "empty target directory");
  }
  std::error_code ec;
  std::filesystem::create_directories(target, ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::IOError,
                                 "cannot create " + target.string() + ": " + ec.message());
  }

  const auto executable = resolve_executable(sources.executable);
  if (!executable.ok()) {
    return executable.status();
  }
  const auto target_exe = target / executable.value().filename();
  if (auto copied = copy_one_file(executable.value(), target_exe); !copied.ok()) {
    return copied;
  }
  std::filesystem::permissions(target_exe,
                               std::filesystem::perms::owner_all |
                                   std::filesystem::perms::group_read |
                                   std::filesystem::perms::group_exec |
                                   std::filesystem::perms::others_read |
                                   std::filesystem::perms::others_exec,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    return common::Status::error(common::ErrorCode::IOError,
                                 "cannot mark " + target_exe.string() +
                                     " executable: " + ec.message());
  }

  const auto tools_target = target / "tools";
  if (std::filesystem::is_directory(sources.tools_dir, ec)) {
    if (auto copied = common::copy_tree(sources.tools_dir, tools_target); !copied.ok()) {
      return copied;
    }
  } else {
    std::filesystem::create_directories(tools_target, ec);
    if (ec) {
      return common::Status::error(common::ErrorCode::IOError,
                                   "cannot create " + tools_target.string() + ": " +
                                       ec.message());
    }
  }

  for (const auto &file : sources.optional_files) {
    if (file.empty() || !std::filesystem::is_regular_file(file, ec)) {
      continue;
    }
    if (auto copied = copy_one_file(file, target / file.filename()); !copied.ok()) {
      return copied;
    }
  }
  return common::Status::success();
}

CloneAgentCapability::CloneAgentCapability(CloneSources sources,
                                           const std::chrono::milliseconds timeout)
    : sources_(std::move(sources)), timeout_(timeout) {}

common::Result<script::Value> CloneAgentCapability::execute(const CapabilityArgs &args) {
  const std::filesystem::path target(common::expand_path(common::trim(args.at(0))));
  const CloneSources sources = sources_;
  auto cloned = common::run_with_deadline<bool>(
      [target, sources]() -> common::Result<bool> {
        const auto status = clone_agent(target, sources);
        if (!status.ok()) {
          return common::Result<bool>::failure(status);
        }
        return common::Result<bool>::success(true);
      },
      timeout_, "clone_agent " + target.string());
  if (!cloned.ok()) {
    return common::Result<script::Value>::failure(cloned.status());
  }
  return common::Result<script::Value>::success(
      script::Value::string("agent cloned to " + target.string()));
}

} // namespace toolsmith::tools
