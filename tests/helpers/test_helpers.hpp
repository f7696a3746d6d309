#pragma once

#include "toolsmith/runtime/tool_runtime.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

namespace toolsmith::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::string read_file(const std::string &name) const;

private:
  std::filesystem::path path_;
};

/// Sets `stop` and joins `thread` when the scope ends, so a failing require
/// never destroys a joinable thread.
class StopAndJoin {
public:
  StopAndJoin(std::atomic<bool> &stop, std::thread &thread) : stop_(stop), thread_(thread) {}
  ~StopAndJoin();

  StopAndJoin(const StopAndJoin &) = delete;
  StopAndJoin &operator=(const StopAndJoin &) = delete;

private:
  std::atomic<bool> &stop_;
  std::thread &thread_;
};

/// Options rooted in the workspace: tools under <ws>/tools, short timeouts,
/// gateway on an ephemeral loopback port.
runtime::RuntimeOptions runtime_options(const TempWorkspace &workspace);

/// A runtime over runtime_options(workspace) that has been opened successfully.
std::unique_ptr<runtime::ToolRuntime> open_runtime(const TempWorkspace &workspace);

} // namespace toolsmith::testing
