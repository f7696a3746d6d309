#pragma once

#include "toolsmith/tools/capability.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>

namespace toolsmith::tools {

inline constexpr std::size_t kMaxReadFileBytes = 1024 * 1024;

/// Blocking read/write used by the capabilities; exposed for direct callers.
[[nodiscard]] common::Result<std::string> read_file_contents(const std::filesystem::path &path);
[[nodiscard]] common::Status write_file_contents(const std::filesystem::path &path,
                                                 const std::string &content);

class ReadFileCapability final : public ICapability {
public:
  explicit ReadFileCapability(std::chrono::milliseconds timeout);

  [[nodiscard]] std::string_view name() const override { return "read_file"; }
  [[nodiscard]] std::string_view description() const override {
    return "Read a UTF-8 text file (up to 1 MiB)";
  }
  [[nodiscard]] std::size_t arity() const override { return 1; }
  [[nodiscard]] common::Result<script::Value> execute(const CapabilityArgs &args) override;

private:
  std::chrono::milliseconds timeout_;
};

class WriteFileCapability final : public ICapability {
public:
  explicit WriteFileCapability(std::chrono::milliseconds timeout);

  [[nodiscard]] std::string_view name() const override { return "write_file"; }
  [[nodiscard]] std::string_view description() const override {
    return "Write text to a file, replacing it atomically";
  }
  [[nodiscard]] std::size_t arity() const override { return 2; }
  [[nodiscard]] common::Result<script::Value> execute(const CapabilityArgs &args) override;

private:
  std::chrono::milliseconds timeout_;
};

} // namespace toolsmith::tools
