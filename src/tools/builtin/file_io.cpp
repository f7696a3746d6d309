#include "toolsmith/tools/builtin/file_io.hpp"

#include "toolsmith/common/deadline.hpp"
#include "toolsmith/common/fs.hpp"

namespace toolsmith::tools {

common::Result<std::string> read_file_contents(const std::filesystem::path &path) {
  if (path.empty()) {
    return common::Result<std::string>::failure(common::ErrorCode::IOError, "empty path");
  }
  std::error_code ec;
  if (std::filesystem::is_directory(path, ec)) {
    return common::Result<std::string>::failure(common::ErrorCode::IOError,
                                                "is a directory: " + path.string());
  }
  return common::read_text_file(path, kMaxReadFileBytes);
}

common::Status write_file_contents(const std::filesystem::path &path, const std::string &content) {
  if (path.empty()) {
    return common::Status::error(common::ErrorCode::IOError, "empty path");
  }
  const auto parent = path.parent_path();
  std::error_code ec;
  if (!parent.empty() && !std::filesystem::is_directory(parent, ec)) {
    return common::Status::error(common::ErrorCode::IOError,
                                 "parent directory does not exist: " + parent.string());
  }
  return common::write_file_atomic(path, content);
}

ReadFileCapability::ReadFileCapability(const std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

common::Result<script::Value> ReadFileCapability::execute(const CapabilityArgs &args) {
  const std::filesystem::path path(common::expand_path(args.at(0)));
  auto content = common::run_with_deadline<std::string>(
      [path] { return read_file_contents(path); }, timeout_, "read_file " + path.string());
  if (!content.ok()) {
    return common::Result<script::Value>::failure(content.status());
  }
  return common::Result<script::Value>::success(script::Value::string(std::move(content.value())));
}

WriteFileCapability::WriteFileCapability(const std::chrono::milliseconds timeout)
    : timeout_(timeout) {}

common::Result<script::Value> WriteFileCapability::execute(const CapabilityArgs &args) {
  const std::filesystem::path path(common::expand_path(args.at(0)));
  const std::string content = args.at(1);
  auto written = common::run_with_deadline<bool>(
      [path, content]() -> common::Result<bool> {
        const auto status = write_file_contents(path, content);
        if (!status.ok()) {
          return common::Result<bool>::failure(status);
        }
        return common::Result<bool>::success(true);
      },
      timeout_, "write_file " + path.string());
  if (!written.ok()) {
    return common::Result<script::Value>::failure(written.status());
  }
  return common::Result<script::Value>::success(script::Value::unit());
}

} // namespace toolsmith::tools
