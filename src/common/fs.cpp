#include "toolsmith/common/fs.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <random>
#include <regex>
#include <sstream>

namespace toolsmith::common {

namespace {

std::string temp_suffix() {
  static std::atomic<std::uint64_t> counter{0};
  static const std::uint64_t seed = std::random_device{}();
  return std::to_string(seed) + "-" + std::to_string(counter.fetch_add(1));
}

} // namespace

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure(ErrorCode::IOError, "HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorCode::IOError, "Failed to create directory: " + path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Result<std::string> read_text_file(const std::filesystem::path &path, const std::size_t max_bytes) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return Result<std::string>::failure(ErrorCode::IOError, "No such file: " + path.string());
  }
  if (max_bytes > 0) {
    const auto size = std::filesystem::file_size(path, ec);
    if (!ec && size > max_bytes) {
      return Result<std::string>::failure(ErrorCode::IOError,
                                          "File too large: " + path.string() + " (" +
                                              std::to_string(size) + " bytes)");
    }
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return Result<std::string>::failure(ErrorCode::IOError, "Failed to open file: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return Result<std::string>::failure(ErrorCode::IOError, "Failed to read file: " + path.string());
  }
  return Result<std::string>::success(buffer.str());
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (!path.parent_path().empty()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return Status::error(ErrorCode::IOError,
                           "Failed to create parent directory: " + ec.message());
    }
  }

  const auto temp_path =
      path.parent_path() / ("." + path.filename().string() + ".tmp-" + temp_suffix());
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error(ErrorCode::IOError,
                           "Failed to open temporary file: " + temp_path.string());
    }
    out << content;
    out.flush();
    if (!out) {
      out.close();
      std::filesystem::remove(temp_path, ec);
      return Status::error(ErrorCode::IOError, "Failed to write: " + path.string());
    }
  }

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code cleanup_ec;
    std::filesystem::remove(temp_path, cleanup_ec);
    return Status::error(ErrorCode::IOError,
                         "Failed to atomically replace " + path.string() + ": " + ec.message());
  }
  return Status::success();
}

Status copy_tree(const std::filesystem::path &from, const std::filesystem::path &to) {
  std::error_code ec;
  if (!std::filesystem::is_directory(from, ec)) {
    return Status::error(ErrorCode::IOError, "Not a directory: " + from.string());
  }
  std::filesystem::create_directories(to, ec);
  if (ec) {
    return Status::error(ErrorCode::IOError,
                         "Failed to create directory " + to.string() + ": " + ec.message());
  }
  std::filesystem::copy(from, to,
                        std::filesystem::copy_options::recursive |
                            std::filesystem::copy_options::overwrite_existing,
                        ec);
  if (ec) {
    return Status::error(ErrorCode::IOError, "Failed to copy " + from.string() + " to " +
                                                 to.string() + ": " + ec.message());
  }
  return Status::success();
}

} // namespace toolsmith::common
