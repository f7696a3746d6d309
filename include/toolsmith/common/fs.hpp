#pragma once

#include "toolsmith/common/result.hpp"
#include <cstddef>
#include <filesystem>
#include <string>

namespace toolsmith::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Read a whole file as text. Fails IOError when missing, unreadable or larger than max_bytes.
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path,
                                                 std::size_t max_bytes = 0);

/// Write through a uniquely named sibling temp file, then rename over the target.
/// Readers observe either the old or the new content, never a partial write.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

/// Recursively copy a directory tree, overwriting existing files.
[[nodiscard]] Status copy_tree(const std::filesystem::path &from, const std::filesystem::path &to);

} // namespace toolsmith::common
