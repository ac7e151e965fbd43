#pragma once

#include "otto/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace otto::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);

/// Cuts `value` to at most `max_length` bytes without splitting a UTF-8 sequence.
[[nodiscard]] std::string truncate_utf8(const std::string &value, std::size_t max_length);
[[nodiscard]] std::string join(const std::vector<std::string> &parts, const std::string &separator);

} // namespace otto::common
