#pragma once

#include "kild/common/result.hpp"

#include <filesystem>
#include <string>

namespace kild::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] std::string now_rfc3339();

[[nodiscard]] std::string shell_quote(const std::string &value);

/// Reversible file-name form: [A-Za-z0-9-] pass through, every other byte (including '_')
/// becomes `_xx` in lowercase hex. Distinct inputs never share an output.
[[nodiscard]] std::string escape_filename(const std::string &value);

[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Write through `<path>.tmp` and rename over the target.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

} // namespace kild::common
