#pragma once

#include "kild/common/result.hpp"
#include "kild/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace kild::config {

[[nodiscard]] common::Result<std::filesystem::path> kild_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] Config default_config(const std::filesystem::path &root);

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text,
                                                  const std::filesystem::path &root);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] bool is_known_runtime_mode(const std::string &mode);

} // namespace kild::config
