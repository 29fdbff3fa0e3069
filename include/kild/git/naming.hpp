#pragma once

#include "kild/common/result.hpp"
#include "kild/git/errors.hpp"

#include <filesystem>
#include <string>

namespace kild::git {

/// First 16 hex chars of SHA-256 over the canonical repository root.
[[nodiscard]] std::string project_id(const std::filesystem::path &repo_root);

/// Trimmed name, or InvalidBranchName for empty names, "..", whitespace, a leading '-' or '/'.
[[nodiscard]] common::Result<std::string, GitError> validate_branch_name(const std::string &branch);

[[nodiscard]] std::string kild_branch_name(const std::string &branch);

[[nodiscard]] std::string session_id(const std::string &project_id, const std::string &branch);

[[nodiscard]] std::filesystem::path worktree_path_for(const std::filesystem::path &worktrees_dir,
                                                      const std::string &project_id,
                                                      const std::string &branch);

} // namespace kild::git
