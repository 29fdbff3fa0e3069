#pragma once

#include "kild/common/command.hpp"
#include "kild/common/result.hpp"
#include "kild/git/errors.hpp"

#include <filesystem>
#include <string>

namespace kild::git {

class IWorktreeManager {
public:
  virtual ~IWorktreeManager() = default;

  [[nodiscard]] virtual common::Result<std::filesystem::path, GitError>
  repo_root(const std::filesystem::path &path) = 0;

  [[nodiscard]] virtual common::Result<void, GitError>
  create(const std::filesystem::path &repo_root, const std::filesystem::path &worktree_path,
         const std::string &branch) = 0;

  [[nodiscard]] virtual common::Result<bool, GitError>
  has_uncommitted_changes(const std::filesystem::path &worktree_path) = 0;

  /// Without `force`, a dirty worktree is refused with UncommittedChanges. A missing directory
  /// counts as removed. The main checkout is never removed.
  [[nodiscard]] virtual common::Result<void, GitError>
  remove(const std::filesystem::path &worktree_path, bool force) = 0;
};

class GitWorktreeManager final : public IWorktreeManager {
public:
  explicit GitWorktreeManager(common::ICommandRunner &runner);

  [[nodiscard]] common::Result<std::filesystem::path, GitError>
  repo_root(const std::filesystem::path &path) override;
  [[nodiscard]] common::Result<void, GitError>
  create(const std::filesystem::path &repo_root, const std::filesystem::path &worktree_path,
         const std::string &branch) override;
  [[nodiscard]] common::Result<bool, GitError>
  has_uncommitted_changes(const std::filesystem::path &worktree_path) override;
  [[nodiscard]] common::Result<void, GitError> remove(const std::filesystem::path &worktree_path,
                                                      bool force) override;

private:
  [[nodiscard]] common::Result<common::CommandResult>
  git(const std::filesystem::path &dir, std::vector<std::string> args, bool allow_failure);

  common::ICommandRunner &runner_;
};

} // namespace kild::git
