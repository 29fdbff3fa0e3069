#include "kild/git/worktree.hpp"

#include "kild/common/fs.hpp"
#include "kild/git/naming.hpp"
#include "kild/observability/global.hpp"

namespace kild::git {

namespace {

constexpr auto GIT_TIMEOUT = std::chrono::milliseconds(60'000);

GitError command_failed(std::string message) {
  return GitError{.kind = GitErrorKind::CommandFailed, .message = std::move(message)};
}

bool is_main_checkout(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::is_directory(path / ".git", ec);
}

std::string first_line(const std::string &text) {
  const std::string trimmed = common::trim(text);
  return trimmed.substr(0, trimmed.find('\n'));
}

} // namespace

GitWorktreeManager::GitWorktreeManager(common::ICommandRunner &runner) : runner_(runner) {}

common::Result<common::CommandResult>
GitWorktreeManager::git(const std::filesystem::path &dir, std::vector<std::string> args,
                        const bool allow_failure) {
  std::vector<std::string> argv = {"git", "-C", dir.string()};
  argv.insert(argv.end(), std::make_move_iterator(args.begin()),
              std::make_move_iterator(args.end()));
  return runner_.run(argv, {.allow_failure = allow_failure, .timeout = GIT_TIMEOUT, .working_dir = {}});
}

common::Result<std::filesystem::path, GitError>
GitWorktreeManager::repo_root(const std::filesystem::path &path) {
  using RootResult = common::Result<std::filesystem::path, GitError>;
  auto result = git(path, {"rev-parse", "--show-toplevel"}, true);
  if (!result.ok()) {
    return RootResult::failure(command_failed(result.error()));
  }
  const std::string top = common::trim(result.value().stdout_text);
  if (result.value().exit_code != 0 || top.empty()) {
    return RootResult::failure(GitError{.kind = GitErrorKind::NotARepository,
                                        .message = path.string() + " is not a git repository"});
  }
  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(top, ec);
  return RootResult::success(ec ? std::filesystem::path(top) : canonical);
}

common::Result<void, GitError> GitWorktreeManager::create(const std::filesystem::path &repo_root,
                                                          const std::filesystem::path &worktree_path,
                                                          const std::string &branch) {
  using CreateResult = common::Result<void, GitError>;
  std::error_code ec;
  if (std::filesystem::exists(worktree_path, ec)) {
    return CreateResult::failure(GitError{.kind = GitErrorKind::WorktreeAlreadyExists,
                                          .message = "worktree path already exists: " +
                                                     worktree_path.string()});
  }
  std::filesystem::create_directories(worktree_path.parent_path(), ec);
  if (ec) {
    return CreateResult::failure(command_failed("failed to create " +
                                                worktree_path.parent_path().string() + ": " +
                                                ec.message()));
  }

  auto existing = git(repo_root, {"rev-parse", "--verify", "--quiet", "refs/heads/" + branch}, true);
  if (!existing.ok()) {
    return CreateResult::failure(command_failed(existing.error()));
  }

  std::vector<std::string> args = {"worktree", "add"};
  if (existing.value().exit_code == 0) {
    args.push_back(worktree_path.string());
    args.push_back(branch);
  } else {
    args.insert(args.end(), {"-b", branch, worktree_path.string()});
  }
  auto added = git(repo_root, args, true);
  if (!added.ok()) {
    return CreateResult::failure(command_failed(added.error()));
  }
  if (added.value().exit_code != 0) {
    const std::string err = first_line(added.value().stderr_text);
    if (err.find("already checked out") != std::string::npos ||
        err.find("already used by worktree") != std::string::npos) {
      return CreateResult::failure(
          GitError{.kind = GitErrorKind::BranchAlreadyExists,
                   .message = "branch " + branch + " is checked out elsewhere"});
    }
    return CreateResult::failure(command_failed("git worktree add failed: " + err));
  }
  return CreateResult::success();
}

common::Result<bool, GitError>
GitWorktreeManager::has_uncommitted_changes(const std::filesystem::path &worktree_path) {
  auto status = git(worktree_path, {"status", "--porcelain"}, true);
  if (!status.ok()) {
    return common::Result<bool, GitError>::failure(command_failed(status.error()));
  }
  if (status.value().exit_code != 0) {
    return common::Result<bool, GitError>::failure(command_failed(
        "git status failed in " + worktree_path.string() + ": " +
        first_line(status.value().stderr_text)));
  }
  return common::Result<bool, GitError>::success(!common::trim(status.value().stdout_text).empty());
}

common::Result<void, GitError> GitWorktreeManager::remove(const std::filesystem::path &worktree_path,
                                                          const bool force) {
  using RemoveResult = common::Result<void, GitError>;
  std::error_code ec;
  if (!std::filesystem::exists(worktree_path, ec)) {
    return RemoveResult::success();
  }
  if (is_main_checkout(worktree_path)) {
    return RemoveResult::failure(GitError{.kind = GitErrorKind::RemovalRefused,
                                          .message = worktree_path.string() +
                                                     " is a main repository, not a worktree"});
  }

  if (!force) {
    auto dirty = has_uncommitted_changes(worktree_path);
    if (!dirty.ok()) {
      return RemoveResult::failure(dirty.error());
    }
    if (dirty.value()) {
      return RemoveResult::failure(
          GitError{.kind = GitErrorKind::UncommittedChanges,
                   .message = worktree_path.string() +
                              " has uncommitted changes (use --force to discard them)"});
    }
  }

  std::optional<std::filesystem::path> main_repo;
  if (auto common_dir = git(worktree_path, {"rev-parse", "--git-common-dir"}, true);
      common_dir.ok() && common_dir.value().exit_code == 0) {
    std::filesystem::path dir = common::trim(common_dir.value().stdout_text);
    if (dir.is_relative()) {
      dir = worktree_path / dir;
    }
    main_repo = dir.lexically_normal().parent_path();
  }

  if (main_repo.has_value()) {
    std::vector<std::string> args = {"worktree", "remove"};
    if (force) {
      args.push_back("--force");
    }
    args.push_back(worktree_path.string());
    auto removed = git(*main_repo, args, true);
    if (!removed.ok()) {
      return RemoveResult::failure(command_failed(removed.error()));
    }
    if (removed.value().exit_code != 0 && !force) {
      return RemoveResult::failure(command_failed("git worktree remove failed: " +
                                                  first_line(removed.value().stderr_text)));
    }
  }

  std::filesystem::remove_all(worktree_path, ec);
  if (ec) {
    return RemoveResult::failure(command_failed("failed to delete " + worktree_path.string() +
                                                ": " + ec.message()));
  }
  if (main_repo.has_value()) {
    if (auto pruned = git(*main_repo, {"worktree", "prune"}, true);
        !pruned.ok() || pruned.value().exit_code != 0) {
      observability::record_warning("git", "git worktree prune failed in " + main_repo->string());
    }
  }
  return RemoveResult::success();
}

} // namespace kild::git
