#pragma once

#include <string>
#include <string_view>

namespace kild::git {

enum class GitErrorKind {
  NotARepository,
  InvalidBranchName,
  BranchAlreadyExists,
  WorktreeAlreadyExists,
  UncommittedChanges,
  RemovalRefused,
  CommandFailed,
};

struct GitError {
  GitErrorKind kind = GitErrorKind::CommandFailed;
  std::string message;

  [[nodiscard]] std::string_view code() const;
  [[nodiscard]] bool is_user_error() const { return kind != GitErrorKind::CommandFailed; }
};

} // namespace kild::git
