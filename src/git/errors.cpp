#include "kild/git/errors.hpp"

namespace kild::git {

std::string_view GitError::code() const {
  switch (kind) {
  case GitErrorKind::NotARepository:
    return "NOT_A_REPOSITORY";
  case GitErrorKind::InvalidBranchName:
    return "INVALID_BRANCH_NAME";
  case GitErrorKind::BranchAlreadyExists:
    return "BRANCH_ALREADY_EXISTS";
  case GitErrorKind::WorktreeAlreadyExists:
    return "WORKTREE_ALREADY_EXISTS";
  case GitErrorKind::UncommittedChanges:
    return "UNCOMMITTED_CHANGES";
  case GitErrorKind::RemovalRefused:
    return "WORKTREE_REMOVAL_REFUSED";
  case GitErrorKind::CommandFailed:
    return "GIT_COMMAND_FAILED";
  }
  return "GIT_COMMAND_FAILED";
}

} // namespace kild::git
