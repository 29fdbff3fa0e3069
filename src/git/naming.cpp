#include "kild/git/naming.hpp"

#include "kild/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <openssl/sha.h>
#include <sstream>

namespace kild::git {

namespace {

constexpr std::size_t PROJECT_ID_LENGTH = 16;

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);
  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (unsigned char c : digest) {
    out << std::setw(2) << static_cast<int>(c);
  }
  return out.str();
}

} // namespace

std::string project_id(const std::filesystem::path &repo_root) {
  std::error_code ec;
  auto canonical = std::filesystem::weakly_canonical(repo_root, ec);
  if (ec) {
    canonical = repo_root.lexically_normal();
  }
  std::string text = canonical.string();
  while (text.size() > 1 && text.back() == '/') {
    text.pop_back();
  }
  return sha256_hex(text).substr(0, PROJECT_ID_LENGTH);
}

common::Result<std::string, GitError> validate_branch_name(const std::string &branch) {
  using BranchResult = common::Result<std::string, GitError>;
  const std::string trimmed = common::trim(branch);
  if (trimmed.empty()) {
    return BranchResult::failure(
        GitError{.kind = GitErrorKind::InvalidBranchName, .message = "branch name cannot be empty"});
  }
  const bool has_space = std::any_of(trimmed.begin(), trimmed.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  if (has_space || trimmed.find("..") != std::string::npos || trimmed.front() == '-' ||
      trimmed.front() == '/') {
    return BranchResult::failure(GitError{.kind = GitErrorKind::InvalidBranchName,
                                          .message = "invalid branch name '" + trimmed + "'"});
  }
  return BranchResult::success(trimmed);
}

std::string kild_branch_name(const std::string &branch) { return "kild/" + branch; }

std::string session_id(const std::string &project_id, const std::string &branch) {
  return project_id + "/" + branch;
}

std::filesystem::path worktree_path_for(const std::filesystem::path &worktrees_dir,
                                        const std::string &project_id,
                                        const std::string &branch) {
  return worktrees_dir / project_id / common::escape_filename(branch);
}

} // namespace kild::git
