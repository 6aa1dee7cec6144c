#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace treemirror {

// One directory of the source tree and its immediate children (sorted by name)
struct DirectoryVisit {
  std::filesystem::path relative; // empty for the root
  std::vector<std::string> dirs;
  std::vector<std::string> files;
  std::vector<std::string> skipped; // symlinks and special files, never mirrored
};

/**
 * Lazy depth-first, top-down enumeration of a directory tree.
 *
 * Every directory reachable from the root is yielded exactly once, and a
 * directory is always yielded before anything inside it. A directory is
 * listed only when it is yielded, so a pass sees the tree as it is at that
 * moment. Symlinked directories are not followed.
 */
class TreeWalker {
public:
  // Throws TraversalError if root is missing or not a directory.
  explicit TreeWalker(std::filesystem::path root);

  // Next directory, or nullopt when the walk is done.
  // Throws TraversalError if a directory cannot be listed.
  std::optional<DirectoryVisit> next();

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

private:
  std::filesystem::path root_;
  std::vector<std::filesystem::path> pending_; // stack of relative paths
};

} // namespace treemirror
