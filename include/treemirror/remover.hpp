#pragma once
#include "treemirror/fs.hpp"
#include "treemirror/walker.hpp"

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace treemirror {

/**
 * Authoritative names of one source directory.
 * A replica child survives only if the source has a child of the same name
 * and the same kind; a directory where the source has a file (or the
 * reverse) is stale and gets replaced.
 */
class SourceNames {
public:
  explicit SourceNames(const DirectoryVisit &visit);

  [[nodiscard]] bool keeps(const std::string &name, fs::EntryType replica_type) const;

private:
  std::unordered_set<std::string> dirs_;
  std::unordered_set<std::string> files_;
};

struct StaleEntry {
  std::string name;
  fs::EntryType type;
};

// Immediate children of replica_dir that the source no longer has, in name
// order. Nothing is deleted. A missing replica_dir has no stale entries.
// Throws DeletionError if replica_dir cannot be listed.
std::vector<StaleEntry> find_stale(const std::filesystem::path &replica_dir,
                                   const SourceNames &names);

// Delete one stale entry; directories go with their whole subtree.
// Throws DeletionError.
void remove_stale(const std::filesystem::path &replica_dir, const StaleEntry &entry);

} // namespace treemirror
