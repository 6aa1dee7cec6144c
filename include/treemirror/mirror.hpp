#pragma once
#include <filesystem>

namespace treemirror {

// Make sure replica_root/relative exists as a directory, creating missing
// segments. Returns true if anything was created, false if it already existed.
// Throws StructureError if the path is taken by a non-directory or mkdir fails.
bool ensure_directory(const std::filesystem::path& replica_root,
                      const std::filesystem::path& relative);

} // namespace treemirror
