#include "treemirror/mirror.hpp"

#include "treemirror/error.hpp"
#include "treemirror/fs.hpp"

namespace treemirror {

bool ensure_directory(const std::filesystem::path &replica_root,
                      const std::filesystem::path &relative) {
  const auto target = relative.empty() ? replica_root : replica_root / relative;
  switch (fs::entry_type(target)) {
  case fs::EntryType::Directory:
    return false;
  case fs::EntryType::Missing:
    break;
  case fs::EntryType::File:
  case fs::EntryType::Other:
    throw StructureError("ensure directory", target, "exists but is not a directory");
  }

  std::error_code ec;
  std::filesystem::create_directories(target, ec);
  if (ec)
    throw StructureError("create directory", target, ec);
  return true;
}

} // namespace treemirror
