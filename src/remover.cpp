#include "treemirror/remover.hpp"

#include "treemirror/error.hpp"

#include <algorithm>

namespace treemirror {

SourceNames::SourceNames(const DirectoryVisit &visit)
    : dirs_(visit.dirs.begin(), visit.dirs.end()), files_(visit.files.begin(), visit.files.end()) {}

bool SourceNames::keeps(const std::string &name, fs::EntryType replica_type) const {
  switch (replica_type) {
  case fs::EntryType::Directory:
    return dirs_.contains(name);
  case fs::EntryType::File:
    return files_.contains(name);
  case fs::EntryType::Missing:
  case fs::EntryType::Other:
    break;
  }
  return false;
}

std::vector<StaleEntry> find_stale(const std::filesystem::path &replica_dir,
                                   const SourceNames &names) {
  std::vector<StaleEntry> out;
  if (fs::entry_type(replica_dir) != fs::EntryType::Directory)
    return out;

  fs::Listing listing;
  try {
    listing = fs::list_dir(replica_dir);
  } catch (const std::filesystem::filesystem_error &e) {
    throw DeletionError("list replica directory", replica_dir, e.code());
  }

  auto collect = [&](const std::vector<std::string> &xs, fs::EntryType type) {
    for (const auto &name : xs)
      if (!names.keeps(name, type))
        out.push_back(StaleEntry{.name = name, .type = type});
  };
  collect(listing.dirs, fs::EntryType::Directory);
  collect(listing.files, fs::EntryType::File);
  collect(listing.others, fs::EntryType::Other);

  std::ranges::sort(out, {}, &StaleEntry::name);
  return out;
}

void remove_stale(const std::filesystem::path &replica_dir, const StaleEntry &entry) {
  fs::remove_entry(replica_dir / entry.name);
}

} // namespace treemirror
