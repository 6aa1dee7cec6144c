#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace treemirror::fs {

// Kind of an entry as seen without following symlinks
enum class EntryType : std::uint8_t { Missing, Directory, File, Other };
EntryType entry_type(const std::filesystem::path& p);

// Immediate children of a directory, split by kind and sorted by name.
// Symlinks and special files land in `others`. Throws filesystem_error.
struct Listing {
  std::vector<std::string> dirs;
  std::vector<std::string> files;
  std::vector<std::string> others;
};
Listing list_dir(const std::filesystem::path& dir);

// Copy `from` into a fresh `.treemirror-XXXXXXXX` staging file beside `to`,
// then rename it over `to`.
// `to` keeps its old content if anything fails. Returns bytes copied.
std::uintmax_t copy_file_atomic(const std::filesystem::path& from, const std::filesystem::path& to);

// Remove a file, or a directory with everything below it
void remove_entry(const std::filesystem::path& p);

} // namespace treemirror::fs
