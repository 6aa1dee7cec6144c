#include "treemirror/fs.hpp"

#include "treemirror/consts.hpp"
#include "treemirror/error.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <random>

namespace treemirror::fs {

namespace sfs = std::filesystem;

EntryType entry_type(const sfs::path &p) {
  std::error_code ec;
  const auto st = sfs::symlink_status(p, ec);
  if (ec || !sfs::exists(st))
    return EntryType::Missing;
  if (sfs::is_directory(st))
    return EntryType::Directory;
  if (sfs::is_regular_file(st))
    return EntryType::File;
  return EntryType::Other;
}

Listing list_dir(const sfs::path &dir) {
  Listing out;
  for (const auto &entry : sfs::directory_iterator(dir)) {
    auto name = entry.path().filename().string();
    const auto st = entry.symlink_status();
    if (sfs::is_directory(st))
      out.dirs.push_back(std::move(name));
    else if (sfs::is_regular_file(st))
      out.files.push_back(std::move(name));
    else
      out.others.push_back(std::move(name));
  }
  std::ranges::sort(out.dirs);
  std::ranges::sort(out.files);
  std::ranges::sort(out.others);
  return out;
}

// Unused path in the target's directory. The name length does not depend on
// the target's, and the path never names an existing entry.
static sfs::path staging_path_for(const sfs::path &target) {
  static thread_local std::mt19937 gen{std::random_device{}()};
  std::uniform_int_distribution<std::uint32_t> dist;
  for (int attempt = 0; attempt < consts::kStagingAttempts; ++attempt) {
    char id[9];
    std::snprintf(id, sizeof id, "%08x", static_cast<unsigned>(dist(gen)));
    auto candidate = target.parent_path() / (std::string(consts::kStagingPrefix) + id);
    if (entry_type(candidate) == EntryType::Missing)
      return candidate;
  }
  throw ReconcileError("pick staging name", target, "no free staging name");
}

// Rename the staging file over the target; on failure drop the staging file.
static void commit_temp(const sfs::path &tmp, const sfs::path &p) {
  std::error_code ec;
  sfs::rename(tmp, p, ec);
  if (ec) {
    std::error_code ignore;
    sfs::remove(tmp, ignore);
    throw ReconcileError("replace", p, ec);
  }
}

std::uintmax_t copy_file_atomic(const sfs::path &from, const sfs::path &to) {
  std::ifstream ifs(from, std::ios::binary);
  if (!ifs)
    throw ReconcileError("open source", from, "cannot open for read");

  const auto tmp = staging_path_for(to);
  std::uintmax_t total = 0;
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs)
      throw ReconcileError("open temp for write", tmp, "cannot open");

    auto fail = [&](std::string_view op, const sfs::path &where, std::string_view why) {
      ofs.close();
      std::error_code ignore;
      sfs::remove(tmp, ignore);
      throw ReconcileError(op, where, why);
    };

    std::vector<char> buf(consts::kChunkSize);
    while (ifs) {
      ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
      const auto got = ifs.gcount();
      if (got <= 0)
        break;
      ofs.write(buf.data(), got);
      if (!ofs)
        fail("write temp", tmp, "write failed");
      total += static_cast<std::uintmax_t>(got);
    }
    if (ifs.bad())
      fail("read source", from, "read failed");
    ofs.flush();
    if (!ofs)
      fail("flush temp", tmp, "write failed");
  }
  commit_temp(tmp, to);
  return total;
}

void remove_entry(const sfs::path &p) {
  std::error_code ec;
  sfs::remove_all(p, ec);
  if (ec)
    throw DeletionError("remove", p, ec);
}

} // namespace treemirror::fs
