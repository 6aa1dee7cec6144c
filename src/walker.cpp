#include "treemirror/walker.hpp"

#include "treemirror/error.hpp"
#include "treemirror/fs.hpp"

namespace treemirror {

TreeWalker::TreeWalker(std::filesystem::path root) : root_(std::move(root)) {
  std::error_code ec;
  const auto st = std::filesystem::status(root_, ec);
  if (ec || !std::filesystem::exists(st)) {
    throw TraversalError("open source root", root_,
                         ec ? ec : std::make_error_code(std::errc::no_such_file_or_directory));
  }
  if (!std::filesystem::is_directory(st)) {
    throw TraversalError("open source root", root_,
                         std::make_error_code(std::errc::not_a_directory));
  }
  pending_.emplace_back();
}

std::optional<DirectoryVisit> TreeWalker::next() {
  if (pending_.empty())
    return std::nullopt;

  DirectoryVisit visit;
  visit.relative = std::move(pending_.back());
  pending_.pop_back();

  const auto abs = visit.relative.empty() ? root_ : root_ / visit.relative;
  try {
    auto listing = fs::list_dir(abs);
    visit.dirs = std::move(listing.dirs);
    visit.files = std::move(listing.files);
    visit.skipped = std::move(listing.others);
  } catch (const std::filesystem::filesystem_error &e) {
    throw TraversalError("list directory", abs, e.code());
  }

  // reverse push so children come off the stack in name order
  for (auto it = visit.dirs.rbegin(); it != visit.dirs.rend(); ++it)
    pending_.push_back(visit.relative / *it);
  return visit;
}

} // namespace treemirror
