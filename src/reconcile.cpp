#include "treemirror/reconcile.hpp"

#include "treemirror/error.hpp"
#include "treemirror/fs.hpp"

namespace treemirror {

Decision classify_file(const std::filesystem::path &source, const std::filesystem::path &replica,
                       const FingerprintFunction &fingerprint) {
  if (fs::entry_type(replica) != fs::EntryType::File)
    return Decision::Create;
  return fingerprint.file(source) == fingerprint.file(replica) ? Decision::Unchanged
                                                               : Decision::Update;
}

ReconcileResult reconcile_file(const std::filesystem::path &source,
                               const std::filesystem::path &replica,
                               const FingerprintFunction &fingerprint) {
  switch (fs::entry_type(replica)) {
  case fs::EntryType::Missing:
    return {.decision = Decision::Create, .bytes = fs::copy_file_atomic(source, replica)};
  case fs::EntryType::File:
    break;
  case fs::EntryType::Directory:
  case fs::EntryType::Other:
    throw ReconcileError("reconcile", replica, "exists but is not a regular file");
  }

  if (fingerprint.file(source) == fingerprint.file(replica))
    return {.decision = Decision::Unchanged};
  return {.decision = Decision::Update, .bytes = fs::copy_file_atomic(source, replica)};
}

} // namespace treemirror
