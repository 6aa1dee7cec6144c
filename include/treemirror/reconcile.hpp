#pragma once
#include "treemirror/decision.hpp"
#include "treemirror/fingerprint.hpp"

#include <cstdint>
#include <filesystem>

namespace treemirror {

struct ReconcileResult {
  Decision decision;          // Create, Update or Unchanged
  std::uintmax_t bytes = 0;   // bytes written to the replica
};

// Decide what reconcile_file would do, without touching the replica.
// A replica path taken by a non-file counts as Create.
auto classify_file(const std::filesystem::path &source, const std::filesystem::path &replica,
                   const FingerprintFunction &fingerprint) -> Decision;

/**
 * Bring one replica file in line with its source file.
 *  - replica missing: copy the source in (Create)
 *  - fingerprints differ: replace the replica atomically (Update)
 *  - fingerprints equal: leave it alone (Unchanged)
 * Throws ReconcileError; on failure the replica file is either untouched or
 * absent, never half-written.
 */
auto reconcile_file(const std::filesystem::path &source, const std::filesystem::path &replica,
                    const FingerprintFunction &fingerprint) -> ReconcileResult;

} // namespace treemirror
