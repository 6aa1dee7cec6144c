#pragma once
#include <cstdint>
#include <string>

namespace treemirror {

// Transient per-entry classification; recomputed every pass, never stored
enum class Decision : std::uint8_t { Create, Update, Delete, Unchanged };

enum class EntryKind : std::uint8_t { Directory, File };

struct PlannedChange {
  Decision decision;
  EntryKind kind;
  std::string path; // replica-relative, generic separators
};

// One-letter code for listings: A(dd), M(odify), D(elete), ' ' unchanged
auto status_code(Decision d) -> char;

} // namespace treemirror
