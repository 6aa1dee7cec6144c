#include "treemirror/engine.hpp"
#include "treemirror/error.hpp"

#include <spdlog/sinks/null_sink.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using treemirror::Decision;
using treemirror::EntryKind;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static bool has(const std::vector<treemirror::PlannedChange> &xs, Decision d, EntryKind k,
                std::string_view path) {
  for (auto &c : xs)
    if (c.decision == d && c.kind == k && c.path == path)
      return true;
  return false;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("treemirror_plan_" + std::to_string(std::random_device{}()));
  const fs::path src = root / "source";
  const fs::path dst = root / "replica";

  try {
    auto logger = std::make_shared<spdlog::logger>(
        "plan", std::make_shared<spdlog::sinks::null_sink_mt>());
    treemirror::Engine eng{treemirror::Config{.source = src,
                                              .replica = dst,
                                              .fingerprint =
                                                  treemirror::FingerprintFunction::create("crc32")},
                           logger};

    write_file(src / "a.txt", "A");
    write_file(src / "d" / "b.txt", "B");

    // 1) Nothing mirrored yet: everything is Create, nothing is written
    {
      const auto plan = eng.plan();
      if (!has(plan, Decision::Create, EntryKind::Directory, ".") ||
          !has(plan, Decision::Create, EntryKind::File, "a.txt") ||
          !has(plan, Decision::Create, EntryKind::Directory, "d") ||
          !has(plan, Decision::Create, EntryKind::File, "d/b.txt") || plan.size() != 4) {
        std::cerr << "initial plan mismatch (" << plan.size() << " entries)\n";
        return 1;
      }
      if (fs::exists(dst)) {
        std::cerr << "plan created the replica\n";
        return 1;
      }
    }

    // 2) After a pass the plan is empty
    if (!eng.run_one_pass().complete()) {
      std::cerr << "pass aborted\n";
      return 1;
    }
    if (!eng.plan().empty()) {
      std::cerr << "plan after pass should be empty\n";
      return 1;
    }

    // 3) Update, delete, and a file/dir swap
    write_file(src / "a.txt", "A2");
    write_file(dst / "d" / "extra.txt", "x");
    fs::remove(src / "d" / "b.txt");
    fs::remove(src / "d");
    write_file(src / "d", "d is a file now");
    {
      const auto plan = eng.plan();
      if (!has(plan, Decision::Update, EntryKind::File, "a.txt")) {
        std::cerr << "expected Update a.txt\n";
        return 1;
      }
      if (!has(plan, Decision::Delete, EntryKind::Directory, "d") ||
          !has(plan, Decision::Create, EntryKind::File, "d")) {
        std::cerr << "expected Delete d/ then Create d\n";
        return 1;
      }
      if (has(plan, Decision::Delete, EntryKind::File, "d/extra.txt")) {
        std::cerr << "entries below a deleted directory should not be listed\n";
        return 1;
      }
      if (!fs::is_directory(dst / "d") || !fs::exists(dst / "d" / "extra.txt")) {
        std::cerr << "plan mutated the replica\n";
        return 1;
      }
    }

    // Applying the pass realises exactly that plan
    const auto rep = eng.run_one_pass();
    if (!rep.complete() || rep.files_updated != 1 || rep.entries_deleted != 1 ||
        rep.files_created != 1) {
      std::cerr << "pass did not match the plan\n";
      return 1;
    }
    if (!eng.plan().empty()) {
      std::cerr << "plan after second pass should be empty\n";
      return 1;
    }

    // 4) Replica root occupied by a file
    fs::remove_all(dst);
    write_file(dst, "file");
    bool threw = false;
    try {
      (void)eng.plan();
    } catch (const treemirror::StructureError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "plan over a file replica root should throw StructureError\n";
      return 1;
    }

    std::cout << "plan OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
