#include "treemirror/consts.hpp"
#include "treemirror/error.hpp"
#include "treemirror/reconcile.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

static bool no_temp_left(const fs::path &dir) {
  for (const auto &e : fs::directory_iterator(dir))
    if (e.path().filename().string().starts_with(treemirror::consts::kStagingPrefix))
      return false;
  return true;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("treemirror_rec_" + std::to_string(std::random_device{}()));
  const fs::path src = root / "src";
  const fs::path dst = root / "dst";
  fs::create_directories(src);
  fs::create_directories(dst);

  try {
    const auto fp = treemirror::FingerprintFunction::create("sha256");

    // 1) Missing replica -> Create
    write_file(src / "a.txt", "hello");
    if (treemirror::classify_file(src / "a.txt", dst / "a.txt", fp) !=
        treemirror::Decision::Create) {
      std::cerr << "classify should say Create\n";
      return 1;
    }
    auto r = treemirror::reconcile_file(src / "a.txt", dst / "a.txt", fp);
    if (r.decision != treemirror::Decision::Create || r.bytes != 5 ||
        slurp(dst / "a.txt") != "hello") {
      std::cerr << "expected Create with content hello\n";
      return 1;
    }

    // 2) Equal content -> Unchanged, replica not rewritten
    const auto old_time = fs::file_time_type::clock::now() - std::chrono::hours(24);
    fs::last_write_time(dst / "a.txt", old_time);
    r = treemirror::reconcile_file(src / "a.txt", dst / "a.txt", fp);
    if (r.decision != treemirror::Decision::Unchanged || r.bytes != 0) {
      std::cerr << "expected Unchanged\n";
      return 1;
    }
    if (fs::last_write_time(dst / "a.txt") != old_time) {
      std::cerr << "Unchanged file was rewritten\n";
      return 1;
    }

    // 3) Different content (same size) -> Update
    write_file(dst / "a.txt", "world");
    if (treemirror::classify_file(src / "a.txt", dst / "a.txt", fp) !=
        treemirror::Decision::Update) {
      std::cerr << "classify should say Update\n";
      return 1;
    }
    r = treemirror::reconcile_file(src / "a.txt", dst / "a.txt", fp);
    if (r.decision != treemirror::Decision::Update || slurp(dst / "a.txt") != "hello") {
      std::cerr << "expected Update to hello\n";
      return 1;
    }
    if (fp.file(src / "a.txt") != fp.file(dst / "a.txt")) {
      std::cerr << "fingerprints differ after update\n";
      return 1;
    }

    // Replica longer than source is fully replaced, not overwritten in place
    write_file(dst / "a.txt", "hello, this is a much longer stale replica");
    (void)treemirror::reconcile_file(src / "a.txt", dst / "a.txt", fp);
    if (slurp(dst / "a.txt") != "hello") {
      std::cerr << "update left trailing bytes\n";
      return 1;
    }

    // Empty files work both ways
    write_file(src / "empty", "");
    r = treemirror::reconcile_file(src / "empty", dst / "empty", fp);
    if (r.decision != treemirror::Decision::Create || !fs::exists(dst / "empty") ||
        fs::file_size(dst / "empty") != 0) {
      std::cerr << "empty file not created\n";
      return 1;
    }

    // 4) Source vanished mid-pass -> ReconcileError, existing replica intact
    bool threw = false;
    try {
      (void)treemirror::reconcile_file(src / "gone.txt", dst / "a.txt", fp);
    } catch (const treemirror::ReconcileError &) {
      threw = true;
    }
    if (!threw || slurp(dst / "a.txt") != "hello") {
      std::cerr << "vanished source: expected ReconcileError and intact replica\n";
      return 1;
    }
    threw = false;
    try {
      (void)treemirror::reconcile_file(src / "gone.txt", dst / "new.txt", fp);
    } catch (const treemirror::ReconcileError &) {
      threw = true;
    }
    if (!threw || fs::exists(dst / "new.txt")) {
      std::cerr << "vanished source: expected ReconcileError and no replica file\n";
      return 1;
    }
    if (!no_temp_left(dst)) {
      std::cerr << "staging file left behind\n";
      return 1;
    }

    // 5) A directory where a file belongs is not silently overwritten
    fs::create_directories(dst / "d.txt");
    write_file(src / "d.txt", "data");
    threw = false;
    try {
      (void)treemirror::reconcile_file(src / "d.txt", dst / "d.txt", fp);
    } catch (const treemirror::ReconcileError &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "directory in place of file did not throw ReconcileError\n";
      return 1;
    }

    std::cout << "reconcile OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
