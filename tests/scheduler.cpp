#include "treemirror/engine.hpp"
#include "treemirror/scheduler.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <sstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::size_t count(const std::string &hay, std::string_view needle) {
  std::size_t n = 0;
  for (auto pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + 1))
    ++n;
  return n;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("treemirror_sched_" + std::to_string(std::random_device{}()));
  const fs::path src = root / "source";
  const fs::path dst = root / "replica";

  try {
    std::ostringstream text;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(text);
    sink->set_pattern("%v");
    auto logger = std::make_shared<spdlog::logger>("sched", sink);

    write_file(src / "a.txt", "A");
    std::atomic<bool> stop{false};
    treemirror::Engine eng{treemirror::Config{.source = src,
                                              .replica = dst,
                                              .fingerprint =
                                                  treemirror::FingerprintFunction::create("md5")},
                           logger, &stop};

    // 1) Bounded run: passes happen back to back with a wait in between
    treemirror::Scheduler sched{eng, 10ms, logger, stop};
    if (const auto n = sched.run(3); n != 3) {
      std::cerr << "expected 3 passes, got " << n << "\n";
      return 1;
    }
    const auto log = text.str();
    if (count(log, "Synchronization started") != 3) {
      std::cerr << "expected 3 started events\n";
      return 1;
    }
    if (count(log, "Sleeping for") != 2) {
      std::cerr << "expected a wait between passes only\n";
      return 1;
    }
    if (!fs::exists(dst / "a.txt") || !sched.last_report().complete() ||
        sched.last_report().mutations() != 0) {
      std::cerr << "replica should be converged and the last pass a no-op\n";
      return 1;
    }

    // 2) An aborted pass does not end the loop; the next one retries
    fs::remove_all(src);
    text.str("");
    if (const auto n = sched.run(2); n != 2) {
      std::cerr << "aborted passes should not stop the loop\n";
      return 1;
    }
    if (sched.last_report().complete() || count(text.str(), "Synchronization failed") != 2) {
      std::cerr << "expected two failed passes\n";
      return 1;
    }
    write_file(src / "b.txt", "B");
    (void)sched.run(1);
    if (!sched.last_report().complete() || !fs::exists(dst / "b.txt") || fs::exists(dst / "a.txt")) {
      std::cerr << "recovery pass did not converge\n";
      return 1;
    }

    // 3) A raised stop flag ends the loop before the next pass
    stop = true;
    if (const auto n = sched.run(); n != 0) {
      std::cerr << "stopped scheduler ran " << n << " passes\n";
      return 1;
    }

    // 4) Stop raised during the wait ends an unbounded run promptly
    stop = false;
    treemirror::Scheduler slow{eng, 60s, logger, stop};
    std::atomic<bool> done{false};
    std::size_t passes = 0;
    std::thread runner([&] {
      passes = slow.run();
      done = true;
    });
    std::this_thread::sleep_for(100ms);
    stop = true;
    const auto stopped_at = std::chrono::steady_clock::now();
    runner.join();
    if (!done || passes != 1) {
      std::cerr << "unbounded run should stop after its first pass, ran " << passes << "\n";
      return 1;
    }
    // the wait is sliced at 200ms, so the stop is seen well before the interval ends
    if (std::chrono::steady_clock::now() - stopped_at > 2s) {
      std::cerr << "stop during the wait was not noticed promptly\n";
      return 1;
    }

    // 5) Non-positive intervals are rejected
    bool threw = false;
    try {
      treemirror::Scheduler bad{eng, 0ms, logger, stop};
    } catch (const std::exception &) {
      threw = true;
    }
    if (!threw) {
      std::cerr << "zero interval accepted\n";
      return 1;
    }

    std::cout << "scheduler OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
