#include "treemirror/scheduler.hpp"

#include "treemirror/error.hpp"

#include <algorithm>
#include <csignal>
#include <thread>

namespace treemirror {

namespace {

constexpr std::chrono::milliseconds kWaitSlice{200};

std::atomic<bool> *g_stop_flag = nullptr;

void on_stop_signal(int /*sig*/) {
  if (g_stop_flag != nullptr)
    g_stop_flag->store(true);
}

} // namespace

Scheduler::Scheduler(Engine &engine, std::chrono::milliseconds interval,
                     std::shared_ptr<spdlog::logger> logger, const std::atomic<bool> &stop)
    : engine_(engine), interval_(interval), log_(std::move(logger)), stop_(stop) {
  if (interval_.count() <= 0)
    throw ConfigurationError("interval must be positive");
  if (!log_)
    throw ConfigurationError("scheduler needs a logger");
}

std::size_t Scheduler::run(std::size_t max_passes) {
  std::size_t passes = 0;
  while (!stop_.load()) {
    last_ = engine_.run_one_pass();
    ++passes;
    if (max_passes != 0 && passes >= max_passes)
      break;
    if (stop_.load())
      break;
    const auto secs = std::chrono::duration<double>(interval_).count();
    log_->info("Sleeping for {} seconds", secs);
    wait_interval();
  }
  if (stop_.load())
    log_->info("Stop requested, exiting after {} pass(es)", passes);
  return passes;
}

void Scheduler::wait_interval() const {
  const auto deadline = std::chrono::steady_clock::now() + interval_;
  while (!stop_.load()) {
    const auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return;
    std::this_thread::sleep_for(
        std::min<std::chrono::steady_clock::duration>(deadline - now, kWaitSlice));
  }
}

void install_stop_signals(std::atomic<bool> &flag) {
  g_stop_flag = &flag;
  std::signal(SIGINT, on_stop_signal);
  std::signal(SIGTERM, on_stop_signal);
}

} // namespace treemirror
