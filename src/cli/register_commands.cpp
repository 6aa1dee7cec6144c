#include "cli/registry.hpp"

int cmd_sync(int argc, char **argv);
int cmd_once(int argc, char **argv);
int cmd_plan(int, char **);
int cmd_hash(int, char **);
int cmd_algorithms(int, char **);

namespace treemirror::cli {

void register_all_commands() {
  register_command("sync", {.fn = ::cmd_sync,
                            .args = "<source> <replica> <logfile> <interval> [algorithm]",
                            .summary = "Mirror source onto replica every <interval> seconds"});
  register_command("once", {.fn = ::cmd_once,
                            .args = "<source> <replica>",
                            .summary = "Run a single pass and exit (1 if it aborted)"});
  register_command("plan", {.fn = ::cmd_plan,
                            .args = "<source> <replica>",
                            .summary = "Show what a pass would change, without changing it"});
  register_command("hash", {.fn = ::cmd_hash,
                            .args = "<file>...",
                            .summary = "Print file fingerprints"});
  register_command("algorithms", {.fn = ::cmd_algorithms,
                                  .args = "",
                                  .summary = "List supported fingerprint algorithms"});
}

} // namespace treemirror::cli
