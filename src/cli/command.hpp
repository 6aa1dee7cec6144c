#pragma once

namespace treemirror::cli {

// A subcommand handler; argv[0] is the subcommand name itself.
using command_fn = int (*)(int argc, char **argv);

} // namespace treemirror::cli
