#include "cli/registry.hpp"

#include <algorithm>
#include <map>
#include <ostream>
#include <utility>

namespace treemirror::cli {

static std::map<std::string, CommandInfo> &table() {
  static std::map<std::string, CommandInfo> t;
  return t;
}

static void print_options(std::ostream &os) {
  os << "options: --config <file> --algorithm <name> --interval <seconds>\n"
        "         --log <file> --log-level <level>\n";
}

void register_command(const std::string &name, CommandInfo info) {
  table()[name] = std::move(info);
}

const CommandInfo *find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : &it->second;
}

void print_usage(std::ostream &os) {
  os << "usage: treemirror <command> [args]\n"
        "       treemirror help [command]\n\n"
        "commands:\n";
  std::size_t width = 0;
  for (const auto &[name, info] : table())
    width = std::max(width, name.size());
  for (const auto &[name, info] : table())
    os << "  " << name << std::string(width - name.size() + 2, ' ') << info.summary << "\n";
  os << "\n";
  print_options(os);
}

void print_command_usage(const std::string &name, std::ostream &os) {
  const auto *info = find_command(name);
  if (info == nullptr) {
    print_usage(os);
    return;
  }
  os << "usage: treemirror " << name;
  if (!info->args.empty())
    os << " " << info->args;
  os << "\n  " << info->summary << "\n";
  print_options(os);
}

} // namespace treemirror::cli
