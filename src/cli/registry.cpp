#include "cli/registry.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <vector>

namespace objsplit::cli {

namespace {

struct entry {
  std::string name;
  command_fn fn;
  std::string help;
};

// Registration order is the order shown in the usage text.
std::vector<entry> &table() {
  static std::vector<entry> t;
  return t;
}

} // namespace

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  auto &t = table();
  const auto it = std::ranges::find(t, name, &entry::name);
  if (it != t.end()) {
    *it = entry{.name = name, .fn = fn, .help = help};
    return;
  }
  t.push_back(entry{.name = name, .fn = fn, .help = help});
}

command_fn find_command(const std::string &name) {
  const auto &t = table();
  const auto it = std::ranges::find(t, name, &entry::name);
  return it == t.end() ? nullptr : it->fn;
}

void print_usage() {
  std::size_t width = 0;
  for (const auto &e : table()) {
    width = std::max(width, e.name.size());
  }
  std::cerr << "usage: objsplit <command> [args]\n\n";
  std::cerr << "commands:\n";
  for (const auto &e : table()) {
    std::cerr << "  " << std::left << std::setw(static_cast<int>(width)) << e.name << "  "
              << e.help << "\n";
  }
}

int dispatch(int argc, char **argv) {
  if (argc < 2) {
    print_usage();
    return 2;
  }
  const std::string cmd = argv[1];
  const auto fn = find_command(cmd);
  if (!fn) {
    std::cerr << "unknown command: " << cmd << "\n";
    print_usage();
    return 2;
  }
  // Pass everything after the program name to the handler
  return fn(argc - 1, argv + 1);
}

} // namespace objsplit::cli
