#pragma once
#include <string>
#include "cli/command.hpp"

namespace objsplit::cli {

void register_command(const std::string& name, command_fn fn, const std::string& help);
command_fn find_command(const std::string& name);
void print_usage();

// Look up argv[1] and run it; 2 on a usage error.
int dispatch(int argc, char** argv);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace objsplit::cli
