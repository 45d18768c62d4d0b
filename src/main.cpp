#include "cli/registry.hpp"

int main(int argc, char **argv) {
  objsplit::cli::register_all_commands(); // defined in register_commands.cpp
  return objsplit::cli::dispatch(argc, argv);
}
