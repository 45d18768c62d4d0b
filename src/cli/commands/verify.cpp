#include "cli/workspace.hpp"

#include <iostream>

int cmd_verify(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: objsplit verify <id>\n";
    return 2;
  }
  try {
    const auto store = objsplit::cli::open_store();
    const auto id = objsplit::cli::id_arg(argv[1]);
    const auto obj = store.read(id);
    const auto payload = store.read_payload(id);
    const std::size_t chunks = obj.header.children.empty() ? 1 : obj.header.children.size();
    std::cout << "OK " << payload.size() << " bytes in " << chunks << " chunk(s)\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "verify: FAILED: " << e.what() << "\n";
    return 1;
  }
}
