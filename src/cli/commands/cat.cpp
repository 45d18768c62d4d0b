#include "cli/workspace.hpp"

#include <iostream>

int cmd_cat(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: objsplit cat <id>\n";
    return 2;
  }
  try {
    const auto store = objsplit::cli::open_store();
    const auto payload = store.read_payload(objsplit::cli::id_arg(argv[1]));
    std::cout.write(reinterpret_cast<const char *>(payload.data()),
                    static_cast<std::streamsize>(payload.size()));
    std::cout.flush();
    return std::cout ? 0 : 1;
  } catch (const std::exception &e) {
    std::cerr << "cat: " << e.what() << "\n";
    return 1;
  }
}
