#include "cli/workspace.hpp"
#include "objsplit/object.hpp"

#include <iostream>

int cmd_show(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: objsplit show <id>\n";
    return 2;
  }
  try {
    const auto store = objsplit::cli::open_store();
    const auto obj = store.read(objsplit::cli::id_arg(argv[1]));
    std::cout << objsplit::encode_header(obj.header);
    std::cout << "stored payload: " << obj.payload.size() << " bytes\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "show: " << e.what() << "\n";
    return 1;
  }
}
