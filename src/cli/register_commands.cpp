#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_put(int argc, char **argv);
int cmd_cat(int, char **);
int cmd_show(int, char **);
int cmd_verify(int, char **);

namespace objsplit::cli {

void register_all_commands() {
  register_command("init", ::cmd_init, "Create a store here: objsplit init [max_object_size]");
  register_command("put", ::cmd_put, "Split a file into the store: objsplit put <file> [key=value]...");
  register_command("cat", ::cmd_cat, "Write an object's payload to stdout: objsplit cat <id>");
  register_command("show", ::cmd_show, "Print an object's header: objsplit show <id>");
  register_command("verify", ::cmd_verify, "Check every chunk of an object: objsplit verify <id>");
}

} // namespace objsplit::cli
