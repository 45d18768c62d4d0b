#pragma once

namespace objsplit::cli {

// Handler receives argv starting at the subcommand name.
using command_fn = int (*)(int argc, char **argv);

} // namespace objsplit::cli
