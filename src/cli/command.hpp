#pragma once

namespace mergemaster::cli {

// Handler receives argv starting at the subcommand name
using command_fn = int (*)(int argc, char **argv);

} // namespace mergemaster::cli
