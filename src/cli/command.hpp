#pragma once

namespace jobtree::cli {

// Handlers get argv shifted so that argv[0] is the command name.
using command_fn = int (*)(int argc, char **argv);

} // namespace jobtree::cli
