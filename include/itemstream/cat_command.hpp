#pragma once
#include <cstdio>

namespace itemstream {

// itemstream-cat: prints the items of an input to out and keeps the position
// in a JSON state file. Returns the exit code: 0 done, 1 runtime failure,
// 2 usage error.
int RunCatCommand(int argc, char **argv, std::FILE *out);

} // namespace itemstream
