#define _FILE_OFFSET_BITS 64

#include "itemstream/cat_command.hpp"
#include "itemstream/signals.hpp"

#include <cstdio>

int main(int argc, char **argv) {
    itemstream::InstallSignalHandlers();
    return itemstream::RunCatCommand(argc, argv, stdout);
}
