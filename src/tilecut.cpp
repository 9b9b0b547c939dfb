// tilecut.cpp
// MIT License (c) 2026 Pedro

#include "commands/tilecut_command.h"

int main(int argc, char** argv) {
    return run_tilecut(argc, argv);
}
