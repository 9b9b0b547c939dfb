#pragma once

// Parses the tilecut command line and runs one split. Markup goes to stdout
// (unless redirected), diagnostics to stderr. Returns the process exit code.
int run_tilecut(int argc, char** argv);
