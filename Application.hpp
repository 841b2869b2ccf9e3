#pragma once

#include <iostream>
#include <ostream>

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFileErrors = 1;
inline constexpr int kExitFatal = 2;

// The whole command: parses argv, loads the configuration, organizes every
// source directory and returns the process exit status. "move" lines, help
// and version go to `out`; diagnostics go to stderr.
int run_application(int argc, char* argv[], std::ostream& out = std::cout);
