#pragma once

namespace pipeline {

// Command-line entry point used by rfpos_run. Returns the process exit code
// (0 success, 1 runtime failure, 2 configuration error).
int RunPositioningCli(int argc, char** argv);

} // namespace pipeline
