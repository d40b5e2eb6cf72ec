#ifndef POLYP_PROCESS_H
#define POLYP_PROCESS_H

#include <string>
#include <vector>

struct ProcessResult {
    int exit_code = -1;
    std::string out;
    std::string err;
};

// Runs argv[0] (looked up on PATH) with the given arguments and waits for it.
// Throws std::runtime_error if the child cannot be spawned.
ProcessResult run_process(const std::vector<std::string>& argv, const std::string& working_dir = "");

#endif
