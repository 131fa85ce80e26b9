#pragma once

#include "util/result.hpp"

#include <string>
#include <vector>

namespace tzupdater {

struct ProcessOutput {
    int exit_status = -1;   // -1 when killed by a signal
    std::string output;     // stdout and stderr interleaved
};

// Runs argv[0] (looked up through PATH) and blocks until it exits.
// A failure to start the program is reported as a failed Result carrying the
// exec errno; a program that ran and exited non-zero is an Ok Result.
Result RunProcess(const std::vector<std::string>& argv, ProcessOutput& out);

// PATH-style lookup of an executable file. `search_path` is a ':' list.
bool FindExecutable(const std::string& name, const std::string& search_path, std::string& out_path);

} // namespace tzupdater
