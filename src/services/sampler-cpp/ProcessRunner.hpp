#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <vector>

struct ProcessResult {
    bool launched = false;
    bool timedOut = false;
    int exitCode = -1;
    std::string out;
    std::string err;
};

// argv[0] is resolved through PATH. input, when non-null, is written to the child's stdin.
using ProcessRunner = std::function<ProcessResult(
    const std::vector<std::string>& argv,
    const std::string* input,
    std::chrono::milliseconds timeout)>;

ProcessResult RunProcess(
    const std::vector<std::string>& argv,
    const std::string* input,
    std::chrono::milliseconds timeout);

std::string FindExecutableOnPath(const std::string& name);
