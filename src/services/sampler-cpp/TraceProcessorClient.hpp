#pragma once

#include "ProcessRunner.hpp"

#include <chrono>
#include <string>
#include <vector>

// Runs SQL against a pulled trace file with the host trace_processor binary.
class TraceProcessorClient {
public:
    explicit TraceProcessorClient(std::string binaryPath, ProcessRunner runner = ProcessRunner());

    bool Available() const;
    const std::string& BinaryPath() const;

    // Uses `-Q <sql>`; binaries that reject -Q get the query through `-q <file>`.
    bool Query(const std::string& tracePath, const std::string& sql, std::string& outText, std::string& outError) const;

    // Environment overrides first, then trace_processor / trace_processor_shell on PATH.
    static std::string Resolve();

private:
    bool RunQuery(const std::vector<std::string>& argv, std::string& outText, std::string& outError) const;

    std::string binaryPath_;
    ProcessRunner runner_;
};
