#include "TraceProcessorClient.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <utility>

#include <unistd.h>

namespace {
constexpr auto kQueryTimeout = std::chrono::seconds(20);

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

bool RejectsInlineQuery(const std::string& error) {
    std::string lower = error;
    std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return lower.find("unknown option") != std::string::npos
        || lower.find("unrecognized") != std::string::npos;
}

std::string WriteQueryFile(const std::string& sql) {
    std::error_code error;
    const auto dir = std::filesystem::temp_directory_path(error);
    if (error) {
        return {};
    }

    std::string pattern = (dir / "perfbridge-query-XXXXXX.sql").string();
    const int fd = ::mkstemps(pattern.data(), 4);
    if (fd < 0) {
        return {};
    }
    ::close(fd);

    std::ofstream output(pattern, std::ios::trunc);
    if (!output) {
        std::filesystem::remove(pattern, error);
        return {};
    }
    output << sql;
    output.close();
    if (!output) {
        std::filesystem::remove(pattern, error);
        return {};
    }
    return pattern;
}
} // namespace

TraceProcessorClient::TraceProcessorClient(std::string binaryPath, ProcessRunner runner)
    : binaryPath_(std::move(binaryPath)),
      runner_(runner ? std::move(runner) : ProcessRunner(RunProcess)) {}

bool TraceProcessorClient::Available() const {
    return !binaryPath_.empty();
}

const std::string& TraceProcessorClient::BinaryPath() const {
    return binaryPath_;
}

bool TraceProcessorClient::Query(
    const std::string& tracePath,
    const std::string& sql,
    std::string& outText,
    std::string& outError) const {
    if (!Available()) {
        outError = "trace_processor unavailable";
        return false;
    }

    if (RunQuery({binaryPath_, tracePath, "-Q", sql}, outText, outError)) {
        return true;
    }
    if (!RejectsInlineQuery(outError)) {
        return false;
    }

    const std::string queryFile = WriteQueryFile(sql);
    if (queryFile.empty()) {
        outError = "unable to write trace_processor query file";
        return false;
    }

    const bool ok = RunQuery({binaryPath_, tracePath, "-q", queryFile}, outText, outError);
    std::error_code error;
    std::filesystem::remove(queryFile, error);
    return ok;
}

std::string TraceProcessorClient::Resolve() {
    for (const char* name : {
             "PERFBRIDGE_TRACE_PROCESSOR",
             "TRACE_PROCESSOR",
             "TRACE_PROCESSOR_SHELL",
             "PERFETTO_TRACE_PROCESSOR",
         }) {
        const char* value = std::getenv(name);
        if (value == nullptr) {
            continue;
        }
        const std::string path = Trim(value);
        if (!path.empty() && ::access(path.c_str(), X_OK) == 0) {
            return path;
        }
    }

    for (const char* name : {"trace_processor", "trace_processor_shell"}) {
        const std::string found = FindExecutableOnPath(name);
        if (!found.empty()) {
            return found;
        }
    }
    return {};
}

bool TraceProcessorClient::RunQuery(
    const std::vector<std::string>& argv,
    std::string& outText,
    std::string& outError) const {
    outText.clear();
    outError.clear();

    const ProcessResult result = runner_(argv, nullptr, kQueryTimeout);
    if (!result.launched) {
        outError = "unable to execute " + binaryPath_ + (result.err.empty() ? "" : ": " + result.err);
        return false;
    }
    if (result.timedOut) {
        outError = "trace_processor query timed out";
        return false;
    }
    if (result.exitCode != 0) {
        outError = Trim(result.err);
        if (outError.empty()) {
            outError = Trim(result.out);
        }
        if (outError.empty()) {
            outError = "trace_processor exited with code " + std::to_string(result.exitCode);
        }
        return false;
    }

    outText = result.out;
    return true;
}
