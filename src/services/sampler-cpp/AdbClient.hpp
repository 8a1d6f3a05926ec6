#pragma once

#include "ProcessRunner.hpp"

#include <chrono>
#include <string>
#include <vector>

enum class ErrorKind {
    None,
    Timeout,
    Unreachable,
    NotFound,
    PermissionDenied,
    NotDebuggable,
    RemoteFailure
};

const char* ErrorKindName(ErrorKind kind);

// Maps the raw diagnostic text of a failed remote command onto ErrorKind.
// Checked in this order, case-sensitive unless noted:
//   NotDebuggable     "not debuggable" (any case), or "run-as" + "debug" + "not"
//   PermissionDenied  "Permission denied", "errno: 13"
//   NotFound          "No such file or directory", "not found" (any case)
//   RemoteFailure     everything else
ErrorKind ClassifyRemoteFailure(const std::string& message);

struct RemoteError {
    ErrorKind kind = ErrorKind::None;
    std::string message;
    std::string command;

    // Message followed by the literal command that produced it.
    std::string Describe() const;
};

struct AdbDevice {
    std::string serial;
    std::string state;
};

class AdbClient {
public:
    AdbClient(std::string adbPath, std::string serial, ProcessRunner runner = ProcessRunner());

    bool Run(
        const std::vector<std::string>& args,
        std::chrono::milliseconds timeout,
        std::string& outStdout,
        RemoteError& outError,
        const std::string* input = nullptr) const;
    bool Shell(
        const std::vector<std::string>& args,
        std::chrono::milliseconds timeout,
        std::string& outStdout,
        RemoteError& outError,
        const std::string* input = nullptr) const;
    bool RunAs(
        const std::string& package,
        const std::vector<std::string>& args,
        std::chrono::milliseconds timeout,
        std::string& outStdout,
        RemoteError& outError,
        const std::string* input = nullptr) const;
    bool Pull(
        const std::string& remotePath,
        const std::string& localPath,
        std::chrono::milliseconds timeout,
        RemoteError& outError) const;

    // Fire-and-forget: the outcome is intentionally dropped.
    void TryShell(const std::vector<std::string>& args, std::chrono::milliseconds timeout) const;

    const std::string& Serial() const;
    const std::string& AdbPath() const;

    static std::vector<AdbDevice> ParseDeviceList(const std::string& devicesOutput);
    static std::string ShellDoubleQuote(const std::string& value);
    static std::string ShellSingleQuote(const std::string& value);

private:
    std::string adbPath_;
    std::string serial_;
    ProcessRunner runner_;
};
