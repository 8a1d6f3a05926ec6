#include "AdbClient.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace {
std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool Contains(const std::string& haystack, const char* needle) {
    return haystack.find(needle) != std::string::npos;
}

std::string RenderCommand(const std::vector<std::string>& args) {
    std::ostringstream command;
    command << "adb";
    for (const auto& arg : args) {
        command << ' ' << arg;
    }
    return command.str();
}

std::vector<std::string> Concat(std::vector<std::string> head, const std::vector<std::string>& tail) {
    head.insert(head.end(), tail.begin(), tail.end());
    return head;
}
} // namespace

const char* ErrorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:
            return "none";
        case ErrorKind::Timeout:
            return "timeout";
        case ErrorKind::Unreachable:
            return "unreachable";
        case ErrorKind::NotFound:
            return "not-found";
        case ErrorKind::PermissionDenied:
            return "permission-denied";
        case ErrorKind::NotDebuggable:
            return "not-debuggable";
        case ErrorKind::RemoteFailure:
            return "remote-failure";
    }
    return "unknown";
}

ErrorKind ClassifyRemoteFailure(const std::string& message) {
    const std::string lower = ToLower(message);
    if (Contains(lower, "not debuggable")
        || (Contains(lower, "run-as") && Contains(lower, "debug") && Contains(lower, "not"))) {
        return ErrorKind::NotDebuggable;
    }
    if (Contains(message, "Permission denied") || Contains(message, "errno: 13")) {
        return ErrorKind::PermissionDenied;
    }
    if (Contains(message, "No such file or directory") || Contains(lower, "not found")) {
        return ErrorKind::NotFound;
    }
    return ErrorKind::RemoteFailure;
}

std::string RemoteError::Describe() const {
    if (command.empty()) {
        return message;
    }
    return message + "\n\ncommand: " + command;
}

AdbClient::AdbClient(std::string adbPath, std::string serial, ProcessRunner runner)
    : adbPath_(std::move(adbPath)),
      serial_(std::move(serial)),
      runner_(runner ? std::move(runner) : ProcessRunner(RunProcess)) {}

bool AdbClient::Run(
    const std::vector<std::string>& args,
    std::chrono::milliseconds timeout,
    std::string& outStdout,
    RemoteError& outError,
    const std::string* input) const {
    outStdout.clear();
    outError = RemoteError{};

    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(adbPath_);
    argv.insert(argv.end(), args.begin(), args.end());

    const ProcessResult result = runner_(argv, input, timeout);
    if (!result.launched) {
        outError.kind = ErrorKind::Unreachable;
        outError.message = result.err.empty() ? "unable to execute adb" : "unable to execute adb: " + result.err;
        outError.command = RenderCommand(args);
        return false;
    }

    if (result.timedOut) {
        outError.kind = ErrorKind::Timeout;
        outError.message = "adb command timed out";
        outError.command = RenderCommand(args);
        return false;
    }

    if (result.exitCode != 0) {
        std::string raw = Trim(result.err);
        if (raw.empty()) {
            raw = Trim(result.out);
        }
        outError.message = raw.empty() ? "adb command failed" : raw;
        outError.kind = ClassifyRemoteFailure(outError.message);
        outError.command = RenderCommand(args);
        return false;
    }

    outStdout = result.out;
    return true;
}

bool AdbClient::Shell(
    const std::vector<std::string>& args,
    std::chrono::milliseconds timeout,
    std::string& outStdout,
    RemoteError& outError,
    const std::string* input) const {
    return Run(Concat({"-s", serial_, "shell"}, args), timeout, outStdout, outError, input);
}

bool AdbClient::RunAs(
    const std::string& package,
    const std::vector<std::string>& args,
    std::chrono::milliseconds timeout,
    std::string& outStdout,
    RemoteError& outError,
    const std::string* input) const {
    return Shell(Concat({"run-as", package}, args), timeout, outStdout, outError, input);
}

bool AdbClient::Pull(
    const std::string& remotePath,
    const std::string& localPath,
    std::chrono::milliseconds timeout,
    RemoteError& outError) const {
    std::string output;
    return Run({"-s", serial_, "pull", remotePath, localPath}, timeout, output, outError);
}

void AdbClient::TryShell(const std::vector<std::string>& args, std::chrono::milliseconds timeout) const {
    std::string output;
    RemoteError error;
    Shell(args, timeout, output, error);
}

const std::string& AdbClient::Serial() const {
    return serial_;
}

const std::string& AdbClient::AdbPath() const {
    return adbPath_;
}

std::vector<AdbDevice> AdbClient::ParseDeviceList(const std::string& devicesOutput) {
    std::vector<AdbDevice> devices;
    std::istringstream lines(devicesOutput);
    std::string line;
    while (std::getline(lines, line)) {
        line = Trim(line);
        if (line.empty() || line.rfind("List of devices", 0) == 0 || line.front() == '*') {
            continue;
        }

        std::istringstream fields(line);
        AdbDevice device;
        if (!(fields >> device.serial)) {
            continue;
        }
        if (!(fields >> device.state)) {
            continue;
        }
        devices.push_back(std::move(device));
    }
    return devices;
}

std::string AdbClient::ShellDoubleQuote(const std::string& value) {
    std::string quoted = "\"";
    for (char ch : value) {
        if (ch == '\\' || ch == '"' || ch == '$' || ch == '`') {
            quoted.push_back('\\');
        }
        quoted.push_back(ch);
    }
    quoted.push_back('"');
    return quoted;
}

std::string AdbClient::ShellSingleQuote(const std::string& value) {
    std::string quoted = "'";
    for (char ch : value) {
        if (ch == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(ch);
        }
    }
    quoted.push_back('\'');
    return quoted;
}
