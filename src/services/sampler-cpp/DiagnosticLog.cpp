#include "DiagnosticLog.hpp"

#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <utility>

namespace {
constexpr size_t kMaxThrottleEntries = 512;

std::string FormatClock() {
    const auto now = std::chrono::system_clock::now();
    const auto nowTime = std::chrono::system_clock::to_time_t(now);
    std::tm localTime = {};
    localtime_r(&nowTime, &localTime);

    std::ostringstream output;
    output << std::put_time(&localTime, "%H:%M:%S");
    return output.str();
}

void WriteToConsole(LogTag tag, const std::string& line) {
    if (tag == LogTag::Err || tag == LogTag::Warn) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}
} // namespace

const char* LogTagName(LogTag tag) {
    switch (tag) {
        case LogTag::Ok:
            return "OK";
        case LogTag::Info:
            return "INFO";
        case LogTag::Warn:
            return "WARN";
        case LogTag::Err:
            return "ERR";
        case LogTag::Wait:
            return "WAIT";
        case LogTag::Cfg:
            return "CFG";
        case LogTag::Sample:
            return "SAMPLE";
    }
    return "LOG";
}

DiagnosticLog::DiagnosticLog(Sink sink)
    : sink_(sink ? std::move(sink) : Sink(WriteToConsole)) {}

void DiagnosticLog::Log(LogTag tag, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    Emit(tag, message);
}

bool DiagnosticLog::LogThrottled(
    LogTag tag,
    const std::string& message,
    std::chrono::milliseconds minInterval,
    const std::string& key) {
    if (message.empty()) {
        return false;
    }

    const std::string throttleKey = std::string(LogTagName(tag)) + "|" + (key.empty() ? message : key);
    const auto now = std::chrono::steady_clock::now();

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = lastEmitted_.find(throttleKey);
    if (it != lastEmitted_.end() && now - it->second < minInterval) {
        return false;
    }

    if (it == lastEmitted_.end() && lastEmitted_.size() >= kMaxThrottleEntries) {
        lastEmitted_.clear();
    }
    lastEmitted_[throttleKey] = now;
    Emit(tag, message);
    return true;
}

bool DiagnosticLog::LogThrottled(LogTag tag, const std::string& message) {
    return LogThrottled(tag, message, DefaultInterval(tag));
}

std::chrono::milliseconds DiagnosticLog::DefaultInterval(LogTag tag) {
    switch (tag) {
        case LogTag::Wait:
            return std::chrono::seconds(30);
        case LogTag::Err:
        case LogTag::Warn:
            return std::chrono::seconds(5);
        case LogTag::Sample:
        case LogTag::Cfg:
        case LogTag::Info:
        case LogTag::Ok:
            return std::chrono::milliseconds(1500);
    }
    return std::chrono::milliseconds(1500);
}

void DiagnosticLog::Emit(LogTag tag, const std::string& message) {
    std::ostringstream line;
    line << FormatClock() << " [" << LogTagName(tag) << "] " << message;
    sink_(tag, line.str());
}
