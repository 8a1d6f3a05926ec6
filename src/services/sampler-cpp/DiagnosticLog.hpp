#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

enum class LogTag {
    Ok,
    Info,
    Warn,
    Err,
    Wait,
    Cfg,
    Sample
};

const char* LogTagName(LogTag tag);

class DiagnosticLog {
public:
    // Receives fully formatted lines ("HH:MM:SS [TAG] message").
    using Sink = std::function<void(LogTag tag, const std::string& line)>;

    explicit DiagnosticLog(Sink sink = Sink());

    void Log(LogTag tag, const std::string& message);

    // Drops the line when the same key was emitted less than minInterval ago.
    // The key defaults to the message itself.
    bool LogThrottled(
        LogTag tag,
        const std::string& message,
        std::chrono::milliseconds minInterval,
        const std::string& key = std::string());
    bool LogThrottled(LogTag tag, const std::string& message);

    static std::chrono::milliseconds DefaultInterval(LogTag tag);

private:
    void Emit(LogTag tag, const std::string& message);

    Sink sink_;
    std::mutex mutex_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> lastEmitted_;
};
