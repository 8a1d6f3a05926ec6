#pragma once

#include "AdbClient.hpp"

#include <chrono>
#include <string>

// Records a short frame-timeline trace on the device into a file.
class PerfettoCapture {
public:
    static constexpr int kMinDurationMs = 800;

    explicit PerfettoCapture(AdbClient adb, std::chrono::milliseconds tracedSettleDelay = std::chrono::milliseconds(500));

    // Tries `perfetto` and then `cmd perfetto`. When the output location is
    // not writable the trace is recorded under FallbackOutputPath() and then
    // copied (or symlinked) to remoteOut.
    bool Capture(const std::string& remoteOut, int durationMs, RemoteError& outError) const;

    std::string FallbackOutputPath() const;

    static std::string BuildTraceConfig(int durationMs);
    static std::string BuildCaptureCommand(const std::string& binary, const std::string& remoteOut);
    static std::string SafeSerial(const std::string& serial);

private:
    bool RunCapture(const std::string& command, const std::string& config, int durationMs, RemoteError& outError) const;
    void EnsureTracedEnabled() const;
    void RemoveRemoteFile(const std::string& path) const;

    AdbClient adb_;
    std::chrono::milliseconds tracedSettleDelay_;
};
