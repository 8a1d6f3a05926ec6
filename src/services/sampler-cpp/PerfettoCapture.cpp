#include "PerfettoCapture.hpp"

#include <algorithm>
#include <sstream>
#include <thread>
#include <utility>

namespace {
constexpr auto kHousekeepingTimeout = std::chrono::seconds(3);
constexpr auto kCopyTimeout = std::chrono::seconds(5);
constexpr int kCaptureSlackMs = 10000;
constexpr const char* kFallbackTraceDir = "/data/misc/perfetto-traces";

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}
} // namespace

PerfettoCapture::PerfettoCapture(AdbClient adb, std::chrono::milliseconds tracedSettleDelay)
    : adb_(std::move(adb)),
      tracedSettleDelay_(tracedSettleDelay) {}

bool PerfettoCapture::Capture(const std::string& remoteOut, int durationMs, RemoteError& outError) const {
    const int duration = std::max(kMinDurationMs, durationMs);
    const std::string config = BuildTraceConfig(duration);

    RemoveRemoteFile(remoteOut);
    EnsureTracedEnabled();

    RemoteError lastError;
    for (const char* binary : {"perfetto", "cmd perfetto"}) {
        RemoteError error;
        if (RunCapture(BuildCaptureCommand(binary, remoteOut), config, duration, error)) {
            return true;
        }
        lastError = error;

        if (error.kind == ErrorKind::PermissionDenied) {
            const std::string fallbackOut = FallbackOutputPath();
            RemoveRemoteFile(fallbackOut);

            RemoteError fallbackError;
            if (!RunCapture(BuildCaptureCommand(binary, fallbackOut), config, duration, fallbackError)) {
                lastError = fallbackError;
                break;
            }

            std::string output;
            RemoteError copyError;
            if (!adb_.Shell({"cp", fallbackOut, remoteOut}, kCopyTimeout, output, copyError)) {
                adb_.TryShell({"ln", "-sf", fallbackOut, remoteOut}, kHousekeepingTimeout);
            }
            return true;
        }

        if (error.kind != ErrorKind::NotFound) {
            break;
        }
    }

    outError = lastError;
    if (outError.message.empty()) {
        outError.kind = ErrorKind::RemoteFailure;
        outError.message = "perfetto/cmd perfetto capture failed";
    }
    return false;
}

std::string PerfettoCapture::FallbackOutputPath() const {
    return std::string(kFallbackTraceDir) + "/pm_ft_" + SafeSerial(adb_.Serial()) + ".perfetto-trace";
}

std::string PerfettoCapture::BuildTraceConfig(int durationMs) {
    const int duration = std::max(kMinDurationMs, durationMs);
    std::ostringstream config;
    config << "buffers: {\n"
           << "  size_kb: 32768\n"
           << "  fill_policy: RING_BUFFER\n"
           << "}\n"
           << "data_sources: {\n"
           << "  config {\n"
           << "    name: \"android.surfaceflinger.frametimeline\"\n"
           << "  }\n"
           << "}\n"
           << "data_sources: {\n"
           << "  config {\n"
           << "    name: \"android.surfaceflinger.frame\"\n"
           << "  }\n"
           << "}\n"
           << "data_sources: {\n"
           << "  config {\n"
           << "    name: \"linux.ftrace\"\n"
           << "    ftrace_config {\n"
           << "      atrace_categories: \"view\"\n"
           << "      atrace_categories: \"gfx\"\n"
           << "    }\n"
           << "  }\n"
           << "}\n"
           << "duration_ms: " << duration << "\n"
           << "write_into_file: true\n"
           << "flush_period_ms: 500\n"
           << "file_write_period_ms: " << std::max(500, duration / 2) << "\n";
    return config.str();
}

std::string PerfettoCapture::BuildCaptureCommand(const std::string& binary, const std::string& remoteOut) {
    return binary + " --txt -c - -o " + AdbClient::ShellSingleQuote(remoteOut);
}

std::string PerfettoCapture::SafeSerial(const std::string& serial) {
    std::string safe = serial;
    std::replace(safe.begin(), safe.end(), ':', '_');
    std::replace(safe.begin(), safe.end(), '/', '_');
    return safe;
}

bool PerfettoCapture::RunCapture(
    const std::string& command,
    const std::string& config,
    int durationMs,
    RemoteError& outError) const {
    std::string output;
    return adb_.Shell(
        {"sh", "-c", AdbClient::ShellDoubleQuote(command)},
        std::chrono::milliseconds(durationMs + kCaptureSlackMs),
        output,
        outError,
        &config);
}

// Best effort: traced stays off on some builds until the property is set.
void PerfettoCapture::EnsureTracedEnabled() const {
    std::string output;
    RemoteError error;
    if (!adb_.Shell({"getprop", "persist.traced.enable"}, kHousekeepingTimeout, output, error)) {
        return;
    }
    if (Trim(output) == "1") {
        return;
    }

    if (adb_.Shell({"setprop", "persist.traced.enable", "1"}, kHousekeepingTimeout, output, error)
        && tracedSettleDelay_.count() > 0) {
        std::this_thread::sleep_for(tracedSettleDelay_);
    }
}

void PerfettoCapture::RemoveRemoteFile(const std::string& path) const {
    adb_.TryShell({"rm", "-f", path}, kHousekeepingTimeout);
}
