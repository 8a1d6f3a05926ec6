#include "BridgePathNegotiator.hpp"

#include <chrono>
#include <utility>

namespace {
constexpr auto kConfigReadTimeout = std::chrono::milliseconds(2500);
constexpr auto kMetricsWriteTimeout = std::chrono::milliseconds(3000);

std::string BuildOverwriteCommand(const std::string& path) {
    return "cat > " + AdbClient::ShellSingleQuote(path);
}
} // namespace

const char* PathModeName(PathMode mode) {
    switch (mode) {
        case PathMode::Unknown:
            return "unknown";
        case PathMode::External:
            return "external";
        case PathMode::Sandboxed:
            return "run-as";
    }
    return "unknown";
}

const char* ConfigSourceName(ConfigSource source) {
    switch (source) {
        case ConfigSource::Missing:
            return "missing";
        case ConfigSource::External:
            return "external";
        case ConfigSource::Sandboxed:
            return "run-as";
        case ConfigSource::NotDebuggable:
            return "run-as:not-debuggable";
        case ConfigSource::Invalid:
            return "invalid";
        case ConfigSource::Error:
            return "error";
    }
    return "unknown";
}

BridgePathNegotiator::BridgePathNegotiator(AdbClient adb, BridgeSettings settings)
    : adb_(std::move(adb)),
      settings_(std::move(settings)) {}

ConfigReadResult BridgePathNegotiator::ReadConfig() {
    ConfigReadResult result;
    const auto order = ProbeOrder(configMode_);

    for (size_t i = 0; i < order.size(); ++i) {
        std::string text;
        RemoteError error;
        if (ReadFrom(order[i], text, error)) {
            configMode_ = order[i];
            result.source = order[i] == PathMode::Sandboxed ? ConfigSource::Sandboxed : ConfigSource::External;

            SampleConfig config;
            if (ParseSampleConfig(text, config)) {
                result.config = std::move(config);
            } else {
                result.source = ConfigSource::Invalid;
            }
            return result;
        }

        const bool last = i + 1 == order.size();
        if (!last && ShouldTryNextPath(error.kind)) {
            continue;
        }

        result.error = error;
        switch (error.kind) {
            case ErrorKind::NotDebuggable:
                result.source = ConfigSource::NotDebuggable;
                break;
            case ErrorKind::NotFound:
                result.source = ConfigSource::Missing;
                break;
            default:
                result.source = ConfigSource::Error;
                break;
        }
        return result;
    }

    return result;
}

bool BridgePathNegotiator::WriteMetrics(const std::string& text, RemoteError* outError) {
    const auto order = ProbeOrder(metricsMode_);

    RemoteError lastError;
    for (size_t i = 0; i < order.size(); ++i) {
        RemoteError error;
        if (WriteTo(order[i], text, error)) {
            metricsMode_ = order[i];
            return true;
        }

        lastError = error;
        const bool last = i + 1 == order.size();
        if (!last && ShouldTryNextPath(error.kind)) {
            continue;
        }
        break;
    }

    if (outError != nullptr) {
        *outError = lastError;
    }
    return false;
}

PathMode BridgePathNegotiator::ConfigMode() const {
    return configMode_;
}

PathMode BridgePathNegotiator::MetricsMode() const {
    return metricsMode_;
}

std::vector<PathMode> BridgePathNegotiator::ProbeOrder(PathMode cached) {
    if (cached == PathMode::Sandboxed) {
        return {PathMode::Sandboxed, PathMode::External};
    }
    return {PathMode::External, PathMode::Sandboxed};
}

// Only a missing file or a permission wall moves on to the other path.
bool BridgePathNegotiator::ShouldTryNextPath(ErrorKind kind) {
    return kind == ErrorKind::NotFound || kind == ErrorKind::PermissionDenied;
}

bool BridgePathNegotiator::ReadFrom(PathMode mode, std::string& outText, RemoteError& outError) const {
    if (mode == PathMode::Sandboxed) {
        return adb_.RunAs(
            settings_.packageName,
            {"cat", settings_.SandboxedConfigPath()},
            kConfigReadTimeout,
            outText,
            outError);
    }

    return adb_.Shell({"cat", settings_.ExternalConfigPath()}, kConfigReadTimeout, outText, outError);
}

bool BridgePathNegotiator::WriteTo(PathMode mode, const std::string& text, RemoteError& outError) const {
    std::string output;
    if (mode == PathMode::Sandboxed) {
        const std::string command = BuildOverwriteCommand(settings_.SandboxedMetricsPath());
        return adb_.RunAs(
            settings_.packageName,
            {"sh", "-c", AdbClient::ShellDoubleQuote(command)},
            kMetricsWriteTimeout,
            output,
            outError,
            &text);
    }

    const std::string command = BuildOverwriteCommand(settings_.ExternalMetricsPath());
    return adb_.Shell(
        {"sh", "-c", AdbClient::ShellDoubleQuote(command)},
        kMetricsWriteTimeout,
        output,
        outError,
        &text);
}
