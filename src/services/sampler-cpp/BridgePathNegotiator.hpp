#pragma once

#include "AdbClient.hpp"
#include "BridgeSettings.hpp"
#include "SampleConfig.hpp"

#include <optional>
#include <string>
#include <vector>

enum class PathMode {
    Unknown,
    External,
    Sandboxed
};

const char* PathModeName(PathMode mode);

enum class ConfigSource {
    Missing,
    External,
    Sandboxed,
    NotDebuggable,
    Invalid,
    Error
};

const char* ConfigSourceName(ConfigSource source);

struct ConfigReadResult {
    std::optional<SampleConfig> config;
    ConfigSource source = ConfigSource::Missing;
    RemoteError error;
};

// Chooses between the public external-storage copy of the bridge files and the
// app-private copy reachable through run-as. Whichever path last worked is
// tried first; the other one is only probed when the cached path fails.
class BridgePathNegotiator {
public:
    BridgePathNegotiator(AdbClient adb, BridgeSettings settings);

    ConfigReadResult ReadConfig();
    bool WriteMetrics(const std::string& text, RemoteError* outError = nullptr);

    PathMode ConfigMode() const;
    PathMode MetricsMode() const;

private:
    static std::vector<PathMode> ProbeOrder(PathMode cached);
    static bool ShouldTryNextPath(ErrorKind kind);

    bool ReadFrom(PathMode mode, std::string& outText, RemoteError& outError) const;
    bool WriteTo(PathMode mode, const std::string& text, RemoteError& outError) const;

    AdbClient adb_;
    const BridgeSettings settings_;
    PathMode configMode_ = PathMode::Unknown;
    PathMode metricsMode_ = PathMode::Unknown;
};
