#pragma once

#include <string>

// Identity of the on-device monitor app and the bridge files it exchanges with
// the sampler. Built once at startup and handed to the sampler by value.
struct BridgeSettings {
    std::string packageName = "com.ikun.monitor";
    std::string configFileName = "pm_desktop_bridge_config.json";
    std::string metricsFileName = "pm_desktop_bridge_metrics.json";
    std::string samplerRevision = "perfbridge-1.4";

    std::string ExternalFilesDir() const;
    std::string ExternalConfigPath() const;
    std::string ExternalMetricsPath() const;
    std::string SandboxedConfigPath() const;
    std::string SandboxedMetricsPath() const;
};

BridgeSettings MakeBridgeSettings(const std::string& packageName);
