#include "BridgeSettings.hpp"

std::string BridgeSettings::ExternalFilesDir() const {
    return "/sdcard/Android/data/" + packageName + "/files";
}

std::string BridgeSettings::ExternalConfigPath() const {
    return ExternalFilesDir() + "/" + configFileName;
}

std::string BridgeSettings::ExternalMetricsPath() const {
    return ExternalFilesDir() + "/" + metricsFileName;
}

// Relative to the app data directory that run-as switches into.
std::string BridgeSettings::SandboxedConfigPath() const {
    return "files/" + configFileName;
}

std::string BridgeSettings::SandboxedMetricsPath() const {
    return "files/" + metricsFileName;
}

BridgeSettings MakeBridgeSettings(const std::string& packageName) {
    BridgeSettings settings;
    if (!packageName.empty()) {
        settings.packageName = packageName;
    }
    return settings;
}
