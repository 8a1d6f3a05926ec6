#include "SampleConfig.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>

namespace {
constexpr int kDefaultSamplingMs = 1000;

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

int ReadSamplingMs(const nlohmann::json& json) {
    if (!json.contains("samplingMs")) {
        return kDefaultSamplingMs;
    }

    const auto& value = json["samplingMs"];
    constexpr long long kMaxSamplingMs = 3600 * 1000;
    long long raw = 0;
    if (value.is_number_unsigned()) {
        raw = static_cast<long long>(std::min<unsigned long long>(value.get<unsigned long long>(), kMaxSamplingMs));
    } else if (value.is_number_integer()) {
        raw = value.get<long long>();
    } else if (value.is_number_float()) {
        const double asDouble = value.get<double>();
        if (!std::isfinite(asDouble)) {
            return kDefaultSamplingMs;
        }
        // Narrowed first: the conversion is undefined outside the long long range.
        const double bound = static_cast<double>(kMaxSamplingMs);
        raw = static_cast<long long>(std::clamp(asDouble, -bound, bound));
    } else {
        return kDefaultSamplingMs;
    }

    if (raw == 0) {
        return kDefaultSamplingMs;
    }
    return static_cast<int>(std::clamp<long long>(raw, 1, kMaxSamplingMs));
}
} // namespace

bool SampleConfig::IsActive() const {
    return enabled && !targetPackage.empty();
}

std::string SampleConfig::Signature() const {
    std::ostringstream signature;
    signature << (enabled ? "true" : "false") << '|' << targetPackage << '|';
    if (metricKeys.empty()) {
        signature << '-';
    }
    bool first = true;
    for (const auto& key : metricKeys) {
        if (!first) {
            signature << ',';
        }
        signature << key;
        first = false;
    }
    return signature.str();
}

bool ParseSampleConfig(const std::string& text, SampleConfig& outConfig) {
    const std::string trimmed = Trim(text);
    if (trimmed.empty()) {
        return false;
    }

    auto json = nlohmann::json::parse(trimmed, nullptr, false);
    if (json.is_discarded() || !json.is_object()) {
        return false;
    }

    SampleConfig config;
    if (json.contains("enabled")) {
        const auto& enabled = json["enabled"];
        if (enabled.is_boolean()) {
            config.enabled = enabled.get<bool>();
        } else if (enabled.is_number()) {
            config.enabled = enabled.get<double>() != 0.0;
        }
    }

    if (json.contains("targetPackage") && json["targetPackage"].is_string()) {
        config.targetPackage = Trim(json["targetPackage"].get<std::string>());
    }

    config.samplingMs = ReadSamplingMs(json);

    if (json.contains("metricKeys") && json["metricKeys"].is_array()) {
        for (const auto& item : json["metricKeys"]) {
            if (item.is_string()) {
                config.metricKeys.insert(item.get<std::string>());
            }
        }
    }

    outConfig = std::move(config);
    return true;
}

std::string SerializeMetricSample(const MetricSample& sample) {
    nlohmann::json values = nlohmann::json::object();
    for (const auto& [key, value] : sample.values) {
        if (std::isfinite(value)) {
            values[key] = value;
        }
    }

    nlohmann::json payload = {
        {"pkg", sample.targetPackage},
        {"t", sample.timestampMs},
        {"v", values}
    };
    return payload.dump();
}

void LastGoodConfig::Remember(const SampleConfig& config) {
    config_ = config;
    failureStreak_ = 0;
}

std::optional<SampleConfig> LastGoodConfig::Hold() {
    if (!config_) {
        return std::nullopt;
    }

    ++failureStreak_;
    if (failureStreak_ > kMaxConsecutiveFailures) {
        Forget();
        return std::nullopt;
    }
    return config_;
}

void LastGoodConfig::Forget() {
    config_.reset();
    failureStreak_ = 0;
}

bool LastGoodConfig::HasConfig() const {
    return config_.has_value();
}

int LastGoodConfig::FailureStreak() const {
    return failureStreak_;
}
