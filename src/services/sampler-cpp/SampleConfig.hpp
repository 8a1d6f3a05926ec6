#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

struct SampleConfig {
    bool enabled = false;
    std::string targetPackage;
    int samplingMs = 1000;
    std::set<std::string> metricKeys;

    bool IsActive() const;
    // Stable text used to detect configuration changes between cycles.
    std::string Signature() const;
};

bool ParseSampleConfig(const std::string& text, SampleConfig& outConfig);

struct MetricSample {
    std::string targetPackage;
    int64_t timestampMs = 0;
    std::map<std::string, double> values;
};

std::string SerializeMetricSample(const MetricSample& sample);

// Holds the most recent active config across transient read failures.
class LastGoodConfig {
public:
    static constexpr int kMaxConsecutiveFailures = 10;

    void Remember(const SampleConfig& config);
    // Records one failed read. Returns the held config for up to
    // kMaxConsecutiveFailures failures in a row; the next one drops it.
    std::optional<SampleConfig> Hold();
    void Forget();

    bool HasConfig() const;
    int FailureStreak() const;

private:
    std::optional<SampleConfig> config_;
    int failureStreak_ = 0;
};
