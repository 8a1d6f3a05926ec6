#pragma once

#include "AdbClient.hpp"
#include "DiagnosticLog.hpp"
#include "FrameRateEstimator.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Diffs the cumulative "Total frames rendered" counter of dumpsys gfxinfo.
// Three consecutive failures, zero-frame deltas included, disable it until
// the next Reset().
class LegacyFrameCounter {
public:
    static constexpr int kMaxFailures = 3;

    LegacyFrameCounter(AdbClient adb, std::shared_ptr<DiagnosticLog> log);

    std::optional<double> Sample(const std::string& package, int64_t nowMs);
    void Reset();
    bool Disabled() const;

private:
    void RecordFailure();

    AdbClient adb_;
    std::shared_ptr<DiagnosticLog> log_;
    mutable std::mutex mutex_;
    std::optional<long long> prevTotal_;
    int64_t prevAtMs_ = 0;
    int failStreak_ = 0;
    bool disabled_ = false;
};

// Produces the fps_app value for one sampling cycle. Until the background
// source has two readings in the session the legacy counter is polled first.
class FpsCycleReader {
public:
    FpsCycleReader(
        const FrameRateSource& source,
        AdbClient adb,
        std::shared_ptr<DiagnosticLog> log,
        std::chrono::milliseconds pollStep = std::chrono::milliseconds(50),
        std::chrono::milliseconds maxWait = std::chrono::milliseconds(300),
        std::chrono::milliseconds warmupWait = std::chrono::milliseconds(500));

    std::optional<double> Read(const std::string& package, int64_t nowMs);
    void Reset();

    bool SourceProducing() const;
    const LegacyFrameCounter& Legacy() const;

private:
    bool IsFresh(const FpsReading& reading) const;
    std::optional<double> Consume(const FpsReading& reading);
    std::optional<double> PollSource(std::chrono::milliseconds wait);

    const FrameRateSource& source_;
    LegacyFrameCounter legacy_;
    std::chrono::milliseconds pollStep_;
    std::chrono::milliseconds maxWait_;
    std::chrono::milliseconds warmupWait_;
    std::atomic<bool> producing_{false};
    std::atomic<int64_t> lastConsumedAtMs_{0};
};
