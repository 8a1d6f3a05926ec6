#include "FrameRateReader.hpp"

#include "MetricParsers.hpp"

#include <algorithm>
#include <thread>
#include <utility>

namespace {
constexpr auto kGfxInfoTimeout = std::chrono::seconds(3);
constexpr int kProducingThreshold = 2;
} // namespace

LegacyFrameCounter::LegacyFrameCounter(AdbClient adb, std::shared_ptr<DiagnosticLog> log)
    : adb_(std::move(adb)),
      log_(std::move(log)) {}

std::optional<double> LegacyFrameCounter::Sample(const std::string& package, int64_t nowMs) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (disabled_) {
            return std::nullopt;
        }
    }

    std::string output;
    RemoteError error;
    long long total = 0;
    long long janky = 0;
    const bool ok = adb_.Shell({"dumpsys", "gfxinfo", package, "framestats"}, kGfxInfoTimeout, output, error)
        && ParseGfxTotals(output, total, janky);

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ok) {
        RecordFailure();
        return std::nullopt;
    }

    std::optional<double> fps;
    if (prevTotal_) {
        const int64_t deltaMs = std::max<int64_t>(1, nowMs - prevAtMs_);
        const long long deltaFrames = std::max(0LL, total - *prevTotal_);
        if (deltaFrames > 0) {
            failStreak_ = 0;
            fps = static_cast<double>(deltaFrames) * 1000.0 / static_cast<double>(deltaMs);
        } else {
            RecordFailure();
        }
    }
    prevTotal_ = total;
    prevAtMs_ = nowMs;
    return fps;
}

void LegacyFrameCounter::Reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    prevTotal_.reset();
    prevAtMs_ = 0;
    failStreak_ = 0;
    disabled_ = false;
}

bool LegacyFrameCounter::Disabled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disabled_;
}

// Caller holds mutex_.
void LegacyFrameCounter::RecordFailure() {
    ++failStreak_;
    if (failStreak_ >= kMaxFailures && !disabled_) {
        disabled_ = true;
        if (log_) {
            log_->Log(LogTag::Info, "gfxinfo frame counter keeps failing, disabled for this session (normal for Vulkan/GL-less renderers)");
        }
    }
}

FpsCycleReader::FpsCycleReader(
    const FrameRateSource& source,
    AdbClient adb,
    std::shared_ptr<DiagnosticLog> log,
    std::chrono::milliseconds pollStep,
    std::chrono::milliseconds maxWait,
    std::chrono::milliseconds warmupWait)
    : source_(source),
      legacy_(std::move(adb), std::move(log)),
      pollStep_(pollStep),
      maxWait_(maxWait),
      warmupWait_(warmupWait) {}

std::optional<double> FpsCycleReader::Read(const std::string& package, int64_t nowMs) {
    if (!producing_ && source_.SampleCount() >= kProducingThreshold) {
        producing_ = true;
    }

    if (producing_) {
        const FpsReading reading = source_.ReadLatest();
        if (IsFresh(reading)) {
            return Consume(reading);
        }
        if (auto fresh = PollSource(maxWait_)) {
            return fresh;
        }

        // Between two readings; the previous value still describes the app.
        const FpsReading stale = source_.ReadLatest();
        if (stale.fps && *stale.fps >= 0.0) {
            return std::max(0.0, *stale.fps);
        }
        return std::nullopt;
    }

    if (auto legacy = legacy_.Sample(package, nowMs)) {
        return legacy;
    }

    const FpsReading reading = source_.ReadLatest();
    if (IsFresh(reading)) {
        return Consume(reading);
    }
    return PollSource(warmupWait_);
}

void FpsCycleReader::Reset() {
    producing_ = false;
    lastConsumedAtMs_ = 0;
    legacy_.Reset();
}

bool FpsCycleReader::SourceProducing() const {
    return producing_;
}

const LegacyFrameCounter& FpsCycleReader::Legacy() const {
    return legacy_;
}

bool FpsCycleReader::IsFresh(const FpsReading& reading) const {
    return reading.fps && *reading.fps >= 0.0 && reading.atMs > lastConsumedAtMs_;
}

std::optional<double> FpsCycleReader::Consume(const FpsReading& reading) {
    lastConsumedAtMs_ = reading.atMs;
    return std::max(0.0, *reading.fps);
}

std::optional<double> FpsCycleReader::PollSource(std::chrono::milliseconds wait) {
    const auto step = std::max(std::chrono::milliseconds(1), pollStep_);
    for (auto waited = std::chrono::milliseconds(0); waited < wait; waited += step) {
        std::this_thread::sleep_for(step);
        const FpsReading reading = source_.ReadLatest();
        if (IsFresh(reading)) {
            return Consume(reading);
        }
    }
    return std::nullopt;
}
