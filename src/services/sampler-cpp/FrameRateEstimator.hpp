#pragma once

#include "AdbClient.hpp"
#include "DiagnosticLog.hpp"
#include "FrameTimelineAnalyzer.hpp"
#include "TraceProcessorClient.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct FpsReading {
    std::optional<double> fps;
    int64_t atMs = 0;
    std::string detail;
};

struct FrameRateTarget {
    std::string targetPackage;
    std::string layerHint;
    std::vector<std::string> layerCandidates;
    bool enabled = false;

    bool IsActive() const;
};

// What the sampler needs from a background FPS producer.
class FrameRateSource {
public:
    virtual ~FrameRateSource() = default;

    virtual void Start() = 0;
    virtual void Stop() = 0;
    virtual void Configure(const FrameRateTarget& target) = 0;
    virtual FpsReading ReadLatest() const = 0;
    // Readings produced in the current session.
    virtual int SampleCount() const = 0;
};

enum class EstimatorMode {
    Waiting,
    Streaming,
    Offline
};

const char* EstimatorModeName(EstimatorMode mode);

struct FrameRateTimings {
    std::chrono::milliseconds waitPoll{500};
    std::chrono::milliseconds dumpInterval{1000};
    std::chrono::milliseconds offlinePause{300};
    std::chrono::milliseconds offlineErrorBackoff{2000};
    std::chrono::milliseconds tracedSettleDelay{500};
    std::chrono::milliseconds joinWindow{15000};
    int offlineCaptureMs = 1500;
};

// Background worker producing one FPS reading per interval. A session starts
// when the target becomes active: atrace streaming is tried first and demoted
// to offline Perfetto captures after repeated dump failures or empty windows.
// A session ends when the target is disabled; the next one starts from zero.
class FrameRateEstimator : public FrameRateSource {
public:
    static constexpr int kMaxDumpFailures = 5;
    static constexpr int kMaxEmptyWindows = 10;

    FrameRateEstimator(
        AdbClient adb,
        TraceProcessorClient traceProcessor,
        std::shared_ptr<DiagnosticLog> log,
        FrameRateTimings timings = FrameRateTimings());
    ~FrameRateEstimator() override;

    FrameRateEstimator(const FrameRateEstimator&) = delete;
    FrameRateEstimator& operator=(const FrameRateEstimator&) = delete;

    void Start() override;
    // Waits up to the join window, then abandons the worker with a warning.
    void Stop() override;
    void Configure(const FrameRateTarget& target) override;
    FpsReading ReadLatest() const override;
    int SampleCount() const override;

    EstimatorMode CurrentMode() const;

private:
    struct Worker;

    static void Run(const std::shared_ptr<Worker>& worker);

    std::shared_ptr<Worker> worker_;
    std::thread thread_;
};
