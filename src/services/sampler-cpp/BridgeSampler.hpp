#pragma once

#include "AdbClient.hpp"
#include "BridgePathNegotiator.hpp"
#include "BridgeSettings.hpp"
#include "DiagnosticLog.hpp"
#include "FrameRateEstimator.hpp"
#include "FrameRateReader.hpp"
#include "MetricCollector.hpp"
#include "SampleConfig.hpp"
#include "StopSignal.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

enum class SamplerState {
    Idle,
    Sampling,
    Stopped
};

const char* SamplerStateName(SamplerState state);

// Composition layer the target renders into. Nothing discovers it yet; when
// set, its name seeds the frame-timeline layer filters.
struct LayerTrackingState {
    std::string layer;
};

struct SamplerTimings {
    std::chrono::milliseconds idlePause{2000};
    std::chrono::milliseconds minCyclePause{50};
    std::chrono::milliseconds collectTimeout{4000};
    std::chrono::milliseconds fpsPollStep{50};
    std::chrono::milliseconds fpsMaxWait{300};
    std::chrono::milliseconds fpsWarmupWait{500};
};

class BridgeSampler {
public:
    BridgeSampler(
        AdbClient adb,
        BridgeSettings settings,
        std::shared_ptr<FrameRateSource> frameRate,
        std::shared_ptr<DiagnosticLog> log,
        std::shared_ptr<StopSignal> stop,
        DeviceProfile profile = DeviceProfile(),
        SamplerTimings timings = SamplerTimings());
    ~BridgeSampler();

    BridgeSampler(const BridgeSampler&) = delete;
    BridgeSampler& operator=(const BridgeSampler&) = delete;

    // Loops until the stop signal fires. Returns the process exit code.
    int Run();

    // One iteration of the loop; returns how long to pause before the next.
    std::chrono::milliseconds RunCycle();

    // Best effort: creates the external metrics directory.
    void Prepare();

    SamplerState State() const;
    LayerTrackingState& Layer();

private:
    std::optional<SampleConfig> ResolveConfig();
    void ReportConfigProblem(const ConfigReadResult& read);
    void EnterIdle();
    std::chrono::milliseconds Sample(const SampleConfig& config, std::chrono::steady_clock::time_point cycleStart);
    void ReportWriteFailure(const RemoteError& error);

    AdbClient adb_;
    const BridgeSettings settings_;
    std::shared_ptr<FrameRateSource> frameRate_;
    std::shared_ptr<DiagnosticLog> log_;
    std::shared_ptr<StopSignal> stop_;
    const SamplerTimings timings_;

    BridgePathNegotiator negotiator_;
    LastGoodConfig lastGood_;
    LayerTrackingState layer_;
    std::string lastSignature_;
    SamplerState state_ = SamplerState::Idle;

    FpsCycleReader fpsReader_;
    MetricCollector collector_;
};
