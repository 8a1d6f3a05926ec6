#include "BridgeSampler.hpp"

#include "FrameEventParser.hpp"
#include "Tracing.hpp"

#include <algorithm>
#include <sstream>
#include <utility>
#include <vector>

namespace {
constexpr auto kMkdirTimeout = std::chrono::seconds(6);
constexpr auto kNotDebuggableInterval = std::chrono::seconds(4);
constexpr auto kWriteFailureInterval = std::chrono::seconds(3);

int64_t NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

template <typename Keys>
std::string JoinKeys(const Keys& keys) {
    if (keys.empty()) {
        return "-";
    }
    std::ostringstream joined;
    bool first = true;
    for (const auto& key : keys) {
        if (!first) {
            joined << ',';
        }
        joined << key;
        first = false;
    }
    return joined.str();
}
} // namespace

const char* SamplerStateName(SamplerState state) {
    switch (state) {
        case SamplerState::Idle:
            return "idle";
        case SamplerState::Sampling:
            return "sampling";
        case SamplerState::Stopped:
            return "stopped";
    }
    return "unknown";
}

BridgeSampler::BridgeSampler(
    AdbClient adb,
    BridgeSettings settings,
    std::shared_ptr<FrameRateSource> frameRate,
    std::shared_ptr<DiagnosticLog> log,
    std::shared_ptr<StopSignal> stop,
    DeviceProfile profile,
    SamplerTimings timings)
    : adb_(std::move(adb)),
      settings_(std::move(settings)),
      frameRate_(std::move(frameRate)),
      log_(log ? std::move(log) : std::make_shared<DiagnosticLog>()),
      stop_(stop ? std::move(stop) : std::make_shared<StopSignal>()),
      timings_(timings),
      negotiator_(adb_, settings_),
      fpsReader_(*frameRate_, adb_, log_, timings.fpsPollStep, timings.fpsMaxWait, timings.fpsWarmupWait),
      collector_(
          adb_,
          profile,
          [this](const std::string& package, int64_t nowMs) { return fpsReader_.Read(package, nowMs); },
          log_,
          timings.collectTimeout) {}

BridgeSampler::~BridgeSampler() {
    collector_.Shutdown();
}

int BridgeSampler::Run() {
    if (adb_.Serial().find_first_not_of(" \t\r\n") == std::string::npos) {
        log_->Log(LogTag::Err, "invalid device serial: '" + adb_.Serial() + "'");
        return 1;
    }

    Prepare();
    frameRate_->Start();
    log_->Log(LogTag::Ok, "sampler started serial=" + adb_.Serial()
        + " (waiting for the monitor app to start monitoring) rev=" + settings_.samplerRevision);

    while (!stop_->Requested()) {
        const auto pause = RunCycle();
        if (stop_->WaitFor(pause)) {
            break;
        }
    }

    state_ = SamplerState::Stopped;
    log_->Log(LogTag::Ok, "sampler stopped");
    frameRate_->Stop();
    collector_.Shutdown();
    return 0;
}

std::chrono::milliseconds BridgeSampler::RunCycle() {
    const auto cycleStart = std::chrono::steady_clock::now();
    const std::optional<SampleConfig> config = ResolveConfig();
    if (!config) {
        EnterIdle();
        return timings_.idlePause;
    }
    return Sample(*config, cycleStart);
}

void BridgeSampler::Prepare() {
    adb_.TryShell({"mkdir", "-p", settings_.ExternalFilesDir()}, kMkdirTimeout);
}

SamplerState BridgeSampler::State() const {
    return state_;
}

LayerTrackingState& BridgeSampler::Layer() {
    return layer_;
}

// An explicit disable drops the held config at once; failed reads keep it
// alive until LastGoodConfig gives up on it.
std::optional<SampleConfig> BridgeSampler::ResolveConfig() {
    ConfigReadResult read;
    {
        ScopedSpan span("sampler.config.read");
        read = negotiator_.ReadConfig();
        span.SetAttribute("sampler.config.source", ConfigSourceName(read.source));
        span.SetAttribute("sampler.config.mode", PathModeName(negotiator_.ConfigMode()));
        if (read.config) {
            span.MarkSuccess();
        }
    }

    if (read.config) {
        if (read.config->IsActive()) {
            lastGood_.Remember(*read.config);
            return read.config;
        }
        lastGood_.Forget();
        return std::nullopt;
    }

    ReportConfigProblem(read);
    return lastGood_.Hold();
}

void BridgeSampler::ReportConfigProblem(const ConfigReadResult& read) {
    switch (read.source) {
        case ConfigSource::NotDebuggable:
            log_->LogThrottled(
                LogTag::Err,
                "run-as unavailable: " + settings_.packageName + " is not a debuggable build.\n"
                    "      Install a debug build of the monitor app on this device and retry.",
                kNotDebuggableInterval);
            break;
        case ConfigSource::Error:
            log_->LogThrottled(LogTag::Err, "config read failed: " + read.error.Describe());
            break;
        case ConfigSource::Invalid:
            log_->LogThrottled(LogTag::Warn, "config file is not a valid JSON object");
            break;
        case ConfigSource::Missing:
        case ConfigSource::External:
        case ConfigSource::Sandboxed:
            break;
    }
}

void BridgeSampler::EnterIdle() {
    if (state_ == SamplerState::Sampling) {
        log_->Log(LogTag::Info, "monitoring stopped on the device, sampler idle");
    }
    log_->LogThrottled(LogTag::Wait, "waiting for the device to start monitoring");

    frameRate_->Configure(FrameRateTarget());
    fpsReader_.Reset();
    collector_.ResetRateState();
    layer_ = LayerTrackingState();
    lastSignature_.clear();
    state_ = SamplerState::Idle;
}

std::chrono::milliseconds BridgeSampler::Sample(
    const SampleConfig& config,
    std::chrono::steady_clock::time_point cycleStart) {
    state_ = SamplerState::Sampling;

    ScopedSpan span("sampler.cycle");
    span.SetAttribute("sampler.package", config.targetPackage);
    span.SetAttribute("sampler.keys_wanted", static_cast<int64_t>(config.metricKeys.size()));

    const std::string signature = config.Signature();
    if (signature != lastSignature_) {
        lastSignature_ = signature;
        log_->Log(LogTag::Cfg, "enabled=" + std::string(config.enabled ? "true" : "false")
            + " pkg=" + config.targetPackage + " keys=" + JoinKeys(config.metricKeys));
    }

    FrameRateTarget target;
    target.targetPackage = config.targetPackage;
    target.layerHint = layer_.layer;
    target.layerCandidates = layer_.layer.empty()
        ? std::vector<std::string>{config.targetPackage}
        : BuildLayerCandidates(layer_.layer, config.targetPackage);
    target.enabled = true;
    frameRate_->Configure(target);

    MetricSample sample;
    sample.targetPackage = config.targetPackage;
    sample.timestampMs = NowMs();
    sample.values = collector_.Collect({config.targetPackage, config.metricKeys, sample.timestampMs});
    span.SetAttribute("sampler.keys_got", static_cast<int64_t>(sample.values.size()));

    std::vector<std::string> gotKeys;
    gotKeys.reserve(sample.values.size());
    for (const auto& entry : sample.values) {
        gotKeys.push_back(entry.first);
    }
    log_->LogThrottled(
        LogTag::Sample,
        "pkg=" + config.targetPackage
            + " want=" + std::to_string(config.metricKeys.size())
            + " got=" + std::to_string(gotKeys.size())
            + " gotKeys=" + JoinKeys(gotKeys)
            + " rev=" + settings_.samplerRevision
            + " wantFps=" + (config.metricKeys.count("fps_app") > 0 ? "1" : "0")
            + " fpsSamples=" + std::to_string(frameRate_->SampleCount()));

    RemoteError writeError;
    if (negotiator_.WriteMetrics(SerializeMetricSample(sample), &writeError)) {
        span.MarkSuccess();
    } else {
        ReportWriteFailure(writeError);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - cycleStart);
    return std::max(timings_.minCyclePause, std::chrono::milliseconds(config.samplingMs) - elapsed);
}

void BridgeSampler::ReportWriteFailure(const RemoteError& error) {
    if (error.kind == ErrorKind::NotDebuggable) {
        log_->LogThrottled(
            LogTag::Err,
            "metrics write failed: run-as unavailable (" + settings_.packageName + " is not debuggable)",
            kNotDebuggableInterval);
    } else if (error.kind != ErrorKind::None) {
        log_->LogThrottled(LogTag::Err, "metrics write failed: " + error.Describe());
    }
    log_->LogThrottled(LogTag::Err, "metrics write failed: no usable write path", kWriteFailureInterval);
}
