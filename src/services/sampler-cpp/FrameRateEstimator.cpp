#include "FrameRateEstimator.hpp"

#include "FrameEventParser.hpp"
#include "PerfettoCapture.hpp"
#include "StopSignal.hpp"
#include "Tracing.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <utility>

namespace {
constexpr auto kAtraceTimeout = std::chrono::seconds(5);
constexpr auto kPullTimeout = std::chrono::seconds(12);

const std::vector<std::string> kAtraceCategories = {"-b", "8192", "-c", "gfx", "view"};

std::vector<std::string> AtraceCommand(const char* action, bool withCategories) {
    std::vector<std::string> args = {"atrace", action};
    if (withCategories) {
        args.insert(args.end(), kAtraceCategories.begin(), kAtraceCategories.end());
    }
    return args;
}

int64_t NowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string FormatFps(double fps) {
    std::ostringstream output;
    output << std::fixed << std::setprecision(1) << fps;
    return output.str();
}

std::string FormatSpan(double seconds) {
    std::ostringstream output;
    output << std::fixed << std::setprecision(3) << seconds;
    return output.str();
}

enum class StreamEnd {
    Stopped,
    Disabled,
    Demoted
};
} // namespace

const char* EstimatorModeName(EstimatorMode mode) {
    switch (mode) {
        case EstimatorMode::Waiting:
            return "waiting";
        case EstimatorMode::Streaming:
            return "atrace";
        case EstimatorMode::Offline:
            return "perfetto";
    }
    return "unknown";
}

bool FrameRateTarget::IsActive() const {
    return enabled && targetPackage.find_first_not_of(" \t\r\n") != std::string::npos;
}

struct FrameRateEstimator::Worker {
    Worker(AdbClient adbClient, TraceProcessorClient processor, std::shared_ptr<DiagnosticLog> logSink, FrameRateTimings settings)
        : adb(std::move(adbClient)),
          traceProcessor(std::move(processor)),
          log(std::move(logSink)),
          timings(settings) {}

    FrameRateTarget Snapshot() const {
        std::lock_guard<std::mutex> lock(targetMutex);
        return target;
    }

    uint64_t BeginSession() {
        std::lock_guard<std::mutex> lock(latestMutex);
        latest = FpsReading();
        sampleCount = 0;
        return session;
    }

    // Called with targetMutex held; the loops of the old session notice the bump and return.
    void ResetSession() {
        std::lock_guard<std::mutex> lock(latestMutex);
        ++session;
        latest = FpsReading();
        sampleCount = 0;
    }

    bool SessionCurrent(uint64_t id) const {
        std::lock_guard<std::mutex> lock(latestMutex);
        return session == id;
    }

    // Readers detect fresh values by timestamp, so atMs never repeats.
    // Results of a session that was reset in the meantime are dropped.
    void Publish(uint64_t id, const std::optional<double>& fps, const std::string& detail) {
        std::lock_guard<std::mutex> lock(latestMutex);
        if (session != id) {
            return;
        }
        if (fps && *fps >= 0.0) {
            const int64_t now = NowMs();
            latest.fps = fps;
            latest.atMs = now > latest.atMs ? now : latest.atMs + 1;
            latest.detail = detail;
        }
        ++sampleCount;
    }

    bool StartStreaming() {
        std::string output;
        RemoteError error;
        if (adb.Shell(AtraceCommand("--async_start", true), kAtraceTimeout, output, error)) {
            return true;
        }
        log->Log(LogTag::Warn, "atrace --async_start failed: " + error.Describe());
        return false;
    }

    void StopStreaming() {
        adb.TryShell(AtraceCommand("--async_stop", false), kAtraceTimeout);
    }

    StreamEnd RunStreaming(uint64_t id) {
        double lastMaxTs = 0.0;
        int dumpFailures = 0;
        int emptyWindows = 0;

        while (!stop.WaitFor(timings.dumpInterval)) {
            if (!Snapshot().IsActive() || !SessionCurrent(id)) {
                return StreamEnd::Disabled;
            }

            std::string dump;
            RemoteError error;
            if (!adb.Shell(AtraceCommand("--async_dump", true), kAtraceTimeout, dump, error)) {
                log->LogThrottled(LogTag::Warn, "atrace dump failed: " + error.Describe(),
                                  DiagnosticLog::DefaultInterval(LogTag::Warn), "atrace-dump");
                if (++dumpFailures >= kMaxDumpFailures) {
                    log->Log(LogTag::Info, "atrace dump keeps failing, switching to Perfetto captures");
                    return StreamEnd::Demoted;
                }
                continue;
            }
            dumpFailures = 0;

            const FrameEventWindow window = CountFrameEvents(dump, lastMaxTs);
            if (window.count <= 0) {
                if (++emptyWindows >= kMaxEmptyWindows) {
                    log->Log(LogTag::Info, "atrace produced no frame events 10 times in a row, switching to Perfetto captures");
                    return StreamEnd::Demoted;
                }
                continue;
            }
            emptyWindows = 0;

            const double fps = ComputeStreamingFps(window.count, window.minTs, window.maxTs);
            if (window.maxTs > 0.0) {
                lastMaxTs = std::max(lastMaxTs, window.maxTs);
            }
            const std::string span = window.maxTs > window.minTs
                ? FormatSpan(window.maxTs - window.minTs) + "s"
                : std::string("~1s");
            const std::string detail = window.method + " frames=" + std::to_string(window.count) + " span=" + span;
            Publish(id, fps, detail);
            log->LogThrottled(LogTag::Ok, "FPS(atrace): " + FormatFps(fps) + " (" + detail + ")",
                              DiagnosticLog::DefaultInterval(LogTag::Ok), "fps-atrace");
        }
        return StreamEnd::Stopped;
    }

    void RunOffline(uint64_t id) {
        while (!stop.Requested()) {
            const FrameRateTarget current = Snapshot();
            if (!current.IsActive() || !SessionCurrent(id)) {
                return;
            }

            FpsEstimate estimate;
            RemoteError error;
            if (!CaptureOnce(current, estimate, error)) {
                log->LogThrottled(LogTag::Err, "Perfetto capture failed: " + error.Describe(),
                                  DiagnosticLog::DefaultInterval(LogTag::Err), "fps-offline");
                if (stop.WaitFor(timings.offlineErrorBackoff)) {
                    return;
                }
                continue;
            }

            Publish(id, estimate.fps, estimate.detail);
            if (estimate.fps && *estimate.fps >= 0.0) {
                log->LogThrottled(LogTag::Ok, "FPS(perfetto): " + FormatFps(*estimate.fps) + " (" + estimate.detail + ")",
                                  DiagnosticLog::DefaultInterval(LogTag::Ok), "fps-perfetto");
            } else {
                log->LogThrottled(LogTag::Warn, "Perfetto produced no FPS: " + estimate.detail,
                                  DiagnosticLog::DefaultInterval(LogTag::Warn), "fps-perfetto-empty");
            }

            if (stop.WaitFor(timings.offlinePause)) {
                return;
            }
        }
    }

    bool CaptureOnce(const FrameRateTarget& current, FpsEstimate& outEstimate, RemoteError& outError) {
        if (!traceProcessor.Available()) {
            outEstimate = {std::nullopt, "trace_processor unavailable"};
            return true;
        }

        ScopedSpan span("fps.offline.capture");
        span.SetAttribute("sampler.package", current.targetPackage);

        const std::string serial = PerfettoCapture::SafeSerial(adb.Serial());
        const std::string remote = "/data/local/tmp/pm_ft_" + serial + ".perfetto-trace";
        std::error_code dirError;
        std::filesystem::path localDir = std::filesystem::temp_directory_path(dirError);
        if (dirError) {
            localDir = "/tmp";
        }
        const std::string local = (localDir / ("pm_ft_" + serial + ".perfetto-trace")).string();

        const int durationMs = std::max(PerfettoCapture::kMinDurationMs, timings.offlineCaptureMs);
        PerfettoCapture capture(adb, timings.tracedSettleDelay);
        if (!capture.Capture(remote, durationMs, outError)) {
            return false;
        }
        if (!adb.Pull(remote, local, kPullTimeout, outError)) {
            return false;
        }

        const TraceProcessorClient& processor = traceProcessor;
        FrameTimelineAnalyzer analyzer([&processor, &local](const std::string& sql, std::string& outText, std::string& outQueryError) {
            return processor.Query(local, sql, outText, outQueryError);
        });
        outEstimate = analyzer.Analyze(current.targetPackage, durationMs, current.layerHint, current.layerCandidates);
        span.SetAttribute("fps.detail", outEstimate.detail);
        span.MarkSuccess();
        return true;
    }

    AdbClient adb;
    TraceProcessorClient traceProcessor;
    std::shared_ptr<DiagnosticLog> log;
    const FrameRateTimings timings;
    StopSignal stop;

    mutable std::mutex targetMutex;
    FrameRateTarget target;

    mutable std::mutex latestMutex;
    FpsReading latest;
    int sampleCount = 0;
    uint64_t session = 0;

    std::atomic<EstimatorMode> mode{EstimatorMode::Waiting};

    std::mutex doneMutex;
    std::condition_variable doneCv;
    bool done = false;
};

FrameRateEstimator::FrameRateEstimator(
    AdbClient adb,
    TraceProcessorClient traceProcessor,
    std::shared_ptr<DiagnosticLog> log,
    FrameRateTimings timings)
    : worker_(std::make_shared<Worker>(
          std::move(adb),
          std::move(traceProcessor),
          log ? std::move(log) : std::make_shared<DiagnosticLog>(),
          timings)) {}

FrameRateEstimator::~FrameRateEstimator() {
    Stop();
}

void FrameRateEstimator::Start() {
    if (thread_.joinable()) {
        return;
    }

    if (worker_->stop.Requested()) {
        auto fresh = std::make_shared<Worker>(worker_->adb, worker_->traceProcessor, worker_->log, worker_->timings);
        fresh->target = worker_->Snapshot();
        worker_ = fresh;
    }
    thread_ = std::thread(&FrameRateEstimator::Run, worker_);
}

void FrameRateEstimator::Stop() {
    if (!thread_.joinable()) {
        return;
    }

    const std::shared_ptr<Worker> worker = worker_;
    worker->stop.Request();

    bool finished = false;
    {
        std::unique_lock<std::mutex> lock(worker->doneMutex);
        finished = worker->doneCv.wait_for(lock, worker->timings.joinWindow, [&worker] { return worker->done; });
    }

    if (finished) {
        thread_.join();
        return;
    }

    worker->log->Log(LogTag::Warn, "FPS worker did not stop within the join window; abandoning it");
    thread_.detach();
}

void FrameRateEstimator::Configure(const FrameRateTarget& target) {
    std::lock_guard<std::mutex> lock(worker_->targetMutex);
    const FrameRateTarget& previous = worker_->target;
    const bool wasActive = previous.IsActive();
    const bool nowActive = target.IsActive();
    const bool packageChanged = wasActive && nowActive && previous.targetPackage != target.targetPackage;
    if (wasActive != nowActive || packageChanged) {
        worker_->ResetSession();
    }
    worker_->target = target;
}

FpsReading FrameRateEstimator::ReadLatest() const {
    std::lock_guard<std::mutex> lock(worker_->latestMutex);
    return worker_->latest;
}

int FrameRateEstimator::SampleCount() const {
    std::lock_guard<std::mutex> lock(worker_->latestMutex);
    return worker_->sampleCount;
}

EstimatorMode FrameRateEstimator::CurrentMode() const {
    return worker_->mode.load();
}

void FrameRateEstimator::Run(const std::shared_ptr<Worker>& worker) {
    while (!worker->stop.Requested()) {
        if (!worker->Snapshot().IsActive()) {
            worker->stop.WaitFor(worker->timings.waitPoll);
            continue;
        }

        const uint64_t session = worker->BeginSession();
        bool offline = true;
        if (worker->StartStreaming()) {
            worker->mode = EstimatorMode::Streaming;
            worker->log->Log(LogTag::Ok, "FPS worker: atrace streaming, one reading per second");
            const StreamEnd end = worker->RunStreaming(session);
            worker->StopStreaming();
            offline = end == StreamEnd::Demoted;
        } else {
            worker->log->Log(LogTag::Info, "FPS worker: atrace unavailable, using offline Perfetto captures");
        }

        if (offline) {
            worker->mode = EstimatorMode::Offline;
            worker->RunOffline(session);
        }
        worker->mode = EstimatorMode::Waiting;
    }

    {
        std::lock_guard<std::mutex> lock(worker->doneMutex);
        worker->done = true;
    }
    worker->doneCv.notify_all();
}
