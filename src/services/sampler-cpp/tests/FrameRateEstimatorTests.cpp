#include "FrameRateEstimator.hpp"
#include "ScriptedRunner.hpp"

#include <atomic>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

bool WaitUntil(const std::function<bool()>& predicate, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

struct LogCapture {
    std::mutex mutex;
    std::vector<std::string> lines;

    bool Contains(const std::string& text) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& line : lines) {
            if (line.find(text) != std::string::npos) {
                return true;
            }
        }
        return false;
    }
};

std::shared_ptr<DiagnosticLog> MakeLog(const std::shared_ptr<LogCapture>& capture) {
    return std::make_shared<DiagnosticLog>([capture](LogTag, const std::string& line) {
        std::lock_guard<std::mutex> lock(capture->mutex);
        capture->lines.push_back(line);
    });
}

FrameRateTimings FastTimings() {
    FrameRateTimings timings;
    timings.waitPoll = std::chrono::milliseconds(10);
    timings.dumpInterval = std::chrono::milliseconds(20);
    timings.offlinePause = std::chrono::milliseconds(10);
    timings.offlineErrorBackoff = std::chrono::milliseconds(20);
    timings.tracedSettleDelay = std::chrono::milliseconds(0);
    timings.joinWindow = std::chrono::seconds(3);
    return timings;
}

FrameRateTarget ActiveTarget() {
    FrameRateTarget target;
    target.targetPackage = "com.game.app";
    target.layerCandidates = {"com.game.app"};
    target.enabled = true;
    return target;
}

// Each dump carries ten queueBuffer markers 16ms apart, later than the last.
ScriptedRunner::Responder AdvancingDump() {
    auto window = std::make_shared<std::atomic<int>>(0);
    return [window](const std::string&, const std::string*) {
        const int index = window->fetch_add(1);
        std::ostringstream dump;
        dump << "# tracer: nop\n";
        for (int i = 0; i < 10; ++i) {
            const double ts = 100.0 + index + i * 0.016;
            dump << "  RenderThread-8123 ( 8090) [003] ...1 " << std::fixed << std::setprecision(6) << ts
                 << ": tracing_mark_write: B|8090|queueBuffer\n";
        }
        return ScriptedRunner::Ok(dump.str());
    };
}

// The same ten markers on every dump: only the first window has new frames.
std::string RepeatingDump() {
    std::ostringstream dump;
    dump << "# tracer: nop\n";
    for (int i = 0; i < 10; ++i) {
        dump << "  RenderThread-8123 ( 8090) [003] ...1 " << std::fixed << std::setprecision(6) << 200.0 + i * 0.016
             << ": tracing_mark_write: B|8090|queueBuffer\n";
    }
    return dump.str();
}
} // namespace

int main() {
    {
        ScriptedRunner runner;
        runner.On("atrace --async_start", ScriptedRunner::Ok());
        runner.On("atrace --async_stop", ScriptedRunner::Ok());
        runner.OnCall("atrace --async_dump", AdvancingDump());
        auto capture = std::make_shared<LogCapture>();

        FrameRateEstimator estimator(AdbClient("adb", "SER", runner.AsRunner()), TraceProcessorClient(""), MakeLog(capture), FastTimings());
        if (estimator.CurrentMode() != EstimatorMode::Waiting) {
            return Fail("estimator should start out waiting.");
        }
        estimator.Start();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        if (runner.CountCalls("atrace") != 0) {
            return Fail("no target configured, atrace must not start.");
        }

        estimator.Configure(ActiveTarget());
        if (!WaitUntil([&estimator] { return estimator.SampleCount() >= 2; })) {
            return Fail("streaming should publish readings.");
        }
        if (estimator.CurrentMode() != EstimatorMode::Streaming) {
            return Fail(std::string("expected streaming mode, got ") + EstimatorModeName(estimator.CurrentMode()));
        }
        const FpsReading reading = estimator.ReadLatest();
        if (!reading.fps || *reading.fps <= 0.0 || reading.atMs <= 0) {
            return Fail("streaming reading should carry a positive fps.");
        }
        if (reading.detail.find("atrace_marker frames=10") == std::string::npos) {
            return Fail("unexpected streaming detail: " + reading.detail);
        }

        FrameRateTarget disabled = ActiveTarget();
        disabled.enabled = false;
        estimator.Configure(disabled);
        if (!WaitUntil([&estimator] { return estimator.CurrentMode() == EstimatorMode::Waiting; })) {
            return Fail("disabling the target should end the session.");
        }
        if (!WaitUntil([&runner] { return runner.CountCalls("atrace --async_stop") == 1; })) {
            return Fail("ending a streaming session should stop atrace.");
        }

        estimator.Configure(ActiveTarget());
        if (!WaitUntil([&runner] { return runner.CountCalls("atrace --async_start") == 2; })) {
            return Fail("re-enabling should start a new session.");
        }
        estimator.Stop();
        if (!capture->Contains("[OK] FPS worker: atrace streaming")) {
            return Fail("streaming start should be logged.");
        }

        // A stopped estimator can be started again with the same target.
        estimator.Start();
        if (!WaitUntil([&runner] { return runner.CountCalls("atrace --async_start") == 3; })) {
            return Fail("restarted estimator should resume sampling.");
        }
        estimator.Stop();
    }

    {
        ScriptedRunner runner;
        runner.On("atrace --async_start", ScriptedRunner::Ok());
        runner.On("atrace --async_stop", ScriptedRunner::Ok());
        runner.On("atrace --async_dump", ScriptedRunner::Failed("atrace: error opening trace buffer"));
        auto capture = std::make_shared<LogCapture>();

        FrameRateEstimator estimator(AdbClient("adb", "SER", runner.AsRunner()), TraceProcessorClient(""), MakeLog(capture), FastTimings());
        estimator.Configure(ActiveTarget());
        estimator.Start();
        if (!WaitUntil([&estimator] { return estimator.CurrentMode() == EstimatorMode::Offline; })) {
            return Fail("repeated dump failures should demote to offline captures.");
        }
        if (runner.CountCalls("atrace --async_dump") != static_cast<size_t>(FrameRateEstimator::kMaxDumpFailures)) {
            return Fail("demotion should happen after exactly five failed dumps.");
        }
        if (!WaitUntil([&estimator] { return estimator.SampleCount() >= 1; })) {
            return Fail("offline mode should still publish readings.");
        }
        const FpsReading reading = estimator.ReadLatest();
        if (reading.fps) {
            return Fail("without trace_processor no fps can be produced.");
        }
        estimator.Stop();
        if (runner.CountCalls("atrace --async_stop") != 1) {
            return Fail("demotion should stop atrace.");
        }
        if (!capture->Contains("switching to Perfetto captures")) {
            return Fail("demotion should be logged.");
        }
    }

    {
        // A disable and re-enable inside one dump interval still starts a fresh session.
        ScriptedRunner runner;
        runner.On("atrace --async_start", ScriptedRunner::Ok());
        runner.On("atrace --async_stop", ScriptedRunner::Ok());
        runner.OnCall("atrace --async_dump", AdvancingDump());
        auto capture = std::make_shared<LogCapture>();

        FrameRateTimings timings = FastTimings();
        timings.dumpInterval = std::chrono::milliseconds(300);
        FrameRateTarget oldTarget = ActiveTarget();
        oldTarget.targetPackage = "com.old.app";
        FrameRateEstimator estimator(AdbClient("adb", "SER", runner.AsRunner()), TraceProcessorClient(""), MakeLog(capture), timings);
        estimator.Configure(oldTarget);
        estimator.Start();
        if (!WaitUntil([&estimator] { return estimator.SampleCount() >= 2; })) {
            return Fail("streaming should publish readings for the first package.");
        }

        estimator.Configure(FrameRateTarget());
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        FrameRateTarget newTarget = ActiveTarget();
        newTarget.targetPackage = "com.new.app";
        estimator.Configure(newTarget);
        if (estimator.SampleCount() != 0 || estimator.ReadLatest().fps) {
            return Fail("re-enabling must not carry over the previous package's readings, count="
                        + std::to_string(estimator.SampleCount()));
        }
        if (!WaitUntil([&runner] { return runner.CountCalls("atrace --async_start") == 2; })) {
            return Fail("a quick disable and re-enable should start a new atrace session.");
        }
        if (!WaitUntil([&estimator] { return estimator.SampleCount() >= 1; })) {
            return Fail("the new session should publish its own readings.");
        }

        // Switching packages while active resets the session as well.
        estimator.Configure(oldTarget);
        if (estimator.SampleCount() != 0 || estimator.ReadLatest().fps) {
            return Fail("a package change must reset the readings.");
        }
        if (!WaitUntil([&runner] { return runner.CountCalls("atrace --async_start") == 3; })) {
            return Fail("a package change should start a new atrace session.");
        }
        estimator.Stop();
    }

    {
        // A dump that keeps repeating consumed events yields empty windows until demotion.
        ScriptedRunner runner;
        runner.On("atrace --async_start", ScriptedRunner::Ok());
        runner.On("atrace --async_stop", ScriptedRunner::Ok());
        runner.On("atrace --async_dump", ScriptedRunner::Ok(RepeatingDump()));
        auto capture = std::make_shared<LogCapture>();

        FrameRateEstimator estimator(AdbClient("adb", "SER", runner.AsRunner()), TraceProcessorClient(""), MakeLog(capture), FastTimings());
        estimator.Configure(ActiveTarget());
        estimator.Start();
        if (!WaitUntil([&estimator] { return estimator.CurrentMode() == EstimatorMode::Offline; })) {
            return Fail("repeated empty windows should demote to offline captures.");
        }
        if (runner.CountCalls("atrace --async_dump") != static_cast<size_t>(1 + FrameRateEstimator::kMaxEmptyWindows)) {
            return Fail("demotion should follow exactly ten empty windows after the first reading, dumps="
                        + std::to_string(runner.CountCalls("atrace --async_dump")));
        }
        const FpsReading reading = estimator.ReadLatest();
        if (!reading.fps || reading.detail.find("frames=10") == std::string::npos) {
            return Fail("the first window should still have published a reading.");
        }
        estimator.Stop();
        if (runner.CountCalls("atrace --async_stop") != 1) {
            return Fail("demotion should stop atrace once.");
        }
        if (!capture->Contains("atrace produced no frame events")) {
            return Fail("empty-window demotion should be logged.");
        }
    }

    {
        ScriptedRunner runner;
        runner.On("atrace --async_start", ScriptedRunner::Failed("/system/bin/sh: atrace: not found", 127));
        auto capture = std::make_shared<LogCapture>();

        FrameRateEstimator estimator(AdbClient("adb", "SER", runner.AsRunner()), TraceProcessorClient(""), MakeLog(capture), FastTimings());
        estimator.Configure(ActiveTarget());
        estimator.Start();
        if (!WaitUntil([&estimator] { return estimator.CurrentMode() == EstimatorMode::Offline; })) {
            return Fail("missing atrace should go straight to offline captures.");
        }
        estimator.Stop();
        if (runner.CountCalls("atrace --async_dump") != 0 || runner.CountCalls("atrace --async_stop") != 0) {
            return Fail("atrace must not be dumped or stopped when it never started.");
        }
        if (!capture->Contains("atrace unavailable")) {
            return Fail("fallback to offline captures should be logged.");
        }
    }

    return 0;
}
