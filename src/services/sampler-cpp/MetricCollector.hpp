#pragma once

#include "AdbClient.hpp"
#include "DiagnosticLog.hpp"
#include "WorkerPool.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>

struct DeviceProfile {
    long clockTicks = 100;
    int cores = 1;

    // getconf CLK_TCK and _NPROCESSORS_ONLN; defaults stay on failure.
    static DeviceProfile Probe(const AdbClient& adb);
};

struct CollectRequest {
    std::string targetPackage;
    std::set<std::string> wantedKeys;
    int64_t nowMs = 0;
};

// Runs the per-cycle metric reads in parallel. A task that fails or misses
// its deadline leaves its keys out of the result.
class MetricCollector {
public:
    using FpsProvider = std::function<std::optional<double>(const std::string& package, int64_t nowMs)>;
    using Values = std::map<std::string, double>;

    static constexpr size_t kWorkerCount = 7;

    MetricCollector(
        AdbClient adb,
        DeviceProfile profile,
        FpsProvider fps,
        std::shared_ptr<DiagnosticLog> log,
        std::chrono::milliseconds taskTimeout = std::chrono::seconds(4));
    ~MetricCollector();

    Values Collect(const CollectRequest& request);

    // Forget previous counters so the next rate metrics start over.
    void ResetRateState();
    void Shutdown();

    const DeviceProfile& Profile() const;

private:
    struct ProcessCpuState {
        std::string pid;
        std::optional<unsigned long long> prevTicks;
        int64_t prevAtMs = 0;
    };

    struct CpuTotalState {
        std::optional<unsigned long long> prevTotal;
        unsigned long long prevIdle = 0;
    };

    struct NetState {
        std::optional<unsigned long long> prevRx;
        unsigned long long prevTx = 0;
        int64_t prevAtMs = 0;
    };

    Values SampleProcessCpu(const std::string& package, int64_t nowMs);
    Values SamplePss(const std::string& package);
    Values SampleFps(const std::string& package, int64_t nowMs);
    Values SampleBattery();
    Values SampleMemory();
    Values SampleCpuSystem(bool wantTotal, bool wantFrequency);
    Values SampleNetwork(int64_t nowMs);

    AdbClient adb_;
    const DeviceProfile profile_;
    FpsProvider fps_;
    std::shared_ptr<DiagnosticLog> log_;
    std::chrono::milliseconds taskTimeout_;

    std::mutex cpuMutex_;
    ProcessCpuState cpuState_;
    std::mutex cpuTotalMutex_;
    CpuTotalState cpuTotalState_;
    std::mutex netMutex_;
    NetState netState_;

    // Declared last: its threads reference the members above.
    WorkerPool pool_;
};
