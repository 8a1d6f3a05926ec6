#include "MetricCollector.hpp"

#include "MetricParsers.hpp"

#include <algorithm>
#include <future>
#include <sstream>
#include <utility>
#include <vector>

namespace {
constexpr auto kShortReadTimeout = std::chrono::milliseconds(2500);
constexpr auto kDumpsysTimeout = std::chrono::seconds(3);

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string FirstLine(const std::string& text) {
    std::istringstream stream(Trim(text));
    std::string line;
    std::getline(stream, line);
    return line;
}

bool ReadGetconf(const AdbClient& adb, const char* name, long& outValue) {
    std::string output;
    RemoteError error;
    if (!adb.Shell({"getconf", name}, kDumpsysTimeout, output, error)) {
        return false;
    }
    try {
        outValue = std::stol(Trim(output));
    } catch (const std::exception&) {
        return false;
    }
    return true;
}
} // namespace

DeviceProfile DeviceProfile::Probe(const AdbClient& adb) {
    DeviceProfile profile;
    long value = 0;
    if (ReadGetconf(adb, "CLK_TCK", value) && value > 0) {
        profile.clockTicks = value;
    }
    if (ReadGetconf(adb, "_NPROCESSORS_ONLN", value)) {
        profile.cores = std::max(1, static_cast<int>(value));
    }
    return profile;
}

MetricCollector::MetricCollector(
    AdbClient adb,
    DeviceProfile profile,
    FpsProvider fps,
    std::shared_ptr<DiagnosticLog> log,
    std::chrono::milliseconds taskTimeout)
    : adb_(std::move(adb)),
      profile_(profile),
      fps_(std::move(fps)),
      log_(log ? std::move(log) : std::make_shared<DiagnosticLog>()),
      taskTimeout_(taskTimeout),
      pool_(kWorkerCount) {}

MetricCollector::~MetricCollector() {
    Shutdown();
}

MetricCollector::Values MetricCollector::Collect(const CollectRequest& request) {
    const auto& want = request.wantedKeys;
    const auto wants = [&want](const char* key) {
        return want.count(key) > 0;
    };
    const auto wantsPrefix = [&want](const std::string& prefix) {
        return std::any_of(want.begin(), want.end(), [&prefix](const std::string& key) {
            return key.rfind(prefix, 0) == 0;
        });
    };

    const std::string package = request.targetPackage;
    const int64_t nowMs = request.nowMs;
    const bool wantCpuTotal = wants("cpu_total_pct");
    const bool wantCpuFrequency = wantsPrefix("cpu_freq_khz_");

    std::vector<std::future<Values>> pending;
    if (wants("cpu_fg_app_pct")) {
        pending.push_back(pool_.Submit([this, package, nowMs] { return SampleProcessCpu(package, nowMs); }));
    }
    if (wants("app_pss_mb")) {
        pending.push_back(pool_.Submit([this, package] { return SamplePss(package); }));
    }
    if (wants("fps_app")) {
        pending.push_back(pool_.Submit([this, package, nowMs] { return SampleFps(package, nowMs); }));
    }
    if (wantsPrefix("battery_")) {
        pending.push_back(pool_.Submit([this] { return SampleBattery(); }));
    }
    if (wants("mem_total_mb") || wants("mem_avail_mb")) {
        pending.push_back(pool_.Submit([this] { return SampleMemory(); }));
    }
    if (wantCpuTotal || wantCpuFrequency) {
        pending.push_back(pool_.Submit([this, wantCpuTotal, wantCpuFrequency] {
            return SampleCpuSystem(wantCpuTotal, wantCpuFrequency);
        }));
    }
    if (wants("net_rx_kbps") || wants("net_tx_kbps")) {
        pending.push_back(pool_.Submit([this, nowMs] { return SampleNetwork(nowMs); }));
    }

    const auto deadline = std::chrono::steady_clock::now() + taskTimeout_;
    Values merged;
    int late = 0;
    for (auto& future : pending) {
        if (future.wait_until(deadline) != std::future_status::ready) {
            ++late;
            continue;
        }
        try {
            const Values values = future.get();
            merged.insert(values.begin(), values.end());
        } catch (const std::exception& ex) {
            log_->LogThrottled(LogTag::Warn, std::string("metric task failed: ") + ex.what());
        }
    }

    if (late > 0) {
        log_->LogThrottled(
            LogTag::Warn,
            std::to_string(late) + " metric task(s) missed the " + std::to_string(taskTimeout_.count()) + "ms deadline",
            DiagnosticLog::DefaultInterval(LogTag::Warn),
            "metric-late");
    }
    return merged;
}

void MetricCollector::ResetRateState() {
    {
        std::lock_guard<std::mutex> lock(cpuMutex_);
        cpuState_ = ProcessCpuState();
    }
    {
        std::lock_guard<std::mutex> lock(cpuTotalMutex_);
        cpuTotalState_ = CpuTotalState();
    }
    {
        std::lock_guard<std::mutex> lock(netMutex_);
        netState_ = NetState();
    }
}

void MetricCollector::Shutdown() {
    pool_.Shutdown();
}

const DeviceProfile& MetricCollector::Profile() const {
    return profile_;
}

MetricCollector::Values MetricCollector::SampleProcessCpu(const std::string& package, int64_t nowMs) {
    std::string output;
    RemoteError error;
    if (!adb_.Shell({"pidof", package}, kShortReadTimeout, output, error)) {
        return {};
    }
    const std::string pid = FirstPid(output);
    if (pid.empty()) {
        return {};
    }

    if (!adb_.Shell({"cat", "/proc/" + pid + "/stat"}, kShortReadTimeout, output, error)) {
        return {};
    }
    unsigned long long ticks = 0;
    if (!ParseProcStatTicks(FirstLine(output), ticks)) {
        return {};
    }

    Values values;
    std::lock_guard<std::mutex> lock(cpuMutex_);
    // A new pid means the app restarted; its counters start from zero.
    if (cpuState_.prevTicks && cpuState_.pid == pid) {
        const unsigned long long deltaTicks = ticks > *cpuState_.prevTicks ? ticks - *cpuState_.prevTicks : 0;
        values["cpu_fg_app_pct"] = ComputeProcessCpuPercent(
            deltaTicks,
            profile_.clockTicks,
            nowMs - cpuState_.prevAtMs,
            profile_.cores);
    }
    cpuState_.pid = pid;
    cpuState_.prevTicks = ticks;
    cpuState_.prevAtMs = nowMs;
    return values;
}

MetricCollector::Values MetricCollector::SamplePss(const std::string& package) {
    std::string output;
    RemoteError error;
    if (!adb_.Shell({"dumpsys", "meminfo", package}, kDumpsysTimeout, output, error)) {
        return {};
    }

    long long pssKb = 0;
    if (!ParsePssKb(output, pssKb) || pssKb <= 0) {
        return {};
    }
    return {{"app_pss_mb", static_cast<double>(pssKb) / 1024.0}};
}

MetricCollector::Values MetricCollector::SampleFps(const std::string& package, int64_t nowMs) {
    if (!fps_) {
        return {};
    }
    const std::optional<double> fps = fps_(package, nowMs);
    if (!fps) {
        return {};
    }
    return {{"fps_app", std::max(0.0, *fps)}};
}

MetricCollector::Values MetricCollector::SampleBattery() {
    std::string output;
    RemoteError error;
    if (!adb_.Shell({"dumpsys", "battery"}, kDumpsysTimeout, output, error)) {
        return {};
    }
    return ParseBatteryInfo(output);
}

MetricCollector::Values MetricCollector::SampleMemory() {
    std::string output;
    RemoteError error;
    if (!adb_.Shell({"cat", "/proc/meminfo"}, kShortReadTimeout, output, error)) {
        return {};
    }
    return ParseMemInfo(output);
}

MetricCollector::Values MetricCollector::SampleCpuSystem(bool wantTotal, bool wantFrequency) {
    Values values;
    std::string output;
    RemoteError error;

    if (wantTotal && adb_.Shell({"head", "-1", "/proc/stat"}, kShortReadTimeout, output, error)) {
        unsigned long long total = 0;
        unsigned long long idle = 0;
        if (ParseCpuTotalLine(FirstLine(output), total, idle)) {
            std::lock_guard<std::mutex> lock(cpuTotalMutex_);
            if (cpuTotalState_.prevTotal && total > *cpuTotalState_.prevTotal) {
                const double deltaTotal = static_cast<double>(total - *cpuTotalState_.prevTotal);
                const double deltaIdle = static_cast<double>(idle) - static_cast<double>(cpuTotalState_.prevIdle);
                values["cpu_total_pct"] = ClampPercent((1.0 - deltaIdle / deltaTotal) * 100.0);
            }
            cpuTotalState_.prevTotal = total;
            cpuTotalState_.prevIdle = idle;
        }
    }

    // The glob is expanded by the device shell, one line per core in cpu order.
    if (wantFrequency
        && adb_.Shell({"cat", "/sys/devices/system/cpu/cpu*/cpufreq/scaling_cur_freq"}, kShortReadTimeout, output, error)) {
        const Values frequencies = ParseCpuFrequencies(output);
        values.insert(frequencies.begin(), frequencies.end());
    }
    return values;
}

MetricCollector::Values MetricCollector::SampleNetwork(int64_t nowMs) {
    std::string output;
    RemoteError error;
    if (!adb_.Shell({"cat", "/proc/net/dev"}, kShortReadTimeout, output, error)) {
        return {};
    }

    unsigned long long rx = 0;
    unsigned long long tx = 0;
    if (!ParseNetDevTotals(output, rx, tx)) {
        return {};
    }

    Values values;
    std::lock_guard<std::mutex> lock(netMutex_);
    if (netState_.prevRx) {
        const int64_t deltaMs = nowMs - netState_.prevAtMs;
        const double deltaRx = rx > *netState_.prevRx ? static_cast<double>(rx - *netState_.prevRx) : 0.0;
        const double deltaTx = tx > netState_.prevTx ? static_cast<double>(tx - netState_.prevTx) : 0.0;
        values["net_rx_kbps"] = ComputeThroughputKbps(deltaRx, deltaMs);
        values["net_tx_kbps"] = ComputeThroughputKbps(deltaTx, deltaMs);
    }
    netState_.prevRx = rx;
    netState_.prevTx = tx;
    netState_.prevAtMs = nowMs;
    return values;
}
