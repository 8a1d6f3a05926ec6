#include "AdbClient.hpp"
#include "BridgeSampler.hpp"
#include "BridgeSettings.hpp"
#include "DiagnosticLog.hpp"
#include "FrameRateEstimator.hpp"
#include "MetricCollector.hpp"
#include "ProcessRunner.hpp"
#include "StopSignal.hpp"
#include "TraceProcessorClient.hpp"
#include "Tracing.hpp"

#include <algorithm>
#include <cctype>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <pthread.h>

namespace {
constexpr auto kDeviceListTimeout = std::chrono::seconds(3);

std::string GetEnvOrDefault(const char* name, const std::string& defaultValue) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : defaultValue;
}

bool GetEnvBool(const char* name, bool defaultValue) {
    const char* value = std::getenv(name);
    if (!value) {
        return defaultValue;
    }

    std::string normalized(value);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });

    if (normalized == "1" || normalized == "true" || normalized == "yes") {
        return true;
    }
    if (normalized == "0" || normalized == "false" || normalized == "no") {
        return false;
    }

    return defaultValue;
}

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string ResolveAdbPath() {
    const std::string configured = Trim(GetEnvOrDefault("PERFBRIDGE_ADB", ""));
    if (!configured.empty()) {
        return configured;
    }
    const std::string found = FindExecutableOnPath("adb");
    return found.empty() ? std::string("adb") : found;
}

bool PickDefaultSerial(const std::string& adbPath, std::string& outSerial, std::string& outError) {
    AdbClient lister(adbPath, "");
    std::string output;
    RemoteError error;
    if (!lister.Run({"devices", "-l"}, kDeviceListTimeout, output, error)) {
        outError = error.Describe();
        return false;
    }

    std::vector<std::string> ready;
    for (const auto& device : AdbClient::ParseDeviceList(output)) {
        if (device.state == "device" && !Trim(device.serial).empty()) {
            ready.push_back(device.serial);
        }
    }
    if (ready.empty()) {
        outError = "no device in 'device' state (connect the cable and authorize USB debugging)";
        return false;
    }

    outSerial = ready.front();
    return true;
}

// SIGINT/SIGTERM are blocked in every thread and collected here, so the stop
// request runs outside signal-handler context.
void StartSignalWatcher(const std::shared_ptr<StopSignal>& stop) {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    std::thread([stop, signals]() {
        int received = 0;
        if (sigwait(&signals, &received) == 0) {
            std::cout << "[INFO] received signal " << received << ", stopping" << std::endl;
        }
        stop->Request();
    }).detach();
}
} // namespace

int main() {
    std::cout << "perfbridge sampler starting..." << std::endl;

    // Writes to an adb child that already exited must fail with EPIPE instead of killing us.
    std::signal(SIGPIPE, SIG_IGN);

    auto stop = std::make_shared<StopSignal>();
    StartSignalWatcher(stop);

    TraceConfig traceConfig;
    traceConfig.enabled = GetEnvBool("PERFBRIDGE_OTEL_ENABLED", false);
    traceConfig.endpoint = GetEnvOrDefault("PERFBRIDGE_OTEL_ENDPOINT", "");
    traceConfig.serviceName = GetEnvOrDefault("PERFBRIDGE_OTEL_SERVICE", "perfbridge-sampler");
    Tracer::Instance().Configure(traceConfig);

    const std::string adbPath = ResolveAdbPath();
    std::string serial = Trim(GetEnvOrDefault("PERFBRIDGE_SERIAL", ""));
    if (serial.empty()) {
        std::string error;
        if (!PickDefaultSerial(adbPath, serial, error)) {
            std::cerr << "[ERR] " << error << std::endl;
            return 1;
        }
    }

    const BridgeSettings settings = MakeBridgeSettings(
        Trim(GetEnvOrDefault("PERFBRIDGE_PACKAGE", BridgeSettings().packageName)));
    const std::string traceProcessorPath = TraceProcessorClient::Resolve();

    std::cout << "Using adb=" << adbPath << std::endl;
    std::cout << "Using serial=" << serial << std::endl;
    std::cout << "Using trace_processor=" << (traceProcessorPath.empty() ? "(none)" : traceProcessorPath) << std::endl;

    auto log = std::make_shared<DiagnosticLog>();
    AdbClient adb(adbPath, serial);
    const DeviceProfile profile = DeviceProfile::Probe(adb);

    auto estimator = std::make_shared<FrameRateEstimator>(
        adb,
        TraceProcessorClient(traceProcessorPath),
        log);

    int exitCode = 0;
    {
        BridgeSampler sampler(adb, settings, estimator, log, stop, profile);
        exitCode = sampler.Run();
    }
    estimator->Stop();

    Tracer::Instance().Shutdown();
    return exitCode;
}
