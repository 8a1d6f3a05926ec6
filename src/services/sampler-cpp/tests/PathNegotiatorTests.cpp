#include "BridgePathNegotiator.hpp"
#include "ScriptedRunner.hpp"

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

constexpr const char* kExternalRead = "shell cat /sdcard/Android/data/com.ikun.monitor/files/pm_desktop_bridge_config.json";
constexpr const char* kSandboxedRead = "shell run-as com.ikun.monitor cat files/pm_desktop_bridge_config.json";
constexpr const char* kExternalWrite = "shell sh -c";
constexpr const char* kSandboxedWrite = "shell run-as com.ikun.monitor sh -c";

const char* kActiveConfig = "{\"enabled\":true,\"targetPackage\":\"com.game.app\",\"samplingMs\":500,\"metricKeys\":[\"fps\"]}";

BridgePathNegotiator MakeNegotiator(const ScriptedRunner& runner) {
    return BridgePathNegotiator(AdbClient("adb", "SER", runner.AsRunner()), MakeBridgeSettings("com.ikun.monitor"));
}
} // namespace

int main() {
    {
        // External storage is blocked; run-as works and is remembered.
        ScriptedRunner runner;
        runner.On(kExternalRead, ScriptedRunner::Failed("cat: /sdcard/...: Permission denied"));
        runner.On(kSandboxedRead, ScriptedRunner::Ok(kActiveConfig));
        BridgePathNegotiator negotiator = MakeNegotiator(runner);

        ConfigReadResult result = negotiator.ReadConfig();
        if (!result.config || result.source != ConfigSource::Sandboxed) {
            return Fail(std::string("run-as fallback should read the config, source=") + ConfigSourceName(result.source));
        }
        if (result.config->samplingMs != 500 || result.config->targetPackage != "com.game.app") {
            return Fail("config fields parsed incorrectly.");
        }
        if (negotiator.ConfigMode() != PathMode::Sandboxed) {
            return Fail("run-as should become the cached config path.");
        }

        runner.ClearCalls();
        result = negotiator.ReadConfig();
        if (!result.config || runner.CountCalls(kExternalRead) != 0) {
            return Fail("cached path must be tried without probing external storage.");
        }
    }

    {
        ScriptedRunner runner;
        runner.On(kExternalRead, ScriptedRunner::Failed("cat: No such file or directory"));
        runner.On(kSandboxedRead, ScriptedRunner::Failed("run-as: package not debuggable: com.ikun.monitor"));
        BridgePathNegotiator negotiator = MakeNegotiator(runner);

        const ConfigReadResult result = negotiator.ReadConfig();
        if (result.config || result.source != ConfigSource::NotDebuggable) {
            return Fail(std::string("not debuggable app should be reported, source=") + ConfigSourceName(result.source));
        }
        if (result.error.command.find("run-as") == std::string::npos) {
            return Fail("error should carry the run-as command.");
        }
    }

    {
        ScriptedRunner runner;
        runner.On(kExternalRead, ScriptedRunner::Failed("cat: No such file or directory"));
        runner.On(kSandboxedRead, ScriptedRunner::Failed("cat: files/pm_desktop_bridge_config.json: No such file or directory"));
        BridgePathNegotiator negotiator = MakeNegotiator(runner);

        const ConfigReadResult result = negotiator.ReadConfig();
        if (result.config || result.source != ConfigSource::Missing) {
            return Fail("absent config on both paths should be Missing.");
        }
    }

    {
        ScriptedRunner runner;
        runner.On(kExternalRead, ScriptedRunner::Ok("{not json"));
        BridgePathNegotiator negotiator = MakeNegotiator(runner);

        const ConfigReadResult result = negotiator.ReadConfig();
        if (result.config || result.source != ConfigSource::Invalid) {
            return Fail("unparsable config should be Invalid.");
        }
        if (runner.CountCalls(kSandboxedRead) != 0) {
            return Fail("a readable but invalid config must not probe run-as.");
        }
    }

    {
        // A timeout is not a reason to switch paths.
        ScriptedRunner runner;
        runner.On(kExternalRead, ScriptedRunner::TimedOut());
        BridgePathNegotiator negotiator = MakeNegotiator(runner);

        const ConfigReadResult result = negotiator.ReadConfig();
        if (result.source != ConfigSource::Error || result.error.kind != ErrorKind::Timeout) {
            return Fail("timeout should surface as Error.");
        }
        if (runner.CountCalls("run-as") != 0) {
            return Fail("timeout must not fall through to run-as.");
        }
    }

    {
        ScriptedRunner runner;
        runner.On(kExternalWrite, ScriptedRunner::Failed("sh: can't create /sdcard/...: Permission denied"));
        runner.On(kSandboxedWrite, ScriptedRunner::Ok());
        BridgePathNegotiator negotiator = MakeNegotiator(runner);

        const std::string payload = "{\"pkg\":\"com.game.app\",\"t\":1,\"v\":{}}";
        RemoteError error;
        if (!negotiator.WriteMetrics(payload, &error)) {
            return Fail("write should fall back to run-as: " + error.Describe());
        }
        if (negotiator.MetricsMode() != PathMode::Sandboxed) {
            return Fail("run-as should become the cached metrics path.");
        }
        if (runner.Inputs().back() != payload) {
            return Fail("metrics payload should be streamed through stdin.");
        }
        const std::string lastCall = runner.Calls().back();
        if (lastCall.find("cat > 'files/pm_desktop_bridge_metrics.json'") == std::string::npos) {
            return Fail("unexpected sandboxed write command: " + lastCall);
        }

        runner.ClearCalls();
        if (!negotiator.WriteMetrics(payload) || runner.CountCalls(kExternalWrite) != 0) {
            return Fail("cached write path must be used first.");
        }
    }

    {
        ScriptedRunner runner;
        runner.On(kExternalWrite, ScriptedRunner::Failed("Permission denied"));
        runner.On(kSandboxedWrite, ScriptedRunner::Failed("run-as: package not debuggable"));
        BridgePathNegotiator negotiator = MakeNegotiator(runner);

        RemoteError error;
        if (negotiator.WriteMetrics("{}", &error)) {
            return Fail("write must fail when both paths fail.");
        }
        if (error.kind != ErrorKind::NotDebuggable) {
            return Fail(std::string("last error should be reported, got ") + ErrorKindName(error.kind));
        }
    }

    return 0;
}
