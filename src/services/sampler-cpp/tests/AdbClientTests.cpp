#include "AdbClient.hpp"
#include "ScriptedRunner.hpp"

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

constexpr auto kTimeout = std::chrono::milliseconds(1000);
} // namespace

int main() {
    if (ClassifyRemoteFailure("run-as: package not debuggable: com.ikun.monitor") != ErrorKind::NotDebuggable) {
        return Fail("not debuggable message misclassified.");
    }
    if (ClassifyRemoteFailure("run-as: Package 'x' is NOT DEBUGGABLE") != ErrorKind::NotDebuggable) {
        return Fail("upper-case not debuggable message misclassified.");
    }
    // Debuggability wins over the permission text that often accompanies it.
    if (ClassifyRemoteFailure("run-as: Permission denied, package not debuggable") != ErrorKind::NotDebuggable) {
        return Fail("not debuggable must be checked before permission denied.");
    }
    if (ClassifyRemoteFailure("cat: /data/x: Permission denied") != ErrorKind::PermissionDenied) {
        return Fail("permission denied misclassified.");
    }
    if (ClassifyRemoteFailure("open failed errno: 13") != ErrorKind::PermissionDenied) {
        return Fail("errno 13 misclassified.");
    }
    if (ClassifyRemoteFailure("cat: /sdcard/a.json: No such file or directory") != ErrorKind::NotFound) {
        return Fail("missing file misclassified.");
    }
    if (ClassifyRemoteFailure("/system/bin/sh: perfetto: Not Found") != ErrorKind::NotFound) {
        return Fail("missing binary misclassified.");
    }
    if (ClassifyRemoteFailure("device offline") != ErrorKind::RemoteFailure) {
        return Fail("generic failure misclassified.");
    }

    RemoteError described;
    described.message = "boom";
    described.command = "adb -s X shell cat /a";
    if (described.Describe() != "boom\n\ncommand: adb -s X shell cat /a") {
        return Fail("unexpected error rendering: " + described.Describe());
    }

    ScriptedRunner runner;
    runner.On("shell cat /sdcard/ok.json", ScriptedRunner::Ok("{\"enabled\":true}"));
    runner.On("shell cat /sdcard/missing.json", ScriptedRunner::Failed("cat: /sdcard/missing.json: No such file or directory"));
    runner.On("shell dumpsys slow", ScriptedRunner::TimedOut());
    runner.On("shell echo quiet", ScriptedRunner::Failed("", 2));

    AdbClient adb("/opt/adb", "emulator-5554", runner.AsRunner());

    std::string output;
    RemoteError error;
    if (!adb.Shell({"cat", "/sdcard/ok.json"}, kTimeout, output, error)) {
        return Fail("shell read should succeed: " + error.Describe());
    }
    if (output != "{\"enabled\":true}") {
        return Fail("unexpected stdout: " + output);
    }
    if (runner.Calls().back() != "/opt/adb -s emulator-5554 shell cat /sdcard/ok.json") {
        return Fail("unexpected argv: " + runner.Calls().back());
    }

    if (adb.Shell({"cat", "/sdcard/missing.json"}, kTimeout, output, error)) {
        return Fail("missing file read should fail.");
    }
    if (error.kind != ErrorKind::NotFound) {
        return Fail(std::string("missing file kind: ") + ErrorKindName(error.kind));
    }
    if (error.command != "adb -s emulator-5554 shell cat /sdcard/missing.json") {
        return Fail("unexpected rendered command: " + error.command);
    }

    if (adb.Shell({"dumpsys", "slow"}, kTimeout, output, error) || error.kind != ErrorKind::Timeout) {
        return Fail("timed out command should report Timeout.");
    }

    if (adb.Shell({"echo", "quiet"}, kTimeout, output, error) || error.kind != ErrorKind::RemoteFailure) {
        return Fail("silent non-zero exit should be a generic failure.");
    }
    if (error.message != "adb command failed") {
        return Fail("silent failure message: " + error.message);
    }

    runner.On("run-as com.ikun.monitor cat files/cfg.json", ScriptedRunner::Ok("x"));
    if (!adb.RunAs("com.ikun.monitor", {"cat", "files/cfg.json"}, kTimeout, output, error)) {
        return Fail("run-as read should succeed.");
    }
    if (runner.Calls().back() != "/opt/adb -s emulator-5554 shell run-as com.ikun.monitor cat files/cfg.json") {
        return Fail("unexpected run-as argv: " + runner.Calls().back());
    }

    runner.On("shell sh -c", ScriptedRunner::Ok());
    const std::string payload = "{\"pkg\":\"a\"}";
    if (!adb.Shell({"sh", "-c", "\"cat > '/sdcard/m.json'\""}, kTimeout, output, error, &payload)) {
        return Fail("write with stdin should succeed.");
    }
    if (runner.Inputs().back() != payload) {
        return Fail("stdin payload not forwarded.");
    }

    ScriptedRunner absent;
    absent.On("", ScriptedRunner::NotLaunched());
    AdbClient unreachable("adb", "X", absent.AsRunner());
    if (unreachable.Shell({"true"}, kTimeout, output, error) || error.kind != ErrorKind::Unreachable) {
        return Fail("spawn failure should report Unreachable.");
    }

    const auto devices = AdbClient::ParseDeviceList(
        "* daemon started successfully\n"
        "List of devices attached\n"
        "R58M123ABC             unauthorized usb:1-1 transport_id:3\n"
        "emulator-5554          device product:sdk_gphone64 model:Pixel transport_id:1\n"
        "\n");
    if (devices.size() != 2) {
        return Fail("expected two parsed devices, got " + std::to_string(devices.size()));
    }
    if (devices[0].state != "unauthorized" || devices[1].serial != "emulator-5554" || devices[1].state != "device") {
        return Fail("device list parsed incorrectly.");
    }

    if (AdbClient::ShellSingleQuote("it's") != "'it'\\''s'") {
        return Fail("single quoting: " + AdbClient::ShellSingleQuote("it's"));
    }
    if (AdbClient::ShellDoubleQuote("cat > '$HOME/a\"b'") != "\"cat > '\\$HOME/a\\\"b'\"") {
        return Fail("double quoting: " + AdbClient::ShellDoubleQuote("cat > '$HOME/a\"b'"));
    }

    return 0;
}
