#include "ProcessRunner.hpp"

#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

constexpr auto kTimeout = std::chrono::seconds(5);
} // namespace

int main() {
    ProcessResult result = RunProcess({"sh", "-c", "printf 'out'; printf 'err' >&2; exit 3"}, nullptr, kTimeout);
    if (!result.launched || result.timedOut) {
        return Fail("sh should launch and finish.");
    }
    if (result.out != "out" || result.err != "err" || result.exitCode != 3) {
        return Fail("unexpected result: out=" + result.out + " err=" + result.err + " code=" + std::to_string(result.exitCode));
    }

    const std::string payload(200000, 'x');
    result = RunProcess({"sh", "-c", "wc -c"}, &payload, kTimeout);
    if (result.exitCode != 0 || result.out.find("200000") == std::string::npos) {
        return Fail("stdin should be streamed completely, wc printed: " + result.out);
    }

    result = RunProcess({"sh", "-c", "exec sleep 5"}, nullptr, std::chrono::milliseconds(200));
    if (!result.launched || !result.timedOut) {
        return Fail("a command past its timeout should be reported as timed out.");
    }

    result = RunProcess({"/nonexistent/perfbridge-adb"}, nullptr, kTimeout);
    if (result.launched || result.err.empty()) {
        return Fail("a missing binary must not count as launched.");
    }

    if (FindExecutableOnPath("sh").empty()) {
        return Fail("sh should be found on PATH.");
    }
    if (!FindExecutableOnPath("perfbridge-no-such-tool").empty()) {
        return Fail("unknown tools must not be found.");
    }

    return 0;
}
