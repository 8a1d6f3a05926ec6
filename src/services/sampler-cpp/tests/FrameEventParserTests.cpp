#include "FrameEventParser.hpp"

#include <cmath>
#include <iostream>
#include <string>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

bool Near(double actual, double expected, double tolerance = 1e-6) {
    return std::fabs(actual - expected) <= tolerance;
}

std::string MarkerLine(const std::string& ts, const std::string& name) {
    return "    RenderThread-8123  ( 8090) [003] ...1  " + ts + ": tracing_mark_write: B|8090|" + name + "\n";
}
} // namespace

int main() {
    std::string dump = "# tracer: nop\n#\n";
    dump += MarkerLine("100.000000", "queueBuffer");
    dump += MarkerLine("100.001000", "queueBuffer");  // within 2ms of the previous one
    dump += MarkerLine("100.016000", "eglSwapBuffersWithDamageKHR");
    dump += MarkerLine("100.033000", "queueBuffer");
    dump += MarkerLine("100.050000", "dequeueBuffer");
    dump += "  surfaceflinger-600 (  600) [001] d..2 100.040000: tracing_mark_write: B|600|doComposition\n";

    FrameEventWindow window = CountFrameEvents(dump, 0.0);
    if (window.method != "atrace_marker") {
        return Fail("expected marker method, got " + window.method);
    }
    if (window.count != 3) {
        return Fail("expected 3 deduped markers, got " + std::to_string(window.count));
    }
    if (!Near(window.minTs, 100.0) || !Near(window.maxTs, 100.033)) {
        return Fail("unexpected marker window bounds.");
    }

    window = CountFrameEvents(dump, 100.016);
    if (window.count != 1 || !Near(window.minTs, 100.033)) {
        return Fail("events at or before the boundary must be skipped.");
    }

    const std::string vsyncOnly =
        "  surfaceflinger-600 [001] d..2 200.000000: tracing_mark_write: B|600|doComposition\n"
        "  surfaceflinger-600 [001] d..2 200.016600: tracing_mark_write: B|600|postComposition\n"
        "  <idle>-0 [000] d.h1 200.033200: tracing_mark_write: C|600|HW_VSYNC_ON_0|1\n";
    window = CountFrameEvents(vsyncOnly, 0.0);
    if (window.method != "atrace_vsync" || window.count != 3) {
        return Fail("vsync fallback should count 3 events, got " + std::to_string(window.count) + " via " + window.method);
    }

    window = CountFrameEvents("# tracer: nop\n", 0.0);
    if (window.count != 0 || window.method != "no_events") {
        return Fail("empty dump should report no events.");
    }

    const auto deduped = DedupeFrameTimestamps({1.010, 1.000, 1.0015, 1.004, 1.0055});
    if (deduped.size() != 3 || !Near(deduped[0], 1.0) || !Near(deduped[1], 1.004) || !Near(deduped[2], 1.010)) {
        return Fail("dedupe should keep 1.000, 1.004, 1.010.");
    }
    for (size_t i = 1; i < deduped.size(); ++i) {
        if (deduped[i] - deduped[i - 1] <= 0.002) {
            return Fail("kept timestamps closer than 2ms.");
        }
    }

    if (!Near(ComputeStreamingFps(60, 10.0, 11.0), 60.0)) {
        return Fail("60 frames over 1s should be 60 fps.");
    }
    if (!Near(ComputeStreamingFps(3, 10.0, 10.04), 3.0)) {
        return Fail("span under 50ms should report the raw count.");
    }
    if (ComputeStreamingFps(0, 0.0, 0.0) != 0.0) {
        return Fail("no frames should be 0 fps.");
    }

    const auto candidates = BuildLayerCandidates(
        " SurfaceView[com.game.app/com.game.MainActivity]#0(BLAST Consumer)0 ",
        "com.game.app");
    const std::vector<std::string> expected = {
        "SurfaceView[com.game.app/com.game.MainActivity]#0(BLAST Consumer)0",
        "SurfaceView[com.game.app/com.game.MainActivity]",
        "com.game.app/com.game.MainActivity",
        "SurfaceView - com.game.app/com.game.MainActivity#0",
        "SurfaceView - com.game.app/com.game.MainActivity",
        "com.game.app",
    };
    if (candidates != expected) {
        std::string joined;
        for (const auto& candidate : candidates) {
            joined += candidate + " | ";
        }
        return Fail("unexpected layer candidates: " + joined);
    }

    const auto plain = BuildLayerCandidates("com.game.app", "com.game.app");
    if (plain.size() != 1) {
        return Fail("duplicate candidates must collapse.");
    }

    return 0;
}
