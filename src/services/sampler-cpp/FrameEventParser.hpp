#pragma once

#include <string>
#include <vector>

struct FrameEventWindow {
    int count = 0;
    double minTs = 0.0;
    double maxTs = 0.0;
    std::string method = "no_events";
};

// Counts frame-boundary events in atrace text output that are strictly newer
// than sinceTs (seconds). tracing_mark_write markers (queueBuffer,
// eglSwapBuffers*) are preferred; VSYNC/composition lines are used only when
// no marker is present. Events closer than 2ms to the previous kept one are
// merged.
FrameEventWindow CountFrameEvents(const std::string& dumpText, double sinceTs);

// Sorts and drops timestamps within minGapSeconds of the previous kept one.
std::vector<double> DedupeFrameTimestamps(std::vector<double> timestamps, double minGapSeconds = 0.002);

// count / span when the span exceeds 50ms, otherwise count (one second's worth).
double ComputeStreamingFps(int count, double minTs, double maxTs);

// Layer names worth matching against frame-timeline rows, most specific first.
std::vector<std::string> BuildLayerCandidates(const std::string& layer, const std::string& targetPackage);
