#include "FrameEventParser.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace {
constexpr double kMinStreamingSpanSeconds = 0.05;
constexpr size_t kMaxLayerCandidates = 8;

//   <task>-<tid> (<tgid>) [<cpu>] <flags> <ts>: tracing_mark_write: B|<pid>|<name>
// The "(<tgid>)" group is absent on older kernels.
const std::regex& MarkerPattern() {
    static const std::regex pattern(
        R"(^\s*\S+-\d+\s+(?:\(\s*\d+\s*\)\s+)?\[\d+\]\s+\S+\s+(\d+\.\d+):\s+tracing_mark_write:\s+[BC]\|(\d+)\|(.+))");
    return pattern;
}

const std::regex& VsyncPattern() {
    static const std::regex pattern(
        R"(^\s*\S+-\d+\s+(?:\(\s*\d+\s*\)\s+)?\[\d+\]\s+\S+\s+(\d+\.\d+):\s+.*\b(?:HW_VSYNC_ON_0|doComposition|postComposition)\b)");
    return pattern;
}

bool IsFrameMarker(const std::string& name) {
    static const std::unordered_set<std::string> markers = {
        "queueBuffer",
        "eglSwapBuffers",
        "eglSwapBuffersWithDamageKHR",
    };
    return markers.count(name) > 0;
}

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}
} // namespace

FrameEventWindow CountFrameEvents(const std::string& dumpText, double sinceTs) {
    const auto lines = SplitLines(dumpText);
    std::vector<double> timestamps;
    FrameEventWindow window;

    std::smatch match;
    for (const auto& line : lines) {
        if (line.find("tracing_mark_write") == std::string::npos) {
            continue;
        }
        if (!std::regex_search(line, match, MarkerPattern())) {
            continue;
        }
        const double ts = std::stod(match[1].str());
        if (ts > sinceTs && IsFrameMarker(Trim(match[3].str()))) {
            timestamps.push_back(ts);
        }
    }

    if (!timestamps.empty()) {
        window.method = "atrace_marker";
    } else {
        for (const auto& line : lines) {
            if (!std::regex_search(line, match, VsyncPattern())) {
                continue;
            }
            const double ts = std::stod(match[1].str());
            if (ts > sinceTs) {
                timestamps.push_back(ts);
            }
        }
        if (!timestamps.empty()) {
            window.method = "atrace_vsync";
        }
    }

    if (timestamps.empty()) {
        return window;
    }

    const auto deduped = DedupeFrameTimestamps(std::move(timestamps));
    window.count = static_cast<int>(deduped.size());
    window.minTs = deduped.front();
    window.maxTs = deduped.back();
    return window;
}

std::vector<double> DedupeFrameTimestamps(std::vector<double> timestamps, double minGapSeconds) {
    if (timestamps.empty()) {
        return timestamps;
    }

    std::sort(timestamps.begin(), timestamps.end());
    std::vector<double> deduped;
    deduped.reserve(timestamps.size());
    deduped.push_back(timestamps.front());
    for (size_t i = 1; i < timestamps.size(); ++i) {
        if (timestamps[i] - deduped.back() > minGapSeconds) {
            deduped.push_back(timestamps[i]);
        }
    }
    return deduped;
}

double ComputeStreamingFps(int count, double minTs, double maxTs) {
    if (count <= 0) {
        return 0.0;
    }

    const double span = maxTs - minTs;
    if (span > kMinStreamingSpanSeconds) {
        return static_cast<double>(count) / span;
    }
    return static_cast<double>(count);
}

std::vector<std::string> BuildLayerCandidates(const std::string& layer, const std::string& targetPackage) {
    std::vector<std::string> candidates;
    auto add = [&candidates](const std::string& value) {
        const std::string trimmed = Trim(value);
        if (trimmed.empty()) {
            return;
        }
        if (std::find(candidates.begin(), candidates.end(), trimmed) == candidates.end()) {
            candidates.push_back(trimmed);
        }
    };

    const std::string base = Trim(layer);
    add(base);

    static const std::regex prefixPattern(R"(^(SurfaceView\[[^\]]+\]))");
    static const std::regex innerPattern(R"(SurfaceView\[([^\]]+)\])");

    std::smatch match;
    if (std::regex_search(base, match, prefixPattern)) {
        add(match[1].str());
    }

    if (std::regex_search(base, match, innerPattern)) {
        const std::string windowArea = Trim(match[1].str());
        add(windowArea);
        add("SurfaceView - " + windowArea + "#0");
        add("SurfaceView - " + windowArea);
    }

    add(targetPackage);

    if (candidates.size() > kMaxLayerCandidates) {
        candidates.resize(kMaxLayerCandidates);
    }
    return candidates;
}
