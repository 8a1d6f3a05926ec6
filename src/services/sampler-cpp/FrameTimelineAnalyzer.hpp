#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

struct FpsEstimate {
    std::optional<double> fps;
    std::string detail;
};

// Derives an FPS figure from a captured trace through SQL queries.
class FrameTimelineAnalyzer {
public:
    using QueryFn = std::function<bool(const std::string& sql, std::string& outText, std::string& outError)>;

    explicit FrameTimelineAnalyzer(QueryFn query);

    // Frame-timeline tables first, filtered by layer name where possible; the
    // slice marker scan when the trace has no frame-timeline table.
    FpsEstimate Analyze(
        const std::string& targetPackage,
        int durationMs,
        const std::string& layerHint,
        const std::vector<std::string>& layerCandidates) const;

    FpsEstimate ScanSliceMarkers(int durationMs) const;

    static std::string SqlQuote(const std::string& value);
    static std::string PickTable(const std::vector<std::string>& tables);

private:
    struct CountStats {
        long long count = 0;
        long long minTs = 0;
        long long maxTs = 0;
    };

    struct FilterCandidate {
        std::string whereSql;
        std::string label;
    };

    bool QueryCount(const std::string& sql, CountStats& outStats) const;
    std::vector<std::string> ListFrameTables(std::string& outError) const;
    std::vector<std::string> ListColumns(const std::string& table) const;
    static std::vector<FilterCandidate> BuildFilters(
        const std::vector<std::string>& columns,
        const std::string& targetPackage,
        const std::string& layerHint,
        const std::vector<std::string>& layerCandidates);

    QueryFn query_;
};
