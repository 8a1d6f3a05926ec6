#include "FrameTimelineAnalyzer.hpp"

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <regex>
#include <sstream>
#include <utility>

namespace {
constexpr size_t kMaxLayerFilters = 10;

const char* const kPreferredTables[] = {
    "actual_frame_timeline_slice",
    "frame_timeline_slice",
    "android_frame_timeline_slice",
    "expected_frame_timeline_slice",
};

const char* const kSliceFrameMarkers[] = {
    "Choreographer#doFrame",
    "DrawFrame",
    "doFrame",
    "queueBuffer",
    "HIDL::IComposerClient::executeCommands_2_2",
};

std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::string StripQuotes(const std::string& value) {
    std::string stripped = Trim(value);
    while (!stripped.empty() && (stripped.front() == '"' || stripped.front() == '\'')) {
        stripped.erase(stripped.begin());
    }
    while (!stripped.empty() && (stripped.back() == '"' || stripped.back() == '\'')) {
        stripped.pop_back();
    }
    return Trim(stripped);
}

std::string ToLower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch) {
        return static_cast<char>(std::tolower(ch));
    });
    return value;
}

bool IsDigits(const std::string& value) {
    return !value.empty() && std::all_of(value.begin(), value.end(), [](unsigned char ch) {
        return std::isdigit(ch) != 0;
    });
}

std::vector<std::string> SplitLines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(line);
    }
    return lines;
}

bool ParseCountTriple(const std::string& text, long long& count, long long& minTs, long long& maxTs) {
    static const std::regex pattern(R"((\d+)\|(\d+)\|(\d+))");
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) {
        return false;
    }
    try {
        count = std::stoll(match[1].str());
        minTs = std::stoll(match[2].str());
        maxTs = std::stoll(match[3].str());
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

std::string FormatFixed(double value, int precision) {
    std::ostringstream output;
    output << std::fixed << std::setprecision(precision) << value;
    return output.str();
}
} // namespace

FrameTimelineAnalyzer::FrameTimelineAnalyzer(QueryFn query)
    : query_(std::move(query)) {}

FpsEstimate FrameTimelineAnalyzer::Analyze(
    const std::string& targetPackage,
    int durationMs,
    const std::string& layerHint,
    const std::vector<std::string>& layerCandidates) const {
    std::string error;
    const auto tables = ListFrameTables(error);
    if (!error.empty()) {
        return {std::nullopt, "trace_processor query failed: " + error};
    }

    if (tables.empty()) {
        FpsEstimate slice = ScanSliceMarkers(durationMs);
        if (slice.fps) {
            return slice;
        }
        return {std::nullopt, "trace has no frame_timeline table (data source inactive or unsupported)"};
    }

    const std::string table = PickTable(tables);
    const auto columns = ListColumns(table);
    const bool hasTs = std::find(columns.begin(), columns.end(), "ts") != columns.end();
    const auto filters = BuildFilters(columns, Trim(targetPackage), layerHint, layerCandidates);

    std::optional<CountStats> unfiltered;
    for (const auto& filter : filters) {
        const std::string sql = hasTs
            ? "select printf('%d|%d|%d', count(*), min(ts), max(ts)) from " + table + filter.whereSql + ";"
            : "select printf('%d|0|0', count(*)) from " + table + filter.whereSql + ";";

        CountStats stats;
        if (!QueryCount(sql, stats)) {
            continue;
        }
        if (filter.whereSql.empty()) {
            unfiltered = stats;
        }
        if (stats.count <= 0) {
            continue;
        }

        double spanSeconds = 0.0;
        if (stats.maxTs > stats.minTs && stats.minTs > 0) {
            spanSeconds = static_cast<double>(stats.maxTs - stats.minTs) / 1e9;
        }

        std::ostringstream detail;
        detail << "table=" << table << " filter=" << filter.label << " count=" << stats.count;
        double fps = 0.0;
        if (spanSeconds > 0.0) {
            fps = static_cast<double>(stats.count) / spanSeconds;
            detail << " spanMs=" << static_cast<long long>(spanSeconds * 1000.0);
        } else {
            fps = static_cast<double>(stats.count) * 1000.0 / static_cast<double>(std::max(1, durationMs));
            detail << " durMs=" << durationMs;
        }
        return {fps, detail.str()};
    }

    if (unfiltered) {
        return {std::nullopt, "frame_timeline count is 0 (unfiltered total=" + std::to_string(unfiltered->count) + ")"};
    }
    return {std::nullopt, "trace_processor query failed: no frame_timeline statistics"};
}

FpsEstimate FrameTimelineAnalyzer::ScanSliceMarkers(int durationMs) const {
    std::string text;
    std::string error;
    if (!query_("select count(*) from sqlite_master where type='table' and name='slice';", text, error)) {
        return {std::nullopt, "slice table query failed"};
    }

    for (const auto& line : SplitLines(text)) {
        const std::string value = StripQuotes(line);
        if (IsDigits(value)) {
            if (value == "0") {
                return {std::nullopt, "slice table missing"};
            }
            break;
        }
    }

    for (const char* marker : kSliceFrameMarkers) {
        const std::string sql = "select printf('%d|%d|%d', count(*), min(ts), max(ts)) from slice where name = "
            + SqlQuote(marker) + ";";
        CountStats stats;
        if (!QueryCount(sql, stats) || stats.count <= 1) {
            continue;
        }

        const double spanSeconds = stats.maxTs > stats.minTs
            ? static_cast<double>(stats.maxTs - stats.minTs) / 1e9
            : 0.0;
        const double fps = spanSeconds > 0.0
            ? static_cast<double>(stats.count) / spanSeconds
            : static_cast<double>(stats.count) * 1000.0 / static_cast<double>(std::max(1, durationMs));

        return {fps,
                std::string("ftrace_slice marker=") + marker + " count=" + std::to_string(stats.count)
                    + " spanS=" + FormatFixed(spanSeconds, 2)};
    }

    return {std::nullopt, "no known frame marker in ftrace slices"};
}

std::string FrameTimelineAnalyzer::SqlQuote(const std::string& value) {
    std::string quoted = "'";
    for (char ch : value) {
        if (ch == '\'') {
            quoted += "''";
        } else {
            quoted.push_back(ch);
        }
    }
    quoted.push_back('\'');
    return quoted;
}

std::string FrameTimelineAnalyzer::PickTable(const std::vector<std::string>& tables) {
    for (const char* preferred : kPreferredTables) {
        if (std::find(tables.begin(), tables.end(), preferred) != tables.end()) {
            return preferred;
        }
    }
    return tables.empty() ? std::string() : tables.front();
}

bool FrameTimelineAnalyzer::QueryCount(const std::string& sql, CountStats& outStats) const {
    std::string text;
    std::string error;
    if (!query_(sql, text, error)) {
        return false;
    }
    return ParseCountTriple(text, outStats.count, outStats.minTs, outStats.maxTs);
}

std::vector<std::string> FrameTimelineAnalyzer::ListFrameTables(std::string& outError) const {
    std::string text;
    if (!query_(
            "select name from sqlite_master where (type='table' or type='view') and "
            "(name like '%frame%timeline%' or name like '%frame_slice%' or name like '%android_frames%');",
            text,
            outError)) {
        if (outError.empty()) {
            outError = "unknown error";
        }
        return {};
    }

    std::vector<std::string> tables;
    for (const auto& line : SplitLines(text)) {
        const std::string name = StripQuotes(line);
        if (name.empty() || ToLower(name) == "name" || name.front() == '-') {
            continue;
        }
        tables.push_back(name);
    }
    return tables;
}

// pragma table_info rows: cid | name | type | notnull | dflt_value | pk
std::vector<std::string> FrameTimelineAnalyzer::ListColumns(const std::string& table) const {
    std::string text;
    std::string error;
    if (!query_("pragma table_info(" + table + ");", text, error)) {
        return {};
    }

    std::vector<std::string> columns;
    for (const auto& line : SplitLines(text)) {
        std::vector<std::string> parts;
        if (line.find('|') != std::string::npos) {
            std::istringstream fields(line);
            std::string field;
            while (std::getline(fields, field, '|')) {
                parts.push_back(StripQuotes(field));
            }
        } else {
            std::istringstream fields(line);
            std::string field;
            while (fields >> field) {
                parts.push_back(StripQuotes(field));
            }
        }

        if (parts.size() < 2 || parts[1].empty()) {
            continue;
        }
        if (ToLower(parts[1]) == "name" || parts[1].front() == '-') {
            continue;
        }
        columns.push_back(parts[1]);
    }
    return columns;
}

std::vector<FrameTimelineAnalyzer::FilterCandidate> FrameTimelineAnalyzer::BuildFilters(
    const std::vector<std::string>& columns,
    const std::string& targetPackage,
    const std::string& layerHint,
    const std::vector<std::string>& layerCandidates) {
    std::vector<FilterCandidate> filters;
    const auto hasColumn = [&columns](const char* name) {
        return std::find(columns.begin(), columns.end(), name) != columns.end();
    };

    if (hasColumn("layer_name")) {
        std::vector<std::string> names;
        auto add = [&names](const std::string& value) {
            const std::string trimmed = Trim(value);
            if (!trimmed.empty() && std::find(names.begin(), names.end(), trimmed) == names.end()) {
                names.push_back(trimmed);
            }
        };
        add(layerHint);
        for (const auto& candidate : layerCandidates) {
            add(candidate);
        }
        if (names.size() > kMaxLayerFilters) {
            names.resize(kMaxLayerFilters);
        }

        for (const auto& name : names) {
            filters.push_back({" where layer_name = " + SqlQuote(name), "layer_eq=" + name});
        }
        for (const auto& name : names) {
            filters.push_back({" where layer_name like " + SqlQuote("%" + name + "%"), "layer_like=" + name});
        }
        if (!targetPackage.empty()) {
            filters.push_back({" where layer_name like " + SqlQuote("%" + targetPackage + "%"), "pkg_like=" + targetPackage});
        }
    } else if (hasColumn("name") && !targetPackage.empty()) {
        filters.push_back({" where name like " + SqlQuote("%" + targetPackage + "%"), "name_like=" + targetPackage});
    }

    filters.push_back({"", "unfiltered"});
    return filters;
}
