#include "FrameTimelineAnalyzer.hpp"

#include <cmath>
#include <iostream>
#include <map>
#include <string>
#include <vector>

namespace {
int Fail(const std::string& message) {
    std::cerr << message << std::endl;
    return 1;
}

// Answers by substring of the SQL text; the first matching entry wins.
struct FakeTraceDb {
    std::vector<std::pair<std::string, std::string>> answers;
    std::vector<std::string> queries;

    FrameTimelineAnalyzer::QueryFn AsQuery() {
        return [this](const std::string& sql, std::string& outText, std::string& outError) {
            queries.push_back(sql);
            for (const auto& answer : answers) {
                if (sql.find(answer.first) != std::string::npos) {
                    outText = answer.second;
                    return true;
                }
            }
            outError = "no such table";
            return false;
        };
    }
};

const char* kColumnsWithLayer =
    "\"cid\",\"name\",\"type\",\"notnull\",\"dflt_value\",\"pk\"\n"
    "0|id|INT|0||0\n"
    "1|ts|INT|0||0\n"
    "2|dur|INT|0||0\n"
    "3|layer_name|STRING|0||0\n";
} // namespace

int main() {
    if (FrameTimelineAnalyzer::SqlQuote("it's") != "'it''s'") {
        return Fail("SQL quoting: " + FrameTimelineAnalyzer::SqlQuote("it's"));
    }
    if (FrameTimelineAnalyzer::PickTable({"android_frames", "expected_frame_timeline_slice", "actual_frame_timeline_slice"})
        != "actual_frame_timeline_slice") {
        return Fail("actual_frame_timeline_slice should be preferred.");
    }
    if (FrameTimelineAnalyzer::PickTable({"android_frames"}) != "android_frames") {
        return Fail("unknown table should fall back to the first one.");
    }

    {
        // exact layer match finds nothing, LIKE finds 12 frames, unfiltered has 40.
        FakeTraceDb db;
        db.answers = {
            {"from sqlite_master", "\"name\"\n\"actual_frame_timeline_slice\"\n\"expected_frame_timeline_slice\"\n"},
            {"pragma table_info(actual_frame_timeline_slice)", kColumnsWithLayer},
            {"where layer_name = ", "\"0|0|0\"\n"},
            {"where layer_name like '%com.game.app%'", "\"12|1000000000|1200000000\"\n"},
            {"from actual_frame_timeline_slice;", "\"40|1000000000|1500000000\"\n"},
        };
        FrameTimelineAnalyzer analyzer(db.AsQuery());
        const FpsEstimate estimate = analyzer.Analyze("com.game.app", 1500, "", {"com.game.app"});
        if (!estimate.fps) {
            return Fail("expected an fps from the LIKE filter: " + estimate.detail);
        }
        if (std::fabs(*estimate.fps - 60.0) > 1e-6) {
            return Fail("12 frames over 200ms should be 60 fps, got " + std::to_string(*estimate.fps));
        }
        if (estimate.detail.find("filter=layer_like=com.game.app") == std::string::npos
            || estimate.detail.find("count=12") == std::string::npos) {
            return Fail("detail should name the LIKE filter: " + estimate.detail);
        }
        for (const auto& query : db.queries) {
            if (query.find("from actual_frame_timeline_slice;") != std::string::npos) {
                return Fail("unfiltered count must not run once a filter matched.");
            }
        }
    }

    {
        FakeTraceDb db;
        db.answers = {
            {"from sqlite_master", "name\nframe_timeline_slice\n"},
            {"pragma table_info", kColumnsWithLayer},
            {" where ", "\"0|0|0\"\n"},
            {"from frame_timeline_slice;", "\"25|0|0\"\n"},
        };
        FrameTimelineAnalyzer analyzer(db.AsQuery());
        const FpsEstimate estimate = analyzer.Analyze("com.game.app", 1000, "", {});
        if (!estimate.fps || std::fabs(*estimate.fps - 25.0) > 1e-6) {
            return Fail("unfiltered count without span should use the duration.");
        }
        if (estimate.detail.find("durMs=1000") == std::string::npos) {
            return Fail("duration-based detail expected: " + estimate.detail);
        }
    }

    {
        FakeTraceDb db;
        db.answers = {
            {"from sqlite_master", "name\nactual_frame_timeline_slice\n"},
            {"pragma table_info", kColumnsWithLayer},
            {"from actual_frame_timeline_slice", "\"0|0|0\"\n"},
        };
        FrameTimelineAnalyzer analyzer(db.AsQuery());
        const FpsEstimate estimate = analyzer.Analyze("com.game.app", 1500, "", {});
        if (estimate.fps) {
            return Fail("zero frames everywhere must not yield an fps.");
        }
        if (estimate.detail != "frame_timeline count is 0 (unfiltered total=0)") {
            return Fail("unexpected empty detail: " + estimate.detail);
        }
    }

    {
        // No frame-timeline table: the ftrace slice scan takes over.
        FakeTraceDb db;
        db.answers = {
            {"name like '%frame%timeline%'", "name\n"},
            {"type='table' and name='slice'", "\"count(*)\"\n1\n"},
            {"name = 'Choreographer#doFrame'", "\"1|5|5\"\n"},
            {"name = 'DrawFrame'", "\"31|2000000000|2500000000\"\n"},
        };
        FrameTimelineAnalyzer analyzer(db.AsQuery());
        const FpsEstimate estimate = analyzer.Analyze("com.game.app", 1500, "", {});
        if (!estimate.fps || std::fabs(*estimate.fps - 62.0) > 1e-6) {
            return Fail("DrawFrame slices should give 62 fps: " + estimate.detail);
        }
        if (estimate.detail != "ftrace_slice marker=DrawFrame count=31 spanS=0.50") {
            return Fail("unexpected slice detail: " + estimate.detail);
        }
    }

    {
        FakeTraceDb db;
        db.answers = {
            {"name like '%frame%timeline%'", "name\n"},
            {"type='table' and name='slice'", "0\n"},
        };
        FrameTimelineAnalyzer analyzer(db.AsQuery());
        const FpsEstimate estimate = analyzer.Analyze("com.game.app", 1500, "", {});
        if (estimate.fps || estimate.detail.find("no frame_timeline table") == std::string::npos) {
            return Fail("missing tables should be reported: " + estimate.detail);
        }
    }

    {
        FakeTraceDb db;
        FrameTimelineAnalyzer analyzer(db.AsQuery());
        const FpsEstimate estimate = analyzer.Analyze("com.game.app", 1500, "", {});
        if (estimate.fps || estimate.detail != "trace_processor query failed: no such table") {
            return Fail("query failure should surface the error: " + estimate.detail);
        }
    }

    return 0;
}
