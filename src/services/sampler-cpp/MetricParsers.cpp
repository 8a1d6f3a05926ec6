#include "MetricParsers.hpp"

#include <algorithm>
#include <regex>
#include <sstream>
#include <vector>

namespace {
std::string Trim(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::vector<std::string> SplitWhitespace(const std::string& text) {
    std::vector<std::string> parts;
    std::istringstream stream(text);
    std::string part;
    while (stream >> part) {
        parts.push_back(part);
    }
    return parts;
}

bool ParseUnsigned(const std::string& text, unsigned long long& outValue) {
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](unsigned char ch) { return ch >= '0' && ch <= '9'; })) {
        return false;
    }
    try {
        outValue = std::stoull(text);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

bool SearchNumber(const std::string& text, const std::regex& pattern, long long& outValue) {
    std::smatch match;
    if (!std::regex_search(text, match, pattern)) {
        return false;
    }
    try {
        outValue = std::stoll(match[1].str());
    } catch (const std::exception&) {
        return false;
    }
    return true;
}
} // namespace

bool ParseProcStatTicks(const std::string& statLine, unsigned long long& outTicks) {
    const auto close = statLine.rfind(')');
    if (close == std::string::npos || close == 0) {
        return false;
    }

    const auto fields = SplitWhitespace(statLine.substr(close + 1));
    if (fields.size() <= 12) {
        return false;
    }

    unsigned long long utime = 0;
    unsigned long long stime = 0;
    if (!ParseUnsigned(fields[11], utime) || !ParseUnsigned(fields[12], stime)) {
        return false;
    }
    outTicks = utime + stime;
    return true;
}

bool ParsePssKb(const std::string& dumpsys, long long& outKb) {
    static const std::regex totalPss(R"(TOTAL\s+PSS:\s*(\d+))");
    static const std::regex total(R"(\bTOTAL:\s*(\d+))");
    return SearchNumber(dumpsys, totalPss, outKb) || SearchNumber(dumpsys, total, outKb);
}

bool ParseGfxTotals(const std::string& dumpsys, long long& outTotal, long long& outJanky) {
    static const std::regex totalFrames(R"(Total\s+frames\s+rendered:\s*(\d+))");
    static const std::regex jankyFrames(R"(Janky\s+frames:\s*(\d+))");

    if (!SearchNumber(dumpsys, jankyFrames, outJanky)) {
        outJanky = -1;
    }
    return SearchNumber(dumpsys, totalFrames, outTotal);
}

std::map<std::string, double> ParseBatteryInfo(const std::string& dumpsys) {
    static const std::regex level(R"(^level:\s*(\d+))");
    static const std::regex temperature(R"(^temperature:\s*(\d+))");
    static const std::regex voltage(R"(^voltage:\s*(\d+))");

    std::map<std::string, double> values;
    std::istringstream stream(dumpsys);
    std::string rawLine;
    while (std::getline(stream, rawLine)) {
        const std::string line = Trim(rawLine);
        long long value = 0;
        if (SearchNumber(line, level, value)) {
            values["battery_pct"] = static_cast<double>(value);
        } else if (SearchNumber(line, temperature, value)) {
            values["battery_temp_c"] = static_cast<double>(value) / 10.0;
        } else if (SearchNumber(line, voltage, value)) {
            values["battery_voltage_v"] = static_cast<double>(value) / 1000.0;
        }
    }
    return values;
}

std::map<std::string, double> ParseMemInfo(const std::string& meminfo) {
    std::map<std::string, double> values;
    std::istringstream stream(meminfo);
    std::string line;
    while (std::getline(stream, line)) {
        std::istringstream fields(line);
        std::string key;
        unsigned long long valueKb = 0;
        std::string unit;
        if (!(fields >> key >> valueKb >> unit) || unit != "kB") {
            continue;
        }

        if (key == "MemTotal:") {
            values["mem_total_mb"] = static_cast<double>(valueKb) / 1024.0;
        } else if (key == "MemAvailable:") {
            values["mem_avail_mb"] = static_cast<double>(valueKb) / 1024.0;
        }
    }
    return values;
}

bool ParseCpuTotalLine(const std::string& statLine, unsigned long long& outTotal, unsigned long long& outIdle) {
    const auto fields = SplitWhitespace(statLine);
    if (fields.size() < 8 || fields[0] != "cpu") {
        return false;
    }

    unsigned long long total = 0;
    unsigned long long idle = 0;
    for (size_t i = 1; i < 8; ++i) {
        unsigned long long value = 0;
        if (!ParseUnsigned(fields[i], value)) {
            return false;
        }
        total += value;
        if (i == 4) {
            idle = value;
        }
    }

    outTotal = total;
    outIdle = idle;
    return true;
}

bool ParseNetDevTotals(const std::string& netDev, unsigned long long& outRxBytes, unsigned long long& outTxBytes) {
    unsigned long long rxTotal = 0;
    unsigned long long txTotal = 0;

    std::istringstream stream(netDev);
    std::string rawLine;
    while (std::getline(stream, rawLine)) {
        const std::string line = Trim(rawLine);
        const auto colon = line.find(':');
        if (colon == std::string::npos || line.rfind("Inter", 0) == 0 || line.rfind("face", 0) == 0) {
            continue;
        }

        const std::string iface = Trim(line.substr(0, colon));
        if (iface == "lo") {
            continue;
        }

        // rx: bytes packets errs drop fifo frame compressed multicast, then tx.
        const auto fields = SplitWhitespace(line.substr(colon + 1));
        if (fields.size() < 9) {
            continue;
        }
        unsigned long long rx = 0;
        unsigned long long tx = 0;
        if (ParseUnsigned(fields[0], rx) && ParseUnsigned(fields[8], tx)) {
            rxTotal += rx;
            txTotal += tx;
        }
    }

    if (rxTotal == 0 && txTotal == 0) {
        return false;
    }
    outRxBytes = rxTotal;
    outTxBytes = txTotal;
    return true;
}

std::map<std::string, double> ParseCpuFrequencies(const std::string& output) {
    std::map<std::string, double> values;
    std::istringstream stream(output);
    std::string rawLine;
    int index = 0;
    while (std::getline(stream, rawLine)) {
        unsigned long long khz = 0;
        if (!ParseUnsigned(Trim(rawLine), khz) || khz == 0) {
            continue;
        }
        values["cpu_freq_khz_" + std::to_string(index)] = static_cast<double>(khz);
        ++index;
    }
    return values;
}

std::string FirstPid(const std::string& pidofOutput) {
    const auto parts = SplitWhitespace(pidofOutput);
    return parts.empty() ? std::string() : parts.front();
}

double ClampPercent(double value) {
    return std::max(0.0, std::min(100.0, value));
}

double ComputeProcessCpuPercent(
    unsigned long long deltaTicks,
    long clockTicks,
    int64_t deltaMs,
    int cores) {
    const double cpuSeconds = static_cast<double>(deltaTicks) / static_cast<double>(std::max(1L, clockTicks));
    const double wallSeconds = static_cast<double>(std::max<int64_t>(1, deltaMs)) / 1000.0;
    return ClampPercent(cpuSeconds / (wallSeconds * static_cast<double>(std::max(1, cores))) * 100.0);
}

double ComputeThroughputKbps(double deltaBytes, int64_t deltaMs) {
    const double seconds = static_cast<double>(std::max<int64_t>(1, deltaMs)) / 1000.0;
    return std::max(0.0, deltaBytes) / 1024.0 / seconds * 8.0;
}
