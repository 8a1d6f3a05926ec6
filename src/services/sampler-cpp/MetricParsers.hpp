#pragma once

#include <cstdint>
#include <map>
#include <string>

// Text parsers for the device-side sources read by the metric collector.
// None of them touch the device; each takes the raw command output.

// utime + stime from a /proc/<pid>/stat line. Fields are counted after the
// closing parenthesis of the command name, which may itself contain spaces.
bool ParseProcStatTicks(const std::string& statLine, unsigned long long& outTicks);

// "TOTAL PSS: <kb>" or, on older releases, "TOTAL: <kb>" from dumpsys meminfo.
bool ParsePssKb(const std::string& dumpsys, long long& outKb);

// "Total frames rendered: N" from dumpsys gfxinfo; outJanky is -1 when absent.
bool ParseGfxTotals(const std::string& dumpsys, long long& outTotal, long long& outJanky);

// battery_pct, battery_temp_c (tenths of a degree) and battery_voltage_v (mV).
std::map<std::string, double> ParseBatteryInfo(const std::string& dumpsys);

// mem_total_mb and mem_avail_mb from /proc/meminfo.
std::map<std::string, double> ParseMemInfo(const std::string& meminfo);

// First seven counters of the aggregate "cpu" line of /proc/stat.
bool ParseCpuTotalLine(const std::string& statLine, unsigned long long& outTotal, unsigned long long& outIdle);

// Receive and transmit byte totals over every interface except lo. False when
// both totals are zero.
bool ParseNetDevTotals(const std::string& netDev, unsigned long long& outRxBytes, unsigned long long& outTxBytes);

// One scaling_cur_freq value per line; positive values become cpu_freq_khz_<n>.
std::map<std::string, double> ParseCpuFrequencies(const std::string& output);

// First pid printed by pidof, or empty.
std::string FirstPid(const std::string& pidofOutput);

double ClampPercent(double value);

double ComputeProcessCpuPercent(
    unsigned long long deltaTicks,
    long clockTicks,
    int64_t deltaMs,
    int cores);

double ComputeThroughputKbps(double deltaBytes, int64_t deltaMs);
