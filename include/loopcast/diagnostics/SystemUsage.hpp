// Repository: loopcast
// Component: System Usage
// Purpose: Host CPU, memory and disk utilisation from /proc and statvfs.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_DIAGNOSTICS_SYSTEM_USAGE_HPP_
#define LOOPCAST_DIAGNOSTICS_SYSTEM_USAGE_HPP_

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace loopcast::diagnostics {

// Aggregate jiffies from the "cpu " line of /proc/stat.
struct CpuTimes {
  uint64_t busy = 0;
  uint64_t total = 0;
};

std::optional<CpuTimes> ParseProcStat(const std::string& text);

// (MemTotal - MemAvailable) / MemTotal from /proc/meminfo, in percent.
std::optional<double> ParseMeminfoUsedPercent(const std::string& text);

// Percentage of busy time between two samples.
std::optional<double> CpuPercentBetween(const CpuTimes& before, const CpuTimes& after);

struct SystemUsage {
  std::optional<double> cpu_percent;
  std::optional<double> memory_percent;
  std::optional<double> disk_percent;
};

// CPU usage is measured since the previous reading (since boot on the first
// call). Calls within `min_interval` of a reading return it unchanged, so
// many status watchers share one measurement window. Thread-safe.
class SystemUsageSampler {
 public:
  explicit SystemUsageSampler(std::string proc_root = "/proc", std::string disk_path = "/",
                              std::chrono::milliseconds min_interval = std::chrono::seconds(1));

  SystemUsage Sample();

 private:
  const std::string proc_root_;
  const std::string disk_path_;
  const std::chrono::milliseconds min_interval_;
  std::mutex mutex_;
  std::optional<CpuTimes> last_cpu_;
  std::optional<std::chrono::steady_clock::time_point> last_read_;
  SystemUsage last_usage_;
};

}  // namespace loopcast::diagnostics

#endif  // LOOPCAST_DIAGNOSTICS_SYSTEM_USAGE_HPP_
