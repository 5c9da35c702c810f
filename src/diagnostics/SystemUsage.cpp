// Repository: loopcast
// Component: System Usage Implementation
// Copyright (c) 2026 Loopcast

#include "loopcast/diagnostics/SystemUsage.hpp"

#include <sys/statvfs.h>

#include <fstream>
#include <sstream>
#include <vector>

namespace loopcast::diagnostics {

namespace {

std::optional<std::string> ReadFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) return std::nullopt;
  std::ostringstream out;
  out << file.rdbuf();
  return out.str();
}

}  // namespace

std::optional<CpuTimes> ParseProcStat(const std::string& text) {
  std::istringstream lines(text);
  std::string line;
  while (std::getline(lines, line)) {
    if (line.compare(0, 4, "cpu ") != 0) continue;
    std::istringstream fields(line.substr(4));
    std::vector<uint64_t> values;
    uint64_t value = 0;
    while (fields >> value) values.push_back(value);
    // user nice system idle [iowait irq softirq steal ...]
    if (values.size() < 4) return std::nullopt;
    CpuTimes times;
    // guest and guest_nice are already counted in user and nice.
    const size_t counted = values.size() > 8 ? 8 : values.size();
    for (size_t i = 0; i < counted; ++i) times.total += values[i];
    uint64_t idle = values[3];
    if (values.size() > 4) idle += values[4];
    times.busy = times.total - idle;
    return times;
  }
  return std::nullopt;
}

std::optional<double> ParseMeminfoUsedPercent(const std::string& text) {
  std::istringstream lines(text);
  std::string line;
  std::optional<double> total;
  std::optional<double> available;
  while (std::getline(lines, line)) {
    std::istringstream fields(line);
    std::string key;
    double kb = 0;
    if (!(fields >> key >> kb)) continue;
    if (key == "MemTotal:") total = kb;
    if (key == "MemAvailable:") available = kb;
  }
  if (!total || !available || *total <= 0) return std::nullopt;
  return (*total - *available) * 100.0 / *total;
}

std::optional<double> CpuPercentBetween(const CpuTimes& before, const CpuTimes& after) {
  if (after.total <= before.total || after.busy < before.busy) return std::nullopt;
  return static_cast<double>(after.busy - before.busy) * 100.0 /
         static_cast<double>(after.total - before.total);
}

SystemUsageSampler::SystemUsageSampler(std::string proc_root, std::string disk_path,
                                       std::chrono::milliseconds min_interval)
    : proc_root_(std::move(proc_root)),
      disk_path_(std::move(disk_path)),
      min_interval_(min_interval) {}

SystemUsage SystemUsageSampler::Sample() {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto now = std::chrono::steady_clock::now();
  if (last_read_ && now - *last_read_ < min_interval_) return last_usage_;

  SystemUsage usage;
  if (auto stat = ReadFile(proc_root_ + "/stat")) {
    if (auto times = ParseProcStat(*stat)) {
      usage.cpu_percent = CpuPercentBetween(last_cpu_.value_or(CpuTimes{}), *times);
      // No tick elapsed since the last reading: keep the older baseline.
      if (usage.cpu_percent || !last_cpu_) last_cpu_ = times;
    }
  }
  if (auto meminfo = ReadFile(proc_root_ + "/meminfo")) {
    usage.memory_percent = ParseMeminfoUsedPercent(*meminfo);
  }

  struct statvfs info;
  if (statvfs(disk_path_.c_str(), &info) == 0 && info.f_blocks > 0) {
    const double total = static_cast<double>(info.f_blocks);
    const double free_blocks = static_cast<double>(info.f_bfree);
    usage.disk_percent = (total - free_blocks) * 100.0 / total;
  }
  last_read_ = now;
  last_usage_ = usage;
  return usage;
}

}  // namespace loopcast::diagnostics
