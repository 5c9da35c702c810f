// Repository: loopcast
// Component: Broadcast Configuration
// Copyright (c) 2026 Loopcast

#include "loopcast/config/BroadcastConfig.hpp"

#include <algorithm>
#include <cctype>

namespace loopcast::config {

std::vector<std::string> DefaultExtensions() {
  return {".mp4", ".mkv", ".flv", ".avi", ".mov", ".ts", ".webm", ".m4v"};
}

std::optional<int64_t> BitrateKbps(const std::string& bitrate) {
  if (bitrate.empty()) return std::nullopt;
  const char suffix = static_cast<char>(std::tolower(static_cast<unsigned char>(bitrate.back())));
  const bool has_suffix = suffix == 'k' || suffix == 'm';
  const std::string digits = has_suffix ? bitrate.substr(0, bitrate.size() - 1) : bitrate;
  if (digits.empty() || digits.size() > 12 ||
      !std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  const int64_t n = std::stoll(digits);
  if (suffix == 'k') return n;
  if (suffix == 'm') return n * 1000;
  return n / 1000;
}

}  // namespace loopcast::config
