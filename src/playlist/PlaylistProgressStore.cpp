// Repository: loopcast
// Component: Playlist Progress Store
// Purpose: Persists the current item and position so a restart resumes where
//          the broadcast left off.
// Copyright (c) 2026 Loopcast

#include "loopcast/playlist/PlaylistProgressStore.hpp"

#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "loopcast/util/JsonFields.hpp"
#include "loopcast/util/Logger.hpp"

namespace loopcast::playlist {

using util::Logger;

std::string PlaybackProgress::ToJson() const {
  std::ostringstream o;
  o << "{\"index\":" << index
    << ",\"item_name\":\"" << util::JsonEscape(item_name) << "\""
    << ",\"position_seconds\":" << std::fixed << std::setprecision(1) << position_seconds
    << "}";
  return o.str();
}

std::optional<PlaybackProgress> PlaybackProgress::FromJson(const std::string& json) {
  const auto first = json.find_first_not_of(" \t\r\n");
  const auto last = json.find_last_not_of(" \t\r\n");
  if (first == std::string::npos || json[first] != '{' || json[last] != '}') {
    return std::nullopt;
  }
  auto index = util::JsonGetInt(json, "index");
  auto name = util::JsonGetString(json, "item_name");
  if (!index || !name || *index < 0) return std::nullopt;

  PlaybackProgress progress;
  progress.index = static_cast<size_t>(*index);
  progress.item_name = *name;
  const double position = util::JsonGetDouble(json, "position_seconds").value_or(0.0);
  progress.position_seconds = std::isfinite(position) && position > 0.0 ? position : 0.0;
  return progress;
}

PlaylistProgressStore::PlaylistProgressStore(std::string path) : path_(std::move(path)) {}

std::optional<PlaybackProgress> PlaylistProgressStore::Load() const {
  std::ifstream file(path_);
  if (!file.is_open()) return std::nullopt;
  std::stringstream buffer;
  buffer << file.rdbuf();
  auto progress = PlaybackProgress::FromJson(buffer.str());
  if (!progress) {
    Logger::Warn("[PlaylistProgressStore] ignoring corrupt progress file " + path_);
  }
  return progress;
}

bool PlaylistProgressStore::Save(const PlaybackProgress& progress) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open()) {
      Logger::Warn("[PlaylistProgressStore] cannot write " + tmp_path);
      return false;
    }
    out << progress.ToJson() << '\n';
    out.flush();
    if (!out) {
      Logger::Warn("[PlaylistProgressStore] write failed for " + tmp_path);
      return false;
    }
  }
  if (std::rename(tmp_path.c_str(), path_.c_str()) != 0) {
    Logger::Warn("[PlaylistProgressStore] rename to " + path_ + " failed: " +
                 std::strerror(errno));
    return false;
  }
  return true;
}

}  // namespace loopcast::playlist
