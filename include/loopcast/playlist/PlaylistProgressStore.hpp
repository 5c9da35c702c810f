// Repository: loopcast
// Component: Playlist Progress Store
// Purpose: Persists the current item and position so a restart resumes where
//          the broadcast left off.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_PLAYLIST_PLAYLIST_PROGRESS_STORE_HPP_
#define LOOPCAST_PLAYLIST_PLAYLIST_PROGRESS_STORE_HPP_

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>

namespace loopcast::playlist {

struct PlaybackProgress {
  size_t index = 0;  // Deck index of the item.
  std::string item_name;
  double position_seconds = 0.0;

  // Single-line JSON object.
  std::string ToJson() const;
  // Returns nullopt if the text is corrupt or incomplete.
  static std::optional<PlaybackProgress> FromJson(const std::string& json);
};

// One JSON file, replaced atomically (write temp + rename) on every save.
class PlaylistProgressStore {
 public:
  explicit PlaylistProgressStore(std::string path);

  PlaylistProgressStore(const PlaylistProgressStore&) = delete;
  PlaylistProgressStore& operator=(const PlaylistProgressStore&) = delete;

  // nullopt when the file is missing or unreadable.
  std::optional<PlaybackProgress> Load() const;

  // Returns false (and logs) when the file cannot be written.
  bool Save(const PlaybackProgress& progress);

  const std::string& Path() const { return path_; }

 private:
  const std::string path_;
  std::mutex mutex_;
};

}  // namespace loopcast::playlist

#endif  // LOOPCAST_PLAYLIST_PLAYLIST_PROGRESS_STORE_HPP_
