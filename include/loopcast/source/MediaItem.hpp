// Repository: loopcast
// Component: Media Item Types
// Purpose: Listing results, resolved playback inputs and item metadata.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_SOURCE_MEDIA_ITEM_HPP_
#define LOOPCAST_SOURCE_MEDIA_ITEM_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace loopcast::source {

class ISourceAdapter;

// One playable entry from a listing. Immutable once listed; each listing
// produces a new generation. The adapter pointer is a non-owning
// back-reference used to re-resolve the item at playback time; adapters
// outlive every item they list.
struct MediaItem {
  std::string id;    // Absolute local path, or server path of the remote file.
  std::string name;  // File name shown to operators.
  ISourceAdapter* source = nullptr;
  uint64_t generation = 0;
  std::optional<int64_t> size_bytes;
  std::optional<int64_t> duration_ms;
};

// What the transcoder consumes: a local path or a URL, plus request headers
// (remote authentication). Never cached beyond valid_until.
struct PlayableInput {
  std::string uri;
  std::vector<std::pair<std::string, std::string>> headers;
  std::optional<std::chrono::steady_clock::time_point> valid_until;
};

struct ItemMetadata {
  std::optional<int64_t> size_bytes;
  std::optional<int64_t> duration_ms;
  std::optional<int> width;
  std::optional<int> height;
  std::string video_codec;
};

// One row of a directory browse. `path` is in the adapter's own namespace
// (filesystem path, or path below the WebDAV endpoint) and can be passed back
// to Browse() or SwitchPath().
struct DirectoryEntry {
  std::string name;
  std::string path;
  bool is_directory = false;
  std::optional<int64_t> size_bytes;
};

}  // namespace loopcast::source

#endif  // LOOPCAST_SOURCE_MEDIA_ITEM_HPP_
