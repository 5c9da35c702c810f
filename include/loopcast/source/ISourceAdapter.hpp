// Repository: loopcast
// Component: Source Adapter Interface
// Purpose: One capability surface over where media files live.
//          Production: LocalFolderSource, WebDavSource.
//          Tests: scripted fakes.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_SOURCE_ISOURCE_ADAPTER_HPP_
#define LOOPCAST_SOURCE_ISOURCE_ADAPTER_HPP_

#include <string>
#include <vector>

#include "loopcast/source/MediaItem.hpp"
#include "loopcast/util/CancellationToken.hpp"

namespace loopcast::source {

class ISourceAdapter {
 public:
  virtual ~ISourceAdapter() = default;

  // Human-readable location for logs ("local:/srv/media", "webdav:https://...").
  virtual std::string Label() const = 0;

  // Ordered listing of playable items.
  // Throws SourceUnavailableError on connectivity/auth failure,
  // SourceEmptyError when nothing playable is found.
  virtual std::vector<MediaItem> List(const util::CancellationToken& cancel) = 0;

  // Fresh input reference for one playback.
  // Throws ItemUnresolvableError if the item vanished since listing,
  // SourceUnavailableError on connectivity failure, ShutdownRequestedError
  // once `cancel` fires.
  virtual PlayableInput Resolve(const MediaItem& item, const util::CancellationToken& cancel) = 0;

  // Best-effort metadata; unknown fields stay unset. Does not throw.
  virtual ItemMetadata Describe(const MediaItem& item) = 0;

  // Directories first, then playable files; each group sorted by name.
  // An empty path browses the current listing root.
  virtual std::vector<DirectoryEntry> Browse(const std::string& path,
                                             const util::CancellationToken& cancel) = 0;

  // Current listing root, in the same namespace as Browse() paths.
  virtual std::string RootPath() const = 0;

  // Moves the listing root. Takes effect on the next List().
  virtual void SwitchPath(const std::string& path) = 0;

  // Drops any cached listing so the next List() reads the source again.
  virtual void InvalidateCache() {}

  // Throws SourceUnavailableError when the root cannot be reached.
  virtual void CheckAvailable(const util::CancellationToken& cancel) = 0;
};

}  // namespace loopcast::source

#endif  // LOOPCAST_SOURCE_ISOURCE_ADAPTER_HPP_
