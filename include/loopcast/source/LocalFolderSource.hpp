// Repository: loopcast
// Component: Local Folder Source
// Purpose: Lists video files under a root folder, filtered by extension.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_SOURCE_LOCAL_FOLDER_SOURCE_HPP_
#define LOOPCAST_SOURCE_LOCAL_FOLDER_SOURCE_HPP_

#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "loopcast/config/BroadcastConfig.hpp"
#include "loopcast/source/ISourceAdapter.hpp"

namespace loopcast::source {

// Items are sorted by full path. Resolution is the identity mapping to the
// local path; existence is re-checked because files may be moved or deleted
// between listing and playback.
class LocalFolderSource : public ISourceAdapter {
 public:
  explicit LocalFolderSource(const config::SourceConfig& config);

  LocalFolderSource(const LocalFolderSource&) = delete;
  LocalFolderSource& operator=(const LocalFolderSource&) = delete;

  std::string Label() const override;
  std::vector<MediaItem> List(const util::CancellationToken& cancel) override;
  PlayableInput Resolve(const MediaItem& item, const util::CancellationToken& cancel) override;
  ItemMetadata Describe(const MediaItem& item) override;
  std::vector<DirectoryEntry> Browse(const std::string& path,
                                     const util::CancellationToken& cancel) override;
  std::string RootPath() const override;
  void SwitchPath(const std::string& path) override;
  void CheckAvailable(const util::CancellationToken& cancel) override;

 private:
  bool Accepts(const std::string& path) const;

  mutable std::mutex root_mutex_;
  std::string root_;
  const bool recursive_;
  const std::set<std::string> extensions_;
  std::atomic<uint64_t> generation_{0};
};

}  // namespace loopcast::source

#endif  // LOOPCAST_SOURCE_LOCAL_FOLDER_SOURCE_HPP_
