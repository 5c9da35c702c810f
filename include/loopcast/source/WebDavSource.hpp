// Repository: loopcast
// Component: WebDAV Source
// Purpose: Lists and resolves video files on a remote WebDAV server.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_SOURCE_WEBDAV_SOURCE_HPP_
#define LOOPCAST_SOURCE_WEBDAV_SOURCE_HPP_

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "loopcast/config/BroadcastConfig.hpp"
#include "loopcast/source/ISourceAdapter.hpp"
#include "loopcast/source/WebDavTransport.hpp"
#include "loopcast/util/TimeSource.hpp"

namespace loopcast::source {

// Listing walks the collection tree with PROPFIND Depth 1 and is cached for
// listing_ttl. A failed listing never poisons the cache: the next List()
// retries the network. Resolution is never cached; every playback checks the
// item again and obtains a fresh input reference.
class WebDavSource : public ISourceAdapter {
 public:
  WebDavSource(const config::SourceConfig& config,
               std::unique_ptr<IWebDavTransport> transport,
               std::shared_ptr<util::ITimeSource> time_source =
                   std::make_shared<util::SteadyTimeSource>());

  WebDavSource(const WebDavSource&) = delete;
  WebDavSource& operator=(const WebDavSource&) = delete;

  std::string Label() const override;
  std::vector<MediaItem> List(const util::CancellationToken& cancel) override;
  PlayableInput Resolve(const MediaItem& item, const util::CancellationToken& cancel) override;
  ItemMetadata Describe(const MediaItem& item) override;
  std::vector<DirectoryEntry> Browse(const std::string& path,
                                     const util::CancellationToken& cancel) override;
  std::string RootPath() const override;
  void SwitchPath(const std::string& path) override;
  void InvalidateCache() override;
  void CheckAvailable(const util::CancellationToken& cancel) override;

  // Number of PROPFIND walks performed (cache misses). For diagnostics.
  uint64_t ListingFetches() const { return listing_fetches_.load(); }

 private:
  void Walk(const std::string& server_path, bool is_root,
            const util::CancellationToken& cancel, std::vector<MediaItem>* items);
  bool Accepts(const std::string& server_path) const;
  std::string StreamUrl(const std::string& server_path) const;
  std::string ServerRoot() const;
  // Server path → path below the endpoint ("/remote/videos/a" → "/videos/a").
  std::string EndpointRelative(const std::string& server_path) const;

  const std::string endpoint_url_;
  const DavEndpoint endpoint_;
  const bool recursive_;
  const std::set<std::string> extensions_;
  const std::chrono::milliseconds listing_ttl_;
  const std::chrono::milliseconds resolve_validity_;
  const std::unique_ptr<IWebDavTransport> transport_;
  const std::shared_ptr<util::ITimeSource> time_source_;

  mutable std::mutex root_mutex_;
  std::string root_path_;  // Below the endpoint, guarded by root_mutex_.

  std::mutex cache_mutex_;
  std::vector<MediaItem> cached_items_;
  std::optional<std::chrono::steady_clock::time_point> cached_at_;
  uint64_t generation_ = 0;
  std::atomic<uint64_t> listing_fetches_{0};
};

}  // namespace loopcast::source

#endif  // LOOPCAST_SOURCE_WEBDAV_SOURCE_HPP_
