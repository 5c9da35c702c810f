// Repository: loopcast
// Component: WebDAV Source
// Purpose: Lists and resolves video files on a remote WebDAV server.
// Copyright (c) 2026 Loopcast

#include "loopcast/source/WebDavSource.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

#include "loopcast/Errors.hpp"
#include "loopcast/source/MultistatusParser.hpp"
#include "loopcast/util/Logger.hpp"

namespace loopcast::source {

using util::Logger;

namespace {

constexpr int kMultiStatus = 207;

std::string JoinPath(const std::string& base, const std::string& path) {
  std::string joined = base;
  if (!path.empty() && path != "/") {
    if (path.front() != '/') joined += '/';
    joined += path;
  }
  while (joined.size() > 1 && joined.back() == '/') joined.pop_back();
  return joined.empty() ? "/" : joined;
}

std::string BaseName(const std::string& server_path) {
  const size_t slash = server_path.rfind('/');
  return slash == std::string::npos ? server_path : server_path.substr(slash + 1);
}

std::string LowerExtension(const std::string& server_path) {
  const std::string name = BaseName(server_path);
  const size_t dot = name.rfind('.');
  if (dot == std::string::npos) return "";
  std::string ext = name.substr(dot);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

std::string DescribeStatus(int status) {
  if (status == 401 || status == 403) {
    return "authentication rejected (HTTP " + std::to_string(status) + ")";
  }
  return "HTTP " + std::to_string(status);
}

}  // namespace

WebDavSource::WebDavSource(const config::SourceConfig& config,
                           std::unique_ptr<IWebDavTransport> transport,
                           std::shared_ptr<util::ITimeSource> time_source)
    : endpoint_url_(config.endpoint),
      endpoint_(DavEndpoint::Parse(config.endpoint)),
      recursive_(config.recursive),
      extensions_(config.extensions.begin(), config.extensions.end()),
      listing_ttl_(config.listing_ttl),
      resolve_validity_(config.resolve_validity),
      transport_(std::move(transport)),
      time_source_(std::move(time_source)),
      root_path_(JoinPath("", config.path)) {}

std::string WebDavSource::Label() const {
  return "webdav:" + endpoint_.Origin() + ServerRoot();
}

std::string WebDavSource::RootPath() const {
  std::lock_guard<std::mutex> lock(root_mutex_);
  return root_path_;
}

std::string WebDavSource::ServerRoot() const {
  return JoinPath(endpoint_.base_path, RootPath());
}

std::string WebDavSource::EndpointRelative(const std::string& server_path) const {
  const std::string& base = endpoint_.base_path;
  if (!base.empty() && server_path.compare(0, base.size(), base) == 0) {
    return JoinPath("", server_path.substr(base.size()));
  }
  return JoinPath("", server_path);
}

bool WebDavSource::Accepts(const std::string& server_path) const {
  return extensions_.count(LowerExtension(server_path)) > 0;
}

std::string WebDavSource::StreamUrl(const std::string& server_path) const {
  return endpoint_.Origin() + PercentEncodePath(server_path);
}

void WebDavSource::InvalidateCache() {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  cached_at_.reset();
  cached_items_.clear();
}

void WebDavSource::SwitchPath(const std::string& path) {
  {
    std::lock_guard<std::mutex> lock(root_mutex_);
    root_path_ = JoinPath("", path);
  }
  InvalidateCache();
  Logger::Info("[WebDavSource] listing root is now " + Label());
}

void WebDavSource::CheckAvailable(const util::CancellationToken& cancel) {
  const std::string root = ServerRoot();
  const HttpResponse response = transport_->Propfind(root, 0, cancel);
  if (response.status != kMultiStatus) {
    throw SourceUnavailableError("PROPFIND " + root + ": " + DescribeStatus(response.status));
  }
}

std::vector<DirectoryEntry> WebDavSource::Browse(const std::string& path,
                                                 const util::CancellationToken& cancel) {
  const std::string server_path =
      path.empty() ? ServerRoot() : JoinPath(endpoint_.base_path, path);
  const HttpResponse response = transport_->Propfind(server_path, 1, cancel);
  if (response.status != kMultiStatus) {
    throw SourceUnavailableError("PROPFIND " + server_path + ": " +
                                 DescribeStatus(response.status));
  }

  std::vector<DirectoryEntry> directories;
  std::vector<DirectoryEntry> files;
  for (const auto& entry : ParseMultistatus(response.body)) {
    if (entry.server_path == server_path) continue;
    if (!entry.is_collection && !Accepts(entry.server_path)) continue;
    DirectoryEntry row;
    row.name = BaseName(entry.server_path);
    row.path = EndpointRelative(entry.server_path);
    row.is_directory = entry.is_collection;
    if (!entry.is_collection) row.size_bytes = entry.content_length;
    (entry.is_collection ? directories : files).push_back(std::move(row));
  }

  auto by_name = [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; };
  std::sort(directories.begin(), directories.end(), by_name);
  std::sort(files.begin(), files.end(), by_name);
  directories.insert(directories.end(), std::make_move_iterator(files.begin()),
                     std::make_move_iterator(files.end()));
  return directories;
}

std::vector<MediaItem> WebDavSource::List(const util::CancellationToken& cancel) {
  std::lock_guard<std::mutex> lock(cache_mutex_);
  const auto now = time_source_->Now();
  if (cached_at_ && now - *cached_at_ < listing_ttl_) {
    return cached_items_;
  }

  ++listing_fetches_;
  std::vector<MediaItem> items;
  Walk(ServerRoot(), /*is_root=*/true, cancel, &items);

  if (items.empty()) {
    throw SourceEmptyError("no playable files under " + Label());
  }

  std::sort(items.begin(), items.end(),
            [](const MediaItem& a, const MediaItem& b) { return a.id < b.id; });
  ++generation_;
  for (auto& item : items) item.generation = generation_;

  cached_items_ = items;
  cached_at_ = now;
  Logger::Info("[WebDavSource] " + Label() + " -> " + std::to_string(items.size()) +
               " items (generation " + std::to_string(generation_) + ")");
  return items;
}

void WebDavSource::Walk(const std::string& server_path, bool is_root,
                        const util::CancellationToken& cancel,
                        std::vector<MediaItem>* items) {
  if (cancel.IsCancelled()) throw ShutdownRequestedError();

  std::vector<DavEntry> entries;
  try {
    const HttpResponse response = transport_->Propfind(server_path, 1, cancel);
    if (response.status != kMultiStatus) {
      throw SourceUnavailableError("PROPFIND " + server_path + ": " +
                                   DescribeStatus(response.status));
    }
    entries = ParseMultistatus(response.body);
  } catch (const SourceUnavailableError& e) {
    // The root must list; a broken subdirectory only loses its own files.
    if (is_root) throw;
    Logger::Warn(std::string("[WebDavSource] skipping subdirectory: ") + e.what());
    return;
  }

  for (const auto& entry : entries) {
    if (entry.server_path == server_path) continue;  // The collection itself.
    if (entry.is_collection) {
      if (recursive_) Walk(entry.server_path, /*is_root=*/false, cancel, items);
      continue;
    }
    if (!Accepts(entry.server_path)) continue;

    MediaItem item;
    item.id = entry.server_path;
    item.name = BaseName(entry.server_path);
    item.source = this;
    item.size_bytes = entry.content_length;
    items->push_back(std::move(item));
  }
}

PlayableInput WebDavSource::Resolve(const MediaItem& item,
                                    const util::CancellationToken& cancel) {
  const HttpResponse check = transport_->Propfind(item.id, 0, cancel);
  if (check.status == 404 || check.status == 410) {
    throw ItemUnresolvableError("remote file vanished: " + item.id);
  }
  if (check.status != kMultiStatus) {
    throw SourceUnavailableError("PROPFIND " + item.id + ": " + DescribeStatus(check.status));
  }

  PlayableInput input;
  input.valid_until = time_source_->Now() + resolve_validity_;

  const HttpResponse reply = transport_->FetchFirstByte(item.id, cancel);
  if (reply.status == 404 || reply.status == 410) {
    throw ItemUnresolvableError("remote file vanished: " + item.id);
  }
  const std::string location = reply.Header("location");
  if (reply.status >= 300 && reply.status < 400 && !location.empty()) {
    // Pre-signed download URL: authorization travels in the URL itself.
    input.uri = location.front() == '/' ? endpoint_.Origin() + location : location;
    Logger::Debug("[WebDavSource] " + item.name + " redirected to short-lived URL");
    return input;
  }
  if (reply.status < 200 || reply.status >= 300) {
    throw SourceUnavailableError("GET " + item.id + ": " + DescribeStatus(reply.status));
  }

  input.uri = StreamUrl(item.id);
  input.headers.emplace_back("Authorization", transport_->AuthorizationHeader());
  return input;
}

ItemMetadata WebDavSource::Describe(const MediaItem& item) {
  ItemMetadata meta;
  meta.size_bytes = item.size_bytes;
  meta.duration_ms = item.duration_ms;
  return meta;
}

}  // namespace loopcast::source
