// Repository: loopcast
// Component: Local Folder Source
// Purpose: Lists video files under a root folder, filtered by extension.
// Copyright (c) 2026 Loopcast

#include "loopcast/source/LocalFolderSource.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <system_error>

#include "loopcast/Errors.hpp"
#include "loopcast/source/MediaInfo.hpp"
#include "loopcast/util/Logger.hpp"

namespace fs = std::filesystem;

namespace loopcast::source {

using util::Logger;

namespace {

std::string LowerExtension(const fs::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

}  // namespace

LocalFolderSource::LocalFolderSource(const config::SourceConfig& config)
    : root_(config.path),
      recursive_(config.recursive),
      extensions_(config.extensions.begin(), config.extensions.end()) {}

std::string LocalFolderSource::Label() const {
  return "local:" + RootPath();
}

std::string LocalFolderSource::RootPath() const {
  std::lock_guard<std::mutex> lock(root_mutex_);
  return root_;
}

void LocalFolderSource::SwitchPath(const std::string& path) {
  {
    std::lock_guard<std::mutex> lock(root_mutex_);
    root_ = path;
  }
  Logger::Info("[LocalFolderSource] listing root is now " + path);
}

void LocalFolderSource::CheckAvailable(const util::CancellationToken&) {
  const std::string root = RootPath();
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw SourceUnavailableError("folder does not exist: " + root);
  }
}

bool LocalFolderSource::Accepts(const std::string& path) const {
  return extensions_.count(LowerExtension(fs::path(path))) > 0;
}

std::vector<MediaItem> LocalFolderSource::List(const util::CancellationToken& cancel) {
  const std::string root = RootPath();
  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    throw SourceUnavailableError("folder does not exist: " + root);
  }

  std::vector<std::string> paths;
  const auto options = fs::directory_options::skip_permission_denied;
  auto collect = [&](const fs::directory_entry& entry) {
    std::error_code file_ec;
    if (entry.is_regular_file(file_ec) && Accepts(entry.path().string())) {
      paths.push_back(entry.path().string());
    }
  };

  if (recursive_) {
    fs::recursive_directory_iterator it(root, options, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
      if (cancel.IsCancelled()) throw ShutdownRequestedError();
      collect(*it);
    }
  } else {
    fs::directory_iterator it(root, options, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
      if (cancel.IsCancelled()) throw ShutdownRequestedError();
      collect(*it);
    }
  }
  if (ec) {
    throw SourceUnavailableError("cannot read folder " + root + ": " + ec.message());
  }
  if (paths.empty()) {
    throw SourceEmptyError("no playable files under " + root);
  }

  std::sort(paths.begin(), paths.end());
  const uint64_t generation = ++generation_;

  std::vector<MediaItem> items;
  items.reserve(paths.size());
  for (const auto& path : paths) {
    MediaItem item;
    item.id = path;
    item.name = fs::path(path).filename().string();
    item.source = this;
    item.generation = generation;
    std::error_code size_ec;
    const auto size = fs::file_size(path, size_ec);
    if (!size_ec) item.size_bytes = static_cast<int64_t>(size);
    items.push_back(std::move(item));
  }

  Logger::Info("[LocalFolderSource] " + root + " -> " + std::to_string(items.size()) +
               " items (generation " + std::to_string(generation) + ")");
  return items;
}

PlayableInput LocalFolderSource::Resolve(const MediaItem& item,
                                         const util::CancellationToken&) {
  std::error_code ec;
  if (!fs::is_regular_file(item.id, ec)) {
    throw ItemUnresolvableError("file vanished: " + item.id);
  }
  PlayableInput input;
  input.uri = item.id;
  return input;
}

ItemMetadata LocalFolderSource::Describe(const MediaItem& item) {
  ItemMetadata meta = ReadMediaInfo(item.id);
  std::error_code ec;
  const auto size = fs::file_size(item.id, ec);
  if (!ec) meta.size_bytes = static_cast<int64_t>(size);
  return meta;
}

std::vector<DirectoryEntry> LocalFolderSource::Browse(const std::string& path,
                                                      const util::CancellationToken& cancel) {
  const std::string dir = path.empty() ? RootPath() : path;
  std::error_code ec;
  if (!fs::is_directory(dir, ec)) {
    throw SourceUnavailableError("folder does not exist: " + dir);
  }

  std::vector<DirectoryEntry> directories;
  std::vector<DirectoryEntry> files;
  fs::directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
    if (cancel.IsCancelled()) throw ShutdownRequestedError();
    std::error_code entry_ec;
    DirectoryEntry row;
    row.name = it->path().filename().string();
    row.path = it->path().string();
    if (it->is_directory(entry_ec)) {
      row.is_directory = true;
      directories.push_back(std::move(row));
    } else if (it->is_regular_file(entry_ec) && Accepts(row.path)) {
      const auto size = it->file_size(entry_ec);
      if (!entry_ec) row.size_bytes = static_cast<int64_t>(size);
      files.push_back(std::move(row));
    }
  }
  if (ec) {
    throw SourceUnavailableError("cannot read folder " + dir + ": " + ec.message());
  }

  auto by_name = [](const DirectoryEntry& a, const DirectoryEntry& b) { return a.name < b.name; };
  std::sort(directories.begin(), directories.end(), by_name);
  std::sort(files.begin(), files.end(), by_name);
  directories.insert(directories.end(), std::make_move_iterator(files.begin()),
                     std::make_move_iterator(files.end()));
  return directories;
}

}  // namespace loopcast::source
