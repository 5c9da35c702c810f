// Repository: loopcast
// Component: Playlist Engine
// Purpose: Single source of truth for "what plays next".
// Copyright (c) 2026 Loopcast

#include "loopcast/playlist/PlaylistEngine.hpp"

#include <algorithm>

#include "loopcast/playlist/PlaylistProgressStore.hpp"
#include "loopcast/util/Logger.hpp"

namespace loopcast::playlist {

using util::Logger;

namespace {

const char* ModeName(config::PlayMode mode) {
  return mode == config::PlayMode::kShuffled ? "shuffled" : "sequential";
}

}  // namespace

PlaylistEngine::PlaylistEngine(std::vector<source::ISourceAdapter*> sources,
                               config::PlayMode mode,
                               std::shared_ptr<PlaylistProgressStore> progress_store,
                               std::optional<uint32_t> shuffle_seed)
    : sources_(std::move(sources)),
      mode_(mode),
      progress_store_(std::move(progress_store)),
      rng_(shuffle_seed ? *shuffle_seed : std::random_device{}()) {}

PlaylistPick PlaylistEngine::Next(const util::CancellationToken& cancel) {
  ++next_calls_;

  std::lock_guard<std::mutex> rebuild(rebuild_mutex_);
  bool need_rebuild = false;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    need_rebuild = refresh_requested_ || deck_.empty() || cursor_ >= deck_.size();
  }
  if (need_rebuild) {
    PlaylistPick failure;
    if (!RebuildDeck(cancel, &failure)) {
      return failure;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  PlaylistPick pick;
  pick.index = cursor_;
  pick.item = deck_[cursor_];
  current_ = cursor_;
  ++cursor_;
  last_id_ = pick.item->id;
  SaveProgressLocked(resume_position_);
  return pick;
}

bool PlaylistEngine::EnsureDeck(const util::CancellationToken& cancel) {
  std::lock_guard<std::mutex> rebuild(rebuild_mutex_);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!deck_.empty()) return true;
  }
  PlaylistPick failure;
  if (RebuildDeck(cancel, &failure)) return true;
  Logger::Warn("[PlaylistEngine] cannot build the deck: " + failure.message);
  return false;
}

bool PlaylistEngine::RebuildDeck(const util::CancellationToken& cancel, PlaylistPick* failure) {
  std::vector<source::MediaItem> items;
  size_t unavailable = 0;
  std::string reasons;

  for (source::ISourceAdapter* adapter : sources_) {
    try {
      std::vector<source::MediaItem> listed = adapter->List(cancel);
      items.insert(items.end(), std::make_move_iterator(listed.begin()),
                   std::make_move_iterator(listed.end()));
    } catch (const ShutdownRequestedError&) {
      failure->error = ErrorKind::kShutdownRequested;
      failure->message = "listing cancelled";
      return false;
    } catch (const SourceEmptyError& e) {
      Logger::Warn("[PlaylistEngine] " + adapter->Label() + " is empty: " + e.what());
      reasons += (reasons.empty() ? "" : "; ") + std::string(e.what());
    } catch (const std::exception& e) {
      ++unavailable;
      Logger::Warn("[PlaylistEngine] " + adapter->Label() + " unavailable: " + e.what());
      reasons += (reasons.empty() ? "" : "; ") + std::string(e.what());
    }
  }

  if (items.empty()) {
    failure->error = unavailable > 0 ? ErrorKind::kSourceUnavailable : ErrorKind::kSourceEmpty;
    failure->message = reasons.empty() ? "no sources configured" : reasons;
    return false;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (mode_ == config::PlayMode::kShuffled) {
    std::shuffle(items.begin(), items.end(), rng_);
    if (items.size() > 1 && last_id_ && items.front().id == *last_id_) {
      std::uniform_int_distribution<size_t> pick_other(1, items.size() - 1);
      std::swap(items.front(), items[pick_other(rng_)]);
    }
  }
  const bool keep_position = refresh_requested_ && !restart_from_top_;
  deck_ = std::move(items);
  cursor_ = 0;
  current_.reset();
  refresh_requested_ = false;
  restart_from_top_ = false;
  ++deck_builds_;

  if (keep_position && last_id_) {
    for (size_t i = 0; i < deck_.size(); ++i) {
      if (deck_[i].id != *last_id_) continue;
      current_ = i;
      if (mode_ == config::PlayMode::kSequential && i + 1 < deck_.size()) cursor_ = i + 1;
      break;
    }
  }

  if (restore_pending_) {
    restore_pending_ = false;
    RestoreProgressLocked();
  }

  Logger::Info("[PlaylistEngine] deck built: " + std::to_string(deck_.size()) + " items, mode " +
               ModeName(mode_));
  return true;
}

void PlaylistEngine::RestoreProgressLocked() {
  if (!progress_store_) return;
  const auto saved = progress_store_->Load();
  if (!saved) return;

  // Prefer the name: listing order may have changed since the save.
  for (size_t i = 0; i < deck_.size(); ++i) {
    if (deck_[i].name == saved->item_name) {
      cursor_ = i;
      resume_position_ = saved->position_seconds;
      Logger::Info("[PlaylistEngine] resuming " + saved->item_name + " (entry " +
                   std::to_string(i + 1) + ", " + std::to_string(saved->position_seconds) + "s)");
      return;
    }
  }
  if (saved->index < deck_.size()) {
    cursor_ = saved->index;
    resume_position_ = saved->position_seconds;
    Logger::Info("[PlaylistEngine] resuming at entry " + std::to_string(saved->index + 1));
  }
}

void PlaylistEngine::SaveProgressLocked(double position_seconds) {
  if (!progress_store_ || !current_ || *current_ >= deck_.size()) return;
  PlaybackProgress progress;
  progress.index = *current_;
  progress.item_name = deck_[*current_].name;
  progress.position_seconds = position_seconds;
  progress_store_->Save(progress);
}

bool PlaylistEngine::JumpTo(size_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (index >= deck_.size()) return false;
  cursor_ = index;
  resume_position_ = 0.0;
  Logger::Info("[PlaylistEngine] next entry set to " + std::to_string(index + 1) + ": " +
               deck_[index].name);
  return true;
}

void PlaylistEngine::Refresh(bool restart_from_top) {
  std::lock_guard<std::mutex> lock(mutex_);
  refresh_requested_ = true;
  restart_from_top_ = restart_from_top;
}

std::vector<PlaylistEntry> PlaylistEngine::Entries() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<PlaylistEntry> entries;
  entries.reserve(deck_.size());
  for (size_t i = 0; i < deck_.size(); ++i) {
    entries.push_back({i, deck_[i].name, current_ && *current_ == i});
  }
  return entries;
}

size_t PlaylistEngine::Total() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return deck_.size();
}

void PlaylistEngine::RecordPosition(double position_seconds) {
  std::lock_guard<std::mutex> lock(mutex_);
  SaveProgressLocked(position_seconds);
}

double PlaylistEngine::ConsumeResumePosition() {
  std::lock_guard<std::mutex> lock(mutex_);
  const double position = resume_position_;
  resume_position_ = 0.0;
  return position;
}

}  // namespace loopcast::playlist
