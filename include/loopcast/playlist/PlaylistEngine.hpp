// Repository: loopcast
// Component: Playlist Engine
// Purpose: Single source of truth for "what plays next". Builds a deck from
//          one or more source adapters and loops it forever, sequentially or
//          shuffled.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_PLAYLIST_PLAYLIST_ENGINE_HPP_
#define LOOPCAST_PLAYLIST_PLAYLIST_ENGINE_HPP_

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "loopcast/Errors.hpp"
#include "loopcast/config/BroadcastConfig.hpp"
#include "loopcast/source/ISourceAdapter.hpp"
#include "loopcast/util/CancellationToken.hpp"

namespace loopcast::playlist {

class PlaylistProgressStore;

// Result of Next(). Either an item, or the typed reason there is none
// (kSourceUnavailable, kSourceEmpty, kShutdownRequested). A failed pick leaves
// the engine waiting for refresh; the caller retries after a delay.
struct PlaylistPick {
  std::optional<source::MediaItem> item;
  size_t index = 0;  // Deck position of item.
  ErrorKind error = ErrorKind::kNone;
  std::string message;

  bool ok() const { return item.has_value(); }
};

struct PlaylistEntry {
  size_t index = 0;
  std::string name;
  bool current = false;
};

// Deck invariants:
// - The cursor always indexes the deck, or the deck is rebuilt before use.
// - Shuffled mode permutes a whole deck once, at deck exhaustion only, so each
//   pass plays every item exactly once.
// - A new pass never starts with the item that ended the previous pass unless
//   the deck has a single item.
//
// Next() is meant to be called from one thread (the supervisor control loop);
// the remaining accessors are safe from any thread.
class PlaylistEngine {
 public:
  PlaylistEngine(std::vector<source::ISourceAdapter*> sources,
                 config::PlayMode mode,
                 std::shared_ptr<PlaylistProgressStore> progress_store = nullptr,
                 std::optional<uint32_t> shuffle_seed = std::nullopt);

  PlaylistEngine(const PlaylistEngine&) = delete;
  PlaylistEngine& operator=(const PlaylistEngine&) = delete;

  PlaylistPick Next(const util::CancellationToken& cancel);

  // Lists the sources now if no deck has been built yet. False when the
  // listing fails (the reason is logged).
  bool EnsureDeck(const util::CancellationToken& cancel);

  // Makes the next Next() return deck entry `index` from its beginning.
  // False if out of range.
  bool JumpTo(size_t index);

  // Forces a relisting on the next Next(). By default playback continues
  // after the last handed-out item if it is still listed; with
  // restart_from_top the new deck plays from its first entry.
  void Refresh(bool restart_from_top = false);

  std::vector<PlaylistEntry> Entries() const;
  size_t Total() const;
  config::PlayMode Mode() const { return mode_; }
  const std::vector<source::ISourceAdapter*>& Sources() const { return sources_; }

  // Persists the position reached in the current item (no-op without a store).
  void RecordPosition(double position_seconds);

  // Seconds into the current item to resume from after a restart. One-shot:
  // returns 0 after the first call.
  double ConsumeResumePosition();

  uint64_t NextCalls() const { return next_calls_.load(); }
  uint64_t DeckBuilds() const { return deck_builds_.load(); }

 private:
  // Lists every adapter and installs a fresh deck. Called with rebuild_mutex_
  // held and mutex_ not held.
  bool RebuildDeck(const util::CancellationToken& cancel, PlaylistPick* failure);
  void RestoreProgressLocked();
  void SaveProgressLocked(double position_seconds);

  const std::vector<source::ISourceAdapter*> sources_;
  const config::PlayMode mode_;
  const std::shared_ptr<PlaylistProgressStore> progress_store_;

  // Serializes listings (control loop and operator commands).
  std::mutex rebuild_mutex_;

  mutable std::mutex mutex_;
  std::mt19937 rng_;
  std::vector<source::MediaItem> deck_;
  size_t cursor_ = 0;                   // Next deck index to hand out.
  std::optional<size_t> current_;       // Deck index of the last handed-out item.
  std::optional<std::string> last_id_;  // Item that ended the previous pick.
  bool refresh_requested_ = false;
  bool restart_from_top_ = false;
  bool restore_pending_ = true;
  double resume_position_ = 0.0;

  std::atomic<uint64_t> next_calls_{0};
  std::atomic<uint64_t> deck_builds_{0};
};

}  // namespace loopcast::playlist

#endif  // LOOPCAST_PLAYLIST_PLAYLIST_ENGINE_HPP_
