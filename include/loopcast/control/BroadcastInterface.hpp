// Repository: loopcast
// Component: Broadcast Interface
// Purpose: Control-surface adapter that fronts the stream supervisor and
//          playlist engine for the gRPC service.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_CONTROL_BROADCAST_INTERFACE_HPP_
#define LOOPCAST_CONTROL_BROADCAST_INTERFACE_HPP_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "loopcast/diagnostics/DiagnosticsService.hpp"
#include "loopcast/diagnostics/SystemUsage.hpp"
#include "loopcast/playlist/PlaylistEngine.hpp"
#include "loopcast/source/MediaItem.hpp"
#include "loopcast/supervisor/StreamSupervisor.hpp"

namespace loopcast::control {

// Result structure for interface operations
struct InterfaceResult {
  bool success;
  std::string message;

  InterfaceResult(bool s, const std::string& msg) : success(s), message(msg) {}
};

struct SourceInfo {
  size_t index = 0;
  std::string label;
  std::string root;
};

// BroadcastInterface is a thin adapter between gRPC and the supervisor.
// Commands are enqueued on the supervisor's control loop; a successful
// result means "accepted", not "applied".
class BroadcastInterface {
 public:
  // `sampler` and `diagnostics` may be null; the matching calls then report
  // nothing or fail.
  BroadcastInterface(std::shared_ptr<supervisor::StreamSupervisor> supervisor,
                     std::shared_ptr<playlist::PlaylistEngine> playlist,
                     std::shared_ptr<diagnostics::SystemUsageSampler> sampler = nullptr,
                     std::shared_ptr<diagnostics::DiagnosticsService> diagnostics = nullptr);

  BroadcastInterface(const BroadcastInterface&) = delete;
  BroadcastInterface& operator=(const BroadcastInterface&) = delete;

  InterfaceResult Start();
  // Idempotent: stopping an already-stopping broadcast succeeds.
  InterfaceResult Stop();
  InterfaceResult Skip();
  // Also valid while idle: the sources are listed first and the broadcast
  // starts at `index`.
  InterfaceResult PlayItem(size_t index);
  // Drops cached listings; the next item comes from a fresh listing,
  // continuing after the current one.
  InterfaceResult RefreshPlaylist();
  // Re-roots one source, rebuilds the playlist from its top and moves on
  // to it immediately.
  InterfaceResult SwitchPath(size_t source_index, const std::string& path);
  InterfaceResult Browse(size_t source_index, const std::string& path,
                         std::vector<source::DirectoryEntry>* entries);
  InterfaceResult RunDiagnosis(diagnostics::DiagnosisReport* report);

  supervisor::SupervisorSnapshot Status() const;
  diagnostics::SystemUsage Usage() const;
  std::vector<SourceInfo> Sources() const;
  std::vector<playlist::PlaylistEntry> Playlist() const;
  config::PlayMode Mode() const;

  uint64_t Watch(supervisor::StatusObserver observer);
  void Unwatch(uint64_t id);

 private:
  std::shared_ptr<supervisor::StreamSupervisor> supervisor_;
  std::shared_ptr<playlist::PlaylistEngine> playlist_;
  std::shared_ptr<diagnostics::SystemUsageSampler> sampler_;
  std::shared_ptr<diagnostics::DiagnosticsService> diagnostics_;
};

}  // namespace loopcast::control

#endif  // LOOPCAST_CONTROL_BROADCAST_INTERFACE_HPP_
