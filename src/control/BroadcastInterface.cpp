// Repository: loopcast
// Component: Broadcast Interface Implementation
// Copyright (c) 2026 Loopcast

#include "loopcast/control/BroadcastInterface.hpp"

#include "loopcast/Errors.hpp"

namespace loopcast::control {

using supervisor::Phase;

namespace {

InterfaceResult NoSuchSource(size_t index, size_t count) {
  return InterfaceResult(false, "source " + std::to_string(index) + " out of range (" +
                                    std::to_string(count) + " configured)");
}

}  // namespace

BroadcastInterface::BroadcastInterface(std::shared_ptr<supervisor::StreamSupervisor> supervisor,
                                       std::shared_ptr<playlist::PlaylistEngine> playlist,
                                       std::shared_ptr<diagnostics::SystemUsageSampler> sampler,
                                       std::shared_ptr<diagnostics::DiagnosticsService> diagnostics)
    : supervisor_(std::move(supervisor)),
      playlist_(std::move(playlist)),
      sampler_(std::move(sampler)),
      diagnostics_(std::move(diagnostics)) {}

InterfaceResult BroadcastInterface::Start() {
  const Phase phase = supervisor_->Snapshot().phase;
  if (!supervisor_->Start()) {
    return InterfaceResult(false, "broadcast is stopped; restart the service to start again");
  }
  if (phase != Phase::kIdle) {
    return InterfaceResult(true, std::string("already running (") + supervisor::PhaseName(phase) + ")");
  }
  return InterfaceResult(true, "starting");
}

InterfaceResult BroadcastInterface::Stop() {
  if (!supervisor_->Stop()) {
    return InterfaceResult(true, "already stopping");
  }
  return InterfaceResult(true, "stopping");
}

InterfaceResult BroadcastInterface::Skip() {
  if (!supervisor_->Skip()) {
    return InterfaceResult(false, "nothing is playing");
  }
  return InterfaceResult(true, "skipping to the next item");
}

InterfaceResult BroadcastInterface::PlayItem(size_t index) {
  if (supervisor_->StopRequested()) {
    return InterfaceResult(false, "broadcast is stopping");
  }
  if (!supervisor_->PlayIndex(index)) {
    if (supervisor_->StopRequested()) return InterfaceResult(false, "broadcast is stopping");
    const size_t total = playlist_->Total();
    if (total == 0) return InterfaceResult(false, "playlist is empty: no source could be listed");
    return InterfaceResult(false, "index " + std::to_string(index) + " out of range (playlist has " +
                                      std::to_string(total) + " entries)");
  }
  return InterfaceResult(true, "playing entry " + std::to_string(index + 1));
}

InterfaceResult BroadcastInterface::RefreshPlaylist() {
  for (source::ISourceAdapter* source : playlist_->Sources()) source->InvalidateCache();
  playlist_->Refresh();
  return InterfaceResult(true, "playlist will be re-read before the next item");
}

InterfaceResult BroadcastInterface::SwitchPath(size_t source_index, const std::string& path) {
  const auto& sources = playlist_->Sources();
  if (source_index >= sources.size()) return NoSuchSource(source_index, sources.size());
  if (supervisor_->StopRequested()) return InterfaceResult(false, "broadcast is stopping");

  sources[source_index]->SwitchPath(path);
  playlist_->Refresh(/*restart_from_top=*/true);
  // Idle: the new root is used on Start. Otherwise move on right away.
  supervisor_->Skip();
  return InterfaceResult(true, "playing from " + sources[source_index]->RootPath());
}

InterfaceResult BroadcastInterface::Browse(size_t source_index, const std::string& path,
                                           std::vector<source::DirectoryEntry>* entries) {
  const auto& sources = playlist_->Sources();
  if (source_index >= sources.size()) return NoSuchSource(source_index, sources.size());
  util::CancellationToken cancel;
  try {
    *entries = sources[source_index]->Browse(path, cancel);
  } catch (const Error& e) {
    return InterfaceResult(false, e.what());
  }
  return InterfaceResult(true, std::to_string(entries->size()) + " entries");
}

InterfaceResult BroadcastInterface::RunDiagnosis(diagnostics::DiagnosisReport* report) {
  if (!diagnostics_) return InterfaceResult(false, "diagnostics are disabled");
  const bool live = supervisor_->Snapshot().phase == Phase::kStreaming;
  try {
    *report = diagnostics_->RunNow("requested by operator", live);
  } catch (const ShutdownRequestedError&) {
    return InterfaceResult(false, "service is shutting down");
  }
  return InterfaceResult(true, std::to_string(report->PassedCount()) + "/" +
                                   std::to_string(report->checks.size()) + " checks passed");
}

supervisor::SupervisorSnapshot BroadcastInterface::Status() const {
  return supervisor_->Snapshot();
}

diagnostics::SystemUsage BroadcastInterface::Usage() const {
  if (!sampler_) return {};
  return sampler_->Sample();
}

std::vector<SourceInfo> BroadcastInterface::Sources() const {
  std::vector<SourceInfo> out;
  const auto& sources = playlist_->Sources();
  for (size_t i = 0; i < sources.size(); ++i) {
    SourceInfo info;
    info.index = i;
    info.label = sources[i]->Label();
    info.root = sources[i]->RootPath();
    out.push_back(std::move(info));
  }
  return out;
}

std::vector<playlist::PlaylistEntry> BroadcastInterface::Playlist() const {
  return playlist_->Entries();
}

config::PlayMode BroadcastInterface::Mode() const { return playlist_->Mode(); }

uint64_t BroadcastInterface::Watch(supervisor::StatusObserver observer) {
  return supervisor_->AddObserver(std::move(observer));
}

void BroadcastInterface::Unwatch(uint64_t id) { supervisor_->RemoveObserver(id); }

}  // namespace loopcast::control
