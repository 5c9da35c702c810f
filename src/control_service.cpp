// Repository: loopcast
// Component: StreamControl gRPC Service Implementation
// Purpose: Implements the StreamControl service over BroadcastInterface.
// Copyright (c) 2026 Loopcast

#include "control_service.h"

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

#include "loopcast/util/Logger.hpp"

namespace loopcast
{
  namespace control
  {

    using util::Logger;

    namespace
    {

      v1::Phase ToProto(supervisor::Phase phase)
      {
        switch (phase)
        {
        case supervisor::Phase::kIdle: return v1::PHASE_IDLE;
        case supervisor::Phase::kStarting: return v1::PHASE_STARTING;
        case supervisor::Phase::kStreaming: return v1::PHASE_STREAMING;
        case supervisor::Phase::kCompleted: return v1::PHASE_COMPLETED;
        case supervisor::Phase::kCrashed: return v1::PHASE_CRASHED;
        case supervisor::Phase::kReconnecting: return v1::PHASE_RECONNECTING;
        case supervisor::Phase::kStopping: return v1::PHASE_STOPPING;
        case supervisor::Phase::kStopped: return v1::PHASE_STOPPED;
        }
        return v1::PHASE_IDLE;
      }

      v1::ErrorKind ToProto(ErrorKind kind)
      {
        switch (kind)
        {
        case ErrorKind::kNone: return v1::ERROR_KIND_NONE;
        case ErrorKind::kConfigError: return v1::ERROR_KIND_CONFIG;
        case ErrorKind::kSourceUnavailable: return v1::ERROR_KIND_SOURCE_UNAVAILABLE;
        case ErrorKind::kSourceEmpty: return v1::ERROR_KIND_SOURCE_EMPTY;
        case ErrorKind::kItemUnresolvable: return v1::ERROR_KIND_ITEM_UNRESOLVABLE;
        case ErrorKind::kStreamProcessCrash: return v1::ERROR_KIND_STREAM_PROCESS_CRASH;
        case ErrorKind::kShutdownRequested: return v1::ERROR_KIND_SHUTDOWN_REQUESTED;
        }
        return v1::ERROR_KIND_NONE;
      }

      grpc::Status ToGrpcStatus(const InterfaceResult &result,
                                grpc::StatusCode failure = grpc::StatusCode::FAILED_PRECONDITION)
      {
        if (result.success)
          return grpc::Status::OK;
        grpc::StatusCode code = failure;
        if (result.message.find("out of range") != std::string::npos)
        {
          code = grpc::StatusCode::OUT_OF_RANGE;
        }
        return grpc::Status(code, result.message);
      }

      void FillCommandResponse(const InterfaceResult &result, v1::CommandResponse *response)
      {
        response->set_success(result.success);
        response->set_message(result.message);
      }

    } // namespace

    void FillStatus(const supervisor::SupervisorSnapshot &snapshot, v1::Status *out)
    {
      out->set_phase(ToProto(snapshot.phase));
      out->set_active_item(snapshot.active_item);
      out->set_active_index(snapshot.active_index ? static_cast<int32_t>(*snapshot.active_index) : -1);
      out->set_consecutive_failures(snapshot.consecutive_failures);
      out->set_item_retries(snapshot.item_retries);
      out->set_last_error(snapshot.last_error);
      out->set_last_error_kind(ToProto(snapshot.last_error_kind));
      out->set_backoff_delay_ms(snapshot.backoff_delay.count());
      out->set_items_played(snapshot.items_played);
      out->set_launches(snapshot.launches);
      out->set_forced_kills(snapshot.forced_kills);
      out->set_uptime_seconds(snapshot.uptime.count());
      out->set_sequence(snapshot.sequence);
      out->set_active_size_bytes(snapshot.active_size_bytes.value_or(-1));

      v1::Progress *progress = out->mutable_progress();
      const supervisor::TranscoderProgress &p = snapshot.progress;
      progress->set_has_duration(p.duration_seconds.has_value());
      progress->set_duration_seconds(p.duration_seconds.value_or(0.0));
      progress->set_position_seconds(p.position_seconds);
      progress->set_percent(p.Percent().value_or(0.0));
      progress->set_bitrate_kbps(p.bitrate_kbps.value_or(0.0));
      progress->set_speed(p.speed.value_or(0.0));
    }

    void FillUsage(const diagnostics::SystemUsage &usage, v1::SystemUsage *out)
    {
      out->set_cpu_percent(usage.cpu_percent.value_or(-1.0));
      out->set_memory_percent(usage.memory_percent.value_or(-1.0));
      out->set_disk_percent(usage.disk_percent.value_or(-1.0));
    }

    void FillReport(const diagnostics::DiagnosisReport &report, v1::DiagnosisReport *out)
    {
      out->set_time(report.time);
      out->set_reason(report.reason);
      out->set_passed(static_cast<uint32_t>(report.PassedCount()));
      for (const auto &check : report.checks)
      {
        v1::DiagnosticCheck *c = out->add_checks();
        c->set_id(check.id);
        c->set_name(check.name);
        c->set_ok(check.ok);
        c->set_detail(check.detail);
      }
    }

    StreamControlImpl::StreamControlImpl(std::shared_ptr<BroadcastInterface> interface,
                                         std::chrono::milliseconds default_heartbeat)
        : interface_(std::move(interface)), default_heartbeat_(default_heartbeat)
    {
    }

    StreamControlImpl::~StreamControlImpl() = default;

    grpc::Status StreamControlImpl::GetStatus(grpc::ServerContext *context,
                                              const v1::StatusRequest *request,
                                              v1::Status *response)
    {
      FillStatus(interface_->Status(), response);
      FillUsage(interface_->Usage(), response->mutable_usage());
      return grpc::Status::OK;
    }

    grpc::Status StreamControlImpl::Start(grpc::ServerContext *context,
                                          const v1::CommandRequest *request,
                                          v1::CommandResponse *response)
    {
      Logger::Info("[StreamControl] Start requested");
      auto result = interface_->Start();
      FillCommandResponse(result, response);
      return ToGrpcStatus(result);
    }

    grpc::Status StreamControlImpl::Stop(grpc::ServerContext *context,
                                         const v1::CommandRequest *request,
                                         v1::CommandResponse *response)
    {
      Logger::Info("[StreamControl] Stop requested");
      auto result = interface_->Stop();
      FillCommandResponse(result, response);
      return ToGrpcStatus(result);
    }

    grpc::Status StreamControlImpl::Skip(grpc::ServerContext *context,
                                         const v1::CommandRequest *request,
                                         v1::CommandResponse *response)
    {
      Logger::Info("[StreamControl] Skip requested");
      auto result = interface_->Skip();
      FillCommandResponse(result, response);
      return ToGrpcStatus(result);
    }

    grpc::Status StreamControlImpl::PlayItem(grpc::ServerContext *context,
                                             const v1::PlayItemRequest *request,
                                             v1::CommandResponse *response)
    {
      const uint32_t index = request->index();
      Logger::Info("[StreamControl] PlayItem requested: index=" + std::to_string(index));
      auto result = interface_->PlayItem(index);
      FillCommandResponse(result, response);
      if (!result.success)
      {
        Logger::Warn("[StreamControl] PlayItem rejected: " + result.message);
      }
      return ToGrpcStatus(result);
    }

    grpc::Status StreamControlImpl::GetPlaylist(grpc::ServerContext *context,
                                                const v1::PlaylistRequest *request,
                                                v1::Playlist *response)
    {
      const auto entries = interface_->Playlist();
      response->set_mode(interface_->Mode() == config::PlayMode::kShuffled ? "shuffled" : "sequential");
      response->set_total(static_cast<uint32_t>(entries.size()));
      for (const auto &entry : entries)
      {
        v1::PlaylistEntry *out = response->add_entries();
        out->set_index(static_cast<uint32_t>(entry.index));
        out->set_name(entry.name);
        out->set_current(entry.current);
      }
      return grpc::Status::OK;
    }

    grpc::Status StreamControlImpl::RefreshPlaylist(grpc::ServerContext *context,
                                                    const v1::CommandRequest *request,
                                                    v1::CommandResponse *response)
    {
      Logger::Info("[StreamControl] RefreshPlaylist requested");
      auto result = interface_->RefreshPlaylist();
      FillCommandResponse(result, response);
      return ToGrpcStatus(result);
    }

    grpc::Status StreamControlImpl::ListSources(grpc::ServerContext *context,
                                                const v1::SourcesRequest *request,
                                                v1::SourceList *response)
    {
      for (const auto &source : interface_->Sources())
      {
        v1::SourceInfo *out = response->add_sources();
        out->set_index(static_cast<uint32_t>(source.index));
        out->set_label(source.label);
        out->set_root(source.root);
      }
      return grpc::Status::OK;
    }

    grpc::Status StreamControlImpl::BrowseDirectory(grpc::ServerContext *context,
                                                    const v1::BrowseRequest *request,
                                                    v1::DirectoryListing *response)
    {
      std::vector<source::DirectoryEntry> entries;
      auto result = interface_->Browse(request->source_index(), request->path(), &entries);
      if (!result.success)
      {
        Logger::Warn("[StreamControl] BrowseDirectory failed: " + result.message);
        return ToGrpcStatus(result, grpc::StatusCode::UNAVAILABLE);
      }
      response->set_path(request->path());
      for (const auto &entry : entries)
      {
        v1::DirectoryEntry *out = response->add_entries();
        out->set_name(entry.name);
        out->set_path(entry.path);
        out->set_is_directory(entry.is_directory);
        out->set_size_bytes(entry.size_bytes.value_or(-1));
      }
      return grpc::Status::OK;
    }

    grpc::Status StreamControlImpl::SwitchPath(grpc::ServerContext *context,
                                               const v1::SwitchPathRequest *request,
                                               v1::CommandResponse *response)
    {
      Logger::Info("[StreamControl] SwitchPath requested: source=" +
                   std::to_string(request->source_index()) + " path=" + request->path());
      auto result = interface_->SwitchPath(request->source_index(), request->path());
      FillCommandResponse(result, response);
      return ToGrpcStatus(result);
    }

    grpc::Status StreamControlImpl::RunDiagnosis(grpc::ServerContext *context,
                                                 const v1::DiagnosisRequest *request,
                                                 v1::DiagnosisReport *response)
    {
      Logger::Info("[StreamControl] RunDiagnosis requested");
      diagnostics::DiagnosisReport report;
      auto result = interface_->RunDiagnosis(&report);
      if (!result.success)
      {
        return ToGrpcStatus(result, grpc::StatusCode::UNAVAILABLE);
      }
      FillReport(report, response);
      return grpc::Status::OK;
    }

    grpc::Status StreamControlImpl::WatchStatus(grpc::ServerContext *context,
                                                const v1::WatchStatusRequest *request,
                                                grpc::ServerWriter<v1::Status> *writer)
    {
      const std::chrono::milliseconds heartbeat =
          request->heartbeat_ms() > 0 ? std::chrono::milliseconds(request->heartbeat_ms())
                                      : default_heartbeat_;

      // Shared with the observer, which runs on the supervisor's control loop
      // and may fire after this call has returned but before Unwatch lands.
      struct Feed
      {
        std::mutex mutex;
        std::condition_variable cv;
        std::deque<supervisor::SupervisorSnapshot> pending;
      };
      auto feed = std::make_shared<Feed>();

      const uint64_t watch_id = interface_->Watch([feed](const supervisor::SupervisorSnapshot &snapshot) {
        {
          std::lock_guard<std::mutex> lock(feed->mutex);
          feed->pending.push_back(snapshot);
        }
        feed->cv.notify_one();
      });
      Logger::Debug("[StreamControl] WatchStatus subscriber " + std::to_string(watch_id) + " attached");

      v1::Status message;
      FillStatus(interface_->Status(), &message);
      FillUsage(interface_->Usage(), message.mutable_usage());
      bool open = writer->Write(message);

      while (open && !context->IsCancelled())
      {
        std::deque<supervisor::SupervisorSnapshot> batch;
        {
          std::unique_lock<std::mutex> lock(feed->mutex);
          feed->cv.wait_for(lock, heartbeat, [&] { return !feed->pending.empty(); });
          batch.swap(feed->pending);
        }
        if (batch.empty())
        {
          // Heartbeat: carries fresh progress even without a transition.
          batch.push_back(interface_->Status());
        }
        bool stopped = false;
        for (const auto &snapshot : batch)
        {
          message.Clear();
          FillStatus(snapshot, &message);
          FillUsage(interface_->Usage(), message.mutable_usage());
          if (!writer->Write(message))
          {
            open = false;
            break;
          }
          stopped = snapshot.phase == supervisor::Phase::kStopped;
        }
        if (stopped)
          break;
      }

      interface_->Unwatch(watch_id);
      Logger::Debug("[StreamControl] WatchStatus subscriber " + std::to_string(watch_id) + " detached");
      return grpc::Status::OK;
    }

  } // namespace control
} // namespace loopcast
