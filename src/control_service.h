// Repository: loopcast
// Component: StreamControl gRPC Service Implementation
// Purpose: Implements the StreamControl service over BroadcastInterface.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_CONTROL_SERVICE_H_
#define LOOPCAST_CONTROL_SERVICE_H_

#include <chrono>
#include <memory>

#include <grpcpp/grpcpp.h>

#include "loopcast_control.grpc.pb.h"
#include "loopcast_control.pb.h"
#include "loopcast/control/BroadcastInterface.hpp"

namespace loopcast {
namespace control {

// StreamControlImpl implements the gRPC service defined in loopcast_control.proto.
// This is a thin adapter that delegates to BroadcastInterface.
class StreamControlImpl final : public v1::StreamControl::Service {
 public:
  explicit StreamControlImpl(std::shared_ptr<BroadcastInterface> interface,
                             std::chrono::milliseconds default_heartbeat = std::chrono::seconds(1));
  ~StreamControlImpl() override;

  // Disable copy and move
  StreamControlImpl(const StreamControlImpl&) = delete;
  StreamControlImpl& operator=(const StreamControlImpl&) = delete;

  // RPC implementations
  grpc::Status GetStatus(grpc::ServerContext* context,
                         const v1::StatusRequest* request,
                         v1::Status* response) override;

  grpc::Status Start(grpc::ServerContext* context,
                     const v1::CommandRequest* request,
                     v1::CommandResponse* response) override;

  grpc::Status Stop(grpc::ServerContext* context,
                    const v1::CommandRequest* request,
                    v1::CommandResponse* response) override;

  grpc::Status Skip(grpc::ServerContext* context,
                    const v1::CommandRequest* request,
                    v1::CommandResponse* response) override;

  grpc::Status PlayItem(grpc::ServerContext* context,
                        const v1::PlayItemRequest* request,
                        v1::CommandResponse* response) override;

  grpc::Status GetPlaylist(grpc::ServerContext* context,
                           const v1::PlaylistRequest* request,
                           v1::Playlist* response) override;

  grpc::Status RefreshPlaylist(grpc::ServerContext* context,
                               const v1::CommandRequest* request,
                               v1::CommandResponse* response) override;

  grpc::Status ListSources(grpc::ServerContext* context,
                           const v1::SourcesRequest* request,
                           v1::SourceList* response) override;

  grpc::Status BrowseDirectory(grpc::ServerContext* context,
                               const v1::BrowseRequest* request,
                               v1::DirectoryListing* response) override;

  grpc::Status SwitchPath(grpc::ServerContext* context,
                          const v1::SwitchPathRequest* request,
                          v1::CommandResponse* response) override;

  grpc::Status RunDiagnosis(grpc::ServerContext* context,
                            const v1::DiagnosisRequest* request,
                            v1::DiagnosisReport* response) override;

  // Server-streaming status feed for the web panel.
  grpc::Status WatchStatus(grpc::ServerContext* context,
                           const v1::WatchStatusRequest* request,
                           grpc::ServerWriter<v1::Status>* writer) override;

 private:
  std::shared_ptr<BroadcastInterface> interface_;
  std::chrono::milliseconds default_heartbeat_;
};

// Snapshot → wire message.
void FillStatus(const supervisor::SupervisorSnapshot& snapshot, v1::Status* out);
void FillUsage(const diagnostics::SystemUsage& usage, v1::SystemUsage* out);
void FillReport(const diagnostics::DiagnosisReport& report, v1::DiagnosisReport* out);

}  // namespace control
}  // namespace loopcast

#endif  // LOOPCAST_CONTROL_SERVICE_H_
