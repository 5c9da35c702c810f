// Repository: loopcast
// Component: Broadcaster Entry Point
// Purpose: Loads the configuration, wires sources, playlist engine and
//          stream supervisor, serves the StreamControl gRPC API and runs
//          until SIGINT/SIGTERM.
// Copyright (c) 2026 Loopcast
//
// Usage:
//   loopcast --config /etc/loopcast/config.json [--listen 0.0.0.0:50071]
//            [--autostart | --no-autostart]

#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/grpcpp.h>

#include "control_service.h"
#include "loopcast/Errors.hpp"
#include "loopcast/config/ConfigLoader.hpp"
#include "loopcast/control/BroadcastInterface.hpp"
#include "loopcast/diagnostics/AlertNotifier.hpp"
#include "loopcast/diagnostics/BroadcastDiagnostics.hpp"
#include "loopcast/diagnostics/DiagnosticsService.hpp"
#include "loopcast/diagnostics/SystemUsage.hpp"
#include "loopcast/playlist/PlaylistEngine.hpp"
#include "loopcast/playlist/PlaylistProgressStore.hpp"
#include "loopcast/source/LocalFolderSource.hpp"
#include "loopcast/source/WebDavSource.hpp"
#include "loopcast/source/WebDavTransport.hpp"
#include "loopcast/supervisor/ChildProcess.hpp"
#include "loopcast/supervisor/StreamSupervisor.hpp"
#include "loopcast/util/Logger.hpp"

namespace {

using loopcast::util::Logger;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
struct CliArgs {
  std::string config_path;
  std::string listen_address;      // Empty: keep the configured address.
  std::optional<bool> autostart;   // nullopt: keep the configured value.
  bool help = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " --config PATH [OPTIONS]\n"
            << "\n"
            << "24/7 broadcaster: loops local or WebDAV video files into ffmpeg\n"
            << "and keeps the stream up across crashes and network drops.\n"
            << "\n"
            << "Options:\n"
            << "  --config PATH        JSON configuration file (required)\n"
            << "  --listen ADDR        StreamControl gRPC address (default from config)\n"
            << "  --autostart          Start streaming immediately (default)\n"
            << "  --no-autostart       Wait for a Start command\n"
            << "  --help               Show this help message\n"
            << "\n"
            << "Environment:\n"
            << "  LOOPCAST_DEBUG=1     Log transcoder output and phase changes\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--listen" && i + 1 < argc) {
      args.listen_address = argv[++i];
    } else if (arg == "--autostart") {
      args.autostart = true;
    } else if (arg == "--no-autostart") {
      args.autostart = false;
    } else {
      args.error = "Unknown argument: " + arg;
      return args;
    }
  }

  if (args.config_path.empty()) {
    args.error = "--config is required";
    return args;
  }

  args.valid = true;
  return args;
}

std::vector<std::unique_ptr<loopcast::source::ISourceAdapter>> BuildSources(
    const loopcast::config::BroadcastConfig& config) {
  std::vector<std::unique_ptr<loopcast::source::ISourceAdapter>> sources;
  for (const auto& source_config : config.sources) {
    if (source_config.type == loopcast::config::SourceType::kLocal) {
      sources.push_back(std::make_unique<loopcast::source::LocalFolderSource>(source_config));
    } else {
      sources.push_back(std::make_unique<loopcast::source::WebDavSource>(
          source_config,
          std::make_unique<loopcast::source::BeastWebDavTransport>(source_config)));
    }
    Logger::Info("[Main] source: " + sources.back()->Label());
  }
  return sources;
}

int Run(const CliArgs& args) {
  loopcast::config::BroadcastConfig config;
  std::vector<std::unique_ptr<loopcast::source::ISourceAdapter>> sources;
  try {
    config = loopcast::config::LoadConfigFile(args.config_path);
    if (!args.listen_address.empty()) config.control.listen_address = args.listen_address;
    if (args.autostart) config.control.autostart = *args.autostart;
    loopcast::config::ValidateConfig(config);
    sources = BuildSources(config);
  } catch (const loopcast::ConfigError& e) {
    Logger::Error(std::string("[Main] configuration error: ") + e.what());
    return 2;
  }

  std::vector<loopcast::source::ISourceAdapter*> adapters;
  for (const auto& source : sources) adapters.push_back(source.get());

  std::shared_ptr<loopcast::playlist::PlaylistProgressStore> progress_store;
  if (!config.playback.progress_file.empty()) {
    progress_store =
        std::make_shared<loopcast::playlist::PlaylistProgressStore>(config.playback.progress_file);
  }

  auto playlist = std::make_shared<loopcast::playlist::PlaylistEngine>(
      adapters, config.playback.mode, progress_store);
  auto launcher = std::make_shared<loopcast::supervisor::PosixProcessLauncher>();
  auto supervisor =
      std::make_shared<loopcast::supervisor::StreamSupervisor>(config, *playlist, launcher);

  auto sampler = std::make_shared<loopcast::diagnostics::SystemUsageSampler>();
  std::shared_ptr<loopcast::diagnostics::IAlertNotifier> notifier;
  if (config.email.enabled) {
    notifier = std::make_shared<loopcast::diagnostics::SmtpAlertNotifier>(config.email);
    Logger::Info("[Main] alerts go to " + std::to_string(config.email.to.size()) +
                 " recipient(s) via " + config.email.host);
  }
  std::weak_ptr<loopcast::supervisor::StreamSupervisor> weak_supervisor = supervisor;
  auto diagnostics = std::make_shared<loopcast::diagnostics::DiagnosticsService>(
      config.diagnostics,
      std::make_shared<loopcast::diagnostics::BroadcastDiagnostics>(config, adapters, launcher,
                                                                    sampler),
      notifier, [weak_supervisor] {
        auto live = weak_supervisor.lock();
        return live && live->Snapshot().phase == loopcast::supervisor::Phase::kStreaming;
      });
  if (config.diagnostics.enabled) {
    supervisor->AddObserver([diagnostics](const loopcast::supervisor::SupervisorSnapshot& s) {
      diagnostics->OnStatus(s);
    });
  }

  auto interface = std::make_shared<loopcast::control::BroadcastInterface>(
      supervisor, playlist, sampler, diagnostics);
  loopcast::control::StreamControlImpl service(interface);

  grpc::ServerBuilder builder;
  int bound_port = 0;
  builder.AddListeningPort(config.control.listen_address, grpc::InsecureServerCredentials(),
                           &bound_port);
  builder.RegisterService(&service);
  std::unique_ptr<grpc::Server> server = builder.BuildAndStart();
  if (!server || bound_port == 0) {
    Logger::Error("[Main] failed to listen on " + config.control.listen_address);
    return 1;
  }
  Logger::Info("[Main] StreamControl listening on " + config.control.listen_address);

  if (config.email.enabled && config.email.notify_on_start) {
    loopcast::diagnostics::Alert alert;
    alert.subject = "Broadcaster started";
    alert.body = "loopcast is up with " + std::to_string(adapters.size()) + " source(s).\n";
    for (const auto* adapter : adapters) alert.body += "  " + adapter->Label() + "\n";
    diagnostics->Notify(std::move(alert));
  }

  if (config.control.autostart) {
    supervisor->Start();
  } else {
    Logger::Info("[Main] waiting for a Start command");
  }

  // The process keeps serving status after a Stop from the panel; only a
  // signal ends it.
  while (!g_termination_requested.load(std::memory_order_acquire)) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
  Logger::Info("[Main] termination requested, shutting down");

  supervisor->Stop();
  supervisor->WaitUntilStopped();
  diagnostics->Shutdown();

  // Open WatchStatus streams end on the Stopped transition; bound the rest.
  server->Shutdown(std::chrono::system_clock::now() + std::chrono::seconds(2));
  server->Wait();
  return 0;
}

}  // namespace

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return 0;
  }

  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return 1;
  }

  // Install signal handlers
  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  // A dropped panel connection must not kill the broadcaster.
  std::signal(SIGPIPE, SIG_IGN);

  try {
    return Run(args);
  } catch (const std::exception& e) {
    Logger::Error(std::string("[Main] fatal: ") + e.what());
    return 1;
  }
}
