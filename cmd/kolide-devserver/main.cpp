#include <chrono>
#include <csignal>
#include <iostream>
#include <map>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using launcher::observability::BoolField;
using launcher::observability::IntField;
using launcher::observability::StringField;
using launcher::runtime::Server;

static constexpr const char* kDefaultGrpcBindAddress = "0.0.0.0:8800";

static volatile std::sig_atomic_t g_running       = 1;
static volatile std::sig_atomic_t g_reload        = 0;
static volatile std::sig_atomic_t g_toggle_device = 0;

void HandleSignal(int signal) {
  switch (signal) {
    case SIGHUP:
      g_reload = 1;
      break;
    case SIGUSR1:
      g_toggle_device = 1;
      break;
    default:
      g_running = 0;
  }
}

// SIGHUP: re-read the served config, queries and kill switch. Listener
// settings need a restart.
static void Reload(const std::string& config_path, launcher::devserver::MemoryService& service) {
  try {
    const auto  config    = launcher::config::ConfigLoader::LoadFromYaml(config_path);
    const auto& devserver = config.devserver();

    service.SetConfig(devserver.config_json().empty() ? "{}" : devserver.config_json());
    service.SetQueries(std::map<std::string, std::string>(devserver.queries().begin(), devserver.queries().end()));
    service.SetDisableDevice(devserver.disable_device());

    LAUNCHER_LOG_INFO("devserver reloaded", {IntField("queries", devserver.queries_size()),
                                             BoolField("disable_device", devserver.disable_device())});
  } catch (const std::exception& e) {
    LAUNCHER_LOG_ERROR("devserver reload failed, keeping previous settings", {StringField("error", e.what())});
  }
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: kolide-devserver <config.yaml> OR kolide-devserver --config <config.yaml>\n"
              << "  SIGHUP reloads config_json, queries and disable_device\n"
              << "  SIGUSR1 toggles disable_device" << std::endl;
    return 1;
  }

  try {
    auto config = launcher::config::ConfigLoader::LoadFromYaml(config_path);
    launcher::observability::InitializeLogging(config);

    auto app = launcher::factory::Build(config);

    const std::string grpc_bind_address = config.devserver().grpc_bind_address().empty()
                                              ? std::string(kDefaultGrpcBindAddress)
                                              : config.devserver().grpc_bind_address();

    Server server(grpc_bind_address, app.grpc_services, app.grpc_credentials);

    // Register signal handlers before starting servers to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);
    std::signal(SIGHUP, HandleSignal);
    std::signal(SIGUSR1, HandleSignal);

    server.Start();
    if (app.jsonrpc_server) {
      app.jsonrpc_server->Start();
    }
    LAUNCHER_LOG_INFO("kolide devserver started",
                      {IntField("grpc_port", server.port()),
                       IntField("jsonrpc_port", app.jsonrpc_server ? app.jsonrpc_server->port() : 0),
                       BoolField("tls", app.grpc_credentials != nullptr)});

    while (g_running) {
      std::this_thread::sleep_for(std::chrono::milliseconds(200));

      if (g_reload) {
        g_reload = 0;
        Reload(config_path, *app.service);
      }
      if (g_toggle_device) {
        g_toggle_device = 0;
        const bool disabled = !app.service->DisableDevice();
        app.service->SetDisableDevice(disabled);
        LAUNCHER_LOG_WARN("disable_device toggled", {BoolField("disable_device", disabled)});
      }
    }

    LAUNCHER_LOG_INFO("Shutting down kolide devserver");

    if (app.jsonrpc_server) {
      app.jsonrpc_server->Stop();
    }
    server.Stop();
    launcher::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    LAUNCHER_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    launcher::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
