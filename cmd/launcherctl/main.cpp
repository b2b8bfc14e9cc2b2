#include <sys/utsname.h>
#include <unistd.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "client/cpp/kolide_client.h"
#include "internal/config/config_loader.hpp"
#include "internal/config/flags.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using launcher::service::CallContext;
using launcher::service::LogType;

static void Usage() {
  std::cout << "Usage:\n"
            << "  launcherctl --config <config.yaml> enroll\n"
            << "  launcherctl --config <config.yaml> config <node_key>\n"
            << "  launcherctl --config <config.yaml> queries <node_key>\n"
            << "  launcherctl --config <config.yaml> logs <node_key> <type=string|snapshot|health|init|status|agent> <log>...\n"
            << "  launcherctl --config <config.yaml> health\n";
}

static std::optional<LogType> ParseLogType(const std::string& value) {
  for (auto type : {LogType::kString, LogType::kSnapshot, LogType::kHealth, LogType::kInit, LogType::kStatus,
                    LogType::kAgent}) {
    if (launcher::service::ToString(type) == value) {
      return type;
    }
  }
  return std::nullopt;
}

static launcher::service::EnrollmentDetails LocalDetails() {
  launcher::service::EnrollmentDetails details;
  details.launcher_version = "launcherctl";

  struct utsname uts {};
  if (uname(&uts) == 0) {
    details.os_name     = uts.sysname;
    details.os_version  = uts.release;
    details.os_build    = uts.version;
    details.os_platform = "linux";
    details.hostname    = uts.nodename;
  }
  return details;
}

static std::string EnrollSecret(const launcher::runtime::config::EnrollmentConfig& enrollment) {
  if (!enrollment.enroll_secret_path().empty()) {
    auto secret = launcher::config::ReadFileContents(enrollment.enroll_secret_path(), "enroll secret");
    while (!secret.empty() && (secret.back() == '\n' || secret.back() == '\r')) {
      secret.pop_back();
    }
    return secret;
  }
  return enrollment.enroll_secret();
}

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return 1;
  }

  const std::string config_path = argv[2];
  const std::string cmd         = argv[3];
  std::vector<std::string> args(argv + 4, argv + argc);

  try {
    auto config = launcher::config::ConfigLoader::LoadFromYaml(config_path);
    launcher::config::ConfigLoader::ApplyEnvironmentOverrides(&config);
    launcher::observability::InitializeLogging(config);

    auto flags  = std::make_shared<launcher::config::Flags>(config);
    auto client = launcher::client::NewClient(flags);
    auto ctx    = CallContext::Background();

    // ------------------------------------------------------------

    if (cmd == "enroll") {
      const auto& enrollment      = config.enrollment();
      const auto  details         = LocalDetails();
      const auto  host_identifier = enrollment.host_identifier().empty() ? details.hostname : enrollment.host_identifier();

      auto result = client->RequestEnrollment(ctx, EnrollSecret(enrollment), host_identifier, details);
      if (result.node_invalid) {
        std::cerr << "enrollment rejected\n";
        return 2;
      }
      std::cout << "node_key=" << result.node_key << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "config") {
      if (args.size() != 1) {
        Usage();
        return 1;
      }

      auto result = client->RequestConfig(ctx, args[0]);
      if (result.node_invalid) {
        std::cerr << "node invalid\n";
        return 2;
      }
      std::cout << result.config << "\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "queries") {
      if (args.size() != 1) {
        Usage();
        return 1;
      }

      auto result = client->RequestQueries(ctx, args[0]);
      if (result.node_invalid) {
        std::cerr << "node invalid\n";
        return 2;
      }
      for (const auto& [name, query] : result.queries.queries) {
        std::cout << name << "\t" << query << "\n";
      }
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "logs") {
      if (args.size() < 3) {
        Usage();
        return 1;
      }
      auto type = ParseLogType(args[1]);
      if (!type) {
        std::cerr << "unsupported log type: " << args[1] << "\n";
        return 1;
      }

      auto result = client->PublishLogs(ctx, args[0], *type, std::vector<std::string>(args.begin() + 2, args.end()));
      if (result.node_invalid) {
        std::cerr << "node invalid\n";
        return 2;
      }
      std::cout << "published " << (args.size() - 2) << " logs\n";
      return 0;
    }

    // ------------------------------------------------------------

    if (cmd == "health") {
      std::cout << launcher::service::ToString(client->CheckHealth(ctx)) << "\n";
      return 0;
    }

    Usage();
    return 1;
  } catch (const launcher::util::DeviceDisabled& e) {
    std::cerr << e.what() << "\n";
    return 3;
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }
}
