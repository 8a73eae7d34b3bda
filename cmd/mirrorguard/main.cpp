#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/revert/revert_status.hpp"

using mirrorguard::factory::Application;
using mirrorguard::revert::RevertStatus;

namespace {

constexpr int kExitOk    = 0;
constexpr int kExitUsage = 1;
constexpr int kExitFatal = 2;
constexpr int kExitNotOk = 3;

void Usage() {
  std::cerr << "Usage:\n"
            << "  mirrorguard --config <config.yaml> revert <commit>\n"
            << "  mirrorguard --config <config.yaml> rollback <commit>\n"
            << "  mirrorguard --config <config.yaml> check <entity> <id> [parent-id]\n"
            << "  mirrorguard --config <config.yaml> sync <entity>...\n";
}

int ReportStatus(RevertStatus status) {
  std::cout << mirrorguard::revert::ToString(status) << std::endl;
  return status == RevertStatus::kOk ? kExitOk : kExitNotOk;
}

int RunCommand(Application& app, const std::string& cmd, const std::vector<std::string>& args) {
  if (cmd == "revert" && args.size() == 1) {
    return ReportStatus(app.reverter->Revert(args[0]));
  }

  if (cmd == "rollback" && args.size() == 1) {
    return ReportStatus(app.reverter->RevertAll(args[0]));
  }

  if (cmd == "check" && (args.size() == 2 || args.size() == 3)) {
    std::optional<std::string> parent_id;
    if (args.size() == 3) {
      parent_id = args[2];
    }
    const bool ok = app.checker->CheckEntityReferences(args[0], args[1], parent_id);
    std::cout << (ok ? "references ok" : "references violated") << std::endl;
    return ok ? kExitOk : kExitNotOk;
  }

  if (cmd == "sync" && !args.empty()) {
    app.synchronization->Synchronize(args);
    return kExitOk;
  }

  Usage();
  return kExitUsage;
}

void Shutdown() {
  mirrorguard::observability::ShutdownLogging();
  mirrorguard::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 4 || std::string(argv[1]) != "--config") {
    Usage();
    return kExitUsage;
  }

  const std::string              config_path = argv[2];
  const std::string              cmd         = argv[3];
  const std::vector<std::string> args(argv + 4, argv + argc);

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = mirrorguard::config::ConfigLoader::LoadFromYaml(config_path);

    mirrorguard::observability::InitializeTracing(config);
    mirrorguard::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application and run the command
    // ------------------------------------------------------------
    auto app  = mirrorguard::factory::Build(config);
    int  code = RunCommand(app, cmd, args);

    Shutdown();
    return code;
  } catch (const std::exception& e) {
    MIRRORGUARD_LOG_ERROR("Fatal error", {mirrorguard::observability::StringField("error", e.what())});
    Shutdown();
    return kExitFatal;
  }
}
