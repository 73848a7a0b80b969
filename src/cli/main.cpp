#include "sq/cli/commands.h"
#include "sq/common.h"
#include "sq/error.h"
#include "sq/errors.h"
#include "sq/orchestrator/config.h"
#include "sq/orchestrator/event_bus.h"
#include "sq/orchestrator/mount_orchestrator.h"
#include "sq/platform/dependency_gate.h"
#include "sq/platform/process_runner.h"
#include "sq/storage/mount_record_store.h"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {

  constexpr int kExitOk = 0;
  constexpr int kExitUsage = 64;
  constexpr int kExitUnavailable = 69;
  constexpr int kExitSoftware = 70;
  constexpr int kExitIO = 74;

  void PrintUsage() {
    std::cerr << "Usage:\n";
    std::cerr << "  squish [flags] mount   <archive> [mount_point]   (alias: m)\n";
    std::cerr << "  squish [flags] unmount <archive> [mount_point]   (alias: um)\n";
    std::cerr << "\nGlobal flags:\n";
    std::cerr << "  -v, --verbose          Print lifecycle and diagnostic events\n";
    std::cerr << "  --config=<file>        Read settings from <file> instead of squish.toml\n";
    std::cerr << "  --mount-base=<dir>     Directory for automatic mount points (default: mounts)\n";
    std::cerr << "  --temp-dir=<dir>       Directory holding mount records (default: /tmp)\n";
    std::cerr << "  --no-auto-cleanup      Keep auto-created mount points after unmount\n";
    std::cerr << "  --help                 Show this message\n";
  }

  std::string_view DomainPrefix(sq::ErrorDomain domain) {
    switch (domain) {
    case sq::ErrorDomain::IO:
      return "I/O error";
    case sq::ErrorDomain::Crypto:
      return "Crypto error";
    case sq::ErrorDomain::Validation:
      return "Validation error";
    case sq::ErrorDomain::Config:
      return "Configuration error";
    case sq::ErrorDomain::Dependency:
      return "Dependency error";
    case sq::ErrorDomain::State:
      return "Error";
    case sq::ErrorDomain::Internal:
      return "Internal error";
    }
    return "Error";
  }

  void ReportError(const sq::Error& err) {
    if (sq::IsError(err, sq::errors::state::kNotMounted)) {
      std::cerr << err.what() << '\n';
      return;
    }
    std::cerr << DomainPrefix(err.domain) << ": " << err.what() << '\n';
  }

  int ExitCodeFor(const sq::Error& err) {
    switch (err.domain) {
    case sq::ErrorDomain::Validation:
    case sq::ErrorDomain::Config:
      return kExitUsage;
    case sq::ErrorDomain::Dependency:
      return kExitUnavailable;
    case sq::ErrorDomain::State:
      return kExitSoftware;
    case sq::ErrorDomain::IO:
    case sq::ErrorDomain::Crypto:
    case sq::ErrorDomain::Internal:
    default:
      return kExitIO;
    }
  }

  // Echoes events on stderr: everything when verbose, otherwise warnings only
  // (errors are reported once by ReportError).
  void AttachConsole(bool verbose) {
    sq::orchestrator::EventBus::Instance().Subscribe([verbose](const sq::orchestrator::Event& event) {
      using sq::orchestrator::EventSeverity;
      if (!verbose && event.severity != EventSeverity::kWarning) {
        return;
      }
      std::cerr << '[' << sq::orchestrator::SeverityToString(event.severity) << "] "
                << event.event_id << ": " << event.message;
      for (const auto& field : event.fields) {
        std::cerr << ' ' << field.key << '=' << sq::orchestrator::RenderFieldValue(field);
      }
      std::cerr << '\n';
    });
  }

  bool TakeValue(std::string_view arg, std::string_view flag, std::string& out) {
    if (arg.rfind(flag, 0) != 0) {
      return false;
    }
    out = std::string(arg.substr(flag.size()));
    return true;
  }

  void PrintSuggestions(std::string_view input, const sq::cli::CommandResolution& resolution) {
    std::cerr << (resolution.ambiguous ? "Ambiguous command: " : "Unknown command: ") << input
              << '\n';
    if (!resolution.suggestions.empty()) {
      std::cerr << "Did you mean:";
      for (const auto& suggestion : resolution.suggestions) {
        std::cerr << ' ' << suggestion;
      }
      std::cerr << "?\n";
    }
  }

} // namespace

int main(int argc, char** argv) {
  try {
    sq::orchestrator::ConfigOverrides overrides;
    std::optional<std::filesystem::path> config_file;
    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.empty() || arg.front() != '-') {
        break;
      }
      std::string value;
      if (arg == "-v" || arg == "--verbose") {
        overrides.verbose = true;
      } else if (arg == "-h" || arg == "--help") {
        PrintUsage();
        return kExitOk;
      } else if (arg == "--no-auto-cleanup") {
        overrides.auto_cleanup = false;
      } else if (TakeValue(arg, "--config=", value)) {
        if (value.empty()) {
          PrintUsage();
          return kExitUsage;
        }
        config_file = std::filesystem::path(value);
      } else if (TakeValue(arg, "--mount-base=", value)) {
        overrides.mount_base = value;
      } else if (TakeValue(arg, "--temp-dir=", value)) {
        overrides.temp_dir = std::filesystem::path(value);
      } else {
        std::cerr << "Unknown flag: " << arg << '\n';
        PrintUsage();
        return kExitUsage;
      }
    }

    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }
    const std::string_view command_word = argv[index++];
    const auto resolution = sq::cli::ResolveCommand(command_word);
    if (!resolution.command) {
      PrintSuggestions(command_word, resolution);
      PrintUsage();
      return kExitUsage;
    }
    const int remaining = argc - index;
    if (remaining < 1 || remaining > 2) {
      PrintUsage();
      return kExitUsage;
    }
    const std::filesystem::path archive = argv[index];
    std::optional<std::filesystem::path> mount_point;
    if (remaining == 2) {
      mount_point = std::filesystem::path(argv[index + 1]);
    }

    const auto config = sq::orchestrator::LoadConfig(overrides, config_file);
    if (config.log_file) {
      sq::orchestrator::DefaultJsonLogger().SetPath(*config.log_file);
    }
    AttachConsole(config.verbose);

    sq::platform::SubprocessRunner runner;
    sq::orchestrator::MountOrchestrator orchestrator(
        config, runner, sq::platform::DependencyGate::FromEnvironment(),
        sq::storage::MountRecordStore(sq::orchestrator::TrackingDirectory(config)));

    switch (*resolution.command) {
    case sq::cli::Command::kMount: {
      const auto result = orchestrator.Mount(archive, mount_point);
      std::cout << "Mounted " << sq::PathToUtf8String(result.archive_path) << " -> "
                << sq::PathToUtf8String(result.mount_point) << std::endl;
      return kExitOk;
    }
    case sq::cli::Command::kUnmount: {
      const auto result = orchestrator.Unmount(archive, mount_point);
      std::cout << "Unmounted " << sq::PathToUtf8String(result.archive_path) << " from "
                << sq::PathToUtf8String(result.mount_point) << std::endl;
      return kExitOk;
    }
    }
    PrintUsage();
    return kExitUsage;
  } catch (const sq::Error& err) {
    ReportError(err);
    return ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}
