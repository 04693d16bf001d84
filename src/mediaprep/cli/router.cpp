#include "mediaprep/cli/router.hpp"

#include "accel/backend_selector.hpp"
#include "accel/capability_probe.hpp"
#include "core/config/service_config.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"
#include "core/logging/logger.hpp"
#include "raw/raw_decoder.hpp"
#include "service/media_service.hpp"
#include "service/wire_codec.hpp"
#include "transport/uds_server.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <signal.h>

namespace fs = std::filesystem;

namespace mediaprep::cli {

namespace {

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);
constexpr int kExitConfigInvalid = core::errors::ToInt(core::errors::ExitCode::kConfigInvalid);
constexpr int kExitTransportFailed =
    core::errors::ToInt(core::errors::ExitCode::kTransportFailed);

// Shared by `help` and every usage error.
void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  mediaprep serve [--socket-path <path>] [--workers <n>] "
         "[--accel <list>|--no-accel] [--ffmpeg <path>] "
         "[--log-level <debug|info|warn|error>] [--export-card <file.json>]\n"
      << "  mediaprep call <request.json|-> [--accel <list>|--no-accel] [--ffmpeg <path>] "
         "[--log-level <debug|info|warn|error>]\n"
      << "  mediaprep capabilities [--out <file.json>] [--accel <list>|--no-accel]\n"
      << "  mediaprep backends [--accel <list>|--no-accel]\n"
      << "  mediaprep version\n"
      << "\n"
      << "accel candidates: " << accel::ExpectedBackendList() << '\n'
      << "\nexit codes:\n";
  for (const core::errors::ExitCode code : core::errors::kAllExitCodes) {
    out << "  " << core::errors::ToInt(code) << "  " << core::errors::Describe(code) << '\n';
  }
}

// Flags each subcommand accepts. Anything else is a usage error.
enum OptionFlag : unsigned {
  kOptSocket = 1U << 0,
  kOptWorkers = 1U << 1,
  kOptAccel = 1U << 2,
  kOptFfmpeg = 1U << 3,
  kOptLogLevel = 1U << 4,
  kOptExportCard = 1U << 5,
  kOptOut = 1U << 6,
};

struct CommandOptions {
  core::config::ServiceConfig config;
  std::optional<fs::path> export_card;
  std::optional<fs::path> out;
  std::vector<std::string> positional;
};

bool TakeValue(const std::vector<std::string_view>& args, std::size_t& i,
               std::string_view flag, std::string_view& value, std::string& error) {
  if (i + 1 >= args.size()) {
    error = "missing value for " + std::string(flag);
    return false;
  }
  value = args[++i];
  return true;
}

// Layering: built-in defaults, then MEDIAPREP_* environment, then flags.
bool ParseCommandOptions(const std::vector<std::string_view>& args, unsigned allowed,
                         CommandOptions& options, std::string& error) {
  options.config = core::config::DefaultServiceConfig();
  if (!core::config::ApplyEnvironment(options.config, core::config::ProcessEnvLookup(),
                                      error)) {
    return false;
  }

  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    std::string_view value;
    if (token == "--socket-path" && (allowed & kOptSocket) != 0) {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.config.socket_path = std::string(value);
      continue;
    }
    if (token == "--workers" && (allowed & kOptWorkers) != 0) {
      if (!TakeValue(args, i, token, value, error) ||
          !core::config::ParseWorkerCount(value, options.config.worker_count, error)) {
        return false;
      }
      continue;
    }
    if (token == "--accel" && (allowed & kOptAccel) != 0) {
      if (!TakeValue(args, i, token, value, error) ||
          !core::config::ParseAccelList(value, options.config.accel_candidates, error)) {
        return false;
      }
      continue;
    }
    if (token == "--no-accel" && (allowed & kOptAccel) != 0) {
      options.config.accel_candidates.clear();
      continue;
    }
    if (token == "--ffmpeg" && (allowed & kOptFfmpeg) != 0) {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.config.ffmpeg_path = std::string(value);
      continue;
    }
    if (token == "--log-level" && (allowed & kOptLogLevel) != 0) {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      if (!core::logging::ParseLogLevel(value, options.config.log_level, error)) {
        error = "--log-level: " + error;
        return false;
      }
      continue;
    }
    if (token == "--export-card" && (allowed & kOptExportCard) != 0) {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.export_card = fs::path(value);
      continue;
    }
    if (token == "--out" && (allowed & kOptOut) != 0) {
      if (!TakeValue(args, i, token, value, error)) {
        return false;
      }
      options.out = fs::path(value);
      continue;
    }

    // A lone "-" is the stdin placeholder, not an option.
    if (token.size() > 1 && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }
    options.positional.emplace_back(token);
  }
  return true;
}

std::atomic<transport::UdsServer*> g_active_server{nullptr};

void HandleStopSignal(int /*signal*/) {
  transport::UdsServer* server = g_active_server.load();
  if (server != nullptr) {
    server->RequestStop();
  }
}

bool InstallStopHandlers(std::string& error) {
  struct sigaction action {};
  action.sa_handler = HandleStopSignal;
  sigemptyset(&action.sa_mask);
  for (const int signal_number : {SIGINT, SIGTERM}) {
    if (::sigaction(signal_number, &action, nullptr) != 0) {
      error = "failed to install handler for signal " + std::to_string(signal_number);
      return false;
    }
  }
  return true;
}

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }
  std::cout << service::kServiceName << ' ' << service::kServiceVersion << '\n';
  return kExitSuccess;
}

int CommandServe(const std::vector<std::string_view>& args) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions(args,
                           kOptSocket | kOptWorkers | kOptAccel | kOptFfmpeg | kOptLogLevel |
                               kOptExportCard,
                           options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (!options.positional.empty()) {
    std::cerr << "error: serve does not accept positional arguments\n";
    return kExitUsage;
  }

  core::logging::Logger logger(options.config.log_level);
  service::MediaService media_service(options.config, &logger);
  if (!media_service.Initialize(error)) {
    logger.Error("service_init_failed", {{"error", error}});
    return kExitConfigInvalid;
  }

  if (options.export_card.has_value()) {
    if (!media_service.card().Export(*options.export_card, error)) {
      logger.Error("card_export_failed", {{"error", error}});
      return kExitFailure;
    }
    logger.Info("card_exported", {{"path", options.export_card->string()}});
  }

  transport::UdsServerOptions server_options;
  server_options.socket_path = options.config.socket_path;
  server_options.worker_count = options.config.worker_count;
  server_options.max_frame_bytes = static_cast<std::uint32_t>(options.config.max_frame_bytes);
  transport::UdsServer server(
      server_options,
      [&media_service](const service::Request& request) {
        return media_service.Dispatch(request);
      },
      &logger);

  g_active_server.store(&server);
  if (!InstallStopHandlers(error) || !server.Start(error)) {
    g_active_server.store(nullptr);
    logger.Error("server_start_failed", {{"error", error}});
    return kExitTransportFailed;
  }

  server.Wait();
  g_active_server.store(nullptr);
  return kExitSuccess;
}

int CommandCall(const std::vector<std::string_view>& args) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions(args, kOptAccel | kOptFfmpeg | kOptLogLevel, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (options.positional.size() != 1) {
    std::cerr << "error: call requires exactly 1 argument: <request.json|->\n";
    return kExitUsage;
  }

  std::string body;
  const std::string& source = options.positional.front();
  if (source == "-") {
    body.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  } else if (!core::ReadFileBytes(source, body, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitFailure;
  }

  core::logging::Logger logger(options.config.log_level);
  service::MediaService media_service(options.config, &logger);
  if (!media_service.Initialize(error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  service::Request request;
  service::OperationError parse_error;
  if (!service::ParseRequest(body, request, parse_error)) {
    service::Outcome rejected;
    rejected.payload = service::BuildErrorPayload(parse_error);
    rejected.latency = std::chrono::nanoseconds(1);
    std::cout << service::SerializeOutcome(rejected) << '\n';
    return kExitFailure;
  }

  const service::Outcome outcome = media_service.Dispatch(request);
  std::cout << service::SerializeOutcome(outcome) << '\n';
  return outcome.ok ? kExitSuccess : kExitFailure;
}

int CommandCapabilities(const std::vector<std::string_view>& args) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions(args, kOptOut | kOptAccel | kOptLogLevel, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (!options.positional.empty()) {
    std::cerr << "error: capabilities does not accept positional arguments\n";
    return kExitUsage;
  }

  core::logging::Logger logger(options.config.log_level);
  service::MediaService media_service(options.config, &logger);
  if (!media_service.Initialize(error)) {
    std::cerr << "error: " << error << '\n';
    return kExitConfigInvalid;
  }

  if (options.out.has_value()) {
    if (!media_service.card().Export(*options.out, error)) {
      std::cerr << "error: " << error << '\n';
      return kExitFailure;
    }
    std::cout << "card: " << options.out->string() << '\n';
    return kExitSuccess;
  }
  std::cout << core::json::Serialize(media_service.card().ToJson()) << '\n';
  return kExitSuccess;
}

int CommandBackends(const std::vector<std::string_view>& args) {
  CommandOptions options;
  std::string error;
  if (!ParseCommandOptions(args, kOptAccel | kOptLogLevel, options, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (!options.positional.empty()) {
    std::cerr << "error: backends does not accept positional arguments\n";
    return kExitUsage;
  }

  for (const accel::Backend backend : accel::kDefaultPreferenceOrder) {
    std::cout << "build " << accel::ToString(backend) << ": "
              << accel::CompiledStatusText(backend) << '\n';
  }
  std::cout << "build raw decoder: " << raw::RawDecoderAvailabilityStatusText() << '\n';

  core::logging::Logger logger(options.config.log_level);
  accel::BackendSelector selector(accel::BuildProbes(options.config.accel_candidates), &logger);
  const accel::BackendSelection selection = selector.Select();
  for (const accel::FailedCandidate& failed : selection.failed) {
    std::cout << "probe " << failed.name << ": unavailable (" << failed.reason << ")\n";
  }
  std::cout << "selected: " << accel::ToString(selection.backend) << '\n';
  std::cout << "identifier: " << selection.identifier << '\n';
  return kExitSuccess;
}

} // namespace

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }
  if (command == "serve") {
    return CommandServe(args);
  }
  if (command == "call") {
    return CommandCall(args);
  }
  if (command == "capabilities") {
    return CommandCapabilities(args);
  }
  if (command == "backends") {
    return CommandBackends(args);
  }
  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace mediaprep::cli
