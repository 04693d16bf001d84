#include "core/config/service_config.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <thread>
#include <utility>

namespace mediaprep::core::config {

namespace {

constexpr std::size_t kMaxWorkerCount = 1024;

std::string Trim(std::string_view input) {
  std::size_t begin = 0;
  while (begin < input.size() && std::isspace(static_cast<unsigned char>(input[begin])) != 0) {
    ++begin;
  }

  std::size_t end = input.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(input[end - 1])) != 0) {
    --end;
  }
  return std::string(input.substr(begin, end - begin));
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

const char* NonEmpty(const EnvLookup& lookup, const char* name) {
  const char* value = lookup(name);
  if (value == nullptr || *value == '\0') {
    return nullptr;
  }
  return value;
}

} // namespace

ServiceConfig DefaultServiceConfig() {
  ServiceConfig config;
  const unsigned int hardware = std::thread::hardware_concurrency();
  config.worker_count = hardware == 0U ? 1U : static_cast<std::size_t>(hardware);
  config.accel_candidates = {accel::Backend::kCuda, accel::Backend::kVulkan,
                             accel::Backend::kOpenCl};
  return config;
}

EnvLookup ProcessEnvLookup() {
  return [](const char* name) -> const char* { return std::getenv(name); };
}

bool ApplyEnvironment(ServiceConfig& config, const EnvLookup& lookup, std::string& error) {
  error.clear();
  if (!lookup) {
    return true;
  }

  if (const char* socket = NonEmpty(lookup, "MEDIAPREP_SOCKET"); socket != nullptr) {
    config.socket_path = socket;
  }

  if (const char* ffmpeg = NonEmpty(lookup, "MEDIAPREP_FFMPEG"); ffmpeg != nullptr) {
    config.ffmpeg_path = ffmpeg;
  }

  if (const char* accel = NonEmpty(lookup, "MEDIAPREP_ACCEL"); accel != nullptr) {
    std::string parse_error;
    if (!ParseAccelList(accel, config.accel_candidates, parse_error)) {
      error = "MEDIAPREP_ACCEL: " + parse_error;
      return false;
    }
  }

  if (const char* level = NonEmpty(lookup, "MEDIAPREP_LOG_LEVEL"); level != nullptr) {
    std::string parse_error;
    if (!logging::ParseLogLevel(level, config.log_level, parse_error)) {
      error = "MEDIAPREP_LOG_LEVEL: " + parse_error;
      return false;
    }
  }

  if (const char* workers = NonEmpty(lookup, "MEDIAPREP_WORKERS"); workers != nullptr) {
    std::string parse_error;
    if (!ParseWorkerCount(workers, config.worker_count, parse_error)) {
      error = "MEDIAPREP_WORKERS: " + parse_error;
      return false;
    }
  }

  return true;
}

bool ParseAccelList(std::string_view raw, std::vector<accel::Backend>& candidates,
                    std::string& error) {
  error.clear();
  std::vector<accel::Backend> parsed;

  std::size_t start = 0;
  while (start <= raw.size()) {
    const std::size_t comma = raw.find(',', start);
    const std::size_t end = comma == std::string_view::npos ? raw.size() : comma;
    const std::string name = ToLower(Trim(raw.substr(start, end - start)));

    if (name.empty()) {
      error = "empty backend name in accel list '" + std::string(raw) + "'";
      return false;
    }

    const auto backend = accel::ParseBackendName(name);
    if (!backend.has_value()) {
      error = "unknown backend '" + name + "' (expected " +
              std::string(accel::ExpectedBackendList()) + ")";
      return false;
    }
    if (std::find(parsed.begin(), parsed.end(), *backend) != parsed.end()) {
      error = "backend '" + name + "' listed more than once";
      return false;
    }
    parsed.push_back(*backend);

    if (comma == std::string_view::npos) {
      break;
    }
    start = comma + 1U;
  }

  candidates = std::move(parsed);
  return true;
}

bool ParseWorkerCount(std::string_view raw, std::size_t& worker_count, std::string& error) {
  error.clear();
  const std::string trimmed = Trim(raw);
  if (trimmed.empty()) {
    error = "worker count cannot be empty";
    return false;
  }

  std::size_t parsed = 0;
  const char* begin = trimmed.data();
  const char* end = begin + trimmed.size();
  const auto [ptr, ec] = std::from_chars(begin, end, parsed);
  if (ec != std::errc() || ptr != end) {
    error = "worker count must be a positive integer, got '" + trimmed + "'";
    return false;
  }
  if (parsed == 0U || parsed > kMaxWorkerCount) {
    error = "worker count must be in [1, " + std::to_string(kMaxWorkerCount) + "], got " +
            trimmed;
    return false;
  }

  worker_count = parsed;
  return true;
}

std::string FormatAccelList(const std::vector<accel::Backend>& candidates) {
  std::string out;
  for (const accel::Backend backend : candidates) {
    if (!out.empty()) {
      out.push_back(',');
    }
    out += accel::ToString(backend);
  }
  return out;
}

} // namespace mediaprep::core::config
