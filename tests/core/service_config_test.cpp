#include "core/config/service_config.hpp"

#include <catch2/catch_test_macros.hpp>

#include <map>
#include <string>
#include <vector>

namespace config = mediaprep::core::config;
using mediaprep::accel::Backend;

namespace {

config::EnvLookup FakeEnv(const std::map<std::string, std::string>& values) {
  return [values](const char* name) -> const char* {
    const auto it = values.find(name);
    return it == values.end() ? nullptr : it->second.c_str();
  };
}

} // namespace

TEST_CASE("Defaults list every accelerated candidate", "[core][config]") {
  const config::ServiceConfig defaults = config::DefaultServiceConfig();
  REQUIRE(defaults.worker_count >= 1U);
  REQUIRE(defaults.accel_candidates ==
          std::vector<Backend>{Backend::kCuda, Backend::kVulkan, Backend::kOpenCl});
  REQUIRE(defaults.preview_quality == 92);
  REQUIRE(defaults.preview_max_dimension == 2048);
}

TEST_CASE("Environment overrides defaults", "[core][config]") {
  config::ServiceConfig cfg = config::DefaultServiceConfig();
  std::string error;
  REQUIRE(config::ApplyEnvironment(cfg,
                                   FakeEnv({{"MEDIAPREP_SOCKET", "/run/mp.sock"},
                                            {"MEDIAPREP_ACCEL", " OpenCL , cpu "},
                                            {"MEDIAPREP_FFMPEG", "/opt/ffmpeg/bin/ffmpeg"},
                                            {"MEDIAPREP_LOG_LEVEL", "debug"},
                                            {"MEDIAPREP_WORKERS", "3"},
                                            {"MEDIAPREP_UNRELATED", "x"}}),
                                   error));
  REQUIRE(error.empty());
  REQUIRE(cfg.socket_path == "/run/mp.sock");
  REQUIRE(cfg.accel_candidates == std::vector<Backend>{Backend::kOpenCl, Backend::kReference});
  REQUIRE(cfg.ffmpeg_path == "/opt/ffmpeg/bin/ffmpeg");
  REQUIRE(cfg.log_level == mediaprep::core::logging::LogLevel::kDebug);
  REQUIRE(cfg.worker_count == 3U);
}

TEST_CASE("Empty environment values are ignored", "[core][config]") {
  config::ServiceConfig cfg = config::DefaultServiceConfig();
  std::string error;
  REQUIRE(config::ApplyEnvironment(cfg, FakeEnv({{"MEDIAPREP_SOCKET", ""}}), error));
  REQUIRE(cfg.socket_path == std::string(config::kDefaultSocketPath));
}

TEST_CASE("Invalid environment values name the variable", "[core][config]") {
  config::ServiceConfig cfg = config::DefaultServiceConfig();
  std::string error;
  REQUIRE_FALSE(config::ApplyEnvironment(cfg, FakeEnv({{"MEDIAPREP_ACCEL", "tpu"}}), error));
  REQUIRE(error.find("MEDIAPREP_ACCEL") != std::string::npos);

  REQUIRE_FALSE(config::ApplyEnvironment(cfg, FakeEnv({{"MEDIAPREP_WORKERS", "0"}}), error));
  REQUIRE(error.find("MEDIAPREP_WORKERS") != std::string::npos);
}

TEST_CASE("Accel list parsing rejects duplicates and empty names", "[core][config]") {
  std::vector<Backend> parsed;
  std::string error;
  REQUIRE_FALSE(config::ParseAccelList("cuda,cuda", parsed, error));
  REQUIRE(error.find("more than once") != std::string::npos);
  REQUIRE_FALSE(config::ParseAccelList("cuda,,opencl", parsed, error));
  REQUIRE(config::ParseAccelList("vulkan,cuda", parsed, error));
  REQUIRE(config::FormatAccelList(parsed) == "vulkan,cuda");
}
