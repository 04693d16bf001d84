#pragma once

#include <optional>
#include <string_view>

namespace mediaprep::accel {

// Acceleration families known at build time. The declaration order is the
// default preference order; kReference is the terminal CPU fallback.
enum class Backend {
  kCuda = 0,
  kVulkan = 1,
  kOpenCl = 2,
  kReference = 3,
};

inline constexpr Backend kDefaultPreferenceOrder[] = {
    Backend::kCuda,
    Backend::kVulkan,
    Backend::kOpenCl,
    Backend::kReference,
};

constexpr std::string_view ToString(Backend backend) {
  switch (backend) {
  case Backend::kCuda:
    return "cuda";
  case Backend::kVulkan:
    return "vulkan";
  case Backend::kOpenCl:
    return "opencl";
  case Backend::kReference:
    return "reference";
  }
  return "reference";
}

// Accepts the CLI/env spellings; `cpu` is an alias for `reference`.
inline std::optional<Backend> ParseBackendName(std::string_view name) {
  if (name == "cuda") {
    return Backend::kCuda;
  }
  if (name == "vulkan") {
    return Backend::kVulkan;
  }
  if (name == "opencl") {
    return Backend::kOpenCl;
  }
  if (name == "reference" || name == "cpu") {
    return Backend::kReference;
  }
  return std::nullopt;
}

inline constexpr std::string_view ExpectedBackendList() {
  return "cuda|vulkan|opencl|reference";
}

} // namespace mediaprep::accel
