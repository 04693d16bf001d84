#pragma once

#include "core/json_dom.hpp"
#include "service/operation_router.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace mediaprep::service {

inline constexpr std::string_view kServiceName = "mediaprep";
inline constexpr std::string_view kServiceVersion = "0.1.0";

struct ServiceIdentity {
  std::string name;
  std::string version;
  std::string description;
  std::string division;
  std::string subsystem;
  std::vector<std::string> tags;
};

// Handler-free copy of an OperationSpec.
struct OperationDescriptor {
  std::string name;
  std::string description;
  std::vector<std::string> tags;
  std::vector<OperationExample> examples;
  core::json::Value input_schema;
  core::json::Value output_schema;
  std::vector<std::string> side_effects;
  bool idempotent = true;
  std::int64_t latency_target_ms = 0;
};

struct ActiveBackendInfo {
  std::string backend;
  std::string identifier;
};

using ActiveBackendProvider = std::function<ActiveBackendInfo()>;

// Static self-description built once from a frozen router.
//
// Everything except `active_backend` is fixed at construction. The backend
// field reports the probe result and is read through `active_backend` at
// serialization time, so the card never triggers probing before someone asks
// for it.
class CapabilityCard {
public:
  CapabilityCard(ServiceIdentity identity, const OperationRouter& router,
                 ActiveBackendProvider active_backend);

  const ServiceIdentity& identity() const {
    return identity_;
  }

  const std::vector<OperationDescriptor>& operations() const {
    return operations_;
  }

  core::json::Value ToJson() const;

  // Writes the card as JSON via an atomic temp-file rename.
  bool Export(const std::filesystem::path& output_path, std::string& error) const;

private:
  ServiceIdentity identity_;
  std::vector<OperationDescriptor> operations_;
  ActiveBackendProvider active_backend_;
};

} // namespace mediaprep::service
