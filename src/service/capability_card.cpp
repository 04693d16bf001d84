#include "service/capability_card.hpp"

#include "core/fs_utils.hpp"

#include <utility>

namespace mediaprep::service {

namespace {

using core::json::MakeArray;
using core::json::MakeBool;
using core::json::MakeNumber;
using core::json::MakeObject;
using core::json::MakeString;
using core::json::MakeStringArray;
using JsonValue = core::json::Value;

JsonValue DescriptorToJson(const OperationDescriptor& op) {
  JsonValue out = MakeObject();
  out.Set("name", MakeString(op.name));
  out.Set("description", MakeString(op.description));
  out.Set("tags", MakeStringArray(op.tags));
  out.Set("idempotent", MakeBool(op.idempotent));
  out.Set("side_effects", MakeStringArray(op.side_effects));
  out.Set("latency_target_ms", MakeNumber(static_cast<double>(op.latency_target_ms)));
  out.Set("input_schema", op.input_schema.IsNull() ? MakeObject() : op.input_schema);
  out.Set("output_schema", op.output_schema.IsNull() ? MakeObject() : op.output_schema);

  JsonValue examples = MakeArray();
  for (const OperationExample& example : op.examples) {
    JsonValue entry = MakeObject();
    entry.Set("description", MakeString(example.description));
    entry.Set("input", example.input.IsNull() ? MakeObject() : example.input);
    examples.Push(std::move(entry));
  }
  out.Set("examples", std::move(examples));
  return out;
}

} // namespace

CapabilityCard::CapabilityCard(ServiceIdentity identity, const OperationRouter& router,
                               ActiveBackendProvider active_backend)
    : identity_(std::move(identity)), active_backend_(std::move(active_backend)) {
  operations_.reserve(router.operations().size());
  for (const OperationSpec& spec : router.operations()) {
    OperationDescriptor descriptor;
    descriptor.name = spec.name;
    descriptor.description = spec.description;
    descriptor.tags = spec.tags;
    descriptor.examples = spec.examples;
    descriptor.input_schema = spec.input_schema;
    descriptor.output_schema = spec.output_schema;
    descriptor.side_effects = spec.side_effects;
    descriptor.idempotent = spec.idempotent;
    descriptor.latency_target_ms = spec.latency_target_ms;
    operations_.push_back(std::move(descriptor));
  }
}

JsonValue CapabilityCard::ToJson() const {
  JsonValue out = MakeObject();
  out.Set("name", MakeString(identity_.name));
  out.Set("version", MakeString(identity_.version));
  out.Set("description", MakeString(identity_.description));
  out.Set("division", MakeString(identity_.division));
  out.Set("subsystem", MakeString(identity_.subsystem));
  out.Set("tags", MakeStringArray(identity_.tags));

  JsonValue functions = MakeArray();
  for (const OperationDescriptor& op : operations_) {
    functions.Push(DescriptorToJson(op));
  }
  out.Set("functions", std::move(functions));

  JsonValue backend = MakeObject();
  if (active_backend_) {
    const ActiveBackendInfo info = active_backend_();
    backend.Set("backend", MakeString(info.backend));
    backend.Set("identifier", MakeString(info.identifier));
  } else {
    backend.Set("backend", core::json::MakeNull());
    backend.Set("identifier", core::json::MakeNull());
  }
  out.Set("active_backend", std::move(backend));
  return out;
}

bool CapabilityCard::Export(const std::filesystem::path& output_path, std::string& error) const {
  return core::WriteTextFileAtomic(output_path, core::json::Serialize(ToJson()) + "\n", error);
}

} // namespace mediaprep::service
