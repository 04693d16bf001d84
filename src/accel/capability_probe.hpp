#pragma once

#include "accel/backend.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace mediaprep::accel {

// One self-contained initialization attempt for a backend family. `attempt`
// returns true and fills `identifier` (e.g. "opencl (Intel(R) UHD Graphics)")
// when the backend is usable, otherwise false with `reason` explaining why.
//
// Probes are plain data so tests can inject fakes and so the compiled-in set
// of backends never changes how the cascade itself is written.
struct CapabilityProbe {
  Backend backend = Backend::kReference;
  std::string name;
  std::function<bool(std::string& identifier, std::string& reason)> attempt;
};

// Whether the backend's native path was compiled into this binary.
bool IsCompiledIn(Backend backend);

// `enabled` or `disabled (build option OFF)`, for `mediaprep backends`.
std::string CompiledStatusText(Backend backend);

// Real hardware probes. A backend whose build option is OFF yields a probe
// that always fails with a "not compiled" reason.
CapabilityProbe MakeCudaProbe();
CapabilityProbe MakeVulkanProbe();
CapabilityProbe MakeOpenClProbe();
CapabilityProbe MakeReferenceProbe();

CapabilityProbe MakeProbe(Backend backend);

// Builds probes for `order` in the given order.
std::vector<CapabilityProbe> BuildProbes(const std::vector<Backend>& order);

} // namespace mediaprep::accel
