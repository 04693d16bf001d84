#include "accel/capability_probe.hpp"

#include <opencv2/core.hpp>
#include <opencv2/core/ocl.hpp>

#include <cstdint>
#include <string>
#include <vector>

#ifndef MEDIAPREP_ENABLE_CUDA
#define MEDIAPREP_ENABLE_CUDA 0
#endif

#ifndef MEDIAPREP_ENABLE_VULKAN
#define MEDIAPREP_ENABLE_VULKAN 0
#endif

#if MEDIAPREP_ENABLE_CUDA
#include <opencv2/core/cuda.hpp>
#endif

#if MEDIAPREP_ENABLE_VULKAN
#include <vulkan/vulkan.h>
#endif

namespace mediaprep::accel {

namespace {

bool ProbeCuda(std::string& identifier, std::string& reason) {
#if MEDIAPREP_ENABLE_CUDA
  try {
    const int device_count = cv::cuda::getCudaEnabledDeviceCount();
    if (device_count < 0) {
      reason = "CUDA driver is not installed or is incompatible";
      return false;
    }
    if (device_count == 0) {
      reason = "no CUDA-capable device found";
      return false;
    }

    cv::cuda::setDevice(0);
    const cv::cuda::DeviceInfo info(0);
    if (!info.isCompatible()) {
      reason = std::string("CUDA device '") + info.name() +
               "' is not compatible with this OpenCV build";
      return false;
    }
    identifier = std::string("cuda (") + info.name() + ")";
    return true;
  } catch (const cv::Exception& ex) {
    reason = std::string("CUDA initialization failed: ") + ex.what();
    return false;
  }
#else
  (void)identifier;
  reason = "not compiled (MEDIAPREP_ENABLE_CUDA=OFF)";
  return false;
#endif
}

#if MEDIAPREP_ENABLE_VULKAN
// RAII guard so every early return destroys the probe instance.
class VulkanProbeInstance {
public:
  VulkanProbeInstance() = default;
  ~VulkanProbeInstance() {
    if (instance_ != VK_NULL_HANDLE) {
      vkDestroyInstance(instance_, nullptr);
    }
  }

  VulkanProbeInstance(const VulkanProbeInstance&) = delete;
  VulkanProbeInstance& operator=(const VulkanProbeInstance&) = delete;

  VkResult Create() {
    VkApplicationInfo app_info{};
    app_info.sType = VK_STRUCTURE_TYPE_APPLICATION_INFO;
    app_info.pApplicationName = "mediaprep";
    app_info.applicationVersion = VK_MAKE_VERSION(0, 1, 0);
    app_info.pEngineName = "mediaprep";
    app_info.engineVersion = VK_MAKE_VERSION(0, 1, 0);
    app_info.apiVersion = VK_API_VERSION_1_0;

    VkInstanceCreateInfo create_info{};
    create_info.sType = VK_STRUCTURE_TYPE_INSTANCE_CREATE_INFO;
    create_info.pApplicationInfo = &app_info;
    return vkCreateInstance(&create_info, nullptr, &instance_);
  }

  VkInstance get() const {
    return instance_;
  }

private:
  VkInstance instance_ = VK_NULL_HANDLE;
};
#endif

bool ProbeVulkan(std::string& identifier, std::string& reason) {
#if MEDIAPREP_ENABLE_VULKAN
  VulkanProbeInstance instance;
  const VkResult create_result = instance.Create();
  if (create_result != VK_SUCCESS) {
    reason = "vkCreateInstance failed (VkResult=" +
             std::to_string(static_cast<int>(create_result)) + ")";
    return false;
  }

  std::uint32_t device_count = 0;
  VkResult enum_result = vkEnumeratePhysicalDevices(instance.get(), &device_count, nullptr);
  if (enum_result != VK_SUCCESS) {
    reason = "vkEnumeratePhysicalDevices failed (VkResult=" +
             std::to_string(static_cast<int>(enum_result)) + ")";
    return false;
  }
  if (device_count == 0U) {
    reason = "no Vulkan-compatible devices found";
    return false;
  }

  std::vector<VkPhysicalDevice> devices(device_count);
  enum_result = vkEnumeratePhysicalDevices(instance.get(), &device_count, devices.data());
  if (enum_result != VK_SUCCESS && enum_result != VK_INCOMPLETE) {
    reason = "vkEnumeratePhysicalDevices failed (VkResult=" +
             std::to_string(static_cast<int>(enum_result)) + ")";
    return false;
  }

  // Prefer a discrete GPU, accept an integrated one. CPU and virtual
  // implementations (lavapipe, swiftshader) do not count as acceleration.
  std::string integrated_name;
  for (std::uint32_t i = 0; i < device_count; ++i) {
    VkPhysicalDeviceProperties properties{};
    vkGetPhysicalDeviceProperties(devices[i], &properties);
    if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_DISCRETE_GPU) {
      identifier = std::string("vulkan (") + properties.deviceName + ")";
      return true;
    }
    if (properties.deviceType == VK_PHYSICAL_DEVICE_TYPE_INTEGRATED_GPU &&
        integrated_name.empty()) {
      integrated_name = properties.deviceName;
    }
  }

  if (!integrated_name.empty()) {
    identifier = "vulkan (" + integrated_name + ")";
    return true;
  }
  reason = "Vulkan devices found but none is a discrete or integrated GPU";
  return false;
#else
  (void)identifier;
  reason = "not compiled (MEDIAPREP_ENABLE_VULKAN=OFF)";
  return false;
#endif
}

bool ProbeOpenCl(std::string& identifier, std::string& reason) {
  try {
    if (!cv::ocl::haveOpenCL()) {
      reason = "OpenCV reports no OpenCL runtime";
      return false;
    }
    cv::ocl::setUseOpenCL(true);
    if (!cv::ocl::useOpenCL()) {
      reason = "OpenCL runtime present but could not be enabled";
      return false;
    }

    const cv::ocl::Device& device = cv::ocl::Device::getDefault();
    if (!device.available()) {
      reason = "no usable default OpenCL device";
      cv::ocl::setUseOpenCL(false);
      return false;
    }
    identifier = "opencl (" + device.name() + ")";
    return true;
  } catch (const cv::Exception& ex) {
    reason = std::string("OpenCL initialization failed: ") + ex.what();
    return false;
  }
}

bool ProbeReference(std::string& identifier, std::string& reason) {
  (void)reason;
  identifier = "reference (CPU, " + std::to_string(cv::getNumThreads()) + " threads)";
  return true;
}

} // namespace

bool IsCompiledIn(Backend backend) {
  switch (backend) {
  case Backend::kCuda:
    return MEDIAPREP_ENABLE_CUDA != 0;
  case Backend::kVulkan:
    return MEDIAPREP_ENABLE_VULKAN != 0;
  case Backend::kOpenCl:
  case Backend::kReference:
    return true;
  }
  return false;
}

std::string CompiledStatusText(Backend backend) {
  return IsCompiledIn(backend) ? "enabled" : "disabled (build option OFF)";
}

CapabilityProbe MakeCudaProbe() {
  return CapabilityProbe{Backend::kCuda, std::string(ToString(Backend::kCuda)), ProbeCuda};
}

CapabilityProbe MakeVulkanProbe() {
  return CapabilityProbe{Backend::kVulkan, std::string(ToString(Backend::kVulkan)), ProbeVulkan};
}

CapabilityProbe MakeOpenClProbe() {
  return CapabilityProbe{Backend::kOpenCl, std::string(ToString(Backend::kOpenCl)), ProbeOpenCl};
}

CapabilityProbe MakeReferenceProbe() {
  return CapabilityProbe{Backend::kReference, std::string(ToString(Backend::kReference)),
                         ProbeReference};
}

CapabilityProbe MakeProbe(Backend backend) {
  switch (backend) {
  case Backend::kCuda:
    return MakeCudaProbe();
  case Backend::kVulkan:
    return MakeVulkanProbe();
  case Backend::kOpenCl:
    return MakeOpenClProbe();
  case Backend::kReference:
    return MakeReferenceProbe();
  }
  return MakeReferenceProbe();
}

std::vector<CapabilityProbe> BuildProbes(const std::vector<Backend>& order) {
  std::vector<CapabilityProbe> probes;
  probes.reserve(order.size());
  for (const Backend backend : order) {
    probes.push_back(MakeProbe(backend));
  }
  return probes;
}

} // namespace mediaprep::accel
