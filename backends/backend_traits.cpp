#include "backends/backend_traits.h"

#include <sys/utsname.h>

#include <algorithm>
#include <cctype>

namespace infergate {

namespace {

std::string NormalizeHint(const std::string &hint) {
  std::string lowered = hint;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::tolower(c));
                 });
  return lowered;
}

bool StartsWith(const std::string &value, const std::string &prefix) {
  return value.compare(0, prefix.size(), prefix) == 0;
}

} // namespace

HostPlatform DetectHostPlatform() {
  HostPlatform platform;
#if defined(_WIN32)
  platform.os = "Windows";
#elif defined(__APPLE__)
  platform.os = "Darwin";
#else
  platform.os = "Linux";
#endif
  platform.arch = "x64";
  struct utsname info {};
  if (uname(&info) == 0) {
    const std::string machine = NormalizeHint(info.machine);
    if (machine == "aarch64" || machine == "arm64") {
      platform.arch = "arm64";
    } else if (machine == "s390x") {
      platform.arch = "s390x";
    }
  }
  return platform;
}

BackendTarget ParseBackendTarget(const std::string &hint) {
  const std::string lowered = NormalizeHint(hint);
  if (StartsWith(lowered, "cuda")) {
    return BackendTarget::kCuda;
  }
  if (lowered == "vulkan") {
    return BackendTarget::kVulkan;
  }
  if (lowered == "hip" || lowered == "rocm") {
    return BackendTarget::kHip;
  }
  if (lowered == "sycl") {
    return BackendTarget::kSycl;
  }
  if (lowered == "metal" || lowered == "mps") {
    return BackendTarget::kMetal;
  }
  if (lowered == "opencl-adreno") {
    return BackendTarget::kOpenClAdreno;
  }
  return BackendTarget::kCpu;
}

BackendTraits DescribeBackendTarget(BackendTarget target) {
  BackendTraits traits;
  switch (target) {
  case BackendTarget::kCuda:
    traits.id = "cuda";
    traits.display_name = "NVIDIA CUDA";
    traits.description = "GPU acceleration for NVIDIA GPUs";
    traits.size_hint = "~200 MB (includes runtime)";
    traits.gpu_vendor = "nvidia";
    traits.requires_gpu = true;
    return traits;
  case BackendTarget::kVulkan:
    traits.id = "vulkan";
    traits.display_name = "Vulkan";
    traits.description = "Cross-platform GPU (NVIDIA, AMD, Intel)";
    traits.size_hint = "~32 MB";
    traits.requires_gpu = true;
    return traits;
  case BackendTarget::kHip:
    traits.id = "hip";
    traits.display_name = "AMD ROCm/HIP (Radeon)";
    traits.description = "GPU acceleration for AMD Radeon GPUs";
    traits.size_hint = "~340 MB";
    traits.gpu_vendor = "amd";
    traits.requires_gpu = true;
    return traits;
  case BackendTarget::kSycl:
    traits.id = "sycl";
    traits.display_name = "Intel SYCL/OneAPI";
    traits.description = "GPU acceleration for Intel Arc/Xe GPUs";
    traits.size_hint = "~106 MB";
    traits.gpu_vendor = "intel";
    traits.requires_gpu = true;
    return traits;
  case BackendTarget::kMetal:
    traits.id = "metal";
    traits.display_name = "Apple Metal";
    traits.description = "GPU acceleration for Apple Silicon";
    traits.size_hint = "~14 MB";
    traits.gpu_vendor = "apple";
    traits.requires_gpu = true;
    return traits;
  case BackendTarget::kOpenClAdreno:
    traits.id = "opencl-adreno";
    traits.display_name = "OpenCL Adreno (Windows ARM)";
    traits.description = "GPU acceleration for Qualcomm Adreno GPUs";
    traits.size_hint = "~14 MB";
    traits.gpu_vendor = "qualcomm";
    traits.requires_gpu = true;
    return traits;
  case BackendTarget::kCpu:
  default:
    traits.id = "cpu";
    traits.display_name = "CPU (OpenBLAS)";
    traits.description = "CPU-only inference with OpenBLAS optimization";
    traits.size_hint = "~17 MB";
    traits.requires_gpu = false;
    return traits;
  }
}

BackendTuning TuneForBackend(BackendTarget target, int cpu_cores) {
  BackendTuning tuning;
  const auto traits = DescribeBackendTarget(target);
  if (traits.requires_gpu) {
    // The GPU does the heavy lifting; a few threads feed it.
    tuning.gpu_layers = -1;
    tuning.threads = 4;
    tuning.batch_size = 1024;
  } else {
    tuning.gpu_layers = 0;
    tuning.threads = std::max(1, cpu_cores - 1);
    tuning.batch_size = 512;
  }
  return tuning;
}

std::vector<std::pair<std::string, std::string>>
PlatformAssets(const HostPlatform &platform) {
  if (platform.os == "Windows") {
    if (platform.arch == "arm64") {
      return {{"cpu", "llama-{version}-bin-win-cpu-arm64.zip"},
              {"opencl-adreno",
               "llama-{version}-bin-win-opencl-adreno-arm64.zip"}};
    }
    return {{"cpu", "llama-{version}-bin-win-cpu-x64.zip"},
            {"cuda", "llama-{version}-bin-win-cuda-{cuda_version}-x64.zip"},
            {"vulkan", "llama-{version}-bin-win-vulkan-x64.zip"},
            {"sycl", "llama-{version}-bin-win-sycl-x64.zip"},
            {"hip", "llama-{version}-bin-win-hip-radeon-x64.zip"}};
  }
  if (platform.os == "Darwin") {
    if (platform.arch == "arm64") {
      return {{"metal", "llama-{version}-bin-macos-arm64.zip"}};
    }
    return {{"metal", "llama-{version}-bin-macos-x64.zip"}};
  }
  if (platform.arch == "s390x") {
    return {{"cpu", "llama-{version}-bin-ubuntu-s390x.zip"}};
  }
  if (platform.arch == "x64") {
    return {{"cpu", "llama-{version}-bin-ubuntu-x64.zip"},
            {"vulkan", "llama-{version}-bin-ubuntu-vulkan-x64.zip"}};
  }
  return {};
}

std::vector<std::string> RecommendedPriority(const HostPlatform &platform) {
  if (platform.os == "Windows") {
    return {"cuda", "vulkan", "hip", "sycl", "cpu"};
  }
  if (platform.os == "Darwin") {
    return {"metal", "cpu"};
  }
  return {"vulkan", "cpu"};
}

const char *LibrarySearchVariable(const HostPlatform &platform) {
  if (platform.os == "Windows") {
    return "PATH";
  }
  if (platform.os == "Darwin") {
    return "DYLD_LIBRARY_PATH";
  }
  return "LD_LIBRARY_PATH";
}

} // namespace infergate
