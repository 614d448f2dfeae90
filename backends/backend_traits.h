#pragma once

#include <string>
#include <utility>
#include <vector>

namespace infergate {

enum class BackendTarget {
  kCpu,
  kCuda,
  kVulkan,
  kHip,
  kSycl,
  kMetal,
  kOpenClAdreno,
};

struct BackendTraits {
  std::string id{"cpu"};
  std::string display_name{"CPU"};
  std::string description;
  std::string size_hint;
  std::string gpu_vendor;
  bool requires_gpu{false};
};

// Defaults a backend implies for a freshly loaded model.
struct BackendTuning {
  int gpu_layers{0}; // -1 offloads every layer
  int threads{1};
  int batch_size{512};
};

// Operating system and CPU architecture in release-asset vocabulary
// ("Linux"/"Darwin"/"Windows", "x64"/"arm64"/"s390x").
struct HostPlatform {
  std::string os;
  std::string arch;
};

HostPlatform DetectHostPlatform();

// Accepts backend ids plus common aliases ("cuda-12", "rocm", "mps").
// Unknown hints map to kCpu.
BackendTarget ParseBackendTarget(const std::string &hint);
BackendTraits DescribeBackendTarget(BackendTarget target);
BackendTuning TuneForBackend(BackendTarget target, int cpu_cores);

// Release asset name patterns ({version}, {cuda_version} placeholders) for the
// backends published for a platform, in table order.
std::vector<std::pair<std::string, std::string>>
PlatformAssets(const HostPlatform &platform);

// Preferred backend order for a platform family.
std::vector<std::string> RecommendedPriority(const HostPlatform &platform);

// Environment variable the dynamic loader searches on this platform.
const char *LibrarySearchVariable(const HostPlatform &platform);

} // namespace infergate
