#include "registry/hardware_profile.h"

#include "backends/backend_catalog.h"

#include <thread>

namespace infergate {

StaticHardwareProfile::StaticHardwareProfile(const BackendCatalog *catalog,
                                             int cpu_cores)
    : catalog_(catalog), cpu_cores_(cpu_cores) {
  if (cpu_cores_ <= 0) {
    cpu_cores_ = static_cast<int>(std::thread::hardware_concurrency());
  }
  if (cpu_cores_ <= 0) {
    cpu_cores_ = 4;
  }
}

std::string StaticHardwareProfile::RecommendedBackend() const {
  return catalog_ ? catalog_->GetRecommended() : "cpu";
}

BackendTuning
StaticHardwareProfile::TuningFor(const std::string &backend_id) const {
  return TuneForBackend(ParseBackendTarget(backend_id), cpu_cores_);
}

} // namespace infergate
