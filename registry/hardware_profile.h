#pragma once

#include "backends/backend_traits.h"

#include <string>

namespace infergate {

class BackendCatalog;

// Supplies the backend the host should prefer and the tuning it implies.
class HardwareProfile {
public:
  virtual ~HardwareProfile() = default;
  virtual std::string RecommendedBackend() const = 0;
  virtual BackendTuning TuningFor(const std::string &backend_id) const = 0;
  virtual int CpuCores() const = 0;
};

// Derives everything from the static backend table and the core count.
// The recommendation comes from the catalog's platform priority list when a
// catalog is given, otherwise "cpu".
class StaticHardwareProfile : public HardwareProfile {
public:
  explicit StaticHardwareProfile(const BackendCatalog *catalog = nullptr,
                                 int cpu_cores = 0);

  std::string RecommendedBackend() const override;
  BackendTuning TuningFor(const std::string &backend_id) const override;
  int CpuCores() const override { return cpu_cores_; }

private:
  const BackendCatalog *catalog_;
  int cpu_cores_;
};

} // namespace infergate
