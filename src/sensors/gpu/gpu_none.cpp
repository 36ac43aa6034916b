#include "sensors/gpu/gpu.hpp"

#include <memory>
#include <optional>

namespace guardian::sensors::gpu {
namespace {

class NoneGpuSensor final : public GpuSensor {
 public:
  bool available() const override { return false; }

  std::optional<float> utilization() override { return std::nullopt; }
};

}  // namespace

std::unique_ptr<GpuSensor> make_none_sensor() { return std::make_unique<NoneGpuSensor>(); }

}  // namespace guardian::sensors::gpu
