#pragma once

#include <memory>
#include <optional>

namespace guardian::sensors::gpu {

class GpuSensor {
 public:
  // False when no compatible device or driver telemetry exists. Stays false for
  // the sensor's lifetime.
  virtual bool available() const = 0;

  // Utilization in percent. std::nullopt on a failed read or when unavailable.
  virtual std::optional<float> utilization() = 0;

  virtual ~GpuSensor() = default;
};

std::unique_ptr<GpuSensor> make_nvml_sensor(unsigned int device_index);
std::unique_ptr<GpuSensor> make_none_sensor();

}  // namespace guardian::sensors::gpu
