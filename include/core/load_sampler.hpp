#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "model/load_sample.hpp"
#include "sensors/gpu/gpu.hpp"

namespace guardian::core {

struct SamplerOptions {
  std::uint32_t retries{2};
  std::uint32_t degraded_after_cycles{3};
  float smoothing_alpha{1.0F};
};

struct SampleResult {
  model::load_sample sample{};
  std::uint32_t conditions{0};
};

// Produces one load_sample per call. Transient read failures are retried within
// the call, then the previous value is reused for that call only. Sustained
// failures are escalated to SAMPLING_DEGRADED without ever throwing.
class LoadSampler {
 public:
  using CpuReader = std::function<bool(float&)>;

  LoadSampler(CpuReader cpu_reader, std::unique_ptr<sensors::gpu::GpuSensor> gpu_sensor, SamplerOptions options = {});

  LoadSampler(LoadSampler&&) = default;
  LoadSampler& operator=(LoadSampler&&) = default;

  SampleResult sample();

  void set_options(const SamplerOptions& options) noexcept { options_ = options; }

  [[nodiscard]] bool degraded() const noexcept;

 private:
  std::optional<float> read_cpu();
  std::optional<float> read_gpu();

  CpuReader cpu_reader_;
  std::unique_ptr<sensors::gpu::GpuSensor> gpu_sensor_;
  SamplerOptions options_;

  std::optional<float> last_cpu_{};
  std::optional<float> last_gpu_{};
  std::uint32_t consecutive_failed_cycles_{0};
};

}  // namespace guardian::core
