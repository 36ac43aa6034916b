#include "core/load_sampler.hpp"

#include <iostream>
#include <utility>

#include "core/math.hpp"
#include "core/timestamp.hpp"
#include "model/engine_event.hpp"

namespace guardian::core {

LoadSampler::LoadSampler(CpuReader cpu_reader, std::unique_ptr<sensors::gpu::GpuSensor> gpu_sensor,
                         const SamplerOptions options)
    : cpu_reader_(std::move(cpu_reader)), gpu_sensor_(std::move(gpu_sensor)), options_(options) {
  if (gpu_sensor_ == nullptr) {
    gpu_sensor_ = sensors::gpu::make_none_sensor();
  }
}

bool LoadSampler::degraded() const noexcept {
  return consecutive_failed_cycles_ >= options_.degraded_after_cycles;
}

std::optional<float> LoadSampler::read_cpu() {
  for (std::uint32_t attempt = 0; attempt <= options_.retries; ++attempt) {
    float value = 0.0F;
    if (cpu_reader_ && cpu_reader_(value)) {
      return clamp_percent(value);
    }
  }
  return std::nullopt;
}

std::optional<float> LoadSampler::read_gpu() {
  for (std::uint32_t attempt = 0; attempt <= options_.retries; ++attempt) {
    if (const auto value = gpu_sensor_->utilization(); value.has_value()) {
      return clamp_percent(*value);
    }
  }
  return std::nullopt;
}

SampleResult LoadSampler::sample() {
  SampleResult result{};
  result.sample.timestamp_ms = unix_timestamp_now_ms();
  bool failed = false;

  if (const auto cpu = read_cpu(); cpu.has_value()) {
    const float smoothed = last_cpu_.has_value() ? ema(*last_cpu_, *cpu, options_.smoothing_alpha) : *cpu;
    last_cpu_ = smoothed;
    result.sample.cpu_percent = smoothed;
  } else {
    failed = true;
    result.sample.cpu_percent = last_cpu_.value_or(0.0F);
    result.sample.stale = true;
  }

  if (!gpu_sensor_->available()) {
    result.conditions |= model::bit(model::condition::GPU_UNAVAILABLE);
  } else if (const auto gpu = read_gpu(); gpu.has_value()) {
    const float smoothed = last_gpu_.has_value() ? ema(*last_gpu_, *gpu, options_.smoothing_alpha) : *gpu;
    last_gpu_ = smoothed;
    result.sample.gpu_percent = smoothed;
  } else {
    failed = true;
    result.sample.gpu_percent = last_gpu_;
    result.sample.stale = true;
  }

  if (!failed) {
    if (degraded()) {
      std::cerr << "[sampler] readings recovered after " << consecutive_failed_cycles_ << " failed cycles\n";
    }
    consecutive_failed_cycles_ = 0;
    return result;
  }

  ++consecutive_failed_cycles_;
  result.conditions |= model::bit(model::condition::SAMPLING_TRANSIENT_FAILURE);
  if (degraded()) {
    if (consecutive_failed_cycles_ == options_.degraded_after_cycles) {
      std::cerr << "[sampler] sampling degraded: " << consecutive_failed_cycles_ << " consecutive failed cycles\n";
    }
    result.conditions |= model::bit(model::condition::SAMPLING_DEGRADED);
  }
  return result;
}

}  // namespace guardian::core
