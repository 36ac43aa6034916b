#include "sensors/gpu/gpu.hpp"

#include <dlfcn.h>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <optional>

#include <nvml.h>

namespace guardian::sensors::gpu {
namespace {

constexpr const char* kNvmlLibrary = "libnvidia-ml.so.1";

// The subset of NVML needed for load sampling, resolved with dlsym so the
// binary starts on machines without the NVIDIA driver.
struct NvmlApi {
  nvmlReturn_t (*init)(){nullptr};
  nvmlReturn_t (*shutdown)(){nullptr};
  nvmlReturn_t (*handle_by_index)(unsigned int, nvmlDevice_t*){nullptr};
  nvmlReturn_t (*device_name)(nvmlDevice_t, char*, unsigned int){nullptr};
  nvmlReturn_t (*utilization_rates)(nvmlDevice_t, nvmlUtilization_t*){nullptr};
};

// Tries each exported name in turn; newer drivers suffix versioned entry points.
template <typename Fn>
bool bind(void* library, Fn& fn, std::initializer_list<const char*> symbols) noexcept {
  for (const char* symbol : symbols) {
    fn = reinterpret_cast<Fn>(dlsym(library, symbol));
    if (fn != nullptr) {
      return true;
    }
  }
  return false;
}

bool bind_api(void* library, NvmlApi& api) noexcept {
  return bind(library, api.init, {"nvmlInit_v2", "nvmlInit"}) && bind(library, api.shutdown, {"nvmlShutdown"}) &&
         bind(library, api.handle_by_index, {"nvmlDeviceGetHandleByIndex_v2", "nvmlDeviceGetHandleByIndex"}) &&
         bind(library, api.device_name, {"nvmlDeviceGetName"}) &&
         bind(library, api.utilization_rates, {"nvmlDeviceGetUtilizationRates"});
}

class NvmlGpuSensor final : public GpuSensor {
 public:
  explicit NvmlGpuSensor(unsigned int device_index) : device_index_(device_index) { open(); }

  ~NvmlGpuSensor() override {
    if (session_open_) {
      (void)api_.shutdown();
    }
    if (library_ != nullptr) {
      dlclose(library_);
    }
  }

  NvmlGpuSensor(const NvmlGpuSensor&) = delete;
  NvmlGpuSensor& operator=(const NvmlGpuSensor&) = delete;

  bool available() const override { return device_ != nullptr; }

  std::optional<float> utilization() override {
    if (device_ == nullptr) {
      return std::nullopt;
    }

    nvmlUtilization_t rates{};
    const nvmlReturn_t rc = api_.utilization_rates(device_, &rates);
    if (rc != NVML_SUCCESS) {
      if (!read_failure_reported_) {
        std::cerr << "[sampler] NVML utilization read failed on device " << device_index_ << " (code "
                  << static_cast<int>(rc) << ")\n";
        read_failure_reported_ = true;
      }
      return std::nullopt;
    }
    read_failure_reported_ = false;
    return static_cast<float>(rates.gpu);
  }

 private:
  void open() {
    library_ = dlopen(kNvmlLibrary, RTLD_NOW);
    if (library_ == nullptr || !bind_api(library_, api_)) {
      return;
    }

    if (api_.init() != NVML_SUCCESS) {
      return;
    }
    session_open_ = true;

    nvmlDevice_t device = nullptr;
    if (api_.handle_by_index(device_index_, &device) != NVML_SUCCESS) {
      std::cerr << "[sampler] NVML has no device " << device_index_ << '\n';
      return;
    }

    // Devices without utilization counters report NOT_SUPPORTED forever.
    nvmlUtilization_t probe{};
    if (api_.utilization_rates(device, &probe) == NVML_ERROR_NOT_SUPPORTED) {
      std::cerr << "[sampler] NVML device " << device_index_ << " does not report utilization\n";
      return;
    }

    char name[NVML_DEVICE_NAME_BUFFER_SIZE] = "unknown";
    (void)api_.device_name(device, name, sizeof(name));
    std::cerr << "[sampler] NVML device " << device_index_ << ": " << name << '\n';
    device_ = device;
  }

  unsigned int device_index_{0};
  void* library_{nullptr};
  NvmlApi api_{};
  bool session_open_{false};
  nvmlDevice_t device_{nullptr};
  bool read_failure_reported_{false};
};

}  // namespace

std::unique_ptr<GpuSensor> make_nvml_sensor(const unsigned int device_index) {
  return std::make_unique<NvmlGpuSensor>(device_index);
}

}  // namespace guardian::sensors::gpu
