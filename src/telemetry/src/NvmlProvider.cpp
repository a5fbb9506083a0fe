/**
 * @file NvmlProvider.cpp
 * @brief NVML telemetry collection in a forked child.
 * @note All NVML calls run in the child; the parent only decodes the message.
 */

#include "src/telemetry/inc/NvmlProvider.hpp"

#include "src/exec/inc/ChildProcess.hpp"
#include "src/helpers/inc/Files.hpp"
#include "src/helpers/inc/Strings.hpp"

#include <string> // std::string
#include <vector> // std::vector

#include <fmt/core.h>

#include "src/telemetry/inc/compat_nvml_detect.hpp"

namespace gpuwatch {

namespace telemetry {

namespace nvml {

/* ----------------------------- Decoding ----------------------------- */

namespace {

std::optional<double> metric(const DeviceRecord& dev, Metric which) noexcept {
  if (!dev.has(which)) {
    return std::nullopt;
  }
  return dev.values[which];
}

} // namespace

PollResult decodeMessage(const Message& msg) {
  const auto STATUS = static_cast<PollStatus>(msg.status);
  if (STATUS != PollStatus::OK) {
    return PollResult::failure(STATUS, std::string(msg.detail));
  }
  if (msg.deviceCount == 0) {
    return PollResult::failure(PollStatus::NO_DEVICES, "NVML reported no GPUs");
  }

  PollResult result{};
  result.status = PollStatus::OK;
  result.driverVersion = msg.driver;
  result.cudaVersion = msg.cudaVersion;

  const std::size_t COUNT = msg.deviceCount < MAX_DEVICES ? msg.deviceCount : MAX_DEVICES;
  result.gpus.reserve(COUNT);

  for (std::size_t i = 0; i < COUNT; ++i) {
    const DeviceRecord& dev = msg.devices[i];

    GpuSnapshot snap{};
    snap.index = static_cast<int>(i);
    snap.name = dev.name;
    snap.uuid = dev.uuid;
    snap.utilizationPercent = metric(dev, METRIC_UTILIZATION);
    snap.memoryUtilizationPercent = metric(dev, METRIC_MEMORY_UTILIZATION);
    snap.memoryUsedMiB = metric(dev, METRIC_MEMORY_USED);
    snap.memoryTotalMiB = metric(dev, METRIC_MEMORY_TOTAL);
    snap.temperatureC = metric(dev, METRIC_TEMPERATURE);
    snap.powerDrawW = metric(dev, METRIC_POWER_DRAW);
    snap.powerLimitW = metric(dev, METRIC_POWER_LIMIT);
    snap.graphicsClockMHz = metric(dev, METRIC_GRAPHICS_CLOCK);
    snap.memoryClockMHz = metric(dev, METRIC_MEMORY_CLOCK);
    snap.fanSpeedPercent = metric(dev, METRIC_FAN_SPEED);

    const std::size_t PROCS =
        dev.processCount < MAX_PROCESSES ? dev.processCount : MAX_PROCESSES;
    snap.processes.reserve(PROCS);
    for (std::size_t p = 0; p < PROCS; ++p) {
      const ProcessRecord& rec = dev.processes[p];
      GpuProcessEntry entry{};
      entry.pid = rec.pid;
      entry.name = rec.name;
      if (rec.hasMemory != 0) {
        entry.usedMemoryMiB = rec.usedMemoryMiB;
      }
      snap.processes.push_back(std::move(entry));
    }

    result.gpus.push_back(std::move(snap));
  }

  return result;
}

/* ----------------------------- Collection ----------------------------- */

#if GPUWATCH_NVML_AVAILABLE

namespace {

constexpr double BYTES_PER_MIB = 1024.0 * 1024.0;

/// RAII wrapper for NVML initialization.
class NvmlSession {
public:
  NvmlSession() noexcept : result_(nvmlInit_v2()) {}
  ~NvmlSession() {
    if (result_ == NVML_SUCCESS)
      nvmlShutdown();
  }

  [[nodiscard]] bool valid() const noexcept { return result_ == NVML_SUCCESS; }
  [[nodiscard]] nvmlReturn_t result() const noexcept { return result_; }

  NvmlSession(const NvmlSession&) = delete;
  NvmlSession& operator=(const NvmlSession&) = delete;

private:
  nvmlReturn_t result_;
};

/// Process name from NVML, falling back to /proc/<pid>/comm.
std::string processName(unsigned int pid) {
  char buf[256] = {};
  if (nvmlSystemGetProcessName(pid, buf, sizeof(buf)) == NVML_SUCCESS && buf[0] != '\0') {
    return std::string(helpers::strings::baseName(buf));
  }
  const std::string COMM = fmt::format("/proc/{}/comm", pid);
  return helpers::files::readFirstLine(COMM.c_str());
}

void collectProcesses(nvmlDevice_t device, DeviceRecord& dev) {
  unsigned int count = 0;
  nvmlReturn_t rc = nvmlDeviceGetComputeRunningProcesses(device, &count, nullptr);
  if (rc != NVML_SUCCESS && rc != NVML_ERROR_INSUFFICIENT_SIZE) {
    return;
  }
  if (count == 0) {
    return;
  }

  // Processes may start between the two calls.
  std::vector<nvmlProcessInfo_t> infos(count + 4);
  count = static_cast<unsigned int>(infos.size());
  if (nvmlDeviceGetComputeRunningProcesses(device, &count, infos.data()) != NVML_SUCCESS) {
    return;
  }

  const unsigned int KEEP = count < MAX_PROCESSES ? count : MAX_PROCESSES;
  for (unsigned int i = 0; i < KEEP; ++i) {
    ProcessRecord& rec = dev.processes[i];
    rec.pid = infos[i].pid;
    if (infos[i].usedGpuMemory != NVML_VALUE_NOT_AVAILABLE) {
      rec.hasMemory = 1;
      rec.usedMemoryMiB = static_cast<double>(infos[i].usedGpuMemory) / BYTES_PER_MIB;
    }
    copyText(rec.name, processName(infos[i].pid));
  }
  dev.processCount = KEEP;
}

void collectDevice(nvmlDevice_t device, DeviceRecord& dev, bool queryProcesses) {
  char text[NVML_DEVICE_NAME_BUFFER_SIZE] = {};
  if (nvmlDeviceGetName(device, text, sizeof(text)) == NVML_SUCCESS) {
    copyText(dev.name, text);
  }
  char uuid[NVML_DEVICE_UUID_BUFFER_SIZE] = {};
  if (nvmlDeviceGetUUID(device, uuid, sizeof(uuid)) == NVML_SUCCESS) {
    copyText(dev.uuid, uuid);
  }

  nvmlUtilization_t util{};
  if (nvmlDeviceGetUtilizationRates(device, &util) == NVML_SUCCESS) {
    dev.set(METRIC_UTILIZATION, util.gpu);
    dev.set(METRIC_MEMORY_UTILIZATION, util.memory);
  }

  nvmlMemory_t mem{};
  if (nvmlDeviceGetMemoryInfo(device, &mem) == NVML_SUCCESS) {
    dev.set(METRIC_MEMORY_USED, static_cast<double>(mem.used) / BYTES_PER_MIB);
    dev.set(METRIC_MEMORY_TOTAL, static_cast<double>(mem.total) / BYTES_PER_MIB);
  }

  unsigned int value = 0;
  if (nvmlDeviceGetTemperature(device, NVML_TEMPERATURE_GPU, &value) == NVML_SUCCESS) {
    dev.set(METRIC_TEMPERATURE, value);
  }

  // NVML reports power in milliwatts.
  if (nvmlDeviceGetPowerUsage(device, &value) == NVML_SUCCESS) {
    dev.set(METRIC_POWER_DRAW, value / 1000.0);
  }
  if (nvmlDeviceGetEnforcedPowerLimit(device, &value) == NVML_SUCCESS) {
    dev.set(METRIC_POWER_LIMIT, value / 1000.0);
  }

  if (nvmlDeviceGetClockInfo(device, NVML_CLOCK_GRAPHICS, &value) == NVML_SUCCESS) {
    dev.set(METRIC_GRAPHICS_CLOCK, value);
  }
  if (nvmlDeviceGetClockInfo(device, NVML_CLOCK_MEM, &value) == NVML_SUCCESS) {
    dev.set(METRIC_MEMORY_CLOCK, value);
  }

  if (nvmlDeviceGetFanSpeed(device, &value) == NVML_SUCCESS) {
    dev.set(METRIC_FAN_SPEED, value);
  }

  if (queryProcesses) {
    collectProcesses(device, dev);
  }
}

/// Body of the child process.
void collect(Message& msg, bool queryProcesses) {
  NvmlSession session;
  if (!session.valid()) {
    msg.status = static_cast<std::uint8_t>(PollStatus::DRIVER_UNAVAILABLE);
    copyText(msg.detail, fmt::format("nvmlInit failed: {}", nvmlErrorString(session.result())));
    return;
  }

  char driver[NVML_SYSTEM_DRIVER_VERSION_BUFFER_SIZE] = {};
  if (nvmlSystemGetDriverVersion(driver, sizeof(driver)) == NVML_SUCCESS) {
    copyText(msg.driver, driver);
  }
  int cuda = 0;
  if (nvmlSystemGetCudaDriverVersion(&cuda) == NVML_SUCCESS) {
    msg.cudaVersion = cuda;
  }

  unsigned int count = 0;
  const nvmlReturn_t RC = nvmlDeviceGetCount_v2(&count);
  if (RC != NVML_SUCCESS) {
    msg.status = static_cast<std::uint8_t>(PollStatus::DRIVER_UNAVAILABLE);
    copyText(msg.detail, fmt::format("nvmlDeviceGetCount failed: {}", nvmlErrorString(RC)));
    return;
  }

  msg.status = static_cast<std::uint8_t>(PollStatus::OK);
  msg.deviceCount = count < MAX_DEVICES ? count : static_cast<unsigned int>(MAX_DEVICES);
  for (unsigned int i = 0; i < msg.deviceCount; ++i) {
    nvmlDevice_t device{};
    if (nvmlDeviceGetHandleByIndex_v2(i, &device) == NVML_SUCCESS) {
      collectDevice(device, msg.devices[i], queryProcesses);
    }
  }
}

} // namespace

#endif // GPUWATCH_NVML_AVAILABLE

} // namespace nvml

/* ----------------------------- NvmlProvider ----------------------------- */

bool nvmlBackendAvailable() noexcept { return GPUWATCH_NVML_AVAILABLE != 0; }

PollResult NvmlProvider::poll() {
#if GPUWATCH_NVML_AVAILABLE
  nvml::Message msg{};
  const bool PROCS = queryProcesses_;
  const exec::ExecStatus STATUS =
      exec::callInChild([PROCS](nvml::Message& out) { nvml::collect(out, PROCS); }, msg, timeout_);

  switch (STATUS) {
  case exec::ExecStatus::OK:
    return nvml::decodeMessage(msg);
  case exec::ExecStatus::TIMEOUT:
    return PollResult::failure(PollStatus::TIMEOUT,
                               fmt::format("NVML did not answer within {} ms", timeout_.count()));
  case exec::ExecStatus::SPAWN_FAILED:
  case exec::ExecStatus::EXEC_FAILED:
  case exec::ExecStatus::IO_ERROR:
    break;
  }
  return PollResult::failure(PollStatus::DRIVER_UNAVAILABLE,
                             fmt::format("NVML query child failed: {}", exec::toString(STATUS)));
#else
  (void)timeout_;
  (void)queryProcesses_;
  return PollResult::failure(PollStatus::PROVIDER_MISSING, "built without NVML support");
#endif
}

} // namespace telemetry

} // namespace gpuwatch
