#ifndef GPUWATCH_TELEMETRY_COMPAT_NVML_DETECT_HPP
#define GPUWATCH_TELEMETRY_COMPAT_NVML_DETECT_HPP
/**
 * @file compat_nvml_detect.hpp
 * @brief NVML availability guard and buffer-size shims.
 *
 * Macros:
 *  - GPUWATCH_NVML_AVAILABLE   : 1 if the NVML backend is compiled in, else 0
 *  - GPUWATCH_NVML_API_VERSION : NVML_API_VERSION if provided by the header, else 0
 *
 * The build sets GPUWATCH_NVML_AVAILABLE explicitly (option GPUWATCH_ENABLE_NVML).
 * Without a definition the backend is treated as absent.
 */

#ifndef GPUWATCH_NVML_AVAILABLE
#define GPUWATCH_NVML_AVAILABLE 0
#endif

#if GPUWATCH_NVML_AVAILABLE
#include <nvml.h>
#ifdef NVML_API_VERSION
#define GPUWATCH_NVML_API_VERSION NVML_API_VERSION
#else
#define GPUWATCH_NVML_API_VERSION 0
#endif

// Older headers miss some buffer-size constants.
#ifndef NVML_DEVICE_NAME_BUFFER_SIZE
#define NVML_DEVICE_NAME_BUFFER_SIZE 96
#endif
#ifndef NVML_DEVICE_UUID_BUFFER_SIZE
#define NVML_DEVICE_UUID_BUFFER_SIZE 80
#endif
#ifndef NVML_SYSTEM_DRIVER_VERSION_BUFFER_SIZE
#define NVML_SYSTEM_DRIVER_VERSION_BUFFER_SIZE 80
#endif

#else
#define GPUWATCH_NVML_API_VERSION 0
#endif

#endif // GPUWATCH_TELEMETRY_COMPAT_NVML_DETECT_HPP
