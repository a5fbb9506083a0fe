#ifndef GPUWATCH_TELEMETRY_SMI_CSV_HPP
#define GPUWATCH_TELEMETRY_SMI_CSV_HPP
/**
 * @file SmiCsv.hpp
 * @brief Parsing of nvidia-smi "--format=csv,noheader,nounits" query output.
 * @note Pure functions; no I/O. Thread-safe.
 *
 * Column order of the GPU query is fixed by GpuQueryField. The first
 * GPU_QUERY_REQUIRED_FIELDS columns must be present on every line; later
 * columns are optional so that older tools, or hand-fed lines, still parse.
 *
 * Per-field failures never abort a record: the field becomes unknown and the
 * record's fieldErrors counter is incremented. Only a structurally broken
 * line (too few columns, empty name) fails the whole response.
 */

#include "src/telemetry/inc/GpuSnapshot.hpp"
#include "src/telemetry/inc/TelemetryProvider.hpp"

#include <cstddef>     // std::size_t
#include <cstdint>     // std::uint8_t
#include <string>      // std::string
#include <string_view> // std::string_view
#include <vector>      // std::vector

namespace gpuwatch {

namespace telemetry {

namespace smi {

/* ----------------------------- Query Layout ----------------------------- */

/**
 * @brief Column positions of the GPU query.
 */
enum GpuQueryField : std::uint8_t {
  FIELD_NAME = 0,
  FIELD_UTILIZATION = 1,
  FIELD_POWER_DRAW = 2,
  FIELD_MEMORY_USED = 3,
  FIELD_MEMORY_TOTAL = 4,
  FIELD_TEMPERATURE = 5,
  FIELD_POWER_LIMIT = 6,
  FIELD_GRAPHICS_CLOCK = 7,
  FIELD_MEMORY_CLOCK = 8,
  FIELD_FAN_SPEED = 9,
  FIELD_MEMORY_UTILIZATION = 10,
  FIELD_INDEX = 11,
  FIELD_UUID = 12,
  FIELD_DRIVER_VERSION = 13,
  FIELD_COUNT = 14,
};

/// Columns every GPU line must carry.
inline constexpr std::size_t GPU_QUERY_REQUIRED_FIELDS = 6;

/// Value of --query-gpu, in GpuQueryField order.
inline constexpr const char* GPU_QUERY_FIELDS =
    "name,utilization.gpu,power.draw,memory.used,memory.total,temperature.gpu,power.limit,"
    "clocks.gr,clocks.mem,fan.speed,utilization.memory,index,uuid,driver_version";

/// Value of --query-compute-apps.
inline constexpr const char* COMPUTE_APPS_QUERY_FIELDS = "gpu_uuid,pid,process_name,used_memory";

/// Value of --format for both queries.
inline constexpr const char* QUERY_FORMAT = "csv,noheader,nounits";

/* ----------------------------- Field Parsing ----------------------------- */

/**
 * @brief Classification of one numeric field.
 */
enum class FieldState : std::uint8_t {
  VALUE = 0,     ///< Parsed number
  NOT_AVAILABLE, ///< Provider reported the value as unavailable ("[N/A]", "")
  INVALID,       ///< Present but not a number
};

/**
 * @brief Parsed numeric field.
 */
struct NumericField {
  FieldState state{FieldState::NOT_AVAILABLE};
  double value{0.0};
};

/**
 * @brief Parse one numeric CSV field.
 * @param text Trimmed field text. A trailing unit (W, MiB, MHz, %, C) is accepted.
 * @return VALUE with the number, NOT_AVAILABLE for empty or bracketed tokens
 *         such as "[N/A]" and "[Not Supported]", INVALID otherwise.
 */
[[nodiscard]] NumericField parseNumericField(std::string_view text);

/**
 * @brief Parse one line of GPU query output.
 * @param line     One CSV record.
 * @param position Zero-based line position, used as index when the index column is absent.
 * @param out      Receives the record (fully overwritten).
 * @param driver   Receives the driver_version column if present and non-empty.
 * @return false if the line is structurally malformed.
 */
[[nodiscard]] bool parseGpuQueryLine(std::string_view line, std::size_t position,
                                     GpuSnapshot& out, std::string& driver);

/**
 * @brief Parse the full GPU query output.
 * @param output Provider stdout.
 * @return OK with one snapshot per line; NO_DEVICES for empty output;
 *         MALFORMED_RESPONSE if any line is structurally malformed.
 */
[[nodiscard]] PollResult parseGpuQueryOutput(std::string_view output);

/* ----------------------------- Compute Apps ----------------------------- */

/**
 * @brief One line of compute-apps query output.
 */
struct ComputeAppRecord {
  std::string gpuUuid;     ///< Owning GPU's UUID
  GpuProcessEntry process; ///< Process description
};

/**
 * @brief Parse compute-apps query output. Unusable lines are skipped.
 * @note Columns are uuid, pid, name, memory. The name keeps any embedded commas.
 */
[[nodiscard]] std::vector<ComputeAppRecord> parseComputeAppsOutput(std::string_view output);

/**
 * @brief Attach process records to the snapshot with the matching UUID.
 *        Records whose UUID matches no GPU are dropped.
 */
void attachProcesses(std::vector<GpuSnapshot>& gpus, std::vector<ComputeAppRecord> records);

} // namespace smi

} // namespace telemetry

} // namespace gpuwatch

#endif // GPUWATCH_TELEMETRY_SMI_CSV_HPP
