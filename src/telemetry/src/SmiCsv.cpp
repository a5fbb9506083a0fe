/**
 * @file SmiCsv.cpp
 * @brief nvidia-smi CSV record parsing.
 */

#include "src/telemetry/inc/SmiCsv.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <array>        // std::array
#include <charconv>     // std::from_chars
#include <cmath>        // std::isfinite, std::floor
#include <limits>       // std::numeric_limits
#include <system_error> // std::errc

#include <fmt/core.h>

namespace gpuwatch {

namespace telemetry {

namespace smi {

namespace str = gpuwatch::helpers::strings;

namespace {

/// Units nvidia-smi appends when "nounits" is not requested.
constexpr std::array<std::string_view, 6> KNOWN_UNITS = {"W", "MiB", "MHz", "%", "C", "KiB"};

bool isKnownUnit(std::string_view unit) noexcept {
  for (const std::string_view KNOWN : KNOWN_UNITS) {
    if (unit == KNOWN) {
      return true;
    }
  }
  return false;
}

/// Store a parsed field into target, counting invalid fields.
void assignField(std::optional<double>& target, std::string_view text, int& fieldErrors) {
  const NumericField FIELD = parseNumericField(text);
  switch (FIELD.state) {
  case FieldState::VALUE:
    target = FIELD.value;
    break;
  case FieldState::NOT_AVAILABLE:
    target.reset();
    break;
  case FieldState::INVALID:
    target.reset();
    ++fieldErrors;
    break;
  }
}

/// Column text if present, else empty (treated as not available).
std::string_view column(const std::vector<std::string_view>& cols, GpuQueryField field) noexcept {
  return field < cols.size() ? cols[field] : std::string_view{};
}

} // namespace

/* ----------------------------- Field Parsing ----------------------------- */

NumericField parseNumericField(std::string_view text) {
  NumericField out{};
  text = str::trim(text);

  if (text.empty() || text == "N/A" || (text.front() == '[' && text.back() == ']')) {
    out.state = FieldState::NOT_AVAILABLE;
    return out;
  }

  // from_chars ignores the process locale; nvidia-smi always prints '.' decimals.
  const char* const FIRST = text.data();
  const char* const LAST = text.data() + text.size();
  double value = 0.0;
  const std::from_chars_result RES = std::from_chars(FIRST, LAST, value);
  if (RES.ec != std::errc{} || RES.ptr == FIRST || !std::isfinite(value)) {
    out.state = FieldState::INVALID;
    return out;
  }

  const std::string_view REST =
      str::trim(std::string_view(RES.ptr, static_cast<std::size_t>(LAST - RES.ptr)));
  if (!REST.empty() && !isKnownUnit(REST)) {
    out.state = FieldState::INVALID;
    return out;
  }

  out.state = FieldState::VALUE;
  out.value = value;
  return out;
}

bool parseGpuQueryLine(std::string_view line, std::size_t position, GpuSnapshot& out,
                       std::string& driver) {
  out = GpuSnapshot{};

  const std::vector<std::string_view> COLS = str::splitTrimmed(line, ',');
  if (COLS.size() < GPU_QUERY_REQUIRED_FIELDS || COLS[FIELD_NAME].empty()) {
    return false;
  }

  out.name = std::string(COLS[FIELD_NAME]);

  int& errs = out.fieldErrors;
  assignField(out.utilizationPercent, column(COLS, FIELD_UTILIZATION), errs);
  assignField(out.powerDrawW, column(COLS, FIELD_POWER_DRAW), errs);
  assignField(out.memoryUsedMiB, column(COLS, FIELD_MEMORY_USED), errs);
  assignField(out.memoryTotalMiB, column(COLS, FIELD_MEMORY_TOTAL), errs);
  assignField(out.temperatureC, column(COLS, FIELD_TEMPERATURE), errs);
  assignField(out.powerLimitW, column(COLS, FIELD_POWER_LIMIT), errs);
  assignField(out.graphicsClockMHz, column(COLS, FIELD_GRAPHICS_CLOCK), errs);
  assignField(out.memoryClockMHz, column(COLS, FIELD_MEMORY_CLOCK), errs);
  assignField(out.fanSpeedPercent, column(COLS, FIELD_FAN_SPEED), errs);
  assignField(out.memoryUtilizationPercent, column(COLS, FIELD_MEMORY_UTILIZATION), errs);

  std::optional<double> index;
  assignField(index, column(COLS, FIELD_INDEX), errs);
  constexpr double MAX_INDEX = static_cast<double>(std::numeric_limits<int>::max());
  out.index = (index && *index >= 0.0 && *index <= MAX_INDEX) ? static_cast<int>(*index)
                                                              : static_cast<int>(position);

  const std::string_view UUID = column(COLS, FIELD_UUID);
  if (!UUID.empty() && UUID.front() != '[') {
    out.uuid = std::string(UUID);
  }

  const std::string_view DRIVER = column(COLS, FIELD_DRIVER_VERSION);
  if (!DRIVER.empty() && DRIVER.front() != '[') {
    driver = std::string(DRIVER);
  }

  return true;
}

PollResult parseGpuQueryOutput(std::string_view output) {
  const std::vector<std::string_view> LINES = str::nonEmptyLines(output);
  if (LINES.empty()) {
    return PollResult::failure(PollStatus::NO_DEVICES, "provider reported no GPUs");
  }

  PollResult result{};
  result.status = PollStatus::OK;
  result.gpus.reserve(LINES.size());

  for (std::size_t i = 0; i < LINES.size(); ++i) {
    GpuSnapshot snap{};
    std::string driver;
    if (!parseGpuQueryLine(LINES[i], i, snap, driver)) {
      return PollResult::failure(PollStatus::MALFORMED_RESPONSE,
                                 fmt::format("unparseable record on line {}: '{}'", i + 1,
                                             LINES[i]));
    }
    if (result.driverVersion.empty() && !driver.empty()) {
      result.driverVersion = std::move(driver);
    }
    result.gpus.push_back(std::move(snap));
  }

  return result;
}

/* ----------------------------- Compute Apps ----------------------------- */

std::vector<ComputeAppRecord> parseComputeAppsOutput(std::string_view output) {
  constexpr double MAX_PID = static_cast<double>(std::numeric_limits<std::uint32_t>::max());
  std::vector<ComputeAppRecord> records;

  for (const std::string_view LINE : str::nonEmptyLines(output)) {
    // uuid, pid, process_name, used_memory. The name may itself contain commas,
    // so it is everything between the second and the last separator.
    const std::size_t FIRST = LINE.find(',');
    const std::size_t SECOND =
        FIRST == std::string_view::npos ? std::string_view::npos : LINE.find(',', FIRST + 1);
    const std::size_t LAST = LINE.rfind(',');
    if (SECOND == std::string_view::npos || LAST <= SECOND) {
      continue;
    }

    const NumericField PID = parseNumericField(LINE.substr(FIRST + 1, SECOND - FIRST - 1));
    if (PID.state != FieldState::VALUE || PID.value < 0.0 || PID.value > MAX_PID ||
        std::floor(PID.value) != PID.value) {
      continue;
    }

    ComputeAppRecord rec{};
    rec.gpuUuid = std::string(str::trim(LINE.substr(0, FIRST)));
    rec.process.pid = static_cast<std::uint32_t>(PID.value);
    rec.process.name =
        std::string(str::baseName(str::trim(LINE.substr(SECOND + 1, LAST - SECOND - 1))));

    const NumericField MEM = parseNumericField(LINE.substr(LAST + 1));
    if (MEM.state == FieldState::VALUE) {
      rec.process.usedMemoryMiB = MEM.value;
    }

    records.push_back(std::move(rec));
  }

  return records;
}

void attachProcesses(std::vector<GpuSnapshot>& gpus, std::vector<ComputeAppRecord> records) {
  for (ComputeAppRecord& rec : records) {
    if (rec.gpuUuid.empty()) {
      continue;
    }
    for (GpuSnapshot& gpu : gpus) {
      if (gpu.uuid == rec.gpuUuid) {
        gpu.processes.push_back(std::move(rec.process));
        break;
      }
    }
  }
}

} // namespace smi

} // namespace telemetry

} // namespace gpuwatch
