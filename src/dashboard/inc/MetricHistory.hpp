#ifndef GPUWATCH_DASHBOARD_METRIC_HISTORY_HPP
#define GPUWATCH_DASHBOARD_METRIC_HISTORY_HPP
/**
 * @file MetricHistory.hpp
 * @brief Fixed-capacity sample history for sparklines.
 *
 * Storage is allocated once in the constructor. push() overwrites the
 * oldest sample when full; size() never exceeds capacity().
 */

#include <array>    // std::array
#include <cstddef>  // std::size_t
#include <cstdint>  // std::uint8_t
#include <optional> // std::optional
#include <vector>   // std::vector

namespace gpuwatch {

namespace dashboard {

/// Default samples kept per metric.
inline constexpr std::size_t DEFAULT_HISTORY_LENGTH = 60;

/* ----------------------------- MetricHistory ----------------------------- */

/**
 * @brief Ring buffer of the most recent samples of one metric.
 */
class MetricHistory {
public:
  /// @param capacity Maximum samples kept (0 is treated as 1).
  explicit MetricHistory(std::size_t capacity = DEFAULT_HISTORY_LENGTH);

  /// @brief Append a sample, evicting the oldest when full.
  void push(double value) noexcept;

  /// @brief Sample i in arrival order (0 = oldest). Caller ensures i < size().
  [[nodiscard]] double at(std::size_t i) const noexcept;

  /// @brief Copy of all samples, oldest first.
  [[nodiscard]] std::vector<double> values() const;

  /// @brief Most recent sample, if any.
  [[nodiscard]] std::optional<double> latest() const noexcept;

  /// @brief Smallest sample, if any.
  [[nodiscard]] std::optional<double> min() const noexcept;

  /// @brief Largest sample, if any.
  [[nodiscard]] std::optional<double> max() const noexcept;

  [[nodiscard]] std::size_t size() const noexcept { return size_; }
  [[nodiscard]] std::size_t capacity() const noexcept { return buffer_.size(); }
  [[nodiscard]] bool empty() const noexcept { return size_ == 0; }

  /// @brief Drop all samples; capacity is unchanged.
  void clear() noexcept {
    head_ = 0;
    size_ = 0;
  }

private:
  std::vector<double> buffer_;
  std::size_t head_{0}; ///< Slot of the oldest sample
  std::size_t size_{0};
};

/* ----------------------------- GpuHistory ----------------------------- */

/**
 * @brief Metrics tracked per GPU.
 */
enum class Metric : std::uint8_t {
  UTILIZATION = 0, ///< GPU utilization (%)
  MEMORY,          ///< Memory used (% of total)
  TEMPERATURE,     ///< Core temperature (C)
  POWER,           ///< Power draw (W)
};

inline constexpr std::size_t METRIC_COUNT = 4;

/**
 * @brief Human-readable metric name.
 */
[[nodiscard]] const char* toString(Metric metric) noexcept;

/**
 * @brief One MetricHistory per tracked metric for a single GPU.
 */
class GpuHistory {
public:
  explicit GpuHistory(std::size_t capacity = DEFAULT_HISTORY_LENGTH);

  [[nodiscard]] MetricHistory& operator[](Metric metric) noexcept {
    return series_[static_cast<std::size_t>(metric)];
  }
  [[nodiscard]] const MetricHistory& operator[](Metric metric) const noexcept {
    return series_[static_cast<std::size_t>(metric)];
  }

  /// @brief Push value into the metric's history if known; unknown values are skipped.
  void record(Metric metric, const std::optional<double>& value) noexcept;

private:
  std::array<MetricHistory, METRIC_COUNT> series_;
};

} // namespace dashboard

} // namespace gpuwatch

#endif // GPUWATCH_DASHBOARD_METRIC_HISTORY_HPP
