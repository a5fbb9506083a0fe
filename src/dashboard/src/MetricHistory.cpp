/**
 * @file MetricHistory.cpp
 * @brief Ring buffer history.
 */

#include "src/dashboard/inc/MetricHistory.hpp"

namespace gpuwatch {

namespace dashboard {

/* ----------------------------- MetricHistory ----------------------------- */

MetricHistory::MetricHistory(std::size_t capacity) : buffer_(capacity == 0 ? 1 : capacity, 0.0) {}

void MetricHistory::push(double value) noexcept {
  const std::size_t CAP = buffer_.size();
  if (size_ < CAP) {
    buffer_[(head_ + size_) % CAP] = value;
    ++size_;
    return;
  }
  buffer_[head_] = value;
  head_ = (head_ + 1) % CAP;
}

double MetricHistory::at(std::size_t i) const noexcept {
  return buffer_[(head_ + i) % buffer_.size()];
}

std::vector<double> MetricHistory::values() const {
  std::vector<double> out;
  out.reserve(size_);
  for (std::size_t i = 0; i < size_; ++i) {
    out.push_back(at(i));
  }
  return out;
}

std::optional<double> MetricHistory::latest() const noexcept {
  if (size_ == 0) {
    return std::nullopt;
  }
  return at(size_ - 1);
}

std::optional<double> MetricHistory::min() const noexcept {
  if (size_ == 0) {
    return std::nullopt;
  }
  double lo = at(0);
  for (std::size_t i = 1; i < size_; ++i) {
    if (at(i) < lo) {
      lo = at(i);
    }
  }
  return lo;
}

std::optional<double> MetricHistory::max() const noexcept {
  if (size_ == 0) {
    return std::nullopt;
  }
  double hi = at(0);
  for (std::size_t i = 1; i < size_; ++i) {
    if (at(i) > hi) {
      hi = at(i);
    }
  }
  return hi;
}

/* ----------------------------- GpuHistory ----------------------------- */

const char* toString(Metric metric) noexcept {
  switch (metric) {
  case Metric::UTILIZATION:
    return "GPU";
  case Metric::MEMORY:
    return "MEM";
  case Metric::TEMPERATURE:
    return "TEMP";
  case Metric::POWER:
    return "PWR";
  }
  return "?";
}

GpuHistory::GpuHistory(std::size_t capacity)
    : series_{MetricHistory(capacity), MetricHistory(capacity), MetricHistory(capacity),
              MetricHistory(capacity)} {}

void GpuHistory::record(Metric metric, const std::optional<double>& value) noexcept {
  if (value) {
    (*this)[metric].push(*value);
  }
}

} // namespace dashboard

} // namespace gpuwatch
