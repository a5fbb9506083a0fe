/**
 * @file PanelLayout.cpp
 * @brief Dashboard field placement.
 */

#include "src/dashboard/inc/PanelLayout.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <fmt/core.h>

namespace gpuwatch {

namespace dashboard {

using display::Style;

namespace {

/// Horizontal rule glyph.
constexpr const char* RULE = "─";

std::string rule(int width) {
  std::string out;
  for (int i = 0; i < width; ++i) {
    out += RULE;
  }
  return out;
}

void addLabel(PanelLayout& layout, int row, int col, std::string text, Style style) {
  const int WIDTH = static_cast<int>(helpers::strings::displayWidth(text));
  const Field AT = place(row, col, WIDTH, layout.rows, layout.cols);
  layout.labels.push_back(Label{AT, std::move(text), style});
}

void addRule(PanelLayout& layout, int row) {
  const Field AT = place(row, 0, layout.cols, layout.rows, layout.cols);
  layout.labels.push_back(Label{AT, rule(layout.cols), Style::DIM});
}

void layoutHeader(PanelLayout& layout) {
  const int R = layout.rows;
  const int C = layout.cols;

  addLabel(layout, 0, 0, "gpu-watch", Style::TITLE);
  addLabel(layout, 0, 11, "Driver", Style::LABEL);
  layout.driver = place(0, 18, 12, R, C);
  addLabel(layout, 0, 31, "CUDA", Style::LABEL);
  layout.cuda = place(0, 36, 6, R, C);
  addLabel(layout, 0, 43, "GPUs", Style::LABEL);
  layout.gpuCount = place(0, 48, 3, R, C);
  addLabel(layout, 0, 52, "Backend", Style::LABEL);
  layout.backend = place(0, 60, 10, R, C);

  addLabel(layout, 1, 0, "Time", Style::LABEL);
  layout.clock = place(1, 5, 8, R, C);
  addLabel(layout, 1, 15, "Status", Style::LABEL);
  layout.status = place(1, 22, C - 22, R, C);

  addRule(layout, 2);
}

GpuPanel layoutGpu(PanelLayout& layout, int top, int barWidth, int historyWidth) {
  const int R = layout.rows;
  const int C = layout.cols;
  const int TEXT_COL = VALUE_COL + barWidth + 1;

  GpuPanel panel{};
  panel.top = top;
  panel.title = place(top, 0, C, R, C);

  addLabel(layout, top + 1, LABEL_COL, "GPU", Style::LABEL);
  panel.utilizationBar = place(top + 1, VALUE_COL, barWidth, R, C);
  panel.utilizationText = place(top + 1, TEXT_COL, UTIL_TEXT_WIDTH, R, C);

  addLabel(layout, top + 2, LABEL_COL, "MEM", Style::LABEL);
  panel.memoryBar = place(top + 2, VALUE_COL, barWidth, R, C);
  panel.memoryText = place(top + 2, TEXT_COL, MEMORY_TEXT_WIDTH, R, C);

  addLabel(layout, top + 3, LABEL_COL, "PWR", Style::LABEL);
  panel.powerBar = place(top + 3, VALUE_COL, barWidth, R, C);
  panel.powerText = place(top + 3, TEXT_COL, POWER_TEXT_WIDTH, R, C);

  addLabel(layout, top + 4, LABEL_COL, "Temp", Style::LABEL);
  panel.temperature = place(top + 4, VALUE_COL, 6, R, C);
  addLabel(layout, top + 4, 15, "GPU Clk", Style::LABEL);
  panel.graphicsClock = place(top + 4, 23, 9, R, C);
  addLabel(layout, top + 4, 34, "Mem Clk", Style::LABEL);
  panel.memoryClock = place(top + 4, 42, 9, R, C);
  addLabel(layout, top + 4, 53, "Fan", Style::LABEL);
  panel.fanSpeed = place(top + 4, 57, 5, R, C);

  for (std::size_t m = 0; m < METRIC_COUNT; ++m) {
    const int ROW = top + 5 + static_cast<int>(m);
    addLabel(layout, ROW, LABEL_COL, toString(static_cast<Metric>(m)), Style::DIM);
    panel.sparklines[m] = place(ROW, VALUE_COL, historyWidth, R, C);
  }

  return panel;
}

void layoutProcesses(PanelLayout& layout, int top, int rowCount) {
  addLabel(layout, top, 0, "Processes", Style::TITLE);
  addLabel(layout, top + 1, LABEL_COL,
           fmt::format("{:<4} {:<8} {:<24} {:>10}", "GPU", "PID", "NAME", "MEMORY"),
           Style::LABEL);
  for (int i = 0; i < rowCount; ++i) {
    layout.processRows.push_back(place(top + 2 + i, LABEL_COL, layout.cols - LABEL_COL,
                                       layout.rows, layout.cols));
  }
}

} // namespace

Field place(int row, int col, int width, int rows, int cols) noexcept {
  Field f{};
  f.row = row;
  f.col = col;
  if (row < 0 || col < 0 || row >= rows || col >= cols || width <= 0) {
    f.width = 0;
    f.visible = false;
    return f;
  }
  f.width = (col + width > cols) ? cols - col : width;
  f.visible = true;
  return f;
}

PanelLayout computeLayout(const LayoutParams& params) {
  PanelLayout layout{};
  layout.rows = params.rows < 0 ? 0 : params.rows;
  layout.cols = params.cols < 0 ? 0 : params.cols;

  layoutHeader(layout);

  int top = HEADER_HEIGHT;
  layout.gpus.reserve(params.gpuCount);
  for (std::size_t i = 0; i < params.gpuCount; ++i) {
    layout.gpus.push_back(
        layoutGpu(layout, top, params.barWidth, static_cast<int>(params.historyLength)));
    top += GPU_PANEL_HEIGHT;
  }

  layout.processesShown = params.showProcesses;
  if (params.showProcesses) {
    const int COUNT = params.processRows < 0 ? 0 : params.processRows;
    layoutProcesses(layout, top, COUNT);
    top += 2 + COUNT;
  }

  layout.height = top;
  return layout;
}

} // namespace dashboard

} // namespace gpuwatch
