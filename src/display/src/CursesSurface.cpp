/**
 * @file CursesSurface.cpp
 * @brief ncurses terminal surface.
 */

#include "src/display/inc/CursesSurface.hpp"

#include "src/helpers/inc/Strings.hpp"

#include <unistd.h> // isatty, STDOUT_FILENO

#include <clocale> // std::setlocale
#include <cstdio>  // stdout, stdin

// Function forms only: the clear()/erase() macros collide with member names.
#define NCURSES_NOMACROS
#include <curses.h>

// curses defines OK and ERR as plain macros; OK collides with SurfaceStatus::OK.
#undef OK
#undef ERR

namespace gpuwatch {

namespace display {

namespace {

// Color pair numbers per style.
constexpr short PAIR_LOW = 1;
constexpr short PAIR_MEDIUM = 2;
constexpr short PAIR_HIGH = 3;
constexpr short PAIR_TITLE = 4;
constexpr short PAIR_LABEL = 5;
constexpr short PAIR_DIM = 6;

void initPalette() {
  start_color();
  use_default_colors();

  if (can_change_color() && COLORS >= 32) {
    constexpr short SOFT_GREEN = 20;
    constexpr short SOFT_AMBER = 21;
    constexpr short SOFT_ROSE = 22;
    constexpr short SOFT_CYAN = 23;
    constexpr short SOFT_BLUE = 24;
    constexpr short SOFT_GRAY = 25;

    init_color(SOFT_GREEN, 420, 760, 560);
    init_color(SOFT_AMBER, 780, 700, 430);
    init_color(SOFT_ROSE, 760, 480, 520);
    init_color(SOFT_CYAN, 460, 720, 760);
    init_color(SOFT_BLUE, 430, 560, 760);
    init_color(SOFT_GRAY, 600, 600, 620);

    init_pair(PAIR_LOW, SOFT_GREEN, -1);
    init_pair(PAIR_MEDIUM, SOFT_AMBER, -1);
    init_pair(PAIR_HIGH, SOFT_ROSE, -1);
    init_pair(PAIR_TITLE, SOFT_CYAN, -1);
    init_pair(PAIR_LABEL, SOFT_BLUE, -1);
    init_pair(PAIR_DIM, SOFT_GRAY, -1);
  } else {
    init_pair(PAIR_LOW, COLOR_GREEN, -1);
    init_pair(PAIR_MEDIUM, COLOR_YELLOW, -1);
    init_pair(PAIR_HIGH, COLOR_RED, -1);
    init_pair(PAIR_TITLE, COLOR_CYAN, -1);
    init_pair(PAIR_LABEL, COLOR_BLUE, -1);
    init_pair(PAIR_DIM, COLOR_WHITE, -1);
  }
}

attr_t attributesFor(Style style, bool colors) noexcept {
  attr_t attrs = A_NORMAL;
  short pair = 0;
  switch (style) {
  case Style::NORMAL:
    break;
  case Style::TITLE:
    attrs |= A_BOLD;
    pair = PAIR_TITLE;
    break;
  case Style::LABEL:
    pair = PAIR_LABEL;
    break;
  case Style::DIM:
    attrs |= A_DIM;
    pair = PAIR_DIM;
    break;
  case Style::LOW:
    pair = PAIR_LOW;
    break;
  case Style::MEDIUM:
    pair = PAIR_MEDIUM;
    break;
  case Style::HIGH:
    attrs |= A_BOLD;
    pair = PAIR_HIGH;
    break;
  }
  if (colors && pair != 0) {
    attrs |= static_cast<attr_t>(COLOR_PAIR(pair));
  }
  return attrs;
}

/// Terminal has absolute cursor positioning ("cup" capability).
bool hasCursorAddressing() {
  const char* CUP = tigetstr("cup");
  return CUP != nullptr && CUP != reinterpret_cast<const char*>(-1);
}

} // namespace

/* ----------------------------- Status ----------------------------- */

const char* toString(SurfaceStatus status) noexcept {
  switch (status) {
  case SurfaceStatus::OK:
    return "OK";
  case SurfaceStatus::NOT_A_TERMINAL:
    return "NOT_A_TERMINAL";
  case SurfaceStatus::NEWTERM_FAILED:
    return "NEWTERM_FAILED";
  case SurfaceStatus::NO_CURSOR_ADDRESSING:
    return "NO_CURSOR_ADDRESSING";
  }
  return "UNKNOWN";
}

/* ----------------------------- Lifecycle ----------------------------- */

SurfaceStatus CursesSurface::open(std::unique_ptr<CursesSurface>& out) {
  if (::isatty(STDOUT_FILENO) == 0) {
    return SurfaceStatus::NOT_A_TERMINAL;
  }

  // Character classification only; LC_NUMERIC stays "C".
  std::setlocale(LC_CTYPE, "");

  SCREEN* scr = newterm(nullptr, stdout, stdin);
  if (scr == nullptr) {
    return SurfaceStatus::NEWTERM_FAILED;
  }
  set_term(scr);

  if (!hasCursorAddressing()) {
    endwin();
    delscreen(scr);
    return SurfaceStatus::NO_CURSOR_ADDRESSING;
  }

  cbreak();
  noecho();
  curs_set(0);
  keypad(stdscr, TRUE);

  const bool COLORS_OK = has_colors();
  if (COLORS_OK) {
    initPalette();
  }

  out = std::make_unique<CursesSurface>(PrivateTag{}, scr, COLORS_OK);
  return SurfaceStatus::OK;
}

CursesSurface::~CursesSurface() {
  curs_set(1);
  endwin();
  delscreen(screen_);
}

/* ----------------------------- Drawing ----------------------------- */

int CursesSurface::rows() const noexcept { return getmaxy(stdscr); }

int CursesSurface::cols() const noexcept { return getmaxx(stdscr); }

void CursesSurface::clear() { werase(stdscr); }

void CursesSurface::writeAt(int row, int col, std::string_view text, Style style) {
  const int ROWS = rows();
  const int COLS = cols();
  if (row < 0 || col < 0 || row >= ROWS || col >= COLS || text.empty()) {
    return;
  }

  const std::string_view CLIPPED =
      helpers::strings::clipToWidth(text, static_cast<std::size_t>(COLS - col));

  const attr_t ATTRS = attributesFor(style, colors_);
  wattron(stdscr, static_cast<int>(ATTRS));
  mvwaddnstr(stdscr, row, col, CLIPPED.data(), static_cast<int>(CLIPPED.size()));
  wattroff(stdscr, static_cast<int>(ATTRS));
}

void CursesSurface::flush() { wrefresh(stdscr); }

} // namespace display

} // namespace gpuwatch
