/**
 * @file x11_focus_oracle.cpp
 * @brief Backend A: фокус хоста через _NET_ACTIVE_WINDOW
 */

#include "imesync/config.hpp"
#include "imesync/focus_oracle.hpp"

#include <X11/Xatom.h>
#include <X11/Xlib.h>

#include <iostream>
#include <string>

namespace imesync {

X11FocusOracle::X11FocusOracle(std::uint64_t host_window)
    : host_window_(host_window) {}

X11FocusOracle::~X11FocusOracle() { close(); }

bool X11FocusOracle::open() {
  if (display_) {
    return true;
  }

  display_ = XOpenDisplay(nullptr);
  if (!display_) {
    std::cerr << "[imesync] Ошибка: не удалось открыть X display\n";
    return false;
  }

  // only_if_exists: без EWMH-совместимого WM атома просто нет
  net_active_window_ = XInternAtom(display_, "_NET_ACTIVE_WINDOW", True);
  return true;
}

void X11FocusOracle::close() {
  if (display_) {
    XCloseDisplay(display_);
    display_ = nullptr;
    net_active_window_ = None;
  }
}

std::optional<std::uint64_t> X11FocusOracle::query_active_window() {
  if (!open() || net_active_window_ == None) {
    return std::nullopt;
  }

  Atom actual_type;
  int actual_format = 0;
  unsigned long nitems = 0;
  unsigned long bytes_after = 0;
  unsigned char *data = nullptr;

  Window root = DefaultRootWindow(display_);

  int result = XGetWindowProperty(display_, root, net_active_window_, 0, 1,
                                  False, XA_WINDOW, &actual_type,
                                  &actual_format, &nitems, &bytes_after, &data);

  // Некоторые WM кладут в свойство больше одного значения — берём первое
  if (result != Success || data == nullptr || nitems == 0 ||
      actual_format != 32) {
    if (data) {
      XFree(data);
    }
    return std::nullopt;
  }

  Window active_window = *reinterpret_cast<Window *>(data);
  XFree(data);

  if (active_window == None) {
    return std::nullopt;
  }
  return static_cast<std::uint64_t>(active_window);
}

bool X11FocusOracle::is_host_focused() {
  const std::uint64_t host = host_window_.load();
  if (host == 0) {
    return false;
  }

  auto active = query_active_window();
  return active && *active == host;
}

void X11FocusOracle::on_focus_in(std::string_view hint) {
  if (hint.empty()) {
    return;
  }

  auto id = parse_window_id(hint);
  if (!id || *id == 0) {
    std::cerr << "[imesync] Ignoring invalid host window id: " << hint << "\n";
    return;
  }

  if (host_window_.exchange(*id) != *id) {
    std::cerr << "[imesync] Host window set to 0x" << std::hex << *id
              << std::dec << "\n";
  }
}

} // namespace imesync
