/**
 * @file focus_oracle.cpp
 * @brief Выбор бэкенда фокуса и Wayland-оракул (Backend B)
 */

#include "imesync/focus_oracle.hpp"
#include "imesync/spawn.hpp"

#include <glib.h>

#include <cstdlib>
#include <iostream>
#include <utility>

namespace imesync {

namespace {

/// Таймаут синхронного Shell.Eval (мс): вызывается на каждое уведомление
constexpr gint kShellEvalTimeoutMs = 500;

constexpr const char *kFocusWindowScript =
    "global.display.focus_window ? "
    "String(global.display.focus_window.get_id()) : ''";

[[nodiscard]] bool env_is_set(const char *name) {
  const gchar *value = g_getenv(name);
  return value && *value != '\0';
}

[[nodiscard]] std::string trim_copy(std::string_view sv) {
  while (!sv.empty() && g_ascii_isspace(sv.front())) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && g_ascii_isspace(sv.back())) {
    sv.remove_suffix(1);
  }
  return std::string{sv};
}

} // namespace

// ===========================================================================
// ShellFocusOracle
// ===========================================================================

ShellFocusOracle::ShellFocusOracle(TokenQuery query) : query_(std::move(query)) {}

bool ShellFocusOracle::is_host_focused() {
  std::optional<std::string> cached = cached_token();
  if (!cached) {
    // Фокус ещё ни разу не был получен — нечего сравнивать
    return false;
  }

  std::optional<std::string> current = query_ ? query_() : std::nullopt;
  return current && *current == *cached;
}

void ShellFocusOracle::on_focus_in(std::string_view /*hint*/) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (token_ && !provisional_) {
      return;
    }
  }

  std::optional<std::string> token = query_ ? query_() : std::nullopt;
  if (!token) {
    std::cerr << "[imesync] Focus token query failed, will retry on next "
                 "focus-in\n";
    return;
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (!token_ || provisional_) {
    token_ = std::move(token);
    provisional_ = false;
    std::cerr << "[imesync] Host window token cached: " << *token_ << "\n";
  }
}

void ShellFocusOracle::capture_at_start() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (token_) {
      return;
    }
  }

  std::optional<std::string> token = query_ ? query_() : std::nullopt;
  if (!token) {
    return;
  }

  std::lock_guard<std::mutex> lock(mu_);
  if (!token_) {
    token_ = std::move(token);
    provisional_ = true;
    std::cerr << "[imesync] Provisional host window token: " << *token_
              << " (replaced by the first FOCUS_IN)\n";
  }
}

std::optional<std::string> ShellFocusOracle::cached_token() const {
  std::lock_guard<std::mutex> lock(mu_);
  return token_;
}

bool ShellFocusOracle::token_is_provisional() const {
  std::lock_guard<std::mutex> lock(mu_);
  return token_.has_value() && provisional_;
}

ShellFocusOracle::TokenQuery
ShellFocusOracle::command_query(std::vector<std::string> argv) {
  return [argv = std::move(argv)]() -> std::optional<std::string> {
    const SpawnOutcome out = spawn_sync(argv);
    if (!out.ok) {
      return std::nullopt;
    }
    std::string token = trim_copy(out.stdout_str);
    if (token.empty()) {
      return std::nullopt;
    }
    return token;
  };
}

ShellFocusOracle::TokenQuery
ShellFocusOracle::shell_eval_query(GDBusConnection *connection) {
  return [connection]() -> std::optional<std::string> {
    if (!connection) {
      return std::nullopt;
    }

    GError *err = nullptr;
    GVariant *reply = g_dbus_connection_call_sync(
        connection, "org.gnome.Shell", "/org/gnome/Shell", "org.gnome.Shell",
        "Eval", g_variant_new("(s)", kFocusWindowScript),
        G_VARIANT_TYPE("(bs)"), G_DBUS_CALL_FLAGS_NONE, kShellEvalTimeoutMs,
        nullptr, &err);
    if (!reply) {
      if (err) {
        g_error_free(err);
      }
      return std::nullopt;
    }

    gboolean success = FALSE;
    const gchar *result = nullptr;
    g_variant_get(reply, "(b&s)", &success, &result);

    // Eval возвращает JSON: строка приходит в кавычках
    std::optional<std::string> token;
    if (success && result) {
      std::string value = trim_copy(result);
      if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
        value = value.substr(1, value.size() - 2);
      }
      if (!value.empty()) {
        token = std::move(value);
      }
    }
    g_variant_unref(reply);
    return token;
  };
}

// ===========================================================================
// Выбор бэкенда
// ===========================================================================

FocusBackend probe_focus_backend() {
  const gchar *session_type = g_getenv("XDG_SESSION_TYPE");
  if ((session_type && g_strcmp0(session_type, "wayland") == 0) ||
      env_is_set("WAYLAND_DISPLAY")) {
    return FocusBackend::Shell;
  }
  if (env_is_set("DISPLAY")) {
    return FocusBackend::X11;
  }
  return FocusBackend::Off;
}

std::unique_ptr<FocusOracle> make_focus_oracle(const FocusConfig &config,
                                               GDBusConnection *connection) {
  FocusBackend backend = config.backend;
  if (backend == FocusBackend::Auto) {
    backend = probe_focus_backend();
  }

  switch (backend) {
  case FocusBackend::X11: {
    std::uint64_t host_window = config.host_window;
    if (host_window == 0) {
      if (const gchar *env = g_getenv("WINDOWID")) {
        host_window = parse_window_id(env).value_or(0);
      }
    }
    if (host_window == 0) {
      std::cerr << "[imesync] Host window id unknown, waiting for FOCUS_IN\n";
    }
    return std::make_unique<X11FocusOracle>(host_window);
  }

  case FocusBackend::Shell: {
    if (config.token_command.empty()) {
      return std::make_unique<ShellFocusOracle>(
          ShellFocusOracle::shell_eval_query(connection));
    }

    std::string error;
    auto argv = split_command_line(config.token_command, &error);
    if (!argv) {
      std::cerr << "[imesync] Invalid focus.token_command: " << error
                << ", focus detection disabled\n";
      return std::make_unique<NullFocusOracle>();
    }
    return std::make_unique<ShellFocusOracle>(
        ShellFocusOracle::command_query(std::move(*argv)));
  }

  case FocusBackend::Off:
  case FocusBackend::Auto:
  default:
    break;
  }

  std::cerr << "[imesync] No supported focus backend detected (X11/Wayland), "
               "corrections disabled\n";
  return std::make_unique<NullFocusOracle>();
}

} // namespace imesync
