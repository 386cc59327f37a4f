/**
 * @file actions.cpp
 * @brief Реализация внешних действий (сброс раскладки, toggle метода ввода)
 */

#include "imesync/actions.hpp"
#include "imesync/spawn.hpp"

#include <iostream>
#include <utility>

namespace imesync {

namespace {

constexpr const char *kInputSourcesSchema = "org.gnome.desktop.input-sources";
constexpr const char *kInputSourcesCurrentKey = "current";

constexpr const char *kKeyboardDaemonBusName = "org.gnome.SettingsDaemon.Keyboard";
constexpr const char *kKeyboardDaemonObjectPath = "/org/gnome/SettingsDaemon/Keyboard";
constexpr const char *kKeyboardDaemonInterface = "org.gnome.SettingsDaemon.Keyboard";
constexpr const char *kSetInputSourceMethod = "SetInputSource";

constexpr const char *kShellBusName = "org.gnome.Shell";
constexpr const char *kShellObjectPath = "/org/gnome/Shell";
constexpr const char *kShellInterface = "org.gnome.Shell";
constexpr const char *kShellEvalMethod = "Eval";

/// Таймаут асинхронных D-Bus вызовов (мс)
constexpr gint kCallTimeoutMs = 2000;

void on_set_input_source_done(GObject *source, GAsyncResult *res,
                              gpointer /*user_data*/) {
  GError *err = nullptr;
  GVariant *reply =
      g_dbus_connection_call_finish(G_DBUS_CONNECTION(source), res, &err);
  if (!reply) {
    std::cerr << "[imesync] SetInputSource failed: "
              << (err && err->message ? err->message : "unknown error") << "\n";
    if (err) {
      g_error_free(err);
    }
    return;
  }
  g_variant_unref(reply);
}

void on_shell_eval_done(GObject *source, GAsyncResult *res,
                        gpointer /*user_data*/) {
  GError *err = nullptr;
  GVariant *reply =
      g_dbus_connection_call_finish(G_DBUS_CONNECTION(source), res, &err);
  if (!reply) {
    std::cerr << "[imesync] Shell.Eval failed: "
              << (err && err->message ? err->message : "unknown error") << "\n";
    if (err) {
      g_error_free(err);
    }
    return;
  }

  // (bs): success + результат/текст исключения
  gboolean success = FALSE;
  const gchar *result = nullptr;
  g_variant_get(reply, "(b&s)", &success, &result);
  if (!success) {
    // Начиная с GNOME 41 Eval работает только в unsafe-mode
    std::cerr << "[imesync] Shell.Eval rejected: "
              << (result ? result : "") << "\n";
  }
  g_variant_unref(reply);
}

} // namespace

void GSettingsResetAction::request_reset(std::uint32_t index) {
  std::string error;
  if (!spawn_async({"gsettings", "set", kInputSourcesSchema,
                    kInputSourcesCurrentKey, std::to_string(index)},
                   error)) {
    std::cerr << "[imesync] gsettings reset failed: " << error << "\n";
  }
}

SettingsDaemonResetAction::SettingsDaemonResetAction(GDBusConnection *connection)
    : connection_(connection) {}

void SettingsDaemonResetAction::request_reset(std::uint32_t index) {
  if (!connection_) {
    std::cerr << "[imesync] SetInputSource skipped: no session bus\n";
    return;
  }

  g_dbus_connection_call(connection_,
                         kKeyboardDaemonBusName,
                         kKeyboardDaemonObjectPath,
                         kKeyboardDaemonInterface,
                         kSetInputSourceMethod,
                         g_variant_new("(u)", index),
                         nullptr,
                         G_DBUS_CALL_FLAGS_NONE,
                         kCallTimeoutMs,
                         nullptr,
                         on_set_input_source_done,
                         nullptr);
}

ShellEvalResetAction::ShellEvalResetAction(GDBusConnection *connection)
    : connection_(connection) {}

std::string ShellEvalResetAction::script_for(std::uint32_t index) {
  return "imports.ui.status.keyboard.getInputSourceManager().inputSources[" +
         std::to_string(index) + "].activate()";
}

void ShellEvalResetAction::request_reset(std::uint32_t index) {
  if (!connection_) {
    std::cerr << "[imesync] Shell.Eval skipped: no session bus\n";
    return;
  }

  const std::string script = script_for(index);
  g_dbus_connection_call(connection_,
                         kShellBusName,
                         kShellObjectPath,
                         kShellInterface,
                         kShellEvalMethod,
                         g_variant_new("(s)", script.c_str()),
                         G_VARIANT_TYPE("(bs)"),
                         G_DBUS_CALL_FLAGS_NONE,
                         kCallTimeoutMs,
                         nullptr,
                         on_shell_eval_done,
                         nullptr);
}

std::unique_ptr<LayoutResetAction>
make_layout_reset_action(ResetMethod method, GDBusConnection *connection) {
  switch (method) {
  case ResetMethod::SettingsDaemon:
    return std::make_unique<SettingsDaemonResetAction>(connection);
  case ResetMethod::ShellEval:
    return std::make_unique<ShellEvalResetAction>(connection);
  case ResetMethod::GSettings:
  default:
    return std::make_unique<GSettingsResetAction>();
  }
}

CommandInputMethodToggle::CommandInputMethodToggle(std::vector<std::string> argv)
    : argv_(std::move(argv)) {}

bool CommandInputMethodToggle::toggle() {
  const SpawnOutcome out = spawn_sync(argv_);
  if (!out.ok) {
    std::cerr << "[imesync] Input method toggle failed: " << out.error;
    if (!out.stderr_str.empty()) {
      std::cerr << ": " << out.stderr_str;
    }
    std::cerr << "\n";
    return false;
  }
  return true;
}

} // namespace imesync
