/**
 * @file daemon.cpp
 * @brief Реализация главного цикла imesyncd
 */

#include "imesync/daemon.hpp"
#include "imesync/spawn.hpp"

#include <glib-unix.h>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <utility>

namespace imesync {

namespace {

/// Период проверки процесса хоста (с)
constexpr guint kHostCheckIntervalSec = 1;

} // namespace

Daemon::Daemon(Config config)
    : config_{std::move(config)}, loop_{g_main_loop_new(nullptr, FALSE)} {
  enabled_.store(config_.daemon.enabled);
}

Daemon::~Daemon() {
  teardown();
  if (loop_) {
    g_main_loop_unref(loop_);
    loop_ = nullptr;
  }
}

InitResult Daemon::initialize() {
  if (initialized_) {
    return InitResult::Ready;
  }

  std::string error;
  auto toggle_argv = split_command_line(config_.host.toggle_command, &error);
  if (!toggle_argv) {
    std::cerr << "[imesync] Invalid host.toggle_command: " << error << "\n";
    return InitResult::Failed;
  }

  // Без адреса сессионной шины функция выключается, подписки не будет
  transport_ = std::make_unique<GDBusSignalTransport>();
  if (!transport_->connect()) {
    return InitResult::Disabled;
  }

  focus_ = make_focus_oracle(config_.focus, transport_->connection());
  reset_ = make_layout_reset_action(config_.reset.method, transport_->connection());
  toggle_ = std::make_unique<CommandInputMethodToggle>(std::move(*toggle_argv));
  debouncer_ = std::make_unique<EventDebouncer>(
      make_debouncer_settings(config_), *focus_, *reset_, *toggle_);

  std::cerr << "[imesync] Focus backend: " << focus_->name() << "\n";

  // Окно в фокусе при старте не обязательно хост: захват предварительный
  if (config_.focus.capture_on_start) {
    focus_->capture_at_start();
  }

  subscription_ = std::make_unique<SignalSubscription>(
      *transport_, make_subscription_settings(config_), *debouncer_, enabled_);
  if (!subscription_->register_listener()) {
    return InitResult::Disabled;
  }

  ipc_server_ = std::make_unique<IpcServer>(
      enabled_,
      [this](const std::string &hint) { focus_->on_focus_in(hint); },
      [this] { request_stop(); });
  if (!ipc_server_->start()) {
    std::cerr << "[imesync] IPC server failed to start, "
                 "another imesyncd is probably running\n";
    return InitResult::Failed;
  }

  sigint_source_ = g_unix_signal_add(SIGINT, &Daemon::on_unix_signal, this);
  sigterm_source_ = g_unix_signal_add(SIGTERM, &Daemon::on_unix_signal, this);

  if (config_.host.pid != 0) {
    if (!host_alive()) {
      std::cerr << "[imesync] Host process " << config_.host.pid
                << " is not running\n";
      return InitResult::Failed;
    }
    host_watch_source_ =
        g_timeout_add_seconds(kHostCheckIntervalSec, &Daemon::on_host_check, this);
  }

  initialized_ = true;
  return InitResult::Ready;
}

int Daemon::run() {
  switch (initialize()) {
  case InitResult::Ready:
    break;
  case InitResult::Disabled:
    std::cerr << "[imesync] Layout sync feature disabled\n";
    teardown();
    return 0;
  case InitResult::Failed:
  default:
    std::cerr << "[imesync] Failed to initialize daemon\n";
    teardown();
    return 1;
  }

  if (!stop_requested_.load()) {
    std::cerr << "[imesync] Running\n";
    g_main_loop_run(loop_);
  }

  teardown();
  std::cerr << "[imesync] Stopped\n";
  return 0;
}

void Daemon::request_stop() noexcept {
  stop_requested_.store(true);
  if (loop_) {
    g_main_loop_quit(loop_);
  }
}

gboolean Daemon::on_unix_signal(gpointer user_data) {
  auto *self = static_cast<Daemon *>(user_data);
  std::cerr << "[imesync] Signal received, stopping\n";
  self->request_stop();
  return G_SOURCE_CONTINUE;
}

gboolean Daemon::on_host_check(gpointer user_data) {
  auto *self = static_cast<Daemon *>(user_data);
  if (self->host_alive()) {
    return G_SOURCE_CONTINUE;
  }

  std::cerr << "[imesync] Host process " << self->config_.host.pid
            << " exited, stopping\n";
  self->host_watch_source_ = 0;
  self->request_stop();
  return G_SOURCE_REMOVE;
}

bool Daemon::host_alive() const {
  std::error_code ec;
  const std::filesystem::path proc =
      std::filesystem::path{"/proc"} / std::to_string(config_.host.pid);
  return std::filesystem::exists(proc, ec) && !ec;
}

void Daemon::teardown() {
  // IPC первым: после этого FOCUS_IN/SHUTDOWN больше не трогают компоненты
  if (ipc_server_) {
    ipc_server_->stop();
  }

  if (subscription_) {
    subscription_->unregister();
  }

  if (host_watch_source_ != 0) {
    g_source_remove(host_watch_source_);
    host_watch_source_ = 0;
  }
  if (sigint_source_ != 0) {
    g_source_remove(sigint_source_);
    sigint_source_ = 0;
  }
  if (sigterm_source_ != 0) {
    g_source_remove(sigterm_source_);
    sigterm_source_ = 0;
  }

  initialized_ = false;
}

} // namespace imesync
