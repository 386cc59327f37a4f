/**
 * @file daemon.hpp
 * @brief Главный цикл imesyncd
 *
 * Собирает компоненты (транспорт, оракул фокуса, действия, debouncer,
 * подписку, IPC) и крутит главный цикл GLib, который доставляет
 * уведомления D-Bus строго по одному.
 */

#pragma once

#include <glib.h>

#include <atomic>
#include <memory>

#include "imesync/actions.hpp"
#include "imesync/config.hpp"
#include "imesync/event_debouncer.hpp"
#include "imesync/focus_oracle.hpp"
#include "imesync/ipc_server.hpp"
#include "imesync/signal_subscription.hpp"
#include "imesync/signal_transport.hpp"

namespace imesync {

/// Чем закончилась инициализация
enum class InitResult {
  Ready,    // подписка активна, можно запускать цикл
  Disabled, // транспорт недоступен: функция выключена, выход без ошибки
  Failed    // фатальная ошибка (второй демон, неверная конфигурация)
};

/**
 * @brief Демон синхронизации раскладки
 */
class Daemon {
public:
  explicit Daemon(Config config);
  ~Daemon();

  // Запрет копирования
  Daemon(const Daemon &) = delete;
  Daemon &operator=(const Daemon &) = delete;

  /**
   * @brief Подключается к шине, регистрирует подписку и поднимает IPC
   */
  InitResult initialize();

  /**
   * @brief Запускает главный цикл до SIGINT/SIGTERM, SHUTDOWN или выхода хоста
   * @return Код возврата (0 = успех)
   */
  [[nodiscard]] int run();

  /**
   * @brief Запрашивает остановку главного цикла
   *
   * Thread-safe: вызывается и из IPC-потока.
   */
  void request_stop() noexcept;

private:
  static gboolean on_unix_signal(gpointer user_data);
  static gboolean on_host_check(gpointer user_data);

  /// Жив ли процесс хоста
  [[nodiscard]] bool host_alive() const;

  /// Снимает подписку, останавливает IPC и источники цикла
  void teardown();

  Config config_;
  std::atomic<bool> enabled_{true};
  std::atomic<bool> stop_requested_{false};

  GMainLoop *loop_ = nullptr;
  guint sigint_source_ = 0;
  guint sigterm_source_ = 0;
  guint host_watch_source_ = 0;

  // Порядок важен: подписка разрушается раньше транспорта
  std::unique_ptr<GDBusSignalTransport> transport_;
  std::unique_ptr<FocusOracle> focus_;
  std::unique_ptr<LayoutResetAction> reset_;
  std::unique_ptr<InputMethodToggle> toggle_;
  std::unique_ptr<EventDebouncer> debouncer_;
  std::unique_ptr<SignalSubscription> subscription_;
  std::unique_ptr<IpcServer> ipc_server_;

  bool initialized_ = false;
};

} // namespace imesync
