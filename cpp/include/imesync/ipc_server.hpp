/**
 * @file ipc_server.hpp
 * @brief IPC сервер для управления imesyncd через Unix Domain Socket
 *
 * Через него хост-приложение (его хуки старта, фокуса и выхода) и
 * imesyncctl управляют демоном:
 * - Включают/выключают синхронизацию
 * - Сообщают о получении фокуса
 * - Останавливают демон при завершении хоста
 */

#pragma once

#include <atomic>
#include <functional>
#include <string>
#include <string_view>
#include <thread>

namespace imesync {

/// Путь к сокету текущей сессии: $XDG_RUNTIME_DIR/imesync.sock,
/// иначе /tmp/imesync-<uid>.sock
[[nodiscard]] std::string default_ipc_socket_path();

/// Команды IPC протокола
enum class IpcCommand {
  Unknown,
  GetStatus, // GET_STATUS -> ENABLED|DISABLED
  SetStatus, // SET_STATUS 0|1 -> ENABLED|DISABLED
  FocusIn,   // FOCUS_IN [hint] -> OK
  Shutdown   // SHUTDOWN -> OK (отписка и выход)
};

/// Результат выполнения команды
struct IpcResult {
  bool success = false;
  std::string message;
};

/// Разбор первой строки запроса
[[nodiscard]] IpcCommand parse_ipc_command(std::string_view cmd);

/**
 * @brief IPC сервер на Unix Domain Socket
 *
 * Работает в отдельном потоке, не блокирует главный цикл GLib.
 * Колбэки вызываются в IPC-потоке и должны быть потокобезопасными.
 */
class IpcServer {
public:
  /// Хост получил фокус; аргумент — подсказка после команды (может быть пустой)
  using FocusInCallback = std::function<void(const std::string &)>;

  /// Запрос на завершение демона
  using ShutdownCallback = std::function<void()>;

  /**
   * @brief Конструктор
   * @param enabled_flag Атомарный флаг включения (shared с подпиской)
   * @param on_focus_in Обработчик FOCUS_IN
   * @param on_shutdown Обработчик SHUTDOWN
   * @param socket_path Путь сокета (пусто — default_ipc_socket_path())
   */
  IpcServer(std::atomic<bool> &enabled_flag, FocusInCallback on_focus_in,
            ShutdownCallback on_shutdown, std::string socket_path = {});

  ~IpcServer();

  // Запрет копирования
  IpcServer(const IpcServer &) = delete;
  IpcServer &operator=(const IpcServer &) = delete;

  /**
   * @brief Запускает IPC сервер в отдельном потоке
   * @return false если сокет занят живым демоном или не создаётся
   */
  bool start();

  /**
   * @brief Останавливает IPC сервер
   *
   * Ожидает завершения потока (join) и удаляет файл сокета.
   */
  void stop();

  [[nodiscard]] bool is_running() const noexcept;

  [[nodiscard]] const std::string &socket_path() const noexcept {
    return socket_path_;
  }

  /// Парсит и выполняет команду (одна строка без перевода строки)
  IpcResult execute_command(std::string_view cmd);

private:
  /// Основной цикл сервера (выполняется в отдельном потоке)
  void server_loop(std::stop_token st);

  /// Обрабатывает входящее соединение
  void handle_client(int client_fd);

  /// Создаёт и настраивает серверный сокет
  [[nodiscard]] int create_socket();

  std::atomic<bool> &enabled_flag_;
  FocusInCallback on_focus_in_;
  ShutdownCallback on_shutdown_;

  std::atomic<bool> running_{false};
  std::jthread server_thread_;
  int server_fd_ = -1;
  std::string socket_path_;

  // Файл сокета создан нами и должен быть удалён в stop()
  bool owns_socket_file_ = false;
};

} // namespace imesync
