/**
 * @file ipc_client.hpp
 * @brief IPC клиент для связи с imesyncd
 *
 * Используется imesyncctl, который вызывают хуки хост-приложения.
 */

#pragma once

#include <optional>
#include <string>

namespace imesync {

/// Статус демона
enum class ServiceStatus {
  Unknown, // Не удалось получить статус
  Enabled, // Синхронизация включена
  Disabled // Синхронизация выключена
};

/**
 * @brief IPC клиент для связи с imesyncd через Unix Domain Socket
 */
class IpcClient {
public:
  /// Timeout для операций (в миллисекундах)
  static constexpr int kTimeoutMs = 1000;

  /// socket_path пустой — путь текущей сессии
  explicit IpcClient(std::string socket_path = {});

  [[nodiscard]] ServiceStatus get_status() const;

  /**
   * @brief Включает/выключает синхронизацию
   * @return true при успехе
   */
  bool set_status(bool enabled) const;

  /**
   * @brief Сообщает демону, что хост получил фокус
   * @param hint Подсказка для оракула фокуса (X11 window id), может быть пустой
   */
  bool focus_in(const std::string &hint = {}) const;

  /// Просит демон отписаться и завершиться
  bool shutdown() const;

  [[nodiscard]] bool is_service_available() const;

  /**
   * @brief Отправляет команду и получает ответ
   * @return Ответ без перевода строки или nullopt при ошибке
   */
  [[nodiscard]] std::optional<std::string>
  send_command(const std::string &command) const;

  [[nodiscard]] const std::string &socket_path() const noexcept {
    return socket_path_;
  }

private:
  std::string socket_path_;
};

} // namespace imesync
