/**
 * @file signal_transport.hpp
 * @brief Транспорт уведомлений: подписка на broadcast-сигналы D-Bus
 */

#pragma once

#include <gio/gio.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "imesync/notification.hpp"
#include "imesync/types.hpp"

namespace imesync {

/**
 * @brief Абстракция источника уведомлений
 *
 * Реальная реализация — GDBus на сессионной шине; в тестах подменяется
 * фейком в памяти. Колбэки вызываются в потоке главного цикла по одному.
 */
class SignalTransport {
public:
  using SignalCallback = std::function<void(const RawSignal &)>;

  virtual ~SignalTransport() = default;

  /// Доступен ли транспорт (адрес сессионной шины, соединение)
  [[nodiscard]] virtual bool is_available() = 0;

  /// Проверка живости сервиса по well-known имени
  [[nodiscard]] virtual bool ping(std::string_view bus_name) = 0;

  /// Синхронный запрос текущей раскладки у источника уведомлений
  [[nodiscard]] virtual std::optional<LayoutId>
  query_current_layout(TransportVariant variant) = 0;

  /// Подписка. std::nullopt при отказе шины.
  [[nodiscard]] virtual std::optional<std::uint64_t>
  subscribe(const SignalSpec &spec, SignalCallback callback) = 0;

  /// После возврата колбэк подписки больше не вызывается
  virtual void unsubscribe(std::uint64_t id) = 0;
};

/**
 * @brief Транспорт поверх GDBusConnection сессионной шины
 */
class GDBusSignalTransport final : public SignalTransport {
public:
  GDBusSignalTransport();
  ~GDBusSignalTransport() override;

  // Запрет копирования
  GDBusSignalTransport(const GDBusSignalTransport &) = delete;
  GDBusSignalTransport &operator=(const GDBusSignalTransport &) = delete;

  /**
   * @brief Подключается к сессионной шине
   * @return false если DBUS_SESSION_BUS_ADDRESS не задан или шина недоступна
   */
  bool connect();

  [[nodiscard]] bool is_available() override;
  [[nodiscard]] bool ping(std::string_view bus_name) override;
  [[nodiscard]] std::optional<LayoutId>
  query_current_layout(TransportVariant variant) override;
  [[nodiscard]] std::optional<std::uint64_t>
  subscribe(const SignalSpec &spec, SignalCallback callback) override;
  void unsubscribe(std::uint64_t id) override;

  /// Соединение для D-Bus действий (nullptr до connect())
  [[nodiscard]] GDBusConnection *connection() const noexcept {
    return connection_;
  }

private:
  static void on_signal(GDBusConnection *connection, const gchar *sender,
                        const gchar *object_path, const gchar *interface,
                        const gchar *member, GVariant *parameters,
                        gpointer user_data);

  /// AddMatch/RemoveMatch у org.freedesktop.DBus
  bool call_bus_match(const char *method, const std::string &rule);

  GDBusConnection *connection_ = nullptr;

  /// id подписки -> eavesdrop match rule, который нужно снять
  std::unordered_map<std::uint64_t, std::string> eavesdrop_rules_;
};

} // namespace imesync
