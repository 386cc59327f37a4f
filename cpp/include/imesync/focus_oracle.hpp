/**
 * @file focus_oracle.hpp
 * @brief Определение, владеет ли хост-приложение фокусом ввода
 *
 * Один вариант на оконную систему, выбор — пробой окружения при старте.
 * Любая ошибка запроса к оконной системе означает "не в фокусе": лучше
 * пропустить коррекцию, чем выполнить лишнюю.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gio/gio.h>

#include "imesync/config.hpp"

// Xlib не включаем в заголовок: его макросы (None, Status, Bool)
// ломают остальной код.
struct _XDisplay;

namespace imesync {

class FocusOracle {
public:
  virtual ~FocusOracle() = default;

  /// Владеет ли хост эксклюзивным фокусом прямо сейчас
  [[nodiscard]] virtual bool is_host_focused() = 0;

  /// Хост сообщил о получении фокуса. hint — необязательная подсказка
  /// (для X11 — window id хоста). Может вызываться из IPC-потока.
  virtual void on_focus_in(std::string_view hint) { (void)hint; }

  /// Запуск демона: предварительный захват фокуса. Окно в фокусе при
  /// старте может оказаться чужим, поэтому первый FOCUS_IN его заменяет.
  virtual void capture_at_start() {}

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;
};

/// Бэкенд не распознан: всегда "не в фокусе"
class NullFocusOracle final : public FocusOracle {
public:
  [[nodiscard]] bool is_host_focused() override { return false; }
  [[nodiscard]] std::string_view name() const noexcept override { return "none"; }
};

/**
 * @brief Backend A: X11, сравнение window id хоста с _NET_ACTIVE_WINDOW
 *
 * Чистое чтение свойства корневого окна, без побочных эффектов.
 * Соединение с X сервером открывается лениво и держится до разрушения.
 */
class X11FocusOracle final : public FocusOracle {
public:
  explicit X11FocusOracle(std::uint64_t host_window);
  ~X11FocusOracle() override;

  // Запрет копирования (X11 ресурсы)
  X11FocusOracle(const X11FocusOracle &) = delete;
  X11FocusOracle &operator=(const X11FocusOracle &) = delete;

  [[nodiscard]] bool is_host_focused() override;
  void on_focus_in(std::string_view hint) override;
  [[nodiscard]] std::string_view name() const noexcept override { return "x11"; }

  [[nodiscard]] std::uint64_t host_window() const noexcept {
    return host_window_.load();
  }

private:
  /// Текущее значение _NET_ACTIVE_WINDOW или std::nullopt
  [[nodiscard]] std::optional<std::uint64_t> query_active_window();

  bool open();
  void close();

  std::atomic<std::uint64_t> host_window_;
  _XDisplay *display_ = nullptr;
  unsigned long net_active_window_ = 0;
};

/**
 * @brief Backend B: композитор без стабильных window id (Wayland)
 *
 * При первом получении фокуса спрашивает внешний оракул о непрозрачном
 * токене активного окна и запоминает его на всё время жизни процесса.
 * Дальше каждый вызов перезапрашивает оракул и сравнивает с запомненным.
 * Токен, снятый при старте демона, предварительный: его один раз
 * заменяет первый FOCUS_IN от хоста.
 */
class ShellFocusOracle final : public FocusOracle {
public:
  /// Возвращает токен активного окна или std::nullopt при ошибке
  using TokenQuery = std::function<std::optional<std::string>()>;

  explicit ShellFocusOracle(TokenQuery query);

  [[nodiscard]] bool is_host_focused() override;
  void on_focus_in(std::string_view hint) override;
  void capture_at_start() override;
  [[nodiscard]] std::string_view name() const noexcept override { return "shell"; }

  [[nodiscard]] std::optional<std::string> cached_token() const;
  [[nodiscard]] bool token_is_provisional() const;

  /// TokenQuery поверх внешней команды (stdout без пробелов по краям)
  [[nodiscard]] static TokenQuery command_query(std::vector<std::string> argv);

  /// TokenQuery через org.gnome.Shell.Eval: id окна в фокусе.
  /// connection не принадлежит запросу и должен его пережить.
  [[nodiscard]] static TokenQuery shell_eval_query(GDBusConnection *connection);

private:
  TokenQuery query_;

  // Пишется один раз (из IPC-потока), дальше только читается
  mutable std::mutex mu_;
  std::optional<std::string> token_;
  bool provisional_ = false;
};

/// Что доступно в окружении процесса: wayland -> Shell, DISPLAY -> X11
[[nodiscard]] FocusBackend probe_focus_backend();

/**
 * @brief Создаёт оракул по конфигурации
 *
 * FocusBackend::Auto разрешается через probe_focus_backend().
 * Для Shell: пустой token_command означает запрос через Shell.Eval.
 * Если бэкенд не определён или не настраивается — NullFocusOracle.
 */
[[nodiscard]] std::unique_ptr<FocusOracle>
make_focus_oracle(const FocusConfig &config, GDBusConnection *connection);

} // namespace imesync
