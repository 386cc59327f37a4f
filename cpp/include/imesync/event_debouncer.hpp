/**
 * @file event_debouncer.hpp
 * @brief Ядро: отделяет настоящие переключения раскладки от эха собственного
 *        сброса и выполняет ровно одну компенсацию на событие
 *
 * Обработчик вызывается только из главного цикла GLib, который доставляет
 * сигналы D-Bus строго по одному. Поэтому SuppressionState не защищается
 * мьютексом: им владеет и его меняет только этот класс.
 */

#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string_view>

#include "imesync/actions.hpp"
#include "imesync/focus_oracle.hpp"
#include "imesync/notification.hpp"
#include "imesync/types.hpp"

namespace imesync {

/// Состояние подавления. Живёт от подписки до отписки, не сохраняется.
struct SuppressionState {
  std::optional<LayoutId> last_observed;

  /// Следующее уведомление — эхо нашего сброса (только Echoing)
  bool skip_next = false;

  /// Когда был взведён skip_next
  std::chrono::steady_clock::time_point skip_armed_at{};
};

/// Чем закончилась обработка одного уведомления
enum class DebounceOutcome {
  Unfocused,         // хост не в фокусе, состояние не тронуто
  SignatureMismatch, // чужая группа/настройка
  NoLayout,          // пейлоад без раскладки
  SkipConsumed,      // эхо сброса поглощено skip_next
  Duplicate,         // раскладка не изменилась
  Toggled,           // только toggle метода ввода
  ResetAndToggled    // сброс раскладки + toggle
};

[[nodiscard]] std::string_view to_string(DebounceOutcome outcome) noexcept;

struct DebouncerSettings {
  TransportVariant variant = TransportVariant::Portal;
  ReconciliationPolicy policy = ReconciliationPolicy::EchoFree;

  /// Раскладка, от которой уходим на уровне ОС (EchoFree)
  LayoutId avoid_layout{std::string{"ru"}};

  /// Слот, в который сбрасываем
  std::uint32_t default_index = 0;

  /// Возраст, после которого skip_next считается устаревшим (0 = никогда)
  std::chrono::milliseconds echo_timeout{1500};

  bool verbose = false;
};

[[nodiscard]] DebouncerSettings make_debouncer_settings(const Config &config);

/**
 * @brief Конечный автомат подавления событий
 *
 * Порядок проверок на каждое уведомление: фокус хоста, сигнатура,
 * наличие раскладки, затем политика подавления. Исключения из действий
 * логируются и не пробрасываются; состояние обновляется в любом случае,
 * потому что само уведомление было настоящим.
 */
class EventDebouncer {
public:
  using Clock = std::function<std::chrono::steady_clock::time_point()>;

  EventDebouncer(DebouncerSettings settings, FocusOracle &focus,
                 LayoutResetAction &reset, InputMethodToggle &toggle,
                 Clock clock = [] { return std::chrono::steady_clock::now(); });

  // Запрет копирования
  EventDebouncer(const EventDebouncer &) = delete;
  EventDebouncer &operator=(const EventDebouncer &) = delete;

  /// Обрабатывает одно уведомление до конца
  DebounceOutcome handle(const NotificationEvent &event);

  /// Выключено через IPC: только запоминает раскладку, без действий,
  /// чтобы после включения last_observed не был устаревшим
  void observe(const NotificationEvent &event);

  /// Засевает last_observed текущей раскладкой до подписки
  void prime(LayoutId current);

  /// Сбрасывает SuppressionState (при отписке)
  void reset_state() noexcept;

  [[nodiscard]] const SuppressionState &state() const noexcept { return state_; }
  [[nodiscard]] const DebouncerSettings &settings() const noexcept {
    return settings_;
  }

private:
  DebounceOutcome handle_echo_free(const LayoutId &layout);
  DebounceOutcome handle_echoing(const LayoutId &layout);

  /// Снимает skip_next, если он старше echo_timeout
  void expire_stale_skip();

  void invoke_reset() noexcept;
  void invoke_toggle() noexcept;

  DebouncerSettings settings_;
  FocusOracle &focus_;
  LayoutResetAction &reset_;
  InputMethodToggle &toggle_;
  Clock clock_;

  SuppressionState state_;
};

} // namespace imesync
