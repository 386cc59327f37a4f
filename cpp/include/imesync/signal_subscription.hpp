/**
 * @file signal_subscription.hpp
 * @brief Жизненный цикл подписки на уведомления о смене раскладки
 *
 * Владеет ровно одной подпиской на транспорте. Пока подписка активна,
 * каждое уведомление декодируется и передаётся в EventDebouncer.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <optional>

#include "imesync/config.hpp"
#include "imesync/event_debouncer.hpp"
#include "imesync/signal_transport.hpp"
#include "imesync/types.hpp"

namespace imesync {

/// Непрозрачный дескриптор активной подписки
struct SubscriptionHandle {
  std::uint64_t id = 0;

  bool operator==(const SubscriptionHandle &) const = default;
};

struct SubscriptionSettings {
  TransportVariant variant = TransportVariant::Portal;
  bool eavesdrop = true;
  bool probe = true;
  bool prime = true;
  bool verbose = false;
};

[[nodiscard]] SubscriptionSettings make_subscription_settings(const Config &config);

/**
 * @brief Подписка на сигнал транспорта с автоматической отпиской
 *
 * register_listener() идемпотентен. Если транспорт недоступен или сервис не
 * отвечает на ping, подписка не создаётся, флаг enabled сбрасывается в false,
 * а в лог пишется только предупреждение.
 *
 * Деструктор отписывается сам, поэтому объект должен разрушаться раньше
 * транспорта (соединения с шиной).
 */
class SignalSubscription {
public:
  SignalSubscription(SignalTransport &transport, SubscriptionSettings settings,
                     EventDebouncer &debouncer, std::atomic<bool> &enabled_flag);
  ~SignalSubscription();

  // Запрет копирования
  SignalSubscription(const SignalSubscription &) = delete;
  SignalSubscription &operator=(const SignalSubscription &) = delete;

  /**
   * @brief Создаёт подписку
   * @return Дескриптор (существующий, если уже подписаны) или std::nullopt,
   *         если функция отключена
   */
  std::optional<SubscriptionHandle> register_listener();

  /// Снимает подписку и сбрасывает состояние подавления. Без подписки — no-op.
  void unregister();

  [[nodiscard]] bool is_active() const noexcept { return handle_.has_value(); }
  [[nodiscard]] std::optional<SubscriptionHandle> handle() const noexcept {
    return handle_;
  }

  /// Сколько уведомлений отброшено как некорректные
  [[nodiscard]] std::uint64_t discarded() const noexcept { return discarded_; }

private:
  /// Одно сырое уведомление от транспорта
  void dispatch(const RawSignal &signal);

  /// Проверка живости источника (только Legacy)
  [[nodiscard]] bool probe_source();

  /// Засевает last_observed текущей раскладкой
  void prime_debouncer();

  SignalTransport &transport_;
  SubscriptionSettings settings_;
  EventDebouncer &debouncer_;
  std::atomic<bool> &enabled_flag_;

  std::optional<SubscriptionHandle> handle_;
  std::uint64_t discarded_ = 0;
};

} // namespace imesync
