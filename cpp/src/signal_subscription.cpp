/**
 * @file signal_subscription.cpp
 * @brief Реализация подписки на уведомления
 */

#include "imesync/signal_subscription.hpp"

#include <iostream>
#include <utility>

namespace imesync {

SubscriptionSettings make_subscription_settings(const Config &config) {
  SubscriptionSettings settings;
  settings.variant = config.transport.variant;
  settings.eavesdrop = config.transport.eavesdrop;
  settings.probe = config.transport.probe;
  settings.prime = config.transport.prime;
  settings.verbose = config.daemon.verbose;
  return settings;
}

SignalSubscription::SignalSubscription(SignalTransport &transport,
                                       SubscriptionSettings settings,
                                       EventDebouncer &debouncer,
                                       std::atomic<bool> &enabled_flag)
    : transport_(transport), settings_(std::move(settings)),
      debouncer_(debouncer), enabled_flag_(enabled_flag) {}

SignalSubscription::~SignalSubscription() { unregister(); }

std::optional<SubscriptionHandle> SignalSubscription::register_listener() {
  if (handle_) {
    return handle_;
  }

  if (!transport_.is_available()) {
    std::cerr << "[imesync] Notification transport unavailable, "
                 "layout sync disabled\n";
    enabled_flag_.store(false);
    return std::nullopt;
  }

  if (!probe_source()) {
    std::cerr << "[imesync] " << kLegacyBusName
              << " does not respond, layout sync disabled\n";
    enabled_flag_.store(false);
    return std::nullopt;
  }

  if (settings_.prime) {
    prime_debouncer();
  }

  const SignalSpec spec = signal_spec_for(settings_.variant, settings_.eavesdrop);
  auto id = transport_.subscribe(
      spec, [this](const RawSignal &signal) { dispatch(signal); });
  if (!id) {
    std::cerr << "[imesync] Cannot subscribe to " << spec.interface << "."
              << spec.member << ", layout sync disabled\n";
    enabled_flag_.store(false);
    return std::nullopt;
  }

  handle_ = SubscriptionHandle{*id};
  std::cerr << "[imesync] Listening for " << spec.interface << "."
            << spec.member << " (" << to_string(settings_.variant) << ", "
            << to_string(debouncer_.settings().policy) << ")\n";
  return handle_;
}

void SignalSubscription::unregister() {
  if (!handle_) {
    return;
  }

  transport_.unsubscribe(handle_->id);
  handle_.reset();
  debouncer_.reset_state();

  if (settings_.verbose) {
    std::cerr << "[imesync] Unsubscribed\n";
  }
}

void SignalSubscription::dispatch(const RawSignal &signal) {
  if (!handle_) {
    return;
  }

  auto event = decode_notification(signal);
  if (!event) {
    ++discarded_;
    if (settings_.verbose) {
      std::cerr << "[imesync] Discarding malformed " << signal.interface << "."
                << signal.member << "\n";
    }
    return;
  }

  // Выключено через IPC: подписка живёт, раскладку только запоминаем
  if (!enabled_flag_.load()) {
    debouncer_.observe(*event);
    return;
  }

  (void)debouncer_.handle(*event);
}

bool SignalSubscription::probe_source() {
  if (!settings_.probe || settings_.variant != TransportVariant::Legacy) {
    return true;
  }
  return transport_.ping(kLegacyBusName);
}

void SignalSubscription::prime_debouncer() {
  auto current = transport_.query_current_layout(settings_.variant);
  if (!current) {
    if (settings_.verbose) {
      std::cerr << "[imesync] Current layout unknown, starting unprimed\n";
    }
    return;
  }
  debouncer_.prime(std::move(*current));
}

} // namespace imesync
