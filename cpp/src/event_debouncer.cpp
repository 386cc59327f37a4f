/**
 * @file event_debouncer.cpp
 * @brief Реализация конечного автомата подавления событий
 */

#include "imesync/event_debouncer.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace imesync {

std::string_view to_string(DebounceOutcome outcome) noexcept {
  switch (outcome) {
  case DebounceOutcome::Unfocused:
    return "unfocused";
  case DebounceOutcome::SignatureMismatch:
    return "signature-mismatch";
  case DebounceOutcome::NoLayout:
    return "no-layout";
  case DebounceOutcome::SkipConsumed:
    return "skip-consumed";
  case DebounceOutcome::Duplicate:
    return "duplicate";
  case DebounceOutcome::Toggled:
    return "toggled";
  case DebounceOutcome::ResetAndToggled:
    return "reset+toggled";
  }
  return "unknown";
}

DebouncerSettings make_debouncer_settings(const Config &config) {
  DebouncerSettings settings;
  settings.variant = config.transport.variant;
  settings.policy = policy_for(config.transport.variant);
  settings.avoid_layout = LayoutId{config.reset.avoid_layout};
  settings.default_index = config.reset.default_index;
  settings.echo_timeout = config.debounce.echo_timeout;
  settings.verbose = config.daemon.verbose;
  return settings;
}

EventDebouncer::EventDebouncer(DebouncerSettings settings, FocusOracle &focus,
                               LayoutResetAction &reset,
                               InputMethodToggle &toggle, Clock clock)
    : settings_(std::move(settings)), focus_(focus), reset_(reset),
      toggle_(toggle), clock_(std::move(clock)) {}

DebounceOutcome EventDebouncer::handle(const NotificationEvent &event) {
  // 1. Уведомления для чужого окна — не наши
  if (!focus_.is_host_focused()) {
    if (settings_.verbose) {
      std::cerr << "[imesync] " << event.member << ": host not focused\n";
    }
    return DebounceOutcome::Unfocused;
  }

  // 2. Сигнатура "источники ввода изменились"
  if (!matches_input_sources_signature(event, settings_.variant)) {
    return DebounceOutcome::SignatureMismatch;
  }

  if (settings_.policy == ReconciliationPolicy::Echoing) {
    expire_stale_skip();
  }

  // 3. Раскладка из пейлоада (некоторые транспорты шлют пустые дубли)
  std::optional<LayoutId> layout = first_layout(event);
  if (!layout) {
    if (settings_.policy == ReconciliationPolicy::Echoing && state_.skip_next) {
      state_.skip_next = false;
      return DebounceOutcome::SkipConsumed;
    }
    return DebounceOutcome::NoLayout;
  }

  // 4-5. Политика подавления
  DebounceOutcome outcome = settings_.policy == ReconciliationPolicy::EchoFree
                                ? handle_echo_free(*layout)
                                : handle_echoing(*layout);

  if (settings_.verbose) {
    std::cerr << "[imesync] layout " << layout->to_string() << " -> "
              << to_string(outcome) << "\n";
  }
  return outcome;
}

DebounceOutcome EventDebouncer::handle_echo_free(const LayoutId &layout) {
  const bool avoid = layout == settings_.avoid_layout;
  if (avoid) {
    invoke_reset();
  }
  invoke_toggle();

  state_.last_observed = layout;
  return avoid ? DebounceOutcome::ResetAndToggled : DebounceOutcome::Toggled;
}

DebounceOutcome EventDebouncer::handle_echoing(const LayoutId &layout) {
  const bool duplicate = state_.last_observed && *state_.last_observed == layout;

  if (state_.skip_next || duplicate) {
    const bool was_skip = state_.skip_next;
    state_.skip_next = false;
    state_.last_observed = layout;
    return was_skip ? DebounceOutcome::SkipConsumed : DebounceOutcome::Duplicate;
  }

  invoke_reset();
  state_.skip_next = true;
  state_.skip_armed_at = clock_();
  invoke_toggle();

  state_.last_observed = layout;
  return DebounceOutcome::ResetAndToggled;
}

void EventDebouncer::expire_stale_skip() {
  if (!state_.skip_next || settings_.echo_timeout.count() <= 0) {
    return;
  }

  if (clock_() - state_.skip_armed_at > settings_.echo_timeout) {
    // Эхо так и не пришло: не глотаем следующее настоящее переключение
    state_.skip_next = false;
    if (settings_.verbose) {
      std::cerr << "[imesync] Pending echo expired\n";
    }
  }
}

void EventDebouncer::observe(const NotificationEvent &event) {
  if (!matches_input_sources_signature(event, settings_.variant)) {
    return;
  }
  std::optional<LayoutId> layout = first_layout(event);
  if (!layout) {
    return;
  }
  // Сброса не было, ждать эха не от чего
  state_.skip_next = false;
  state_.last_observed = std::move(*layout);
}

void EventDebouncer::prime(LayoutId current) {
  if (settings_.verbose) {
    std::cerr << "[imesync] Initial layout: " << current.to_string() << "\n";
  }
  state_.last_observed = std::move(current);
}

void EventDebouncer::reset_state() noexcept { state_ = SuppressionState{}; }

void EventDebouncer::invoke_reset() noexcept {
  try {
    reset_.request_reset(settings_.default_index);
  } catch (const std::exception &e) {
    std::cerr << "[imesync] Layout reset failed: " << e.what() << "\n";
  }
}

void EventDebouncer::invoke_toggle() noexcept {
  try {
    if (!toggle_.toggle()) {
      std::cerr << "[imesync] Host did not confirm input method toggle\n";
    }
  } catch (const std::exception &e) {
    std::cerr << "[imesync] Input method toggle failed: " << e.what() << "\n";
  }
}

} // namespace imesync
