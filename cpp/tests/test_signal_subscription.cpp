#include "imesync/signal_subscription.hpp"

#include <gio/gio.h>

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace {

[[noreturn]] void test_fail(const char *expr, const char *file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      test_fail(#expr, __FILE__, __LINE__);                                    \
    }                                                                          \
  } while (0)

using imesync::LayoutId;
using imesync::RawSignal;
using imesync::SignalSubscription;
using imesync::SubscriptionSettings;
using imesync::TransportVariant;

/// Транспорт в памяти: запоминает подписки и доставляет сигналы синхронно
class FakeTransport final : public imesync::SignalTransport {
public:
  bool available = true;
  bool ping_ok = true;
  bool refuse_subscribe = false;
  std::optional<LayoutId> current;

  int pings = 0;
  int queries = 0;
  std::vector<imesync::SignalSpec> specs;
  std::map<std::uint64_t, SignalCallback> subscriptions;

  bool is_available() override { return available; }

  bool ping(std::string_view bus_name) override {
    ++pings;
    CHECK(bus_name == imesync::kLegacyBusName);
    return ping_ok;
  }

  std::optional<LayoutId> query_current_layout(TransportVariant) override {
    ++queries;
    return current;
  }

  std::optional<std::uint64_t> subscribe(const imesync::SignalSpec &spec,
                                         SignalCallback callback) override {
    if (refuse_subscribe) {
      return std::nullopt;
    }
    specs.push_back(spec);
    const std::uint64_t id = next_id_++;
    subscriptions.emplace(id, std::move(callback));
    return id;
  }

  void unsubscribe(std::uint64_t id) override { subscriptions.erase(id); }

  void emit(const RawSignal &signal) {
    // Копия: колбэк может отписаться
    auto subs = subscriptions;
    for (auto &[id, cb] : subs) {
      cb(signal);
    }
  }

private:
  std::uint64_t next_id_ = 1;
};

class ScriptedFocus final : public imesync::FocusOracle {
public:
  bool focused = true;
  bool is_host_focused() override { return focused; }
  std::string_view name() const noexcept override { return "scripted"; }
};

class RecordingReset final : public imesync::LayoutResetAction {
public:
  int calls = 0;
  void request_reset(std::uint32_t) override { ++calls; }
};

class RecordingToggle final : public imesync::InputMethodToggle {
public:
  int calls = 0;
  bool toggle() override {
    ++calls;
    return true;
  }
};

struct Fixture {
  FakeTransport transport;
  ScriptedFocus focus;
  RecordingReset reset;
  RecordingToggle toggle;
  imesync::EventDebouncer debouncer;
  std::atomic<bool> enabled{true};
  SignalSubscription subscription;

  explicit Fixture(TransportVariant variant, SubscriptionSettings settings = {})
      : debouncer(make_settings(variant), focus, reset, toggle),
        subscription(transport, with_variant(settings, variant), debouncer,
                     enabled) {}

  static imesync::DebouncerSettings make_settings(TransportVariant variant) {
    imesync::DebouncerSettings s;
    s.variant = variant;
    s.policy = imesync::policy_for(variant);
    return s;
  }

  static SubscriptionSettings with_variant(SubscriptionSettings s,
                                           TransportVariant variant) {
    s.variant = variant;
    return s;
  }
};

/// SettingChanged с mru-sources, с владением
GVariant *mru_changed(const char *first) {
  GVariantBuilder builder;
  g_variant_builder_init(&builder, G_VARIANT_TYPE("a(ss)"));
  g_variant_builder_add(&builder, "(ss)", "xkb", first);
  g_variant_builder_add(&builder, "(ss)", "xkb", "us");
  return g_variant_ref_sink(g_variant_new("(ssv)", imesync::kInputSourcesGroup,
                                          imesync::kMruSourcesSetting,
                                          g_variant_builder_end(&builder)));
}

/// org.gtk.Actions.Changed с новым состоянием "current", с владением
GVariant *current_changed(guint32 index) {
  GVariantBuilder removed;
  g_variant_builder_init(&removed, G_VARIANT_TYPE("as"));
  GVariantBuilder enabled;
  g_variant_builder_init(&enabled, G_VARIANT_TYPE("a{sb}"));
  GVariantBuilder states;
  g_variant_builder_init(&states, G_VARIANT_TYPE("a{sv}"));
  g_variant_builder_add(&states, "{sv}", imesync::kLegacyCurrentAction,
                        g_variant_new_uint32(index));
  GVariantBuilder added;
  g_variant_builder_init(&added, G_VARIANT_TYPE("a{s(bgav)}"));
  return g_variant_ref_sink(g_variant_new("(asa{sb}a{sv}a{s(bgav)})", &removed,
                                          &enabled, &states, &added));
}

RawSignal legacy_signal(GVariant *parameters) {
  RawSignal s;
  s.object_path = imesync::kLegacyObjectPath;
  s.interface = imesync::kLegacyActionsInterface;
  s.member = imesync::kLegacyChanged;
  s.parameters = parameters;
  return s;
}

RawSignal portal_signal(GVariant *parameters) {
  RawSignal s;
  s.object_path = imesync::kPortalObjectPath;
  s.interface = imesync::kPortalSettingsInterface;
  s.member = imesync::kPortalSettingChanged;
  s.parameters = parameters;
  return s;
}

void test_register_is_idempotent() {
  Fixture f{TransportVariant::Portal};

  auto first = f.subscription.register_listener();
  auto second = f.subscription.register_listener();
  CHECK(first.has_value());
  CHECK(second.has_value());
  CHECK(*first == *second);
  CHECK(f.transport.subscriptions.size() == 1);
  CHECK(f.transport.specs.size() == 1);
  CHECK(f.transport.specs[0].member == imesync::kPortalSettingChanged);
  CHECK(f.transport.specs[0].eavesdrop);
  CHECK(f.subscription.is_active());
}

void test_unregister_twice_is_safe() {
  Fixture f{TransportVariant::Portal};

  CHECK(f.subscription.register_listener().has_value());
  f.subscription.unregister();
  f.subscription.unregister();
  CHECK(!f.subscription.is_active());
  CHECK(!f.subscription.handle().has_value());
  CHECK(f.transport.subscriptions.empty());

  // Без подписки unregister тоже no-op
  Fixture g{TransportVariant::Portal};
  g.subscription.unregister();
  CHECK(!g.subscription.is_active());
}

void test_unavailable_transport_disables_feature() {
  Fixture f{TransportVariant::Portal};
  f.transport.available = false;

  CHECK(!f.subscription.register_listener().has_value());
  CHECK(!f.enabled.load());
  CHECK(f.transport.subscriptions.empty());
  CHECK(f.transport.queries == 0);
}

void test_legacy_probe_failure_disables_feature() {
  Fixture f{TransportVariant::Legacy};
  f.transport.ping_ok = false;

  CHECK(!f.subscription.register_listener().has_value());
  CHECK(f.transport.pings == 1);
  CHECK(!f.enabled.load());
  CHECK(f.transport.subscriptions.empty());
}

void test_portal_skips_probe() {
  Fixture f{TransportVariant::Portal};
  f.transport.ping_ok = false;

  CHECK(f.subscription.register_listener().has_value());
  CHECK(f.transport.pings == 0);
  CHECK(f.enabled.load());
}

void test_probe_can_be_disabled() {
  SubscriptionSettings settings;
  settings.probe = false;
  Fixture f{TransportVariant::Legacy, settings};
  f.transport.ping_ok = false;

  CHECK(f.subscription.register_listener().has_value());
  CHECK(f.transport.pings == 0);
}

void test_subscribe_refused_disables_feature() {
  Fixture f{TransportVariant::Portal};
  f.transport.refuse_subscribe = true;

  CHECK(!f.subscription.register_listener().has_value());
  CHECK(!f.enabled.load());
  CHECK(!f.subscription.is_active());
}

void test_priming_seeds_last_observed() {
  Fixture f{TransportVariant::Legacy};
  f.transport.current = LayoutId{1u};

  CHECK(f.subscription.register_listener().has_value());
  CHECK(f.transport.queries == 1);
  CHECK(f.debouncer.state().last_observed == LayoutId{1u});

  SubscriptionSettings settings;
  settings.prime = false;
  Fixture g{TransportVariant::Legacy, settings};
  g.transport.current = LayoutId{1u};
  CHECK(g.subscription.register_listener().has_value());
  CHECK(g.transport.queries == 0);
  CHECK(!g.debouncer.state().last_observed.has_value());
}

void test_dispatch_reaches_debouncer() {
  Fixture f{TransportVariant::Portal};
  CHECK(f.subscription.register_listener().has_value());

  GVariant *ru = mru_changed("ru");
  f.transport.emit(portal_signal(ru));
  CHECK(f.reset.calls == 1);
  CHECK(f.toggle.calls == 1);

  GVariant *us = mru_changed("us");
  f.transport.emit(portal_signal(us));
  CHECK(f.reset.calls == 1);
  CHECK(f.toggle.calls == 2);

  g_variant_unref(ru);
  g_variant_unref(us);
}

void test_malformed_is_discarded() {
  Fixture f{TransportVariant::Portal};
  CHECK(f.subscription.register_listener().has_value());

  GVariant *bad = g_variant_ref_sink(g_variant_new("(s)", "oops"));
  f.transport.emit(portal_signal(bad));
  CHECK(f.subscription.discarded() == 1);
  CHECK(f.toggle.calls == 0);
  g_variant_unref(bad);
}

void test_disabled_flag_suppresses_actions() {
  Fixture f{TransportVariant::Portal};
  CHECK(f.subscription.register_listener().has_value());
  f.enabled.store(false);

  GVariant *ru = mru_changed("ru");
  f.transport.emit(portal_signal(ru));
  CHECK(f.reset.calls == 0);
  CHECK(f.toggle.calls == 0);

  f.enabled.store(true);
  f.transport.emit(portal_signal(ru));
  CHECK(f.toggle.calls == 1);
  g_variant_unref(ru);
}

void test_disabled_flag_keeps_layout_current() {
  Fixture f{TransportVariant::Legacy};
  f.transport.current = LayoutId{0u};
  CHECK(f.subscription.register_listener().has_value());

  // Пока выключено, пользователь переключился на слот 1
  f.enabled.store(false);
  GVariant *to_one = current_changed(1);
  f.transport.emit(legacy_signal(to_one));
  CHECK(f.reset.calls == 0);
  CHECK(f.toggle.calls == 0);
  CHECK(f.debouncer.state().last_observed == LayoutId{1u});
  CHECK(!f.debouncer.state().skip_next);

  // После включения переход обратно на 0 — настоящее переключение
  f.enabled.store(true);
  GVariant *to_zero = current_changed(0);
  f.transport.emit(legacy_signal(to_zero));
  CHECK(f.reset.calls == 1);
  CHECK(f.toggle.calls == 1);

  g_variant_unref(to_one);
  g_variant_unref(to_zero);
}

void test_unregister_resets_state() {
  Fixture f{TransportVariant::Legacy};
  f.transport.current = LayoutId{0u};
  CHECK(f.subscription.register_listener().has_value());
  CHECK(f.debouncer.state().last_observed.has_value());

  f.subscription.unregister();
  CHECK(!f.debouncer.state().last_observed.has_value());

  // Повторная регистрация создаёт новую подписку
  CHECK(f.subscription.register_listener().has_value());
  CHECK(f.transport.subscriptions.size() == 1);
  CHECK(f.transport.specs.size() == 2);
}

void test_destructor_unsubscribes() {
  FakeTransport transport;
  ScriptedFocus focus;
  RecordingReset reset;
  RecordingToggle toggle;
  imesync::EventDebouncer debouncer(Fixture::make_settings(TransportVariant::Portal),
                                    focus, reset, toggle);
  std::atomic<bool> enabled{true};
  {
    SignalSubscription sub(transport, SubscriptionSettings{}, debouncer, enabled);
    CHECK(sub.register_listener().has_value());
    CHECK(transport.subscriptions.size() == 1);
  }
  CHECK(transport.subscriptions.empty());
}

void test_settings_from_config() {
  imesync::Config config;
  config.transport.variant = TransportVariant::Legacy;
  config.transport.eavesdrop = false;
  config.transport.probe = false;
  config.daemon.verbose = true;

  auto s = imesync::make_subscription_settings(config);
  CHECK(s.variant == TransportVariant::Legacy);
  CHECK(!s.eavesdrop);
  CHECK(!s.probe);
  CHECK(s.prime);
  CHECK(s.verbose);
}

} // namespace

int main() {
  test_register_is_idempotent();
  test_unregister_twice_is_safe();
  test_unavailable_transport_disables_feature();
  test_legacy_probe_failure_disables_feature();
  test_portal_skips_probe();
  test_probe_can_be_disabled();
  test_subscribe_refused_disables_feature();
  test_priming_seeds_last_observed();
  test_dispatch_reaches_debouncer();
  test_malformed_is_discarded();
  test_disabled_flag_suppresses_actions();
  test_disabled_flag_keeps_layout_current();
  test_unregister_resets_state();
  test_destructor_unsubscribes();
  test_settings_from_config();

  std::cout << "OK\n";
  return 0;
}
