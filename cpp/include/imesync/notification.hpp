/**
 * @file notification.hpp
 * @brief Уведомления о смене источника ввода и их декодирование
 *
 * Слабо типизированный GVariant-пейлоад разбирается здесь, на границе
 * транспорта, в небольшой tagged variant. Дальше по конвейеру ходят только
 * строго типизированные LayoutId.
 */

#pragma once

#include <gio/gio.h>

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "imesync/types.hpp"

namespace imesync {

// ===========================================================================
// Сигнатуры сигналов
// ===========================================================================

/// Portal: org.freedesktop.portal.Settings::SettingChanged (s group, s key, v value)
inline constexpr const char *kPortalBusName = "org.freedesktop.portal.Desktop";
inline constexpr const char *kPortalObjectPath = "/org/freedesktop/portal/desktop";
inline constexpr const char *kPortalSettingsInterface =
    "org.freedesktop.portal.Settings";
inline constexpr const char *kPortalSettingChanged = "SettingChanged";
inline constexpr const char *kInputSourcesGroup = "org.gnome.desktop.input-sources";
inline constexpr const char *kMruSourcesSetting = "mru-sources";

/// Legacy: индикатор клавиатуры, org.gtk.Actions::Changed
inline constexpr const char *kLegacyBusName = "com.canonical.indicator.keyboard";
inline constexpr const char *kLegacyObjectPath = "/com/canonical/indicator/keyboard";
inline constexpr const char *kLegacyActionsInterface = "org.gtk.Actions";
inline constexpr const char *kLegacyChanged = "Changed";
inline constexpr const char *kLegacyCurrentAction = "current";

/// Параметры подписки на сигнал. Пустой sender = любой отправитель.
struct SignalSpec {
  std::string sender;
  std::string object_path;
  std::string interface;
  std::string member;
  bool eavesdrop = false;
};

/// Подписка на сигнал смены источника ввода для варианта транспорта
[[nodiscard]] SignalSpec signal_spec_for(TransportVariant variant,
                                         bool eavesdrop);

/// Match rule для AddMatch/RemoveMatch (с eavesdrop='true', если запрошено)
[[nodiscard]] std::string match_rule_for(const SignalSpec &spec);

// ===========================================================================
// Модель уведомления
// ===========================================================================

/// Сигнал в том виде, в каком его отдал транспорт. parameters не владеющий.
struct RawSignal {
  std::string_view sender;
  std::string_view object_path;
  std::string_view interface;
  std::string_view member;
  GVariant *parameters = nullptr;
};

/// Пара (транспорт, раскладка) из mru-sources, например ("xkb", "ru")
struct InputSource {
  std::string transport;
  LayoutId layout;

  bool operator==(const InputSource &) const = default;
};

/// org.gtk.Actions::Changed: текущий слот, если он менялся
struct LegacyPayload {
  std::optional<LayoutId> current;
};

/// SettingChanged: источники в порядке MRU (первый — самый свежий)
struct PortalPayload {
  std::string group;
  std::string setting;
  std::vector<InputSource> sources;
};

struct NotificationEvent {
  std::string interface;
  std::string member;
  std::variant<LegacyPayload, PortalPayload> payload;
};

// ===========================================================================
// Декодирование
// ===========================================================================

/// Разбирает сигнал. std::nullopt — пейлоад не той формы (MalformedNotification).
[[nodiscard]] std::optional<NotificationEvent>
decode_notification(const RawSignal &signal);

/// (ssv) SettingChanged
[[nodiscard]] std::optional<PortalPayload>
decode_portal_setting_changed(GVariant *parameters);

/// (asa{sb}a{sv}a{s(bgav)}) org.gtk.Actions::Changed
[[nodiscard]] std::optional<LegacyPayload>
decode_legacy_changed(GVariant *parameters);

/// a(ss) за любым количеством вложенных v. std::nullopt, если тип другой.
[[nodiscard]] std::optional<std::vector<InputSource>>
decode_mru_sources(GVariant *value);

/// Ответ org.freedesktop.portal.Settings.Read: (v)
[[nodiscard]] std::optional<LayoutId> decode_portal_read_reply(GVariant *reply);

/// Ответ org.gtk.Actions.Describe("current"): ((bgav))
[[nodiscard]] std::optional<LayoutId> decode_legacy_describe_reply(GVariant *reply);

/// Подходит ли уведомление под сигнатуру "источники ввода изменились"
[[nodiscard]] bool matches_input_sources_signature(const NotificationEvent &event,
                                                   TransportVariant variant);

/// Самая свежая раскладка из уведомления (первая пара / слот current)
[[nodiscard]] std::optional<LayoutId> first_layout(const NotificationEvent &event);

} // namespace imesync
