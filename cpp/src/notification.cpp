/**
 * @file notification.cpp
 * @brief Декодирование GVariant-пейлоадов уведомлений
 */

#include "imesync/notification.hpp"

#include <limits>

namespace imesync {

namespace {

/// Снимает все обёртки "v". Возвращает новую ссылку.
GVariant *unwrap_variants(GVariant *value) {
  GVariant *current = g_variant_ref(value);
  while (g_variant_is_of_type(current, G_VARIANT_TYPE_VARIANT)) {
    GVariant *inner = g_variant_get_variant(current);
    g_variant_unref(current);
    current = inner;
  }
  return current;
}

/// Порядковый номер слота из целочисленного значения любого размера
std::optional<LayoutId> layout_index_from(GVariant *value) {
  GVariant *v = unwrap_variants(value);

  std::optional<std::int64_t> number;
  if (g_variant_is_of_type(v, G_VARIANT_TYPE_UINT32)) {
    number = g_variant_get_uint32(v);
  } else if (g_variant_is_of_type(v, G_VARIANT_TYPE_INT32)) {
    number = g_variant_get_int32(v);
  } else if (g_variant_is_of_type(v, G_VARIANT_TYPE_BYTE)) {
    number = g_variant_get_byte(v);
  } else if (g_variant_is_of_type(v, G_VARIANT_TYPE_UINT16)) {
    number = g_variant_get_uint16(v);
  } else if (g_variant_is_of_type(v, G_VARIANT_TYPE_INT16)) {
    number = g_variant_get_int16(v);
  } else if (g_variant_is_of_type(v, G_VARIANT_TYPE_INT64)) {
    number = g_variant_get_int64(v);
  } else if (g_variant_is_of_type(v, G_VARIANT_TYPE_UINT64)) {
    const guint64 u = g_variant_get_uint64(v);
    if (u <= static_cast<guint64>(std::numeric_limits<std::uint32_t>::max())) {
      number = static_cast<std::int64_t>(u);
    }
  }
  g_variant_unref(v);

  if (!number || *number < 0 ||
      *number > static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())) {
    return std::nullopt;
  }
  return LayoutId{static_cast<std::uint32_t>(*number)};
}

/// Первый элемент "av" из описания действия (bgav) — его состояние
std::optional<LayoutId> action_state_index(GVariant *description) {
  GVariant *states = g_variant_get_child_value(description, 2);
  std::optional<LayoutId> out;
  if (g_variant_n_children(states) > 0) {
    GVariant *first = g_variant_get_child_value(states, 0);
    out = layout_index_from(first);
    g_variant_unref(first);
  }
  g_variant_unref(states);
  return out;
}

} // namespace

SignalSpec signal_spec_for(TransportVariant variant, bool eavesdrop) {
  SignalSpec spec;
  spec.eavesdrop = eavesdrop;
  if (variant == TransportVariant::Legacy) {
    // Индикатор рассылает broadcast, поэтому отправитель — wildcard
    spec.object_path = kLegacyObjectPath;
    spec.interface = kLegacyActionsInterface;
    spec.member = kLegacyChanged;
  } else {
    spec.object_path = kPortalObjectPath;
    spec.interface = kPortalSettingsInterface;
    spec.member = kPortalSettingChanged;
  }
  return spec;
}

std::string match_rule_for(const SignalSpec &spec) {
  std::string rule = "type='signal'";
  if (!spec.sender.empty()) {
    rule += ",sender='" + spec.sender + "'";
  }
  if (!spec.object_path.empty()) {
    rule += ",path='" + spec.object_path + "'";
  }
  if (!spec.interface.empty()) {
    rule += ",interface='" + spec.interface + "'";
  }
  if (!spec.member.empty()) {
    rule += ",member='" + spec.member + "'";
  }
  if (spec.eavesdrop) {
    rule += ",eavesdrop='true'";
  }
  return rule;
}

std::optional<std::vector<InputSource>> decode_mru_sources(GVariant *value) {
  if (!value) {
    return std::nullopt;
  }

  GVariant *list = unwrap_variants(value);
  if (!g_variant_is_of_type(list, G_VARIANT_TYPE("a(ss)"))) {
    g_variant_unref(list);
    return std::nullopt;
  }

  std::vector<InputSource> sources;
  GVariantIter iter;
  g_variant_iter_init(&iter, list);
  const gchar *transport = nullptr;
  const gchar *id = nullptr;
  while (g_variant_iter_next(&iter, "(&s&s)", &transport, &id)) {
    sources.push_back(InputSource{transport, LayoutId{std::string{id}}});
  }

  g_variant_unref(list);
  return sources;
}

std::optional<PortalPayload> decode_portal_setting_changed(GVariant *parameters) {
  if (!parameters || !g_variant_is_of_type(parameters, G_VARIANT_TYPE("(ssv)"))) {
    return std::nullopt;
  }

  const gchar *group = nullptr;
  const gchar *setting = nullptr;
  GVariant *value = nullptr;
  g_variant_get(parameters, "(&s&sv)", &group, &setting, &value);

  PortalPayload out;
  out.group = group;
  out.setting = setting;
  // Значения других настроек имеют произвольный тип — это не ошибка формы
  out.sources = decode_mru_sources(value).value_or(std::vector<InputSource>{});

  g_variant_unref(value);
  return out;
}

std::optional<LegacyPayload> decode_legacy_changed(GVariant *parameters) {
  if (!parameters ||
      !g_variant_is_of_type(parameters,
                            G_VARIANT_TYPE("(asa{sb}a{sv}a{s(bgav)})"))) {
    return std::nullopt;
  }

  LegacyPayload out;

  // Изменения состояния: a{sv}
  GVariant *states = g_variant_get_child_value(parameters, 2);
  GVariantIter iter;
  g_variant_iter_init(&iter, states);
  const gchar *name = nullptr;
  GVariant *state = nullptr;
  while (g_variant_iter_next(&iter, "{&sv}", &name, &state)) {
    if (!out.current && g_strcmp0(name, kLegacyCurrentAction) == 0) {
      out.current = layout_index_from(state);
    }
    g_variant_unref(state);
  }
  g_variant_unref(states);

  if (out.current) {
    return out;
  }

  // Добавленные действия: a{s(bgav)}
  GVariant *added = g_variant_get_child_value(parameters, 3);
  g_variant_iter_init(&iter, added);
  GVariant *description = nullptr;
  while (g_variant_iter_next(&iter, "{&s@(bgav)}", &name, &description)) {
    if (!out.current && g_strcmp0(name, kLegacyCurrentAction) == 0) {
      out.current = action_state_index(description);
    }
    g_variant_unref(description);
  }
  g_variant_unref(added);

  return out;
}

std::optional<NotificationEvent> decode_notification(const RawSignal &signal) {
  NotificationEvent event;
  event.interface.assign(signal.interface);
  event.member.assign(signal.member);

  if (signal.member == kPortalSettingChanged) {
    auto payload = decode_portal_setting_changed(signal.parameters);
    if (!payload) {
      return std::nullopt;
    }
    event.payload = std::move(*payload);
    return event;
  }

  if (signal.member == kLegacyChanged) {
    auto payload = decode_legacy_changed(signal.parameters);
    if (!payload) {
      return std::nullopt;
    }
    event.payload = std::move(*payload);
    return event;
  }

  return std::nullopt;
}

std::optional<LayoutId> decode_portal_read_reply(GVariant *reply) {
  if (!reply || !g_variant_is_of_type(reply, G_VARIANT_TYPE("(v)"))) {
    return std::nullopt;
  }

  GVariant *value = g_variant_get_child_value(reply, 0);
  auto sources = decode_mru_sources(value);
  g_variant_unref(value);

  if (!sources || sources->empty()) {
    return std::nullopt;
  }
  return sources->front().layout;
}

std::optional<LayoutId> decode_legacy_describe_reply(GVariant *reply) {
  if (!reply || !g_variant_is_of_type(reply, G_VARIANT_TYPE("((bgav))"))) {
    return std::nullopt;
  }

  GVariant *description = g_variant_get_child_value(reply, 0);
  auto out = action_state_index(description);
  g_variant_unref(description);
  return out;
}

bool matches_input_sources_signature(const NotificationEvent &event,
                                     TransportVariant variant) {
  if (variant == TransportVariant::Legacy) {
    return event.interface == kLegacyActionsInterface &&
           event.member == kLegacyChanged &&
           std::holds_alternative<LegacyPayload>(event.payload);
  }

  const auto *portal = std::get_if<PortalPayload>(&event.payload);
  return portal != nullptr && event.interface == kPortalSettingsInterface &&
         event.member == kPortalSettingChanged &&
         portal->group == kInputSourcesGroup &&
         portal->setting == kMruSourcesSetting;
}

std::optional<LayoutId> first_layout(const NotificationEvent &event) {
  if (const auto *legacy = std::get_if<LegacyPayload>(&event.payload)) {
    return legacy->current;
  }

  const auto &portal = std::get<PortalPayload>(event.payload);
  if (portal.sources.empty()) {
    return std::nullopt;
  }
  return portal.sources.front().layout;
}

} // namespace imesync
