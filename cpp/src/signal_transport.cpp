/**
 * @file signal_transport.cpp
 * @brief Реализация транспорта уведомлений на GDBus
 */

#include "imesync/signal_transport.hpp"

#include <iostream>
#include <memory>
#include <utility>

namespace imesync {

namespace {

constexpr const char *kBusName = "org.freedesktop.DBus";
constexpr const char *kBusObjectPath = "/org/freedesktop/DBus";
constexpr const char *kBusInterface = "org.freedesktop.DBus";

/// Таймаут синхронных вызовов при старте (мс)
constexpr gint kSyncCallTimeoutMs = 1000;

/// GDestroyNotify: забирает владение колбэком обратно у GDBus
void destroy_callback(gpointer data) {
  std::unique_ptr<SignalTransport::SignalCallback> owned(
      static_cast<SignalTransport::SignalCallback *>(data));
}

/// Синхронный вызов; ошибку логирует с префиксом what. Возвращает ответ или nullptr.
GVariant *call_sync_logged(GDBusConnection *connection, const char *bus_name,
                           const char *object_path, const char *interface,
                           const char *method, GVariant *parameters,
                           const GVariantType *reply_type, const char *what) {
  GError *err = nullptr;
  GVariant *reply = g_dbus_connection_call_sync(
      connection, bus_name, object_path, interface, method, parameters,
      reply_type, G_DBUS_CALL_FLAGS_NONE, kSyncCallTimeoutMs, nullptr, &err);
  if (!reply) {
    std::cerr << "[imesync] " << what << ": "
              << (err && err->message ? err->message : "unknown error") << "\n";
    if (err) {
      g_error_free(err);
    }
  }
  return reply;
}

} // namespace

GDBusSignalTransport::GDBusSignalTransport() = default;

GDBusSignalTransport::~GDBusSignalTransport() {
  if (!connection_) {
    return;
  }

  for (const auto &[id, rule] : eavesdrop_rules_) {
    g_dbus_connection_signal_unsubscribe(connection_, static_cast<guint>(id));
    (void)call_bus_match("RemoveMatch", rule);
  }
  eavesdrop_rules_.clear();

  g_object_unref(connection_);
  connection_ = nullptr;
}

bool GDBusSignalTransport::connect() {
  if (connection_) {
    return true;
  }

  const gchar *address = g_getenv("DBUS_SESSION_BUS_ADDRESS");
  if (!address || *address == '\0') {
    std::cerr << "[imesync] DBUS_SESSION_BUS_ADDRESS is not set, "
                 "layout sync disabled\n";
    return false;
  }

  GError *err = nullptr;
  connection_ = g_bus_get_sync(G_BUS_TYPE_SESSION, nullptr, &err);
  if (!connection_) {
    std::cerr << "[imesync] Cannot connect to session bus: "
              << (err && err->message ? err->message : "unknown error")
              << ", layout sync disabled\n";
    if (err) {
      g_error_free(err);
    }
    return false;
  }

  // Выход демона решаем сами, а не по закрытию шины
  g_dbus_connection_set_exit_on_close(connection_, FALSE);
  return true;
}

bool GDBusSignalTransport::is_available() {
  return connection_ != nullptr && !g_dbus_connection_is_closed(connection_);
}

bool GDBusSignalTransport::ping(std::string_view bus_name) {
  if (!is_available()) {
    return false;
  }

  const std::string name{bus_name};
  GError *err = nullptr;
  GVariant *reply = g_dbus_connection_call_sync(
      connection_, name.c_str(), "/", "org.freedesktop.DBus.Peer", "Ping",
      nullptr, nullptr, G_DBUS_CALL_FLAGS_NONE, kSyncCallTimeoutMs, nullptr,
      &err);
  if (!reply) {
    if (err) {
      g_error_free(err);
    }
    return false;
  }

  g_variant_unref(reply);
  return true;
}

std::optional<LayoutId>
GDBusSignalTransport::query_current_layout(TransportVariant variant) {
  if (!is_available()) {
    return std::nullopt;
  }

  std::optional<LayoutId> out;
  if (variant == TransportVariant::Legacy) {
    GVariant *reply = call_sync_logged(
        connection_, kLegacyBusName, kLegacyObjectPath, kLegacyActionsInterface,
        "Describe", g_variant_new("(s)", kLegacyCurrentAction),
        G_VARIANT_TYPE("((bgav))"), "Cannot query current layout");
    if (reply) {
      out = decode_legacy_describe_reply(reply);
      g_variant_unref(reply);
    }
    return out;
  }

  GVariant *reply = call_sync_logged(
      connection_, kPortalBusName, kPortalObjectPath, kPortalSettingsInterface,
      "Read", g_variant_new("(ss)", kInputSourcesGroup, kMruSourcesSetting),
      G_VARIANT_TYPE("(v)"), "Cannot query current layout");
  if (reply) {
    out = decode_portal_read_reply(reply);
    g_variant_unref(reply);
  }
  return out;
}

std::optional<std::uint64_t>
GDBusSignalTransport::subscribe(const SignalSpec &spec, SignalCallback callback) {
  if (!is_available()) {
    return std::nullopt;
  }

  // Владение колбэком переходит к GDBus до destroy_callback
  auto data = std::make_unique<SignalCallback>(std::move(callback));
  const guint id = g_dbus_connection_signal_subscribe(
      connection_, spec.sender.empty() ? nullptr : spec.sender.c_str(),
      spec.interface.c_str(), spec.member.c_str(),
      spec.object_path.empty() ? nullptr : spec.object_path.c_str(), nullptr,
      G_DBUS_SIGNAL_FLAGS_NONE, &GDBusSignalTransport::on_signal,
      data.release(), destroy_callback);
  if (id == 0) {
    // GDBus уже освободил data через destroy_callback
    std::cerr << "[imesync] Signal subscription refused\n";
    return std::nullopt;
  }

  std::string rule;
  if (spec.eavesdrop) {
    // dbus-broker eavesdrop не поддерживает: продолжаем на обычной подписке
    rule = match_rule_for(spec);
    if (!call_bus_match("AddMatch", rule)) {
      std::cerr << "[imesync] Eavesdrop match rule refused, using broadcast "
                   "subscription only\n";
      rule.clear();
    }
  }
  eavesdrop_rules_.emplace(id, std::move(rule));

  return static_cast<std::uint64_t>(id);
}

void GDBusSignalTransport::unsubscribe(std::uint64_t id) {
  auto it = eavesdrop_rules_.find(id);
  if (it == eavesdrop_rules_.end() || !connection_) {
    return;
  }

  g_dbus_connection_signal_unsubscribe(connection_, static_cast<guint>(id));
  if (!it->second.empty()) {
    (void)call_bus_match("RemoveMatch", it->second);
  }
  eavesdrop_rules_.erase(it);
}

bool GDBusSignalTransport::call_bus_match(const char *method,
                                          const std::string &rule) {
  if (rule.empty() || !is_available()) {
    return false;
  }

  GError *err = nullptr;
  GVariant *reply = g_dbus_connection_call_sync(
      connection_, kBusName, kBusObjectPath, kBusInterface, method,
      g_variant_new("(s)", rule.c_str()), nullptr, G_DBUS_CALL_FLAGS_NONE,
      kSyncCallTimeoutMs, nullptr, &err);
  if (!reply) {
    if (err) {
      g_error_free(err);
    }
    return false;
  }

  g_variant_unref(reply);
  return true;
}

void GDBusSignalTransport::on_signal(GDBusConnection * /*connection*/,
                                     const gchar *sender,
                                     const gchar *object_path,
                                     const gchar *interface,
                                     const gchar *member, GVariant *parameters,
                                     gpointer user_data) {
  auto *callback = static_cast<SignalCallback *>(user_data);
  if (!callback || !*callback) {
    return;
  }

  RawSignal signal;
  signal.sender = sender ? sender : "";
  signal.object_path = object_path ? object_path : "";
  signal.interface = interface ? interface : "";
  signal.member = member ? member : "";
  signal.parameters = parameters;
  (*callback)(signal);
}

} // namespace imesync
