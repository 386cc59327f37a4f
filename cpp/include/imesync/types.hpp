/**
 * @file types.hpp
 * @brief Базовые типы и константы imesync
 *
 * Идентификаторы раскладок, варианты транспорта уведомлений и коды
 * результатов, общие для всех компонентов.
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace imesync {

// ===========================================================================
// Константы
// ===========================================================================

/// Путь к системному конфигурационному файлу
inline constexpr std::string_view kConfigPath = "/etc/imesync/config.yaml";

/// Путь к пользовательскому конфигу (относительно $HOME)
inline constexpr std::string_view kUserConfigRelPath =
    ".config/imesync/config.yaml";

/// Имя сокета управления (внутри $XDG_RUNTIME_DIR)
inline constexpr std::string_view kIpcSocketName = "imesync.sock";

// ===========================================================================
// Идентификатор раскладки
// ===========================================================================

/// Идентификатор раскладки клавиатуры.
///
/// Старый транспорт сообщает порядковый номер слота (0, 1, ...), новый —
/// короткий языковой тег ("us", "ru"). Сравнивается только на равенство,
/// порядка нет. Номер и тег с одинаковым текстом не равны.
class LayoutId {
public:
  LayoutId() = default;
  explicit LayoutId(std::uint32_t index) : value_(index) {}
  explicit LayoutId(std::string tag) : value_(std::move(tag)) {}

  [[nodiscard]] bool is_index() const noexcept {
    return std::holds_alternative<std::uint32_t>(value_);
  }

  [[nodiscard]] std::string to_string() const {
    if (const auto *index = std::get_if<std::uint32_t>(&value_)) {
      return "#" + std::to_string(*index);
    }
    return std::get<std::string>(value_);
  }

  bool operator==(const LayoutId &) const = default;

private:
  std::variant<std::uint32_t, std::string> value_{std::uint32_t{0}};
};

// ===========================================================================
// Перечисления
// ===========================================================================

/// Вариант транспорта уведомлений о смене источника ввода
enum class TransportVariant {
  Portal, // org.freedesktop.portal.Settings::SettingChanged
  Legacy  // org.gtk.Actions::Changed индикатора клавиатуры
};

/// Политика подавления эха корректирующего сброса раскладки
enum class ReconciliationPolicy {
  EchoFree, // сброс не порождает уведомления (Portal)
  Echoing   // сброс приходит вторым уведомлением (Legacy)
};

/// Механизм сброса системной раскладки
enum class ResetMethod { GSettings, SettingsDaemon, ShellEval };

/// Бэкенд определения фокуса хост-приложения
enum class FocusBackend { Auto, X11, Shell, Off };

/// Результат парсинга конфигурации
enum class ConfigResult { Ok, FileNotFound, ParseError, InvalidValue };

/// Политика, которую диктует транспорт: только Legacy видит собственный сброс
[[nodiscard]] constexpr ReconciliationPolicy
policy_for(TransportVariant variant) noexcept {
  return variant == TransportVariant::Legacy ? ReconciliationPolicy::Echoing
                                             : ReconciliationPolicy::EchoFree;
}

[[nodiscard]] constexpr std::string_view
to_string(TransportVariant variant) noexcept {
  return variant == TransportVariant::Legacy ? "legacy" : "portal";
}

[[nodiscard]] constexpr std::string_view
to_string(ReconciliationPolicy policy) noexcept {
  return policy == ReconciliationPolicy::Echoing ? "echoing" : "echo-free";
}

} // namespace imesync
