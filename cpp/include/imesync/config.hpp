/**
 * @file config.hpp
 * @brief Конфигурация imesync
 *
 * Типобезопасная конфигурация с YAML парсингом.
 * Все значения имеют разумные дефолты.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "imesync/types.hpp"

namespace imesync {

// ===========================================================================
// Структура конфигурации
// ===========================================================================

/// Настройки транспорта уведомлений (D-Bus)
struct TransportConfig {
  TransportVariant variant = TransportVariant::Portal;

  /// Добавлять match rule с eavesdrop='true' (шина может отказать)
  bool eavesdrop = true;

  /// Пинговать сервис индикатора перед подпиской (только Legacy)
  bool probe = true;

  /// Запрашивать текущую раскладку перед подпиской
  bool prime = true;
};

/// Настройки определения фокуса хост-приложения
struct FocusConfig {
  FocusBackend backend = FocusBackend::Auto;

  /// X11 window id хоста (0 = взять из $WINDOWID или из FOCUS_IN)
  std::uint64_t host_window = 0;

  /// Внешний оракул для Wayland: stdout команды — непрозрачный токен
  /// активного окна. Пусто — спрашиваем org.gnome.Shell.Eval напрямую.
  std::string token_command;

  /// Предварительно запомнить окно в фокусе при запуске демона
  /// (до первого FOCUS_IN от хоста)
  bool capture_on_start = false;
};

/// Настройки корректирующего сброса раскладки
struct ResetConfig {
  ResetMethod method = ResetMethod::GSettings;

  /// Слот, в который сбрасывается системная раскладка
  std::uint32_t default_index = 0;

  /// Раскладка, от которой уходим на уровне ОС (echo-free политика)
  std::string avoid_layout{"ru"};
};

/// Настройки хост-приложения
struct HostConfig {
  /// Команда переключения внутреннего метода ввода хоста
  std::string toggle_command{"emacsclient --eval \"(toggle-input-method)\""};

  /// PID хоста; демон завершается, когда процесс исчезает (0 = не следим)
  std::uint32_t pid = 0;
};

/// Настройки подавления эха
struct DebounceConfig {
  /// Через сколько взведённый skipNext считается устаревшим (0 = никогда)
  std::chrono::milliseconds echo_timeout{1500};
};

/// Общие настройки демона
struct DaemonConfig {
  bool enabled = true;
  bool verbose = false;
};

/// Полная конфигурация приложения
struct Config {
  TransportConfig transport;
  FocusConfig focus;
  ResetConfig reset;
  HostConfig host;
  DebounceConfig debounce;
  DaemonConfig daemon;
  std::filesystem::path config_path{std::string{kConfigPath}};
};

// ===========================================================================
// Загрузчик конфигурации
// ===========================================================================

/// Результат загрузки конфигурации из файла.
///
/// В отличие от `load_config()`, это API НЕ делает скрытых фолбэков и
/// позволяет вызывающему коду принять решение (fail-fast / fallback).
struct ConfigLoadOutcome {
  Config config;
  ConfigResult result = ConfigResult::Ok;
  std::filesystem::path used_path;
  std::string error;
};

/**
 * @brief Загружает конфигурацию из конкретного файла
 *
 * @param path Абсолютный или относительный путь к конфигу
 * @return ConfigLoadOutcome с кодом результата и сообщением ошибки
 */
[[nodiscard]] ConfigLoadOutcome load_config_checked(std::filesystem::path path);

/**
 * @brief Загружает конфигурацию из YAML файла (best-effort)
 *
 * @param path Путь к конфигурационному файлу
 * @return Config с загруженными или дефолтными значениями
 *
 * Если запрошен дефолтный путь, сначала пробует
 * ~/.config/imesync/config.yaml. При ошибках возвращает дефолты.
 */
[[nodiscard]] Config load_config(std::string_view path = kConfigPath);

/**
 * @brief Парсит конфигурацию из строки (без валидации)
 */
[[nodiscard]] Config parse_config_text(std::string_view text);

/**
 * @brief Валидирует конфигурацию
 *
 * @param config Конфигурация для проверки
 * @return true если все значения в допустимых пределах
 */
[[nodiscard]] bool validate_config(const Config &config);

[[nodiscard]] std::optional<TransportVariant>
parse_transport_variant(std::string_view value);

[[nodiscard]] std::optional<ResetMethod> parse_reset_method(std::string_view value);

[[nodiscard]] std::optional<FocusBackend>
parse_focus_backend(std::string_view value);

/// Парсит X11 window id: десятичный или 0x-шестнадцатеричный
[[nodiscard]] std::optional<std::uint64_t>
parse_window_id(std::string_view value);

} // namespace imesync
