/**
 * @file config.cpp
 * @brief Реализация загрузчика конфигурации
 */

#include "imesync/config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <string>

namespace imesync {

namespace {

/// Удаляет пробелы с начала и конца строки
std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) {
    sv.remove_prefix(1);
  }
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) {
    sv.remove_suffix(1);
  }
  return sv;
}

/// Снимает парные кавычки вокруг значения ("ru" -> ru)
std::string_view unquote(std::string_view sv) {
  if (sv.size() >= 2 && (sv.front() == '"' || sv.front() == '\'') &&
      sv.back() == sv.front()) {
    sv.remove_prefix(1);
    sv.remove_suffix(1);
  }
  return sv;
}

/// Парсит целое число из строки
std::optional<long long> parse_int(std::string_view sv) {
  sv = trim(sv);
  long long value = 0;
  auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
  if (ec == std::errc{} && ptr == sv.data() + sv.size()) {
    return value;
  }
  return std::nullopt;
}

/// Целое, влезающее в std::uint32_t без обрезки
std::optional<std::uint32_t> parse_u32(std::string_view sv) {
  auto v = parse_int(sv);
  if (!v || *v < 0 ||
      *v > static_cast<long long>(std::numeric_limits<std::uint32_t>::max())) {
    return std::nullopt;
  }
  return static_cast<std::uint32_t>(*v);
}

/// Парсит булево значение из строки
std::optional<bool> parse_bool(std::string_view sv) {
  sv = trim(sv);
  if (sv == "true" || sv == "yes" || sv == "1" || sv == "on") {
    return true;
  }
  if (sv == "false" || sv == "no" || sv == "0" || sv == "off") {
    return false;
  }
  return std::nullopt;
}

/// Получает путь к user config (~/.config/imesync/config.yaml)
std::string get_user_config_path() {
  const char *home = std::getenv("HOME");
  if (home) {
    return std::string(home) + "/" + std::string(kUserConfigRelPath);
  }
  return "";
}

void apply_transport_key(Config &config, std::string_view key,
                         std::string_view value) {
  if (key == "variant") {
    if (auto v = parse_transport_variant(value)) {
      config.transport.variant = *v;
    }
  } else if (key == "eavesdrop") {
    if (auto v = parse_bool(value)) {
      config.transport.eavesdrop = *v;
    }
  } else if (key == "probe") {
    if (auto v = parse_bool(value)) {
      config.transport.probe = *v;
    }
  } else if (key == "prime") {
    if (auto v = parse_bool(value)) {
      config.transport.prime = *v;
    }
  }
}

void apply_focus_key(Config &config, std::string_view key,
                     std::string_view value) {
  if (key == "backend") {
    if (auto v = parse_focus_backend(value)) {
      config.focus.backend = *v;
    }
  } else if (key == "host_window") {
    if (auto v = parse_window_id(value)) {
      config.focus.host_window = *v;
    }
  } else if (key == "token_command") {
    config.focus.token_command.assign(value);
  } else if (key == "capture_on_start") {
    if (auto v = parse_bool(value)) {
      config.focus.capture_on_start = *v;
    }
  }
}

void apply_reset_key(Config &config, std::string_view key,
                     std::string_view value) {
  if (key == "method") {
    if (auto v = parse_reset_method(value)) {
      config.reset.method = *v;
    }
  } else if (key == "default_index") {
    // Число вне диапазона оставляем валидатору как "не влезает в слот"
    if (parse_int(value)) {
      config.reset.default_index =
          parse_u32(value).value_or(std::numeric_limits<std::uint32_t>::max());
    }
  } else if (key == "avoid_layout") {
    config.reset.avoid_layout.assign(value);
  }
}

void apply_host_key(Config &config, std::string_view key,
                    std::string_view value) {
  if (key == "toggle_command") {
    config.host.toggle_command.assign(value);
  } else if (key == "pid") {
    if (auto v = parse_u32(value)) {
      config.host.pid = *v;
    } else {
      std::cerr << "[imesync] host.pid out of range, ignored: " << value
                << "\n";
    }
  }
}

Config parse_config_stream(std::istream &file) {
  Config config;

  std::string line;
  std::string current_section;

  while (std::getline(file, line)) {
    std::string_view sv = trim(line);

    // Пропуск пустых строк и комментариев
    if (sv.empty() || sv.front() == '#') {
      continue;
    }

    // Определение секции: "name:" без значения в начале строки
    if (!line.empty() && !std::isspace(static_cast<unsigned char>(line[0])) &&
        sv.back() == ':') {
      current_section.assign(sv.substr(0, sv.size() - 1));
      continue;
    }

    // Парсинг key: value
    auto colon_pos = sv.find(':');
    if (colon_pos == std::string_view::npos) {
      continue;
    }

    std::string_view key = trim(sv.substr(0, colon_pos));
    std::string_view value = unquote(trim(sv.substr(colon_pos + 1)));

    if (current_section == "transport") {
      apply_transport_key(config, key, value);
    } else if (current_section == "focus") {
      apply_focus_key(config, key, value);
    } else if (current_section == "reset") {
      apply_reset_key(config, key, value);
    } else if (current_section == "host") {
      apply_host_key(config, key, value);
    } else if (current_section == "debounce") {
      if (key == "echo_timeout_ms") {
        if (auto v = parse_int(value)) {
          config.debounce.echo_timeout = std::chrono::milliseconds{*v};
        }
      }
    } else if (current_section == "daemon") {
      if (key == "enabled") {
        if (auto v = parse_bool(value)) {
          config.daemon.enabled = *v;
        }
      } else if (key == "verbose") {
        if (auto v = parse_bool(value)) {
          config.daemon.verbose = *v;
        }
      }
    }
  }

  return config;
}

} // namespace

std::optional<TransportVariant> parse_transport_variant(std::string_view value) {
  value = trim(value);
  if (value == "portal") {
    return TransportVariant::Portal;
  }
  if (value == "legacy") {
    return TransportVariant::Legacy;
  }
  return std::nullopt;
}

std::optional<ResetMethod> parse_reset_method(std::string_view value) {
  value = trim(value);
  if (value == "gsettings") {
    return ResetMethod::GSettings;
  }
  if (value == "settings_daemon") {
    return ResetMethod::SettingsDaemon;
  }
  if (value == "shell_eval") {
    return ResetMethod::ShellEval;
  }
  return std::nullopt;
}

std::optional<FocusBackend> parse_focus_backend(std::string_view value) {
  value = trim(value);
  if (value == "auto") {
    return FocusBackend::Auto;
  }
  if (value == "x11") {
    return FocusBackend::X11;
  }
  if (value == "shell") {
    return FocusBackend::Shell;
  }
  if (value == "none") {
    return FocusBackend::Off;
  }
  return std::nullopt;
}

std::optional<std::uint64_t> parse_window_id(std::string_view value) {
  value = trim(value);
  int base = 10;
  if (value.size() > 2 && value[0] == '0' && (value[1] == 'x' || value[1] == 'X')) {
    value.remove_prefix(2);
    base = 16;
  }
  if (value.empty()) {
    return std::nullopt;
  }

  std::uint64_t id = 0;
  auto [ptr, ec] =
      std::from_chars(value.data(), value.data() + value.size(), id, base);
  if (ec == std::errc{} && ptr == value.data() + value.size()) {
    return id;
  }
  return std::nullopt;
}

bool validate_config(const Config &config) {
  if (config.reset.avoid_layout.empty()) {
    return false;
  }

  if (config.host.toggle_command.empty()) {
    return false;
  }

  if (config.debounce.echo_timeout.count() < 0) {
    return false;
  }

  // Больше 16 источников ввода GNOME не держит
  if (config.reset.default_index > 15) {
    return false;
  }

  return true;
}

Config parse_config_text(std::string_view text) {
  std::istringstream stream{std::string{text}};
  return parse_config_stream(stream);
}

ConfigLoadOutcome load_config_checked(std::filesystem::path path) {
  ConfigLoadOutcome out;
  out.used_path = std::move(path);

  if (out.used_path.empty()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Empty config path";
    return out;
  }

  std::ifstream file{out.used_path};
  if (!file.is_open()) {
    out.result = ConfigResult::FileNotFound;
    out.error = "Config file not found: " + out.used_path.string();
    return out;
  }

  out.config = parse_config_stream(file);
  out.config.config_path = out.used_path;

  if (!validate_config(out.config)) {
    out.result = ConfigResult::InvalidValue;
    out.error = "Invalid configuration in: " + out.used_path.string();
    out.config = Config{};
    return out;
  }

  out.result = ConfigResult::Ok;
  return out;
}

Config load_config(std::string_view path) {
  // Best-effort логика: если запрошен дефолтный путь, пробуем user-config
  // первым.
  std::filesystem::path effective_path{std::string{path}};

  if (path == kConfigPath) {
    std::string user_path = get_user_config_path();
    if (!user_path.empty()) {
      std::error_code ec;
      bool exists = std::filesystem::exists(user_path, ec);
      if (!ec && exists) {
        effective_path = user_path;
        std::cerr << "[imesync] Using user config: " << user_path << "\n";
      }
    }
  }

  ConfigLoadOutcome out = load_config_checked(effective_path);
  if (out.result != ConfigResult::Ok) {
    // Файл не найден/битый — используем дефолты.
    if (!out.error.empty()) {
      std::cerr << "[imesync] Warning: " << out.error << "\n";
    }
    return Config{};
  }

  return out.config;
}

} // namespace imesync
