/**
 * @file main.cpp
 * @brief Точка входа imesyncd
 *
 * Демон синхронизации раскладки ОС с методом ввода хост-приложения.
 * Запускается хостом на время сессии:
 *   imesyncd -p <host pid>
 */

#include "imesync/config.hpp"
#include "imesync/daemon.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

void print_version() {
  std::cout << "imesyncd 1.0.0 (C++20)\n"
            << "Синхронизация раскладки ОС с методом ввода приложения\n";
}

void print_usage(const char *argv0) {
  std::cout << "Использование: " << argv0 << " [опции]\n"
            << "\n"
            << "Опции:\n"
            << "  -c, --config PATH  Файл конфигурации\n"
            << "  -p, --pid PID      Завершиться вместе с процессом PID\n"
            << "  -d, --debug        Логировать каждое уведомление\n"
            << "  -h, --help         Показать эту справку\n"
            << "  -v, --version      Показать версию\n"
            << "\n"
            << "Конфигурация: ~/.config/imesync/config.yaml, "
            << imesync::kConfigPath << "\n";
}

std::optional<std::uint32_t> parse_pid(std::string_view value) {
  std::uint32_t pid = 0;
  auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), pid);
  if (ec != std::errc{} || ptr != value.data() + value.size() || pid == 0) {
    return std::nullopt;
  }
  return pid;
}

} // namespace

int main(int argc, char *argv[]) {
  std::string config_path;
  std::optional<std::uint32_t> host_pid;
  bool debug = false;

  // Обработка аргументов командной строки
  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if (arg == "-v" || arg == "--version") {
      print_version();
      return 0;
    }
    if (arg == "-d" || arg == "--debug") {
      debug = true;
      continue;
    }
    if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
      config_path = argv[++i];
      continue;
    }
    if ((arg == "-p" || arg == "--pid") && i + 1 < argc) {
      host_pid = parse_pid(argv[++i]);
      if (!host_pid) {
        std::cerr << "[imesync] Invalid pid: " << argv[i] << "\n";
        return 2;
      }
      continue;
    }

    std::cerr << "[imesync] Unknown option: " << arg << "\n";
    print_usage(argv[0]);
    return 2;
  }

  // Загрузка конфигурации: явно указанный файл обязан быть корректным
  imesync::Config config;
  if (!config_path.empty()) {
    auto outcome = imesync::load_config_checked(config_path);
    if (outcome.result != imesync::ConfigResult::Ok) {
      std::cerr << "[imesync] Cannot load config " << config_path << ": "
                << outcome.error << "\n";
      return 1;
    }
    config = std::move(outcome.config);
  } else {
    config = imesync::load_config();
  }

  if (host_pid) {
    config.host.pid = *host_pid;
  }
  if (debug) {
    config.daemon.verbose = true;
  }

  imesync::Daemon daemon{std::move(config)};
  return daemon.run();
}
