/**
 * @file main.cpp
 * @brief Точка входа imesyncctl
 *
 * Управление imesyncd из хуков хост-приложения:
 *   imesyncctl focus-in $WINDOWID   (хук получения фокуса)
 *   imesyncctl shutdown              (хук завершения)
 */

#include "imesync/ipc_client.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace {

void print_usage(const char *argv0) {
  std::cout << "Использование: " << argv0 << " [-s SOCKET] КОМАНДА\n"
            << "\n"
            << "Команды:\n"
            << "  status            Показать статус демона\n"
            << "  enable            Включить синхронизацию\n"
            << "  disable           Выключить синхронизацию\n"
            << "  focus-in [HINT]   Хост получил фокус (HINT: X11 window id)\n"
            << "  shutdown          Остановить демон\n";
}

} // namespace

int main(int argc, char *argv[]) {
  std::string socket_path;
  std::optional<std::string_view> command;
  std::string hint;

  for (int i = 1; i < argc; ++i) {
    std::string_view arg = argv[i];
    if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    }
    if ((arg == "-s" || arg == "--socket") && i + 1 < argc) {
      socket_path = argv[++i];
      continue;
    }
    if (!command) {
      command = arg;
      continue;
    }
    if (*command == "focus-in" && hint.empty()) {
      hint = std::string{arg};
      continue;
    }

    print_usage(argv[0]);
    return 2;
  }

  if (!command) {
    print_usage(argv[0]);
    return 2;
  }

  imesync::IpcClient client{socket_path};

  if (*command == "status") {
    switch (client.get_status()) {
    case imesync::ServiceStatus::Enabled:
      std::cout << "enabled\n";
      return 0;
    case imesync::ServiceStatus::Disabled:
      std::cout << "disabled\n";
      return 0;
    case imesync::ServiceStatus::Unknown:
    default:
      std::cout << "not running\n";
      return 1;
    }
  }

  bool ok = false;
  if (*command == "enable") {
    ok = client.set_status(true);
  } else if (*command == "disable") {
    ok = client.set_status(false);
  } else if (*command == "focus-in") {
    ok = client.focus_in(hint);
  } else if (*command == "shutdown") {
    ok = client.shutdown();
  } else {
    std::cerr << "Неизвестная команда: " << *command << "\n";
    print_usage(argv[0]);
    return 2;
  }

  if (!ok) {
    std::cerr << "imesyncd не отвечает (" << client.socket_path() << ")\n";
    return 1;
  }
  return 0;
}
