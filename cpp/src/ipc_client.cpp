/**
 * @file ipc_client.cpp
 * @brief Реализация IPC клиента
 */

#include "imesync/ipc_client.hpp"
#include "imesync/ipc_server.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

#include <cstring>
#include <utility>

namespace imesync {

namespace {

/// Создаёт подключение к серверу
int connect_to_server(const char *socket_path) {
  int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return -1;
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path, sizeof(addr.sun_path) - 1);

  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) < 0) {
    close(fd);
    return -1;
  }

  return fd;
}

bool is_ok(const std::optional<std::string> &response) {
  return response && response->starts_with("OK");
}

} // namespace

IpcClient::IpcClient(std::string socket_path)
    : socket_path_(socket_path.empty() ? default_ipc_socket_path()
                                       : std::move(socket_path)) {}

std::optional<std::string>
IpcClient::send_command(const std::string &command) const {
  int fd = connect_to_server(socket_path_.c_str());
  if (fd < 0) {
    return std::nullopt;
  }

  // Отправляем команду
  std::string cmd_with_newline = command + "\n";
  ssize_t written = write(fd, cmd_with_newline.c_str(), cmd_with_newline.size());
  if (written != static_cast<ssize_t>(cmd_with_newline.size())) {
    close(fd);
    return std::nullopt;
  }

  // Ждём ответ с таймаутом
  pollfd pfd = {fd, POLLIN, 0};
  int ret = poll(&pfd, 1, kTimeoutMs);

  if (ret <= 0) {
    close(fd);
    return std::nullopt;
  }

  char buffer[256] = {};
  ssize_t bytes_read = read(fd, buffer, sizeof(buffer) - 1);
  close(fd);

  if (bytes_read <= 0) {
    return std::nullopt;
  }

  // Удаляем trailing newline
  std::string response{buffer, static_cast<size_t>(bytes_read)};
  while (!response.empty() &&
         (response.back() == '\n' || response.back() == '\r')) {
    response.pop_back();
  }

  return response;
}

ServiceStatus IpcClient::get_status() const {
  auto response = send_command("GET_STATUS");
  if (!is_ok(response)) {
    return ServiceStatus::Unknown;
  }

  // Ответ: "OK ENABLED" или "OK DISABLED"
  if (*response == "OK ENABLED") {
    return ServiceStatus::Enabled;
  }
  if (*response == "OK DISABLED") {
    return ServiceStatus::Disabled;
  }
  return ServiceStatus::Unknown;
}

bool IpcClient::set_status(bool enabled) const {
  return is_ok(send_command(enabled ? "SET_STATUS 1" : "SET_STATUS 0"));
}

bool IpcClient::focus_in(const std::string &hint) const {
  std::string cmd = "FOCUS_IN";
  if (!hint.empty()) {
    cmd += " ";
    cmd += hint;
  }
  return is_ok(send_command(cmd));
}

bool IpcClient::shutdown() const { return is_ok(send_command("SHUTDOWN")); }

bool IpcClient::is_service_available() const {
  int fd = connect_to_server(socket_path_.c_str());
  if (fd < 0) {
    return false;
  }
  close(fd);
  return true;
}

} // namespace imesync
