/**
 * @file ipc_server.cpp
 * @brief Реализация IPC сервера на Unix Domain Socket
 */

#include "imesync/ipc_server.hpp"
#include "imesync/types.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <string>
#include <string_view>

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

/// Аргумент после имени команды (или пустая строка)
std::string_view command_argument(std::string_view cmd) {
  auto space_pos = cmd.find(' ');
  if (space_pos == std::string_view::npos) {
    return {};
  }
  return trim(cmd.substr(space_pos + 1));
}

/// Есть ли на пути слушающий сокет
bool is_socket_active(const std::string &socket_path) {
  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  if (fd < 0) {
    // Не можем проверить — считаем живым, чтобы не удалить чужой сокет
    return true;
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path.c_str(), sizeof(addr.sun_path) - 1);

  bool active = false;
  if (connect(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0) {
    active = true;
  } else {
    // ECONNREFUSED/ENOENT — стейл-файл без слушателя
    active = !(errno == ECONNREFUSED || errno == ENOENT);
  }

  close(fd);
  return active;
}

} // namespace

std::string default_ipc_socket_path() {
  const char *runtime_dir = std::getenv("XDG_RUNTIME_DIR");
  if (runtime_dir && *runtime_dir) {
    return std::string(runtime_dir) + "/" + std::string(kIpcSocketName);
  }
  return "/tmp/imesync-" + std::to_string(::getuid()) + ".sock";
}

IpcCommand parse_ipc_command(std::string_view cmd) {
  cmd = trim(cmd);
  std::string_view name = cmd.substr(0, cmd.find(' '));

  if (name == "GET_STATUS") {
    return IpcCommand::GetStatus;
  }
  if (name == "SET_STATUS") {
    return IpcCommand::SetStatus;
  }
  if (name == "FOCUS_IN") {
    return IpcCommand::FocusIn;
  }
  if (name == "SHUTDOWN") {
    return IpcCommand::Shutdown;
  }

  return IpcCommand::Unknown;
}

IpcServer::IpcServer(std::atomic<bool> &enabled_flag,
                     FocusInCallback on_focus_in, ShutdownCallback on_shutdown,
                     std::string socket_path)
    : enabled_flag_(enabled_flag), on_focus_in_(std::move(on_focus_in)),
      on_shutdown_(std::move(on_shutdown)),
      socket_path_(socket_path.empty() ? default_ipc_socket_path()
                                       : std::move(socket_path)) {}

IpcServer::~IpcServer() { stop(); }

bool IpcServer::start() {
  if (running_.load()) {
    return true;
  }

  server_fd_ = create_socket();
  if (server_fd_ < 0) {
    return false;
  }

  running_.store(true);
  server_thread_ =
      std::jthread([this](std::stop_token st) { server_loop(std::move(st)); });

  std::cerr << "[imesync-ipc] Server started on " << socket_path_ << "\n";
  return true;
}

void IpcServer::stop() {
  if (!running_.load()) {
    return;
  }

  running_.store(false);

  // Сначала дожидаемся потока: poll() просыпается по таймауту
  if (server_thread_.joinable()) {
    server_thread_.request_stop();
    server_thread_.join();
  }

  if (server_fd_ >= 0) {
    shutdown(server_fd_, SHUT_RDWR);
    close(server_fd_);
    server_fd_ = -1;
  }

  if (owns_socket_file_) {
    unlink(socket_path_.c_str());
    owns_socket_file_ = false;
  }

  std::cerr << "[imesync-ipc] Server stopped\n";
}

bool IpcServer::is_running() const noexcept { return running_.load(); }

int IpcServer::create_socket() {
  if (socket_path_.size() >= sizeof(sockaddr_un{}.sun_path)) {
    std::cerr << "[imesync-ipc] Socket path too long: " << socket_path_ << "\n";
    return -1;
  }

  // Один демон на сессию: живой сокет не трогаем, стейл-файл заменяем
  struct stat st {};
  if (lstat(socket_path_.c_str(), &st) == 0) {
    if (is_socket_active(socket_path_)) {
      std::cerr << "[imesync-ipc] Another daemon is listening on "
                << socket_path_ << "\n";
      return -1;
    }
    std::cerr << "[imesync-ipc] Stale socket detected, replacing: "
              << socket_path_ << "\n";
    (void)unlink(socket_path_.c_str());
  }

  int fd = socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    std::cerr << "[imesync-ipc] Failed to create socket: " << strerror(errno)
              << "\n";
    return -1;
  }

  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

  // Сокет доступен только владельцу сессии (0600)
  const mode_t old_mask = umask(0177);
  const int bind_rc =
      bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  const int bind_errno = errno;
  umask(old_mask);

  if (bind_rc < 0) {
    std::cerr << "[imesync-ipc] Failed to bind socket (" << socket_path_
              << "): " << strerror(bind_errno) << "\n";
    close(fd);
    return -1;
  }
  owns_socket_file_ = true;

  if (chmod(socket_path_.c_str(), 0600) < 0) {
    std::cerr << "[imesync-ipc] Warning: failed to chmod socket ("
              << socket_path_ << "): " << strerror(errno) << "\n";
  }

  if (listen(fd, 5) < 0) {
    std::cerr << "[imesync-ipc] Failed to listen (" << socket_path_
              << "): " << strerror(errno) << "\n";
    close(fd);
    (void)unlink(socket_path_.c_str());
    owns_socket_file_ = false;
    return -1;
  }

  return fd;
}

void IpcServer::server_loop(std::stop_token st) {
  while (running_.load() && !st.stop_requested()) {
    pollfd pfd = {server_fd_, POLLIN, 0};
    int ret = poll(&pfd, 1, 500); // Timeout 500ms для проверки running_

    if (ret < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[imesync-ipc] Poll error: " << strerror(errno) << "\n";
      break;
    }

    if (ret == 0) {
      continue;
    }

    if (pfd.revents & POLLIN) {
      int client_fd = accept4(server_fd_, nullptr, nullptr, SOCK_CLOEXEC);
      if (client_fd < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && running_.load()) {
          std::cerr << "[imesync-ipc] Accept error: " << strerror(errno)
                    << "\n";
        }
        continue;
      }

      handle_client(client_fd);
      close(client_fd);
    }
  }
}

void IpcServer::handle_client(int client_fd) {
  // Клиент, который подключился и молчит, не должен вешать сервер
  pollfd pfd = {client_fd, POLLIN, 0};
  if (poll(&pfd, 1, 1000) <= 0) {
    return;
  }

  char buffer[256] = {};
  ssize_t bytes_read = read(client_fd, buffer, sizeof(buffer) - 1);
  if (bytes_read <= 0) {
    return;
  }

  std::string_view cmd{buffer, static_cast<size_t>(bytes_read)};
  cmd = trim(cmd.substr(0, cmd.find('\n')));

  IpcResult result = execute_command(cmd);

  std::string response = result.success ? "OK" : "ERROR";
  if (!result.message.empty()) {
    response += " ";
    response += result.message;
  }
  response += "\n";

  ssize_t written = write(client_fd, response.c_str(), response.size());
  if (written != static_cast<ssize_t>(response.size())) {
    std::cerr << "[imesync-ipc] Short write of response\n";
  }
}

IpcResult IpcServer::execute_command(std::string_view cmd) {
  cmd = trim(cmd);

  switch (parse_ipc_command(cmd)) {
  case IpcCommand::GetStatus: {
    bool enabled = enabled_flag_.load();
    return {true, enabled ? "ENABLED" : "DISABLED"};
  }

  case IpcCommand::SetStatus: {
    std::string_view arg = command_argument(cmd);
    if (arg.empty()) {
      return {false, "Missing argument"};
    }

    if (arg == "1" || arg == "true" || arg == "on") {
      enabled_flag_.store(true);
      std::cerr << "[imesync-ipc] Status set to ENABLED\n";
      return {true, "ENABLED"};
    } else if (arg == "0" || arg == "false" || arg == "off") {
      enabled_flag_.store(false);
      std::cerr << "[imesync-ipc] Status set to DISABLED\n";
      return {true, "DISABLED"};
    }
    return {false, "Invalid argument"};
  }

  case IpcCommand::FocusIn: {
    if (!on_focus_in_) {
      return {false, "Focus tracking not supported"};
    }
    on_focus_in_(std::string{command_argument(cmd)});
    return {true, "FOCUSED"};
  }

  case IpcCommand::Shutdown: {
    if (!on_shutdown_) {
      return {false, "Shutdown not supported"};
    }
    std::cerr << "[imesync-ipc] Shutdown requested\n";
    on_shutdown_();
    return {true, "SHUTTING_DOWN"};
  }

  case IpcCommand::Unknown:
  default:
    return {false, "Unknown command"};
  }
}

} // namespace imesync
