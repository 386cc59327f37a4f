#include "imesync/ipc_client.hpp"
#include "imesync/ipc_server.hpp"

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
#include <vector>

namespace {

[[noreturn]] void test_fail(const char *expr, const char *file, int line) {
  std::cerr << "TEST FAIL: " << expr << " (" << file << ":" << line << ")\n";
  std::abort();
}

#define CHECK(expr)                                                            \
  do {                                                                         \
    if (!(expr)) {                                                             \
      test_fail(#expr, __FILE__, __LINE__);                                    \
    }                                                                          \
  } while (0)

using imesync::IpcClient;
using imesync::IpcCommand;
using imesync::IpcServer;
using imesync::ServiceStatus;

std::string temp_socket_path(const char *tag) {
  return (std::filesystem::temp_directory_path() /
          ("imesync-test-" + std::string(tag) + "-" +
           std::to_string(::getpid()) + ".sock"))
      .string();
}

/// Хуки хоста, которые дёргает сервер
struct HostHooks {
  std::mutex mu;
  std::vector<std::string> focus_hints;
  std::atomic<int> shutdowns{0};

  IpcServer::FocusInCallback focus_in() {
    return [this](const std::string &hint) {
      std::lock_guard<std::mutex> lock(mu);
      focus_hints.push_back(hint);
    };
  }

  IpcServer::ShutdownCallback shutdown() {
    return [this] { shutdowns.fetch_add(1); };
  }
};

void test_parse_command() {
  CHECK(imesync::parse_ipc_command("GET_STATUS") == IpcCommand::GetStatus);
  CHECK(imesync::parse_ipc_command("  SET_STATUS 1\n") == IpcCommand::SetStatus);
  CHECK(imesync::parse_ipc_command("FOCUS_IN 0x3a00007") == IpcCommand::FocusIn);
  CHECK(imesync::parse_ipc_command("SHUTDOWN") == IpcCommand::Shutdown);
  CHECK(imesync::parse_ipc_command("GET_STATUSX") == IpcCommand::Unknown);
  CHECK(imesync::parse_ipc_command("RELOAD") == IpcCommand::Unknown);
  CHECK(imesync::parse_ipc_command("") == IpcCommand::Unknown);
}

void test_execute_without_socket() {
  std::atomic<bool> enabled{true};
  HostHooks hooks;
  IpcServer server{enabled, hooks.focus_in(), hooks.shutdown(),
                   temp_socket_path("exec")};

  auto r = server.execute_command("GET_STATUS");
  CHECK(r.success && r.message == "ENABLED");

  r = server.execute_command("SET_STATUS off");
  CHECK(r.success && r.message == "DISABLED");
  CHECK(!enabled.load());

  r = server.execute_command("SET_STATUS");
  CHECK(!r.success);

  r = server.execute_command("SET_STATUS maybe");
  CHECK(!r.success);
  CHECK(!enabled.load());

  r = server.execute_command("FOCUS_IN  0x10 ");
  CHECK(r.success);
  CHECK(hooks.focus_hints.size() == 1);
  CHECK(hooks.focus_hints[0] == "0x10");

  r = server.execute_command("FOCUS_IN");
  CHECK(r.success);
  CHECK(hooks.focus_hints.size() == 2);
  CHECK(hooks.focus_hints[1].empty());

  r = server.execute_command("SHUTDOWN");
  CHECK(r.success);
  CHECK(hooks.shutdowns.load() == 1);

  r = server.execute_command("DANCE");
  CHECK(!r.success && r.message == "Unknown command");

  IpcServer bare{enabled, nullptr, nullptr, temp_socket_path("bare")};
  CHECK(!bare.execute_command("SHUTDOWN").success);
  CHECK(!bare.execute_command("FOCUS_IN").success);
}

void test_client_server_roundtrip() {
  const std::string path = temp_socket_path("rt");
  std::atomic<bool> enabled{true};
  HostHooks hooks;
  IpcServer server{enabled, hooks.focus_in(), hooks.shutdown(), path};
  CHECK(server.start());
  CHECK(server.is_running());

  struct stat st {};
  CHECK(stat(path.c_str(), &st) == 0);
  CHECK(S_ISSOCK(st.st_mode));
  CHECK((st.st_mode & 0777) == 0600);

  IpcClient client{path};
  CHECK(client.is_service_available());
  CHECK(client.get_status() == ServiceStatus::Enabled);

  CHECK(client.set_status(false));
  CHECK(!enabled.load());
  CHECK(client.get_status() == ServiceStatus::Disabled);

  CHECK(client.set_status(true));
  CHECK(enabled.load());

  CHECK(client.focus_in("0x3a00007"));
  {
    std::lock_guard<std::mutex> lock(hooks.mu);
    CHECK(hooks.focus_hints.size() == 1);
    CHECK(hooks.focus_hints[0] == "0x3a00007");
  }

  CHECK(client.shutdown());
  CHECK(hooks.shutdowns.load() == 1);

  auto raw = client.send_command("NOPE");
  CHECK(raw.has_value());
  CHECK(*raw == "ERROR Unknown command");

  server.stop();
  CHECK(!server.is_running());
  CHECK(!std::filesystem::exists(path));
  CHECK(!client.is_service_available());
  CHECK(client.get_status() == ServiceStatus::Unknown);
}

void test_live_socket_rejects_second_daemon() {
  const std::string path = temp_socket_path("live");
  std::atomic<bool> enabled{true};
  IpcServer first{enabled, nullptr, nullptr, path};
  CHECK(first.start());

  IpcServer second{enabled, nullptr, nullptr, path};
  CHECK(!second.start());

  // Отказ второго не должен удалить сокет первого
  second.stop();
  CHECK(std::filesystem::exists(path));
  CHECK(IpcClient{path}.get_status() == ServiceStatus::Enabled);

  first.stop();
}

void test_stale_socket_is_replaced() {
  const std::string path = temp_socket_path("stale");
  std::filesystem::remove(path);

  // Сокет-файл без слушателя
  int fd = socket(AF_UNIX, SOCK_STREAM, 0);
  CHECK(fd >= 0);
  sockaddr_un addr{};
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
  CHECK(bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == 0);
  close(fd);
  CHECK(std::filesystem::exists(path));

  std::atomic<bool> enabled{false};
  IpcServer server{enabled, nullptr, nullptr, path};
  CHECK(server.start());
  CHECK(IpcClient{path}.get_status() == ServiceStatus::Disabled);
  server.stop();
}

void test_default_socket_path() {
  setenv("XDG_RUNTIME_DIR", "/run/user/1000", 1);
  CHECK(imesync::default_ipc_socket_path() == "/run/user/1000/imesync.sock");

  unsetenv("XDG_RUNTIME_DIR");
  CHECK(imesync::default_ipc_socket_path() ==
        "/tmp/imesync-" + std::to_string(::getuid()) + ".sock");
}

} // namespace

int main() {
  test_parse_command();
  test_execute_without_socket();
  test_client_server_roundtrip();
  test_live_socket_rejects_second_daemon();
  test_stale_socket_is_replaced();
  test_default_socket_path();

  std::cout << "OK\n";
  return 0;
}
