#include "imesync/focus_oracle.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
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

using imesync::FocusBackend;
using imesync::ShellFocusOracle;

/// Оракул окна в фокусе, которым управляет тест
struct ScriptedTokens {
  std::optional<std::string> active;
  int queries = 0;

  ShellFocusOracle::TokenQuery query() {
    return [this]() -> std::optional<std::string> {
      ++queries;
      return active;
    };
  }
};

void clear_session_env() {
  unsetenv("XDG_SESSION_TYPE");
  unsetenv("WAYLAND_DISPLAY");
  unsetenv("DISPLAY");
  unsetenv("WINDOWID");
}

void test_null_oracle() {
  imesync::NullFocusOracle oracle;
  oracle.on_focus_in("0x123");
  CHECK(!oracle.is_host_focused());
  CHECK(oracle.name() == "none");
}

void test_shell_oracle_requires_focus_in() {
  ScriptedTokens tokens;
  tokens.active = "17";
  ShellFocusOracle oracle{tokens.query()};

  // До первого получения фокуса сравнивать не с чем
  CHECK(!oracle.is_host_focused());
  CHECK(!oracle.cached_token().has_value());

  oracle.on_focus_in({});
  CHECK(oracle.cached_token() == std::string{"17"});
  CHECK(oracle.is_host_focused());

  tokens.active = "23";
  CHECK(!oracle.is_host_focused());

  tokens.active = "17";
  CHECK(oracle.is_host_focused());
}

void test_shell_oracle_token_is_write_once() {
  ScriptedTokens tokens;
  tokens.active = "17";
  ShellFocusOracle oracle{tokens.query()};

  oracle.on_focus_in({});
  tokens.active = "23";
  oracle.on_focus_in({});
  CHECK(oracle.cached_token() == std::string{"17"});
  CHECK(!oracle.is_host_focused());
}

void test_startup_capture_replaced_by_focus_in() {
  ScriptedTokens tokens;
  tokens.active = "term-42";
  ShellFocusOracle oracle{tokens.query()};

  // При старте в фокусе терминал, а не хост
  oracle.capture_at_start();
  CHECK(oracle.cached_token() == std::string{"term-42"});
  CHECK(oracle.token_is_provisional());

  // Первый FOCUS_IN от хоста заменяет предварительный токен
  tokens.active = "host-7";
  oracle.on_focus_in({});
  CHECK(oracle.cached_token() == std::string{"host-7"});
  CHECK(!oracle.token_is_provisional());
  CHECK(oracle.is_host_focused());

  tokens.active = "term-42";
  CHECK(!oracle.is_host_focused());

  // Дальше токен уже не меняется
  oracle.on_focus_in({});
  oracle.capture_at_start();
  CHECK(oracle.cached_token() == std::string{"host-7"});
}

void test_startup_capture_after_focus_in_is_ignored() {
  ScriptedTokens tokens;
  tokens.active = "host-7";
  ShellFocusOracle oracle{tokens.query()};

  oracle.on_focus_in({});
  tokens.active = "term-42";
  oracle.capture_at_start();
  CHECK(oracle.cached_token() == std::string{"host-7"});
  CHECK(!oracle.token_is_provisional());

  // Неудачный запрос при старте ничего не кэширует
  ScriptedTokens none;
  ShellFocusOracle fresh{none.query()};
  fresh.capture_at_start();
  CHECK(none.queries == 1);
  CHECK(!fresh.cached_token().has_value());
}

void test_shell_oracle_fails_closed() {
  ScriptedTokens tokens;
  ShellFocusOracle oracle{tokens.query()};

  // Первый запрос не удался: токен не кэшируется, следующий focus-in повторит
  oracle.on_focus_in({});
  CHECK(!oracle.cached_token().has_value());

  tokens.active = "5";
  oracle.on_focus_in({});
  CHECK(oracle.cached_token() == std::string{"5"});

  tokens.active.reset();
  CHECK(!oracle.is_host_focused());
}

void test_shell_oracle_concurrent_focus_in() {
  ScriptedTokens tokens;
  tokens.active = "42";
  ShellFocusOracle oracle{tokens.query()};

  {
    std::jthread a([&] { oracle.on_focus_in({}); });
  }
  oracle.on_focus_in({});
  CHECK(oracle.cached_token() == std::string{"42"});
}

void test_command_query() {
  auto query = ShellFocusOracle::command_query({"echo", "  token-9  "});
  CHECK(query() == std::string{"token-9"});

  auto failing = ShellFocusOracle::command_query({"false"});
  CHECK(!failing().has_value());

  auto empty = ShellFocusOracle::command_query({"true"});
  CHECK(!empty().has_value());
}

void test_x11_oracle_host_window() {
  clear_session_env();
  imesync::X11FocusOracle oracle{0};

  // Окно хоста неизвестно — не в фокусе, дисплей не открывается
  CHECK(!oracle.is_host_focused());
  CHECK(oracle.name() == "x11");

  oracle.on_focus_in("0x3a00007");
  CHECK(oracle.host_window() == 0x3a00007u);

  oracle.on_focus_in("garbage");
  CHECK(oracle.host_window() == 0x3a00007u);

  oracle.on_focus_in({});
  CHECK(oracle.host_window() == 0x3a00007u);

  // Без X сервера запрос активного окна падает, значит "не в фокусе"
  CHECK(!oracle.is_host_focused());
}

void test_probe_backend() {
  clear_session_env();
  CHECK(imesync::probe_focus_backend() == FocusBackend::Off);

  setenv("DISPLAY", ":0", 1);
  CHECK(imesync::probe_focus_backend() == FocusBackend::X11);

  setenv("WAYLAND_DISPLAY", "wayland-0", 1);
  CHECK(imesync::probe_focus_backend() == FocusBackend::Shell);

  unsetenv("WAYLAND_DISPLAY");
  setenv("XDG_SESSION_TYPE", "wayland", 1);
  CHECK(imesync::probe_focus_backend() == FocusBackend::Shell);

  setenv("XDG_SESSION_TYPE", "x11", 1);
  CHECK(imesync::probe_focus_backend() == FocusBackend::X11);

  clear_session_env();
}

void test_make_focus_oracle() {
  clear_session_env();

  imesync::FocusConfig config;
  auto oracle = imesync::make_focus_oracle(config, nullptr);
  CHECK(oracle->name() == "none");

  config.backend = FocusBackend::X11;
  setenv("WINDOWID", "1234", 1);
  oracle = imesync::make_focus_oracle(config, nullptr);
  CHECK(oracle->name() == "x11");
  CHECK(static_cast<imesync::X11FocusOracle &>(*oracle).host_window() == 1234u);

  config.host_window = 99;
  oracle = imesync::make_focus_oracle(config, nullptr);
  CHECK(static_cast<imesync::X11FocusOracle &>(*oracle).host_window() == 99u);

  config.backend = FocusBackend::Shell;
  config.token_command = "echo host-window";
  oracle = imesync::make_focus_oracle(config, nullptr);
  CHECK(oracle->name() == "shell");
  oracle->on_focus_in({});
  CHECK(oracle->is_host_focused());

  config.token_command = "echo 'unterminated";
  oracle = imesync::make_focus_oracle(config, nullptr);
  CHECK(oracle->name() == "none");

  // Shell.Eval без шины: токена нет, не в фокусе
  config.token_command.clear();
  oracle = imesync::make_focus_oracle(config, nullptr);
  CHECK(oracle->name() == "shell");
  oracle->on_focus_in({});
  CHECK(!oracle->is_host_focused());

  config.backend = FocusBackend::Off;
  oracle = imesync::make_focus_oracle(config, nullptr);
  CHECK(!oracle->is_host_focused());

  clear_session_env();
}

} // namespace

int main() {
  test_null_oracle();
  test_shell_oracle_requires_focus_in();
  test_shell_oracle_token_is_write_once();
  test_startup_capture_replaced_by_focus_in();
  test_startup_capture_after_focus_in_is_ignored();
  test_shell_oracle_fails_closed();
  test_shell_oracle_concurrent_focus_in();
  test_command_query();
  test_x11_oracle_host_window();
  test_probe_backend();
  test_make_focus_oracle();

  std::cout << "OK\n";
  return 0;
}
