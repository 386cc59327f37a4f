/**
 * @file spawn.hpp
 * @brief Запуск внешних команд через GLib (g_spawn_*)
 */

#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace imesync {

struct SpawnOutcome {
  bool ok = false;
  int exit_status = -1;
  std::string stdout_str;
  std::string stderr_str;
  std::string error;
};

/// Разбивает командную строку по правилам shell (g_shell_parse_argv).
/// std::nullopt при синтаксической ошибке или пустой строке.
[[nodiscard]] std::optional<std::vector<std::string>>
split_command_line(std::string_view command, std::string *out_error = nullptr);

/// Синхронно запускает процесс и собирает stdout/stderr.
/// ok == true только при нулевом коде возврата.
[[nodiscard]] SpawnOutcome spawn_sync(const std::vector<std::string> &args);

/// Запускает процесс без ожидания (fire-and-forget).
/// false если процесс не удалось даже создать; error заполняется.
[[nodiscard]] bool spawn_async(const std::vector<std::string> &args,
                               std::string &error);

} // namespace imesync
