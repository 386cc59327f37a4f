/**
 * @file spawn.cpp
 * @brief Реализация запуска внешних команд
 */

#include "imesync/spawn.hpp"

#include <glib.h>

namespace imesync {

namespace {

/// argv в стиле GLib; строки принадлежат args
std::vector<gchar *> make_argv(const std::vector<std::string> &args) {
  std::vector<gchar *> argv;
  argv.reserve(args.size() + 1);
  for (const auto &a : args) {
    argv.push_back(const_cast<gchar *>(a.c_str()));
  }
  argv.push_back(nullptr);
  return argv;
}

} // namespace

std::optional<std::vector<std::string>>
split_command_line(std::string_view command, std::string *out_error) {
  const std::string cmd{command};

  gint argc = 0;
  gchar **argv = nullptr;
  GError *err = nullptr;

  if (!g_shell_parse_argv(cmd.c_str(), &argc, &argv, &err)) {
    if (out_error) {
      out_error->assign(err && err->message ? err->message
                                            : "failed to parse command line");
    }
    if (err) {
      g_error_free(err);
    }
    return std::nullopt;
  }

  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (gint i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  g_strfreev(argv);

  if (out.empty()) {
    if (out_error) {
      out_error->assign("empty command line");
    }
    return std::nullopt;
  }
  return out;
}

SpawnOutcome spawn_sync(const std::vector<std::string> &args) {
  SpawnOutcome out;

  if (args.empty()) {
    out.error = "empty argv";
    return out;
  }

  std::vector<gchar *> argv = make_argv(args);

  gchar *stdout_buf = nullptr;
  gchar *stderr_buf = nullptr;
  gint status = -1;
  GError *err = nullptr;

  const gboolean ok = g_spawn_sync(nullptr,
                                   argv.data(),
                                   nullptr,
                                   G_SPAWN_SEARCH_PATH,
                                   nullptr,
                                   nullptr,
                                   &stdout_buf,
                                   &stderr_buf,
                                   &status,
                                   &err);

  out.exit_status = status;
  if (stdout_buf) {
    out.stdout_str.assign(stdout_buf);
    g_free(stdout_buf);
  }
  if (stderr_buf) {
    out.stderr_str.assign(stderr_buf);
    g_free(stderr_buf);
  }

  if (!ok) {
    out.ok = false;
    if (err) {
      out.error.assign(err->message ? err->message : "unknown error");
      g_error_free(err);
    } else {
      out.error = "g_spawn_sync failed";
    }
    return out;
  }

  if (status != 0) {
    out.ok = false;
    out.error = "command exited with non-zero status";
    return out;
  }

  out.ok = true;
  return out;
}

bool spawn_async(const std::vector<std::string> &args, std::string &error) {
  if (args.empty()) {
    error = "empty argv";
    return false;
  }

  std::vector<gchar *> argv = make_argv(args);
  GError *err = nullptr;

  // Без DO_NOT_REAP_CHILD GLib сам подбирает зомби
  const gboolean ok = g_spawn_async(nullptr,
                                    argv.data(),
                                    nullptr,
                                    static_cast<GSpawnFlags>(
                                        G_SPAWN_SEARCH_PATH |
                                        G_SPAWN_STDOUT_TO_DEV_NULL),
                                    nullptr,
                                    nullptr,
                                    nullptr,
                                    &err);
  if (!ok) {
    error.assign(err && err->message ? err->message : "g_spawn_async failed");
    if (err) {
      g_error_free(err);
    }
    return false;
  }
  return true;
}

} // namespace imesync
