/**
 * @file actions.hpp
 * @brief Внешние действия: сброс системной раскладки и переключение метода
 *        ввода хост-приложения
 *
 * Оба действия — инжектируемые capability с единственным методом, чтобы в
 * тестах их можно было заменить записывающими заглушками.
 */

#pragma once

#include <gio/gio.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "imesync/config.hpp"

namespace imesync {

// ===========================================================================
// Сброс раскладки
// ===========================================================================

/**
 * @brief Просит ОС переключить активную раскладку в заданный слот
 *
 * Асинхронно, без подтверждения. Ошибки только логируются и не повторяются:
 * следующее настоящее уведомление всё равно всё исправит.
 */
class LayoutResetAction {
public:
  virtual ~LayoutResetAction() = default;

  virtual void request_reset(std::uint32_t index) = 0;
};

/// gsettings set org.gnome.desktop.input-sources current <index>
class GSettingsResetAction final : public LayoutResetAction {
public:
  void request_reset(std::uint32_t index) override;
};

/// SetInputSource(u) у демона настроек клавиатуры
class SettingsDaemonResetAction final : public LayoutResetAction {
public:
  /// connection не принадлежит объекту и должен его пережить
  explicit SettingsDaemonResetAction(GDBusConnection *connection);

  void request_reset(std::uint32_t index) override;

private:
  GDBusConnection *connection_;
};

/// org.gnome.Shell.Eval: inputSources[<index>].activate()
class ShellEvalResetAction final : public LayoutResetAction {
public:
  explicit ShellEvalResetAction(GDBusConnection *connection);

  void request_reset(std::uint32_t index) override;

  /// JS-сниппет для Shell.Eval
  [[nodiscard]] static std::string script_for(std::uint32_t index);

private:
  GDBusConnection *connection_;
};

[[nodiscard]] std::unique_ptr<LayoutResetAction>
make_layout_reset_action(ResetMethod method, GDBusConnection *connection);

// ===========================================================================
// Переключение метода ввода хоста
// ===========================================================================

/**
 * @brief Синхронный вызов в хост-приложение: один вызов — одно переключение
 */
class InputMethodToggle {
public:
  virtual ~InputMethodToggle() = default;

  /// @return true если хост подтвердил переключение
  virtual bool toggle() = 0;
};

/// Запускает настроенную команду (по умолчанию emacsclient) и ждёт её
class CommandInputMethodToggle final : public InputMethodToggle {
public:
  explicit CommandInputMethodToggle(std::vector<std::string> argv);

  bool toggle() override;

private:
  std::vector<std::string> argv_;
};

} // namespace imesync
