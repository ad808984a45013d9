// ==============================================================================
// piiguard/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для цветного вывода
//
// Платформенная специфика изолирована в этом модуле.
//
// ==============================================================================

#ifndef PIIGUARD_PLATFORM_HPP
#define PIIGUARD_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace piiguard::platform {

/// UTF-8 строка -> native path
std::filesystem::path path_from_utf8(std::string_view u8str);

/// native path -> UTF-8 строка
std::string path_to_utf8(const std::filesystem::path& p);

/// stdout подключён к терминалу
bool is_tty_stdout();

/// stderr подключён к терминалу
bool is_tty_stderr();

}  // namespace piiguard::platform

#endif  // PIIGUARD_PLATFORM_HPP
