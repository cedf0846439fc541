// ==============================================================================
// bilicache/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования std::filesystem::path <-> UTF-8
// - Определение TTY для цветного вывода
// - Форматирование времени модификации файла в локальном часовом поясе
//
// Вся платформенная специфика (#ifdef _WIN32) изолирована здесь.
//
// ==============================================================================

#ifndef BILICACHE_PLATFORM_HPP
#define BILICACHE_PLATFORM_HPP

#include <filesystem>
#include <string>
#include <string_view>

namespace bilicache::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Создать path из строки UTF-8 (аргументы командной строки)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути (для вывода и JSON)
std::string path_to_utf8(const std::filesystem::path& p);

/// UTF-8 представление с прямыми слешами на всех платформах
/// Используется для относительных путей в отчётах
std::string path_to_generic_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Время
// ----------------------------------------------------------------------------

/// Форматировать время файла как "YYYY-MM-DD HH:MM:SS" (локальное время)
std::string format_file_time(std::filesystem::file_time_type t);

}  // namespace bilicache::platform

#endif  // BILICACHE_PLATFORM_HPP
