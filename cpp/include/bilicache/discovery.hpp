// ==============================================================================
// bilicache/discovery.hpp - Поиск entry.json
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход входной директории
// - Отбор обычных файлов с заданным именем (по умолчанию "entry.json")
// - Детерминированный порядок результатов (сортировка по пути)
// - Best effort: недоступные поддеревья пропускаются и попадают в skipped
//
// ==============================================================================

#ifndef BILICACHE_DISCOVERY_HPP
#define BILICACHE_DISCOVERY_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace bilicache::io {

/// Имя файла метаданных кэша
inline constexpr const char* ENTRY_FILE_NAME = "entry.json";

// ----------------------------------------------------------------------------
// DiscoveryOptions - параметры поиска
// ----------------------------------------------------------------------------

struct DiscoveryOptions {
    /// Точное имя файла (case-sensitive)
    std::string file_name = ENTRY_FILE_NAME;
};

// ----------------------------------------------------------------------------
// Результат поиска
// ----------------------------------------------------------------------------

/// Найденный файл
struct DiscoveredEntry {
    /// Абсолютный путь к файлу
    std::filesystem::path absolute_path;

    /// Путь относительно корня поиска (например "a/entry.json")
    std::filesystem::path relative_path;
};

/// Путь, который не удалось обойти
struct DiscoverySkip {
    std::filesystem::path path;
    std::string message;
};

/// Результат обхода: найденные файлы + пропущенные поддеревья
struct DiscoveryResult {
    std::vector<DiscoveredEntry> entries;
    std::vector<DiscoverySkip> skipped;

    /// true, если обход не пропустил ни одного поддерева
    bool complete() const { return skipped.empty(); }
};

// ----------------------------------------------------------------------------
// discover_entries - основная функция поиска
// ----------------------------------------------------------------------------

/// Найти все файлы opt.file_name под root
///
/// @param root Существующая директория (проверяется вызывающим кодом)
/// @param opt Параметры поиска
/// @return Отсортированный по абсолютному пути список + пропуски
///
/// Поведение:
/// - Обход рекурсивный, depth-first; symlinks разрешаются через status()
/// - Ошибка открытия директории или чтения метаданных элемента не прерывает
///   обход: путь добавляется в skipped, обход продолжается с соседями
/// - Висячая symlink не является пропуском и молча игнорируется
/// - Пустой результат - не ошибка
/// - Исключений при ошибках обхода не бросает
DiscoveryResult discover_entries(const std::filesystem::path& root,
                                 const DiscoveryOptions& opt = {});

}  // namespace bilicache::io

#endif  // BILICACHE_DISCOVERY_HPP
