// ==============================================================================
// bilicache/context.hpp - Чтение entry.json (File Context Reader)
// ==============================================================================
//
// Назначение:
// - Снимок одного файла: содержимое, размер, время модификации, расположение
// - Ошибки чтения как значение (ReadResult), локальные для одного файла
//
// FileContext живёт только на время обработки одного элемента конвейера.
//
// ==============================================================================

#ifndef BILICACHE_CONTEXT_HPP
#define BILICACHE_CONTEXT_HPP

#include "bilicache/discovery.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace bilicache::io {

// ----------------------------------------------------------------------------
// FileContext - снимок файла
// ----------------------------------------------------------------------------

struct FileContext {
    /// Абсолютный путь
    std::filesystem::path path;

    /// Путь относительно корня ввода
    std::filesystem::path relative_path;

    /// Содержимое файла (байты как есть)
    std::string content;

    /// Размер по метаданным файловой системы
    std::uintmax_t size_bytes = 0;

    /// Время последней записи
    std::filesystem::file_time_type last_modified;

    /// Директория относительно корня ввода (пустая для файлов в корне)
    std::filesystem::path relative_dir;
};

// ----------------------------------------------------------------------------
// ReadError - ошибки чтения
// ----------------------------------------------------------------------------

enum class ReadErrorKind {
    FileNotFound,      // Файл удалён после обнаружения
    PermissionDenied,  // Нет доступа
    NotRegularFile,    // На месте файла оказалось что-то другое
    IoError            // Прочие ошибки ввода-вывода
};

const char* read_error_kind_to_string(ReadErrorKind kind);

struct ReadError {
    ReadErrorKind kind = ReadErrorKind::IoError;
    std::string message;
    std::string path;

    /// "failed to read file '<path>' - <message>"
    std::string format() const;
};

/// Результат чтения
struct ReadResult {
    bool ok = false;
    std::optional<FileContext> context;
    ReadError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// read_context
// ----------------------------------------------------------------------------

/// Прочитать файл целиком и собрать метаданные
///
/// Порядок: status -> file_size -> last_write_time -> чтение содержимого.
/// Любая ошибка возвращается в ReadResult::error, исключений не бросает.
ReadResult read_context(const DiscoveredEntry& entry);

}  // namespace bilicache::io

#endif  // BILICACHE_CONTEXT_HPP
