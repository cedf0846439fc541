// ==============================================================================
// bilicache/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 1)
//
// ==============================================================================

#ifndef BILICACHE_CLI_HPP
#define BILICACHE_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace bilicache::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    bool no_banner = false;  // --no-banner
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q, --quiet
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Основной прогон: поиск и обработка entry.json
struct RunCommand {
    std::string input;                            // -i, --input (required)
    std::string output;                           // -o, --output (required)
    bool json = false;                            // -j, --json
    std::optional<std::filesystem::path> report;  // --report
};

/// help - показать справку
struct HelpCommand {};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<RunCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API парсинга
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version
std::string render_version();

/// Сообщение об ошибке парсинга: error + usage + подсказка
std::string render_usage_error(const std::string& error_msg);

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* PROGRAM_NAME = "bilicache";

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Process Bilibili cache directories (entry.json)";

}  // namespace bilicache::cli

#endif  // BILICACHE_CLI_HPP
