// ==============================================================================
// bilicache/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с уровнями: [+] info, [!] warn, [x] error, [*] debug, [~] trace
// - Цветной вывод (ANSI escape codes) при TTY
// - JSON вывод (RapidJSON)
// - Перенаправление stdout в файл (--report)
//
// ==============================================================================

#ifndef BILICACHE_OUTPUT_HPP
#define BILICACHE_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

// Forward declarations для RapidJSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace bilicache::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;      // -q: подавить informational/progress вывод
    int verbose = 0;         // -v: уровень подробности (0..2+)
    bool no_banner = false;  // --no-banner: скрыть ASCII-баннер

    // Путь для вывода stdout (--report)
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Приёмники вывода
// ----------------------------------------------------------------------------

/// Куда пишет Writer. По умолчанию процессные stdout/stderr,
/// в тестах - временные файлы
struct Sinks {
    FILE* out = stdout;
    FILE* err = stderr;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg, Sinks sinks = {});
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    /// Строка с переводом строки, в цвете только для TTY
    void colored_line(Stream s, std::string_view message, Color color);

    // Сообщения с префиксами, все в поток ошибок
    // -------------------------------------------------------------------------

    /// "[+] <message>", подавляется при quiet
    void info(std::string_view message);

    /// "[!] <message>", подавляется при quiet
    void warn(std::string_view message);

    /// "[x] <message>", печатается всегда
    void error(std::string_view message);

    /// "[*] <message>" при verbose > 0
    void debug(std::string_view message);

    /// "[~] <message>" при verbose > 1
    void trace(std::string_view message);

    /// Pretty JSON (отступ 2) + newline в stdout
    void write_json_pretty(const rapidjson::Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

    const Sinks& sinks() const { return sinks_; }

    /// Открыт ли файл output_path (false, если открыть не удалось)
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    enum class Level { Info, Warn, Error, Debug, Trace };

    void message(Level level, std::string_view text);
    bool enabled(Level level) const;

    FILE* target(Stream s) const;
    bool use_color(Stream s) const;

    void open_output_file();
    void close_output_file();

    OutputConfig config_;
    Sinks sinks_;
    FILE* output_file_ = nullptr;
};

}  // namespace bilicache::output

#endif  // BILICACHE_OUTPUT_HPP
