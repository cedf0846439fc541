// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr. Байты первичны, std::endl не
// используется.
//
// ==============================================================================

#include "bilicache/output.hpp"

#include "bilicache/platform.hpp"

#include <initializer_list>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace bilicache::output {

namespace {

constexpr std::string_view ANSI_RESET = "\x1b[0m";

std::string_view ansi_code(Color color) {
    switch (color) {
    case Color::Green:
        return "\x1b[32m";
    case Color::Yellow:
        return "\x1b[33m";
    case Color::Red:
        return "\x1b[31m";
    case Color::Cyan:
        return "\x1b[36m";
    case Color::Magenta:
        return "\x1b[35m";
    case Color::Default:
        break;
    }
    return {};
}

struct LevelStyle {
    std::string_view prefix;
    Color color;
};

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg, Sinks sinks) : config_(cfg), sinks_(sinks) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    flush();
    close_output_file();
}

void Writer::write(Stream s, std::string_view bytes) {
    if (FILE* f = target(s); f != nullptr && !bytes.empty()) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

void Writer::colored_line(Stream s, std::string_view message, Color color) {
    const bool paint = color != Color::Default && use_color(s);
    if (paint) {
        write(s, ansi_code(color));
    }
    write(s, message);
    if (paint) {
        write(s, ANSI_RESET);
    }
    write(s, "\n");
}

void Writer::info(std::string_view message_text) {
    message(Level::Info, message_text);
}

void Writer::warn(std::string_view message_text) {
    message(Level::Warn, message_text);
}

void Writer::error(std::string_view message_text) {
    message(Level::Error, message_text);
}

void Writer::debug(std::string_view message_text) {
    message(Level::Debug, message_text);
}

void Writer::trace(std::string_view message_text) {
    message(Level::Trace, message_text);
}

bool Writer::enabled(Level level) const {
    switch (level) {
    case Level::Info:
    case Level::Warn:
        return !config_.quiet;
    case Level::Error:
        return true;
    case Level::Debug:
        return config_.verbose > 0;
    case Level::Trace:
        return config_.verbose > 1;
    }
    return false;
}

void Writer::message(Level level, std::string_view text) {
    if (!enabled(level)) {
        return;
    }

    static constexpr LevelStyle STYLES[] = {
        {"[+] ", Color::Green},  {"[!] ", Color::Yellow}, {"[x] ", Color::Red},
        {"[*] ", Color::Cyan},   {"[~] ", Color::Magenta},
    };
    const LevelStyle& style = STYLES[static_cast<int>(level)];

    // Цветной только префикс уровня
    if (use_color(Stream::Stderr)) {
        write(Stream::Stderr, ansi_code(style.color));
        write(Stream::Stderr, style.prefix);
        write(Stream::Stderr, ANSI_RESET);
    } else {
        write(Stream::Stderr, style.prefix);
    }
    write_line(Stream::Stderr, text);
}

void Writer::write_json_pretty(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    value.Accept(writer);

    write(Stream::Stdout, std::string_view(buffer.GetString(), buffer.GetSize()));
    write(Stream::Stdout, "\n");
    flush();
}

void Writer::flush() {
    for (FILE* f : {sinks_.out, sinks_.err, output_file_}) {
        if (f != nullptr) {
            std::fflush(f);
        }
    }
}

FILE* Writer::target(Stream s) const {
    if (s == Stream::Stderr) {
        return sinks_.err;
    }
    return output_file_ != nullptr ? output_file_ : sinks_.out;
}

bool Writer::use_color(Stream s) const {
    // Цвет только для настоящего терминала процесса
    if (s == Stream::Stdout) {
        return output_file_ == nullptr && sinks_.out == stdout && platform::is_tty_stdout();
    }
    return sinks_.err == stderr && platform::is_tty_stderr();
}

void Writer::open_output_file() {
    const auto& path = *config_.output_path;
#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    output_file_ = std::fopen(platform::path_to_utf8(path).c_str(), "wb");
#endif
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

}  // namespace bilicache::output
