// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================

#include "bilicache/cli.hpp"

#include "bilicache/platform.hpp"

#include <cstring>
#include <utility>

namespace bilicache::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool starts_with(const char* str, const char* prefix) {
    return std::strncmp(str, prefix, std::strlen(prefix)) == 0;
}

/// "-v", "-vv", "-vvv" -> число v; 0 если аргумент другой
int count_verbose_flags(const char* arg) {
    if (arg[0] != '-' || arg[1] != 'v') {
        return 0;
    }
    int count = 0;
    for (const char* p = arg + 1; *p != '\0'; ++p) {
        if (*p != 'v') {
            return 0;
        }
        ++count;
    }
    return count;
}

ParseResult fail(ParseResult result, const std::string& message) {
    result.ok = false;
    result.diagnostic.exit_code = 1;
    result.diagnostic.stderr_message = render_usage_error(message);
    return result;
}

std::string missing_value(const char* option) {
    return std::string("a value is required for '") + option + "' but none was supplied";
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string(PROGRAM_NAME) + " " + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: bilicache [OPTIONS] --input <INPUT> --output <OUTPUT>\n"
           "\n"
           "Options:\n"
           "  -i, --input <INPUT>    Root directory to scan for entry.json files\n"
           "  -o, --output <OUTPUT>  Root directory for processed output\n"
           "  -j, --json             Print a JSON run report to stdout\n"
           "      --report <FILE>    Save the JSON run report to a file\n"
           "  -q, --quiet            Suppress informational and progress output\n"
           "  -v...                  Print verbose output\n"
           "      --no-banner        Hide the banner\n"
           "  -h, --help             Print help\n"
           "  -V, --version          Print version\n"
           "\n"
           "Examples:\n"
           "\n"
           "    Process a copied Android download directory:\n"
           "        ./bilicache -i ./tv.danmaku.bili/download -o ./videos\n";
}

std::string render_usage_error(const std::string& error_msg) {
    return "error: " + error_msg +
           "\n\n"
           "Usage: bilicache [OPTIONS] --input <INPUT> --output <OUTPUT>\n\n"
           "For more information, try '--help'.\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 1
        result.diagnostic.exit_code = 1;
        result.diagnostic.stderr_message = render_help();
        return result;
    }

    RunCommand run_cmd;
    bool has_input = false;
    bool has_output = false;

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (str_eq(arg, "-i") || str_eq(arg, "--input")) {
            if (i + 1 >= argc) {
                return fail(result, missing_value("--input <INPUT>"));
            }
            ++i;
            run_cmd.input = argv[i];
            has_input = true;
        } else if (starts_with(arg, "--input=")) {
            run_cmd.input = arg + std::strlen("--input=");
            has_input = true;
        } else if (str_eq(arg, "-o") || str_eq(arg, "--output")) {
            if (i + 1 >= argc) {
                return fail(result, missing_value("--output <OUTPUT>"));
            }
            ++i;
            run_cmd.output = argv[i];
            has_output = true;
        } else if (starts_with(arg, "--output=")) {
            run_cmd.output = arg + std::strlen("--output=");
            has_output = true;
        } else if (str_eq(arg, "--report")) {
            if (i + 1 >= argc) {
                return fail(result, missing_value("--report <FILE>"));
            }
            ++i;
            run_cmd.report = platform::path_from_utf8(argv[i]);
        } else if (starts_with(arg, "--report=")) {
            const char* value = arg + std::strlen("--report=");
            if (value[0] == '\0') {
                return fail(result, missing_value("--report <FILE>"));
            }
            run_cmd.report = platform::path_from_utf8(value);
        } else if (str_eq(arg, "-j") || str_eq(arg, "--json")) {
            run_cmd.json = true;
        } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "--no-banner")) {
            result.global.no_banner = true;
        } else if (int v = count_verbose_flags(arg); v > 0) {
            result.global.verbose += v;
        } else {
            return fail(result, std::string("unexpected argument '") + arg + "' found");
        }
    }

    if (!has_input || !has_output) {
        std::string message = "the following required arguments were not provided:";
        if (!has_input) {
            message += "\n  --input <INPUT>";
        }
        if (!has_output) {
            message += "\n  --output <OUTPUT>";
        }
        return fail(result, message);
    }

    // Пустое значение (--input= или -i "") равносильно отсутствию значения
    if (run_cmd.input.empty()) {
        return fail(result, missing_value("--input <INPUT>"));
    }
    if (run_cmd.output.empty()) {
        return fail(result, missing_value("--output <OUTPUT>"));
    }

    result.ok = true;
    result.command = std::move(run_cmd);
    return result;
}

}  // namespace bilicache::cli
