// ==============================================================================
// app.cpp - Выполнение командной строки
// ==============================================================================

#include "bilicache/app.hpp"

#include "bilicache/cli.hpp"
#include "bilicache/pipeline.hpp"
#include "bilicache/platform.hpp"
#include "bilicache/report.hpp"
#include "bilicache/run.hpp"
#include "bilicache/stage.hpp"

#include <rapidjson/document.h>
#include <string>
#include <type_traits>
#include <variant>

namespace bilicache::app {

namespace {

constexpr const char* BANNER = R"(
  ____  _ _ _  ____           _
 | __ )(_) (_)/ ___|__ _  ___| |__   ___
 |  _ \| | | | |   / _` |/ __| '_ \ / _ \
 | |_) | | | | |__| (_| | (__| | | |  __/
 |____/|_|_|_|\____\__,_|\___|_| |_|\___|
)";

void print_banner(output::Writer& writer) {
    const auto& cfg = writer.config();
    if (cfg.no_banner || cfg.quiet) {
        return;
    }
    writer.write(output::Stream::Stderr, BANNER);
    writer.write_line(output::Stream::Stderr, "");
}

/// Записать JSON отчёт в файл --report
/// Файл открывается только после успешного прогона
int save_report(const cli::RunCommand& cmd, const rapidjson::Document& doc,
                output::Writer& writer) {
    output::OutputConfig report_cfg = writer.config();
    report_cfg.output_path = cmd.report;
    output::Writer report_writer(report_cfg, writer.sinks());
    if (!report_writer.has_output_file()) {
        writer.error("failed to open report file '" + platform::path_to_utf8(*cmd.report) + "'");
        return 1;
    }
    report_writer.write_json_pretty(doc);
    writer.info("Report saved to " + platform::path_to_utf8(*cmd.report));
    return 0;
}

int run_process(const cli::RunCommand& cmd, output::Writer& writer) {
    pipeline::RunOptions options = resolve_run_options(cmd.input, cmd.output);

    // JSON в stdout: прогресс уходит в stderr
    const bool json_to_stdout = cmd.json && !cmd.report.has_value();
    report::ConsoleReporter reporter(writer, json_to_stdout ? output::Stream::Stderr
                                                            : output::Stream::Stdout);

    pipeline::Pipeline pipeline(pipeline::make_default_stages());
    writer.debug("pipeline stages: " + std::to_string(pipeline.stage_count()));

    RunResult result = execute(options, pipeline, reporter);
    if (!result.ok) {
        writer.error(result.error);
        return 1;
    }

    if (!cmd.json && !cmd.report.has_value()) {
        return 0;
    }

    rapidjson::Document doc;
    report::build_json_report(result, doc);
    if (cmd.report.has_value()) {
        return save_report(cmd, doc, writer);
    }
    writer.write_json_pretty(doc);
    return 0;
}

}  // namespace

int run_cli(int argc, char** argv, output::Sinks sinks) {
    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_banner = parse_result.global.no_banner;
    output::Writer writer(out_cfg, sinks);

    // Ошибки парсинга: сообщение без префикса [x], напрямую в stderr
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::RunCommand>) {
                print_banner(writer);
                return run_process(cmd, writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // namespace bilicache::app
