// ==============================================================================
// run.cpp - Оркестрация прогона
// ==============================================================================

#include "bilicache/run.hpp"

#include "bilicache/platform.hpp"

#include <filesystem>
#include <stdexcept>
#include <system_error>

namespace bilicache::app {

namespace {

std::filesystem::path resolve_path(std::string_view value, const char* what) {
    if (value.empty()) {
        throw std::invalid_argument(std::string(what) + " path must not be empty");
    }
    return std::filesystem::absolute(platform::path_from_utf8(value)).lexically_normal();
}

}  // namespace

pipeline::RunOptions resolve_run_options(std::string_view input, std::string_view output) {
    pipeline::RunOptions options;
    options.input_root = resolve_path(input, "input");
    options.output_root = resolve_path(output, "output");
    return options;
}

RunResult execute(const pipeline::RunOptions& options, pipeline::Pipeline& pipeline,
                  pipeline::EventSink& sink) {
    RunResult result;
    result.options = options;

    sink.on_event(pipeline::RunStarted{options});

    // Корень ввода проверяется до поиска
    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(options.input_root, ec);
    if (status.type() == std::filesystem::file_type::not_found) {
        result.error = "missing input path: " + platform::path_to_utf8(options.input_root);
        return result;
    }
    if (ec) {
        result.error = "failed to access input path: " +
                       platform::path_to_utf8(options.input_root) + " - " + ec.message();
        return result;
    }
    if (!std::filesystem::is_directory(status)) {
        result.error = "input path is not a directory: " + platform::path_to_utf8(options.input_root);
        return result;
    }

    result.discovery = io::discover_entries(options.input_root);

    for (const auto& skip : result.discovery.skipped) {
        sink.on_event(pipeline::DiscoverySkipped{skip});
    }
    sink.on_event(pipeline::DiscoveryFinished{options.input_root, result.discovery.entries,
                                              result.discovery.skipped.size()});

    // Пустой список: конвейер сообщит NothingFound и нулевые итоги
    result.report = pipeline.run(result.discovery.entries, options, sink);
    result.ok = true;
    return result;
}

}  // namespace bilicache::app
