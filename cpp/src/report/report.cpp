// ==============================================================================
// report.cpp - Представление прогона
// ==============================================================================

#include "bilicache/report.hpp"

#include "bilicache/platform.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <variant>

namespace bilicache::report {

namespace {

std::string relative_dir_string(const std::filesystem::path& dir) {
    if (dir.empty()) {
        return ".";
    }
    return platform::path_to_generic_utf8(dir);
}

std::string counter(std::size_t index, std::size_t total) {
    return "[" + std::to_string(index) + "/" + std::to_string(total) + "]";
}

rapidjson::Value string_value(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

}  // namespace

// ----------------------------------------------------------------------------
// ConsoleReporter
// ----------------------------------------------------------------------------

ConsoleReporter::ConsoleReporter(output::Writer& writer, output::Stream progress_stream)
    : writer_(writer), progress_stream_(progress_stream) {}

void ConsoleReporter::progress(std::string_view line) {
    if (writer_.config().quiet) {
        return;
    }
    writer_.write_line(progress_stream_, line);
}

void ConsoleReporter::on_event(const pipeline::Event& event) {
    using namespace pipeline;

    std::visit(
        [&](auto&& ev) {
            using T = std::decay_t<decltype(ev)>;

            if constexpr (std::is_same_v<T, RunStarted>) {
                writer_.info("Input : " + platform::path_to_utf8(ev.options.input_root));
                writer_.info("Output: " + platform::path_to_utf8(ev.options.output_root));
            } else if constexpr (std::is_same_v<T, DiscoverySkipped>) {
                std::string line = "skipped '" + platform::path_to_utf8(ev.skip.path) + "' - " +
                                   ev.skip.message;
                // Пропущенное поддерево видно и при quiet
                if (writer_.config().quiet) {
                    writer_.error(line);
                } else {
                    writer_.warn(line);
                }
            } else if constexpr (std::is_same_v<T, DiscoveryFinished>) {
                writer_.info("Found " + std::to_string(ev.entries.size()) + " " +
                             io::ENTRY_FILE_NAME + " files in " +
                             platform::path_to_utf8(ev.root));
                for (const auto& entry : ev.entries) {
                    progress("  - " + platform::path_to_generic_utf8(entry.relative_path));
                }
                if (ev.skipped_count > 0) {
                    writer_.warn(std::to_string(ev.skipped_count) +
                                 " paths could not be read, results may be incomplete");
                }
            } else if constexpr (std::is_same_v<T, NothingFound>) {
                writer_.info(std::string("No ") + io::ENTRY_FILE_NAME + " files found in " +
                             platform::path_to_utf8(ev.root));
            } else if constexpr (std::is_same_v<T, ItemStarted>) {
                progress(counter(ev.index, ev.total) + " Processing: " +
                         platform::path_to_generic_utf8(ev.entry.relative_path));
                writer_.trace("absolute path: " + platform::path_to_utf8(ev.entry.absolute_path));
            } else if constexpr (std::is_same_v<T, ItemLoaded>) {
                progress("  size: " + std::to_string(ev.size_bytes) + " bytes");
                progress("  modified: " + platform::format_file_time(ev.last_modified));
                progress("  directory: " + relative_dir_string(ev.relative_dir));
                writer_.debug("content length: " + std::to_string(ev.content_length) + " bytes");
            } else if constexpr (std::is_same_v<T, ItemFinished>) {
                const auto& outcome = ev.outcome;
                if (outcome.succeeded) {
                    if (!writer_.config().quiet) {
                        writer_.colored_line(progress_stream_, "  done", output::Color::Green);
                    }
                    return;
                }
                const std::string message = outcome.error_message.value_or("unknown error");
                if (writer_.config().quiet) {
                    // Сбой не должен пройти незамеченным и при --quiet
                    writer_.error(counter(ev.index, ev.total) + " " +
                                  platform::path_to_generic_utf8(outcome.entry.relative_path) +
                                  ": " + message);
                } else {
                    writer_.colored_line(progress_stream_, "  failed: " + message,
                                         output::Color::Red);
                }
            } else if constexpr (std::is_same_v<T, RunFinished>) {
                const auto& s = ev.summary;
                writer_.colored_line(progress_stream_,
                                     "Processed " + std::to_string(s.total_discovered) +
                                         " files: " + std::to_string(s.total_succeeded) +
                                         " succeeded, " + std::to_string(s.total_failed) +
                                         " failed",
                                     s.total_failed > 0 ? output::Color::Yellow
                                                        : output::Color::Green);
            }
        },
        event);
}

// ----------------------------------------------------------------------------
// JSON отчёт
// ----------------------------------------------------------------------------

void build_json_report(const app::RunResult& result, rapidjson::Document& doc) {
    auto& alloc = doc.GetAllocator();
    doc.SetObject();

    const auto& summary = result.report.summary;

    doc.AddMember("input", string_value(platform::path_to_utf8(result.options.input_root), alloc),
                  alloc);
    doc.AddMember("output", string_value(platform::path_to_utf8(result.options.output_root), alloc),
                  alloc);
    doc.AddMember("discovered", static_cast<std::uint64_t>(summary.total_discovered), alloc);
    doc.AddMember("succeeded", static_cast<std::uint64_t>(summary.total_succeeded), alloc);
    doc.AddMember("failed", static_cast<std::uint64_t>(summary.total_failed), alloc);

    rapidjson::Value skipped(rapidjson::kArrayType);
    for (const auto& skip : result.discovery.skipped) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("path", string_value(platform::path_to_utf8(skip.path), alloc), alloc);
        item.AddMember("error", string_value(skip.message, alloc), alloc);
        skipped.PushBack(item, alloc);
    }
    doc.AddMember("skipped", skipped, alloc);

    rapidjson::Value outcomes(rapidjson::kArrayType);
    for (const auto& outcome : result.report.outcomes) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember(
            "path",
            string_value(platform::path_to_generic_utf8(outcome.entry.relative_path), alloc),
            alloc);
        item.AddMember("succeeded", outcome.succeeded, alloc);
        if (outcome.error_message.has_value()) {
            item.AddMember("error", string_value(*outcome.error_message, alloc), alloc);
        } else {
            item.AddMember("error", rapidjson::Value(rapidjson::kNullType), alloc);
        }
        outcomes.PushBack(item, alloc);
    }
    doc.AddMember("outcomes", outcomes, alloc);
}

}  // namespace bilicache::report
