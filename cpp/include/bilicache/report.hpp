// ==============================================================================
// bilicache/report.hpp - Представление прогона
// ==============================================================================
//
// Назначение:
// - ConsoleReporter: события конвейера -> текст через output::Writer
// - JSON отчёт о прогоне (--json / --report)
//
// ==============================================================================

#ifndef BILICACHE_REPORT_HPP
#define BILICACHE_REPORT_HPP

#include "bilicache/events.hpp"
#include "bilicache/output.hpp"
#include "bilicache/run.hpp"

#include <rapidjson/document.h>

namespace bilicache::report {

// ----------------------------------------------------------------------------
// ConsoleReporter
// ----------------------------------------------------------------------------

/// Печатает ход прогона
///
/// Прогресс и результаты идут в progress_stream (stdout, либо stderr при
/// выводе JSON в stdout). Служебные сообщения идут через info/warn/debug.
/// При quiet печатаются только сбои и итоговая строка.
class ConsoleReporter final : public pipeline::EventSink {
public:
    ConsoleReporter(output::Writer& writer, output::Stream progress_stream);

    void on_event(const pipeline::Event& event) override;

private:
    void progress(std::string_view line);

    output::Writer& writer_;
    output::Stream progress_stream_;
};

// ----------------------------------------------------------------------------
// JSON отчёт
// ----------------------------------------------------------------------------

/// Заполнить doc объектом отчёта:
/// { input, output, discovered, succeeded, failed,
///   skipped: [{path, error}], outcomes: [{path, succeeded, error}] }
/// outcomes[].path - относительный путь с прямыми слешами
void build_json_report(const app::RunResult& result, rapidjson::Document& doc);

}  // namespace bilicache::report

#endif  // BILICACHE_REPORT_HPP
