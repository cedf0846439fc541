// ==============================================================================
// bilicache/run.hpp - Оркестрация прогона
// ==============================================================================
//
// Назначение:
// - Разрешение путей из аргументов (абсолютные, нормализованные)
// - Проверка корня ввода до начала поиска
// - Поиск целиком до начала обработки (не потоковый конвейер)
// - Передача найденного в Pipeline
//
// ==============================================================================

#ifndef BILICACHE_RUN_HPP
#define BILICACHE_RUN_HPP

#include "bilicache/discovery.hpp"
#include "bilicache/events.hpp"
#include "bilicache/pipeline.hpp"
#include "bilicache/types.hpp"

#include <string>
#include <string_view>

namespace bilicache::app {

/// Результат прогона
/// ok == false только при ошибке уровня прогона (нет корня ввода)
struct RunResult {
    bool ok = false;
    std::string error;
    pipeline::RunOptions options;
    io::DiscoveryResult discovery;
    pipeline::RunReport report;

    explicit operator bool() const { return ok; }
};

/// Превратить строки аргументов в абсолютные нормализованные пути
/// Существование путей не проверяется.
/// @throws std::invalid_argument при пустой строке
pipeline::RunOptions resolve_run_options(std::string_view input, std::string_view output);

/// Выполнить прогон: проверка корня -> поиск -> конвейер
RunResult execute(const pipeline::RunOptions& options, pipeline::Pipeline& pipeline,
                  pipeline::EventSink& sink);

}  // namespace bilicache::app

#endif  // BILICACHE_RUN_HPP
