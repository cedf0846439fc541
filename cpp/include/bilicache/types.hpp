// ==============================================================================
// bilicache/types.hpp - Общие типы прогона
// ==============================================================================
//
// RunOptions, ProcessingOutcome, RunSummary, RunReport
//
// ==============================================================================

#ifndef BILICACHE_TYPES_HPP
#define BILICACHE_TYPES_HPP

#include "bilicache/discovery.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bilicache::pipeline {

/// Параметры прогона; не меняются до его завершения
struct RunOptions {
    /// Абсолютный путь к корню кэша (только чтение)
    std::filesystem::path input_root;

    /// Абсолютный путь для результатов стадий (только запись)
    std::filesystem::path output_root;
};

/// Результат обработки одного entry.json
struct ProcessingOutcome {
    io::DiscoveredEntry entry;
    bool succeeded = false;
    std::optional<std::string> error_message;
};

/// Итоги прогона
/// total_discovered == total_succeeded + total_failed
struct RunSummary {
    std::size_t total_discovered = 0;
    std::size_t total_succeeded = 0;
    std::size_t total_failed = 0;
};

/// Результат конвейера: исходы в порядке обнаружения + итоги
struct RunReport {
    std::vector<ProcessingOutcome> outcomes;
    RunSummary summary;
};

/// Посчитать итоги по списку исходов
RunSummary summarize(const std::vector<ProcessingOutcome>& outcomes);

}  // namespace bilicache::pipeline

#endif  // BILICACHE_TYPES_HPP
