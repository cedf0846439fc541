// ==============================================================================
// bilicache/pipeline.hpp - Конвейер обработки
// ==============================================================================
//
// Назначение:
// - Последовательная обработка найденных файлов в порядке обнаружения
// - Изоляция ошибок: сбой одного файла не прерывает остальные
// - Итоги прогона (RunSummary)
//
// В памяти одновременно находится содержимое только одного файла.
//
// ==============================================================================

#ifndef BILICACHE_PIPELINE_HPP
#define BILICACHE_PIPELINE_HPP

#include "bilicache/discovery.hpp"
#include "bilicache/events.hpp"
#include "bilicache/stage.hpp"
#include "bilicache/types.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace bilicache::pipeline {

class Pipeline {
public:
    Pipeline() = default;
    explicit Pipeline(std::vector<std::unique_ptr<Stage>> stages);

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&&) = default;
    Pipeline& operator=(Pipeline&&) = default;

    /// Добавить стадию в конец цепочки
    Pipeline& add_stage(std::unique_ptr<Stage> stage);

    std::size_t stage_count() const { return stages_.size(); }

    /// Обработать entries по одному, строго по порядку
    ///
    /// Для каждого элемента: ItemStarted -> чтение -> ItemLoaded -> стадии ->
    /// ItemFinished. Ошибка чтения или стадии фиксируется в исходе элемента,
    /// обработка продолжается. Пустой список: NothingFound.
    /// В конце всегда RunFinished.
    ///
    /// @return outcomes.size() == entries.size(), порядок совпадает
    RunReport run(const std::vector<io::DiscoveredEntry>& entries, const RunOptions& options,
                  EventSink& sink);

private:
    ProcessingOutcome process_item(std::size_t index, std::size_t total,
                                   const io::DiscoveredEntry& entry, const RunOptions& options,
                                   EventSink& sink);

    std::vector<std::unique_ptr<Stage>> stages_;
};

}  // namespace bilicache::pipeline

#endif  // BILICACHE_PIPELINE_HPP
