// ==============================================================================
// bilicache/events.hpp - События прогона
// ==============================================================================
//
// Ядро не пишет в консоль: оно отправляет события в EventSink.
// Представление (консоль, тесты) подключается реализацией EventSink.
//
// Порядок событий одного прогона:
//   RunStarted
//   DiscoverySkipped*  DiscoveryFinished
//   NothingFound | (ItemStarted [ItemLoaded] ItemFinished)+
//   RunFinished
//
// ==============================================================================

#ifndef BILICACHE_EVENTS_HPP
#define BILICACHE_EVENTS_HPP

#include "bilicache/discovery.hpp"
#include "bilicache/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <variant>
#include <vector>

namespace bilicache::pipeline {

// ----------------------------------------------------------------------------
// События
// ----------------------------------------------------------------------------

struct RunStarted {
    RunOptions options;
};

/// Поддерево, которое не удалось обойти
struct DiscoverySkipped {
    io::DiscoverySkip skip;
};

struct DiscoveryFinished {
    std::filesystem::path root;
    std::vector<io::DiscoveredEntry> entries;
    std::size_t skipped_count = 0;
};

/// Ни одного entry.json не найдено
struct NothingFound {
    std::filesystem::path root;
};

/// Перед обработкой элемента; index начинается с 1
struct ItemStarted {
    std::size_t index = 0;
    std::size_t total = 0;
    io::DiscoveredEntry entry;
};

/// Файл прочитан
struct ItemLoaded {
    std::size_t index = 0;
    std::size_t total = 0;
    std::uintmax_t size_bytes = 0;
    std::filesystem::file_time_type last_modified;
    std::filesystem::path relative_dir;
    std::size_t content_length = 0;
};

struct ItemFinished {
    std::size_t index = 0;
    std::size_t total = 0;
    ProcessingOutcome outcome;
};

struct RunFinished {
    RunSummary summary;
};

using Event = std::variant<RunStarted, DiscoverySkipped, DiscoveryFinished, NothingFound,
                           ItemStarted, ItemLoaded, ItemFinished, RunFinished>;

// ----------------------------------------------------------------------------
// EventSink - получатель событий
// ----------------------------------------------------------------------------

class EventSink {
public:
    virtual ~EventSink() = default;

    virtual void on_event(const Event& event) = 0;
};

}  // namespace bilicache::pipeline

#endif  // BILICACHE_EVENTS_HPP
