// ==============================================================================
// pipeline.cpp - Конвейер обработки
// ==============================================================================

#include "bilicache/pipeline.hpp"

#include "bilicache/context.hpp"

#include <exception>
#include <utility>

namespace bilicache::pipeline {

// ----------------------------------------------------------------------------
// summarize
// ----------------------------------------------------------------------------

RunSummary summarize(const std::vector<ProcessingOutcome>& outcomes) {
    RunSummary summary;
    summary.total_discovered = outcomes.size();
    for (const auto& outcome : outcomes) {
        if (outcome.succeeded) {
            ++summary.total_succeeded;
        } else {
            ++summary.total_failed;
        }
    }
    return summary;
}

// ----------------------------------------------------------------------------
// Pipeline
// ----------------------------------------------------------------------------

Pipeline::Pipeline(std::vector<std::unique_ptr<Stage>> stages) : stages_(std::move(stages)) {}

Pipeline& Pipeline::add_stage(std::unique_ptr<Stage> stage) {
    if (stage) {
        stages_.push_back(std::move(stage));
    }
    return *this;
}

RunReport Pipeline::run(const std::vector<io::DiscoveredEntry>& entries, const RunOptions& options,
                        EventSink& sink) {
    RunReport report;

    if (entries.empty()) {
        sink.on_event(NothingFound{options.input_root});
        sink.on_event(RunFinished{report.summary});
        return report;
    }

    const std::size_t total = entries.size();
    report.outcomes.reserve(total);

    for (std::size_t i = 0; i < total; ++i) {
        const std::size_t index = i + 1;
        sink.on_event(ItemStarted{index, total, entries[i]});

        ProcessingOutcome outcome = process_item(index, total, entries[i], options, sink);

        sink.on_event(ItemFinished{index, total, outcome});
        report.outcomes.push_back(std::move(outcome));
    }

    report.summary = summarize(report.outcomes);
    sink.on_event(RunFinished{report.summary});
    return report;
}

ProcessingOutcome Pipeline::process_item(std::size_t index, std::size_t total,
                                         const io::DiscoveredEntry& entry,
                                         const RunOptions& options, EventSink& sink) {
    ProcessingOutcome outcome;
    outcome.entry = entry;

    // FileContext живёт только внутри этой функции
    io::ReadResult read = io::read_context(entry);
    if (!read.ok) {
        outcome.succeeded = false;
        outcome.error_message = read.error.format();
        return outcome;
    }
    const io::FileContext& ctx = *read.context;

    sink.on_event(ItemLoaded{index, total, ctx.size_bytes, ctx.last_modified, ctx.relative_dir,
                             ctx.content.size()});

    for (const auto& stage : stages_) {
        StageResult result;
        try {
            result = stage->process(ctx, options);
        } catch (const std::exception& e) {
            result = StageResult::failure(e.what());
        }

        if (!result.ok) {
            outcome.succeeded = false;
            outcome.error_message = std::string(stage->name()) + ": " + result.message;
            return outcome;
        }
    }

    outcome.succeeded = true;
    return outcome;
}

}  // namespace bilicache::pipeline
