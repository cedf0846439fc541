// ==============================================================================
// stage.cpp - Встроенные стадии обработки
// ==============================================================================

#include "bilicache/stage.hpp"

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace bilicache::pipeline {

namespace {

// UTF-8 BOM допускается в начале файла
constexpr std::string_view UTF8_BOM = "\xEF\xBB\xBF";

}  // namespace

// ----------------------------------------------------------------------------
// NonEmptyContentStage
// ----------------------------------------------------------------------------

StageResult NonEmptyContentStage::process(const io::FileContext& ctx, const RunOptions& options) {
    (void)options;
    if (ctx.content.empty()) {
        return StageResult::failure("entry file is empty");
    }
    return StageResult::success();
}

// ----------------------------------------------------------------------------
// JsonSyntaxStage
// ----------------------------------------------------------------------------

StageResult JsonSyntaxStage::process(const io::FileContext& ctx, const RunOptions& options) {
    (void)options;

    std::string_view text = ctx.content;
    if (text.substr(0, UTF8_BOM.size()) == UTF8_BOM) {
        text.remove_prefix(UTF8_BOM.size());
    }

    rapidjson::Document doc;
    rapidjson::ParseResult ok = doc.Parse(text.data(), text.size());
    if (!ok) {
        return StageResult::failure(std::string(rapidjson::GetParseError_En(ok.Code())) +
                                    " (offset " + std::to_string(ok.Offset()) + ")");
    }
    return StageResult::success();
}

// ----------------------------------------------------------------------------
// make_default_stages
// ----------------------------------------------------------------------------

std::vector<std::unique_ptr<Stage>> make_default_stages() {
    std::vector<std::unique_ptr<Stage>> stages;
    stages.push_back(std::make_unique<NonEmptyContentStage>());
    stages.push_back(std::make_unique<JsonSyntaxStage>());
    return stages;
}

}  // namespace bilicache::pipeline
