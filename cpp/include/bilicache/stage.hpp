// ==============================================================================
// bilicache/stage.hpp - Стадии обработки entry.json
// ==============================================================================
//
// Точка расширения конвейера. Стадия получает снимок файла и параметры
// прогона и возвращает StageResult. Декодирование кэша Bilibili (выгрузка
// медиа в output_root) подключается сюда новой реализацией Stage.
//
// ==============================================================================

#ifndef BILICACHE_STAGE_HPP
#define BILICACHE_STAGE_HPP

#include "bilicache/context.hpp"
#include "bilicache/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace bilicache::pipeline {

// ----------------------------------------------------------------------------
// StageResult
// ----------------------------------------------------------------------------

struct StageResult {
    bool ok = true;
    std::string message;

    static StageResult success() { return StageResult{true, {}}; }
    static StageResult failure(std::string message) { return StageResult{false, std::move(message)}; }

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// Stage - интерфейс стадии
// ----------------------------------------------------------------------------

class Stage {
public:
    virtual ~Stage() = default;

    /// Короткое имя для сообщений об ошибках ("content", "json")
    virtual std::string_view name() const = 0;

    /// Обработать один файл
    /// Исключения std::exception конвейер превращает в неуспешный исход
    virtual StageResult process(const io::FileContext& ctx, const RunOptions& options) = 0;

protected:
    Stage() = default;
};

// ----------------------------------------------------------------------------
// Встроенные стадии
// ----------------------------------------------------------------------------

/// Отклоняет пустые файлы
class NonEmptyContentStage final : public Stage {
public:
    std::string_view name() const override { return "content"; }
    StageResult process(const io::FileContext& ctx, const RunOptions& options) override;
};

/// Проверяет, что содержимое - синтаксически корректный JSON (RapidJSON).
/// Схема entry.json на этом уровне не проверяется.
class JsonSyntaxStage final : public Stage {
public:
    std::string_view name() const override { return "json"; }
    StageResult process(const io::FileContext& ctx, const RunOptions& options) override;
};

/// Стадии по умолчанию: content, затем json
std::vector<std::unique_ptr<Stage>> make_default_stages();

}  // namespace bilicache::pipeline

#endif  // BILICACHE_STAGE_HPP
