// ==============================================================================
// bilicache/app.hpp - Выполнение командной строки
// ==============================================================================
//
// Назначение:
// - argv -> ParseResult -> команда -> exit code
// - Маршрутизация вывода: прогресс, JSON отчёт, файл --report
//
// main() оставляет себе только границу исключений.
//
// ==============================================================================

#ifndef BILICACHE_APP_HPP
#define BILICACHE_APP_HPP

#include "bilicache/output.hpp"

namespace bilicache::app {

/// Выполнить командную строку
///
/// @return 0 - прогон завершён (включая сбои отдельных файлов и пустой поиск);
///         1 - ошибка аргументов, корня ввода или файла отчёта
/// @throws std::exception из нижних слоёв (ловится в main)
int run_cli(int argc, char** argv, output::Sinks sinks = {});

}  // namespace bilicache::app

#endif  // BILICACHE_APP_HPP
