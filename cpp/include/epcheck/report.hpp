// ==============================================================================
// epcheck/report.hpp - Отчёт об использовании эндпоинтов
// ==============================================================================
//
// Назначение:
// - Табличный отчёт: заголовок, таблица, сводка, детализация
// - JSON отчёт: {"report": {...}, "endpoints": [...]}
//
// Рендеринг чистый (строка на выходе); запись идёт через Writer.
//
// ==============================================================================

#ifndef EPCHECK_REPORT_HPP
#define EPCHECK_REPORT_HPP

#include <epcheck/analyzer.hpp>
#include <epcheck/output.hpp>
#include <ctime>
#include <optional>
#include <string>
#include <vector>

namespace epcheck::output {

/// Параметры запуска, отображаемые в отчёте
struct ReportContext {
    std::string api_spec;    // путь к спецификации как задан
    std::string search_dir;  // каталог поиска как задан
    std::vector<std::string> excludes;
    bool unused_only = false;
    std::optional<std::string> pattern;
    bool truncate = false;  // --truncate: длинные списки файлов сокращаются
    std::string generated;  // метка времени генерации (ISO 8601 UTC)
};

/// Списки длиннее этого значения сокращаются при --truncate
constexpr size_t TRUNCATE_FILES_LIMIT = 3;

/// Метка времени "YYYY-MM-DDTHH:MM:SSZ"
std::string format_timestamp_utc(std::time_t t);

/// Покрытие в процентах с одним знаком: "66.7"
std::string format_coverage(size_t used, size_t total);

/// Текст ячейки Files: "-", "a.ts, b.ts" или "5 files (truncated)"
std::string format_file_list(const std::vector<std::string>& files, bool truncate);

/// Отрендерить табличный отчёт
std::string render_table(const analysis::AnalysisSummary& summary, const ReportContext& ctx);

/// Отрендерить JSON отчёт (pretty, отступ 2 пробела, с завершающим \n)
std::string render_json(const analysis::AnalysisSummary& summary, const ReportContext& ctx);

/// Записать отчёт в выбранном формате в stdout (или в файл --output)
void write_report(Writer& w, Format format, const analysis::AnalysisSummary& summary,
                  const ReportContext& ctx);

}  // namespace epcheck::output

#endif  // EPCHECK_REPORT_HPP
