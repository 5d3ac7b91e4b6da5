// ==============================================================================
// epcheck/analyzer.hpp - Агрегация и конвейер анализа
// ==============================================================================
//
// Назначение:
// - aggregate(): записи FileUsage -> результат по каждому эндпоинту
// - ResultFilter: --unused-only и --pattern (regex по "METHOD path")
// - sort_results(): путь, затем метод
// - AnalyzerBuilder / Analyzer: полный прогон
//   (паттерны -> обход -> сканирование -> агрегация -> фильтр -> сортировка)
//
// usage_count - число РАЗНЫХ файлов с совпадениями, а не число совпадений.
// Сумма совпадений хранится отдельно (total_matches) и завышена, когда
// несколько вариантов паттерна срабатывают на один и тот же вызов.
//
// ==============================================================================

#ifndef EPCHECK_ANALYZER_HPP
#define EPCHECK_ANALYZER_HPP

#include <epcheck/endpoint.hpp>
#include <epcheck/pattern.hpp>
#include <epcheck/scanner.hpp>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace epcheck::output {
class Writer;
}

namespace epcheck::analysis {

// ============================================================================
// Результаты
// ============================================================================

enum class UsageStatus { Used, Unused };

/// "used" / "unused"
const char* usage_status_to_string(UsageStatus status);

struct EndpointResult {
    model::Endpoint endpoint;
    UsageStatus status = UsageStatus::Unused;
    std::size_t usage_count = 0;    // число разных файлов
    std::size_t total_matches = 0;  // сумма совпадений по всем файлам
    std::vector<std::string> files; // по возрастанию, без повторов
};

struct AnalysisSummary {
    std::vector<EndpointResult> results;
    std::size_t total_files_scanned = 0;  // найдено обходом
    std::size_t files_read = 0;
    std::size_t files_skipped = 0;
    std::size_t patterns_compiled = 0;
    std::vector<pattern::CompileFailure> compile_failures;
    std::chrono::milliseconds elapsed{0};
};

// ============================================================================
// Агрегация
// ============================================================================

/// Свести записи сканера в результат по каждому эндпоинту
///
/// Результат содержит ровно один элемент на каждый различный Endpoint
/// из endpoints, в порядке первого появления. Не зависит от порядка records.
std::vector<EndpointResult> aggregate(const std::vector<model::Endpoint>& endpoints,
                                      const std::vector<scan::FileUsage>& records);

// ============================================================================
// Фильтрация и сортировка
// ============================================================================

struct ResultFilter {
    bool unused_only = false;
    std::optional<std::regex> pattern;
    std::string pattern_source;

    /// Проходит ли результат фильтр
    bool matches(const EndpointResult& result) const;
};

struct FilterResult {
    bool ok = false;
    ResultFilter filter;
    std::string error;
};

/// Собрать фильтр; ошибка если pattern не компилируется
FilterResult make_filter(bool unused_only, const std::optional<std::string>& pattern);

/// Оставить только результаты, прошедшие фильтр
std::vector<EndpointResult> apply_filter(std::vector<EndpointResult> results,
                                         const ResultFilter& filter);

/// Сортировка по (path, method) - см. Endpoint::operator<
void sort_results(std::vector<EndpointResult>& results);

// ============================================================================
// AnalyzerBuilder
// ============================================================================

class Analyzer;

/// Builder для создания Analyzer
///
/// Использование:
/// @code
///   auto built = AnalyzerBuilder::create()
///       .endpoints(model::extract_endpoints(spec.paths))
///       .root("./src")
///       .excludes({"node_modules", "*.min.js"})
///       .pattern("^GET ")
///       .build();
///   if (built.ok) {
///       auto result = built.analyzer->run();
///   }
/// @endcode
class AnalyzerBuilder {
public:
    static AnalyzerBuilder create();

    AnalyzerBuilder& endpoints(std::vector<model::Endpoint> endpoints);

    /// Корень обхода (по умолчанию ".")
    AnalyzerBuilder& root(std::filesystem::path root);

    /// Исключения в синтаксисе gitignore
    AnalyzerBuilder& excludes(std::vector<std::string> patterns);

    /// Исключить конкретный файл (файл спецификации)
    AnalyzerBuilder& exclude_file(std::filesystem::path file);

    AnalyzerBuilder& unused_only(bool only);

    /// Regex по "METHOD path"
    AnalyzerBuilder& pattern(std::string regex);

    /// 0 - по числу аппаратных потоков
    AnalyzerBuilder& num_threads(unsigned int threads);

    AnalyzerBuilder& max_file_size(std::uint64_t bytes);

    /// Учитывать .gitignore/.ignore/.git/info/exclude
    AnalyzerBuilder& use_ignore_files(bool use);

    /// Учитывать глобальный git ignore
    AnalyzerBuilder& use_global_ignore(bool use);

    /// Куда писать журнал (nullptr - молча)
    AnalyzerBuilder& writer(output::Writer* writer);

    /// Собрать Analyzer
    /// Ошибка если фильтр --pattern не компилируется
    struct BuildResult {
        bool ok = false;
        std::unique_ptr<Analyzer> analyzer;
        std::string error;
    };
    BuildResult build();

private:
    AnalyzerBuilder() = default;

    std::vector<model::Endpoint> endpoints_;
    std::filesystem::path root_ = ".";
    std::vector<std::string> excludes_;
    std::vector<std::filesystem::path> excluded_files_;
    bool unused_only_ = false;
    std::optional<std::string> pattern_;
    unsigned int num_threads_ = 0;
    std::uint64_t max_file_size_ = scan::DEFAULT_MAX_FILE_SIZE;
    bool use_ignore_files_ = true;
    bool use_global_ignore_ = true;
    output::Writer* writer_ = nullptr;
};

// ============================================================================
// Analyzer
// ============================================================================

struct AnalysisResult {
    bool ok = false;
    AnalysisSummary summary;
    std::string error;

    explicit operator bool() const { return ok; }
};

class Analyzer {
public:
    static AnalyzerBuilder builder() { return AnalyzerBuilder::create(); }

    /// Выполнить полный анализ
    /// Ошибка если корень не существует или не является каталогом
    AnalysisResult run() const;

    const std::vector<model::Endpoint>& endpoints() const { return endpoints_; }
    const std::filesystem::path& root() const { return root_; }
    const ResultFilter& filter() const { return filter_; }

private:
    friend class AnalyzerBuilder;

    Analyzer() = default;

    std::vector<model::Endpoint> endpoints_;
    std::filesystem::path root_;
    std::vector<std::string> excludes_;
    std::vector<std::filesystem::path> excluded_files_;
    ResultFilter filter_;
    unsigned int num_threads_ = 0;
    std::uint64_t max_file_size_ = scan::DEFAULT_MAX_FILE_SIZE;
    bool use_ignore_files_ = true;
    bool use_global_ignore_ = true;
    output::Writer* writer_ = nullptr;
};

}  // namespace epcheck::analysis

#endif  // EPCHECK_ANALYZER_HPP
