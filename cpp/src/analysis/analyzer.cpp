// ==============================================================================
// analyzer.cpp - Агрегация и конвейер анализа
// ==============================================================================

#include "epcheck/analyzer.hpp"

#include "epcheck/discovery.hpp"
#include "epcheck/output.hpp"
#include "epcheck/platform.hpp"

#include <algorithm>
#include <set>
#include <stdexcept>
#include <unordered_map>

namespace epcheck::analysis {

const char* usage_status_to_string(UsageStatus status) {
    return status == UsageStatus::Used ? "used" : "unused";
}

// ----------------------------------------------------------------------------
// Агрегация
// ----------------------------------------------------------------------------

std::vector<EndpointResult> aggregate(const std::vector<model::Endpoint>& endpoints,
                                      const std::vector<scan::FileUsage>& records) {
    std::vector<EndpointResult> results;
    std::vector<std::set<std::string>> file_sets;
    std::unordered_map<model::Endpoint, size_t, model::Endpoint::Hash> index;

    for (const auto& endpoint : endpoints) {
        if (index.emplace(endpoint, results.size()).second) {
            EndpointResult result;
            result.endpoint = endpoint;
            results.push_back(std::move(result));
            file_sets.emplace_back();
        }
    }

    for (const auto& record : records) {
        for (const auto& hit : record.matches) {
            if (hit.count == 0) {
                continue;
            }
            auto it = index.find(hit.endpoint);
            if (it == index.end()) {
                continue;
            }
            results[it->second].total_matches += hit.count;
            file_sets[it->second].insert(record.path);
        }
    }

    for (size_t i = 0; i < results.size(); ++i) {
        auto& result = results[i];
        result.files.assign(file_sets[i].begin(), file_sets[i].end());
        result.usage_count = result.files.size();
        result.status = result.files.empty() ? UsageStatus::Unused : UsageStatus::Used;
    }

    return results;
}

// ----------------------------------------------------------------------------
// Фильтрация и сортировка
// ----------------------------------------------------------------------------

bool ResultFilter::matches(const EndpointResult& result) const {
    if (unused_only && result.status != UsageStatus::Unused) {
        return false;
    }
    if (pattern.has_value() && !std::regex_search(result.endpoint.to_string(), *pattern)) {
        return false;
    }
    return true;
}

FilterResult make_filter(bool unused_only, const std::optional<std::string>& pattern) {
    FilterResult result;
    result.filter.unused_only = unused_only;

    if (pattern.has_value()) {
        try {
            result.filter.pattern.emplace(*pattern, std::regex::ECMAScript);
            result.filter.pattern_source = *pattern;
        } catch (const std::regex_error& e) {
            result.error = "invalid filter pattern '" + *pattern + "': " + e.what();
            return result;
        }
    }

    result.ok = true;
    return result;
}

std::vector<EndpointResult> apply_filter(std::vector<EndpointResult> results,
                                         const ResultFilter& filter) {
    results.erase(std::remove_if(results.begin(), results.end(),
                                 [&](const EndpointResult& r) { return !filter.matches(r); }),
                  results.end());
    return results;
}

void sort_results(std::vector<EndpointResult>& results) {
    std::stable_sort(results.begin(), results.end(),
                     [](const EndpointResult& a, const EndpointResult& b) {
                         return a.endpoint < b.endpoint;
                     });
}

// ----------------------------------------------------------------------------
// AnalyzerBuilder
// ----------------------------------------------------------------------------

AnalyzerBuilder AnalyzerBuilder::create() {
    return AnalyzerBuilder();
}

AnalyzerBuilder& AnalyzerBuilder::endpoints(std::vector<model::Endpoint> endpoints) {
    endpoints_ = std::move(endpoints);
    return *this;
}

AnalyzerBuilder& AnalyzerBuilder::root(std::filesystem::path root) {
    root_ = std::move(root);
    return *this;
}

AnalyzerBuilder& AnalyzerBuilder::excludes(std::vector<std::string> patterns) {
    excludes_ = std::move(patterns);
    return *this;
}

AnalyzerBuilder& AnalyzerBuilder::exclude_file(std::filesystem::path file) {
    excluded_files_.push_back(std::move(file));
    return *this;
}

AnalyzerBuilder& AnalyzerBuilder::unused_only(bool only) {
    unused_only_ = only;
    return *this;
}

AnalyzerBuilder& AnalyzerBuilder::pattern(std::string regex) {
    pattern_ = std::move(regex);
    return *this;
}

AnalyzerBuilder& AnalyzerBuilder::num_threads(unsigned int threads) {
    num_threads_ = threads;
    return *this;
}

AnalyzerBuilder& AnalyzerBuilder::max_file_size(std::uint64_t bytes) {
    max_file_size_ = bytes;
    return *this;
}

AnalyzerBuilder& AnalyzerBuilder::use_ignore_files(bool use) {
    use_ignore_files_ = use;
    return *this;
}

AnalyzerBuilder& AnalyzerBuilder::use_global_ignore(bool use) {
    use_global_ignore_ = use;
    return *this;
}

AnalyzerBuilder& AnalyzerBuilder::writer(output::Writer* writer) {
    writer_ = writer;
    return *this;
}

AnalyzerBuilder::BuildResult AnalyzerBuilder::build() {
    BuildResult result;
    result.ok = false;

    // Невалидный фильтр - ошибка до начала сканирования
    FilterResult filter = make_filter(unused_only_, pattern_);
    if (!filter.ok) {
        result.error = filter.error;
        return result;
    }

    auto analyzer = std::unique_ptr<Analyzer>(new Analyzer());
    analyzer->endpoints_ = endpoints_;
    analyzer->root_ = root_.empty() ? std::filesystem::path(".") : root_;
    analyzer->excludes_ = excludes_;
    analyzer->excluded_files_ = excluded_files_;
    analyzer->filter_ = std::move(filter.filter);
    analyzer->num_threads_ = num_threads_;
    analyzer->max_file_size_ = max_file_size_;
    analyzer->use_ignore_files_ = use_ignore_files_;
    analyzer->use_global_ignore_ = use_global_ignore_;
    analyzer->writer_ = writer_;

    result.analyzer = std::move(analyzer);
    result.ok = true;
    return result;
}

// ----------------------------------------------------------------------------
// Analyzer
// ----------------------------------------------------------------------------

AnalysisResult Analyzer::run() const {
    AnalysisResult result;
    const auto start = std::chrono::steady_clock::now();

    // 1. Паттерны
    pattern::PatternTable table = pattern::compile(endpoints_);
    result.summary.patterns_compiled = table.size();
    result.summary.compile_failures = table.failures();
    if (writer_ != nullptr) {
        for (const auto& failure : table.failures()) {
            writer_->warn(failure.format());
        }
        writer_->debug("compiled " + std::to_string(table.size()) + " patterns for " +
                       std::to_string(endpoints_.size()) + " endpoints");
    }

    // 2. Обход
    io::DiscoveryOptions discovery;
    discovery.use_vcs_ignore = use_ignore_files_;
    discovery.use_global_ignore = use_ignore_files_ && use_global_ignore_;
    discovery.excludes = excludes_;
    discovery.excluded_files = excluded_files_;
    discovery.log = writer_;

    std::vector<std::filesystem::path> files;
    try {
        files = io::discover_files(root_, discovery);
    } catch (const std::runtime_error& e) {
        result.error = e.what();
        return result;
    }
    result.summary.total_files_scanned = files.size();
    if (writer_ != nullptr) {
        writer_->debug("found " + std::to_string(files.size()) + " candidate files in '" +
                       platform::path_to_utf8(root_) + "'");
    }

    // 3. Сканирование
    scan::ScanOptions scan_options;
    scan_options.num_threads = num_threads_;
    scan_options.max_file_size = max_file_size_;
    scan_options.root = root_;
    scan_options.log = writer_;

    scan::ContentScanner scanner(table, scan_options);
    std::vector<scan::FileUsage> records = scanner.scan_files(files);
    result.summary.files_read = scanner.stats().files_read;
    result.summary.files_skipped = scanner.stats().files_skipped;
    if (writer_ != nullptr) {
        writer_->debug("scanned " + std::to_string(files.size()) + " files with " +
                       std::to_string(scanner.stats().threads_used) + " threads");
    }

    // 4. Агрегация, фильтр, сортировка
    std::vector<EndpointResult> results = aggregate(endpoints_, records);
    results = apply_filter(std::move(results), filter_);
    sort_results(results);

    result.summary.results = std::move(results);
    result.summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    result.ok = true;
    return result;
}

}  // namespace epcheck::analysis
