// ==============================================================================
// report.cpp - Отчёт об использовании эндпоинтов
// ==============================================================================

#include "epcheck/report.hpp"

#include "epcheck/platform.hpp"

#include <cstdio>
#include <rapidjson/document.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>

namespace epcheck::output {

namespace {

constexpr size_t RULE_WIDTH = 80;

constexpr const char* STATUS_USED = "\xe2\x9c\x93 USED";      // ✓ USED
constexpr const char* STATUS_UNUSED = "\xe2\x9c\x97 UNUSED";  // ✗ UNUSED

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string result;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            result += sep;
        }
        result += items[i];
    }
    return result;
}

rapidjson::Value json_string(const std::string& s, rapidjson::Document::AllocatorType& alloc) {
    rapidjson::Value v;
    v.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
    return v;
}

void build_json_report(rapidjson::Document& doc, const analysis::AnalysisSummary& summary,
                       const ReportContext& ctx) {
    auto& alloc = doc.GetAllocator();
    doc.SetObject();

    rapidjson::Value report(rapidjson::kObjectType);
    report.AddMember("generated", json_string(ctx.generated, alloc), alloc);
    report.AddMember("api_spec", json_string(ctx.api_spec, alloc), alloc);
    report.AddMember("search_dir", json_string(ctx.search_dir, alloc), alloc);
    report.AddMember("files_scanned", static_cast<uint64_t>(summary.total_files_scanned), alloc);
    report.AddMember("files_read", static_cast<uint64_t>(summary.files_read), alloc);
    report.AddMember("files_skipped", static_cast<uint64_t>(summary.files_skipped), alloc);
    report.AddMember("scan_time_ms", static_cast<int64_t>(summary.elapsed.count()), alloc);

    rapidjson::Value endpoints(rapidjson::kArrayType);
    for (const auto& result : summary.results) {
        rapidjson::Value item(rapidjson::kObjectType);
        item.AddMember("endpoint", json_string(result.endpoint.path, alloc), alloc);
        item.AddMember("method",
                       rapidjson::StringRef(model::http_method_to_string(result.endpoint.method)),
                       alloc);
        item.AddMember("status", rapidjson::StringRef(analysis::usage_status_to_string(result.status)),
                       alloc);
        item.AddMember("usage_count", static_cast<uint64_t>(result.usage_count), alloc);

        rapidjson::Value files(rapidjson::kArrayType);
        for (const auto& file : result.files) {
            files.PushBack(json_string(file, alloc), alloc);
        }
        item.AddMember("files", files, alloc);

        endpoints.PushBack(item, alloc);
    }

    doc.AddMember("report", report, alloc);
    doc.AddMember("endpoints", endpoints, alloc);
}

}  // namespace

// ----------------------------------------------------------------------------
// Форматирование
// ----------------------------------------------------------------------------

std::string format_timestamp_utc(std::time_t t) {
    std::tm tm = platform::utc_time(t);
    char buffer[32];
    size_t n = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return std::string(buffer, n);
}

std::string format_coverage(size_t used, size_t total) {
    if (total == 0) {
        return "0.0";
    }
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%.1f",
                  static_cast<double>(used) / static_cast<double>(total) * 100.0);
    return buffer;
}

std::string format_file_list(const std::vector<std::string>& files, bool truncate) {
    if (files.empty()) {
        return "-";
    }
    if (truncate && files.size() > TRUNCATE_FILES_LIMIT) {
        return std::to_string(files.size()) + " files (truncated)";
    }
    return join(files, ", ");
}

// ----------------------------------------------------------------------------
// Таблица
// ----------------------------------------------------------------------------

std::string render_table(const analysis::AnalysisSummary& summary, const ReportContext& ctx) {
    const std::string rule(RULE_WIDTH, '=');
    std::string out;

    // Заголовок
    out += '\n';
    out += rule + '\n';
    out += "OpenAPI Endpoint Usage Report\n";
    if (!ctx.generated.empty()) {
        out += "Generated on " + ctx.generated + '\n';
    }
    out += "API Spec: " + ctx.api_spec + '\n';
    out += "Search Dir: " + ctx.search_dir + '\n';
    if (!ctx.excludes.empty()) {
        out += "Excluding: " + join(ctx.excludes, ", ") + '\n';
    }
    if (ctx.truncate) {
        out += "Mode: Truncated file lists\n";
    } else {
        out += "Mode: Full file lists (use --truncate to limit)\n";
    }
    if (ctx.unused_only) {
        out += "Filter: Unused endpoints only\n";
    }
    if (ctx.pattern.has_value()) {
        out += "Pattern: " + *ctx.pattern + '\n';
    }
    out += rule + '\n';

    // Таблица
    size_t used = 0;
    size_t file_refs = 0;

    Table table;
    table.set_headers({"Endpoint", "Method", "Status", "Count", "Files"});
    for (const auto& result : summary.results) {
        bool is_used = result.status == analysis::UsageStatus::Used;
        if (is_used) {
            ++used;
        }
        file_refs += result.usage_count;

        table.add_row({result.endpoint.path, model::http_method_to_string(result.endpoint.method),
                       is_used ? STATUS_USED : STATUS_UNUSED, std::to_string(result.usage_count),
                       format_file_list(result.files, ctx.truncate)});
    }
    out += '\n';
    out += table.to_string();

    // Сводка
    size_t total = summary.results.size();
    out += "\nSummary:\n";
    out += "  Total endpoints: " + std::to_string(total) + '\n';
    out += "  Used: " + std::to_string(used) + '\n';
    out += "  Unused: " + std::to_string(total - used) + '\n';
    if (total > 0) {
        out += "  Coverage: " + format_coverage(used, total) + "%\n";
    }
    out += "  Total file references: " + std::to_string(file_refs) + '\n';
    out += "  Files scanned: " + std::to_string(summary.total_files_scanned);
    if (summary.files_skipped > 0) {
        out += " (" + std::to_string(summary.files_skipped) + " skipped)";
    }
    out += '\n';
    out += "  Scan time: " + std::to_string(summary.elapsed.count()) + " ms\n";

    // Детализация для эндпоинтов с 2+ файлами
    out += "\nDetailed File References (for endpoints with 2+ usages):\n";
    bool any_multi = false;
    for (const auto& result : summary.results) {
        if (result.usage_count < 2) {
            continue;
        }
        any_multi = true;
        out += "  " + result.endpoint.to_string() + ": " + std::to_string(result.usage_count) +
               " files\n";
        for (const auto& file : result.files) {
            out += "    - " + file + '\n';
        }
    }
    if (!any_multi) {
        out += ctx.unused_only ? "  No unused endpoints have multiple file references.\n"
                               : "  No endpoints with 2 or more file references found.\n";
    }

    return out;
}

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

std::string render_json(const analysis::AnalysisSummary& summary, const ReportContext& ctx) {
    rapidjson::Document doc;
    build_json_report(doc, summary, ctx);

    rapidjson::StringBuffer buffer;
    rapidjson::PrettyWriter<rapidjson::StringBuffer> writer(buffer);
    writer.SetIndent(' ', 2);
    doc.Accept(writer);

    std::string result(buffer.GetString(), buffer.GetSize());
    result += '\n';
    return result;
}

void write_report(Writer& w, Format format, const analysis::AnalysisSummary& summary,
                  const ReportContext& ctx) {
    if (format == Format::Json) {
        w.write(Stream::Stdout, render_json(summary, ctx));
    } else {
        w.write(Stream::Stdout, render_table(summary, ctx));
    }
    w.flush();
}

}  // namespace epcheck::output
