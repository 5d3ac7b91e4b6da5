// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv
// 2. Создание Writer
// 3. Dispatch команды
// 4. Возврат exit code
//
// Исключения перехватываются на границе main и печатаются как "[x] ...".
//
// ==============================================================================

#include "epcheck/analyzer.hpp"
#include "epcheck/cli.hpp"
#include "epcheck/endpoint.hpp"
#include "epcheck/openapi.hpp"
#include "epcheck/output.hpp"
#include "epcheck/platform.hpp"
#include "epcheck/report.hpp"

#include <ctime>
#include <exception>
#include <iostream>
#include <type_traits>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// check
// ----------------------------------------------------------------------------

int run_check(const epcheck::cli::CheckCommand& cmd, epcheck::output::Writer& writer) {
    using namespace epcheck;

    // 1. Спецификация: URL, явный файл или найденный вверх по дереву каталогов
    std::filesystem::path spec_path;
    std::string spec_location;
    bool remote = false;
    if (cmd.spec.has_value()) {
        spec_path = *cmd.spec;
        spec_location = platform::path_to_utf8(spec_path);
        remote = spec::is_spec_url(spec_location);
    } else {
        auto found = spec::find_spec(std::filesystem::current_path());
        if (!found) {
            writer.error(
                "No OpenAPI spec provided and none found in current or parent directories");
            return 1;
        }
        spec_path = *found;
        spec_location = platform::path_to_utf8(spec_path);
        writer.info("Using specification: " + spec_location);
    }

    if (remote) {
        writer.info("Fetching specification from " + spec_location);
    }
    spec::LoadResult loaded =
        remote ? spec::load_spec_url(spec_location) : spec::load_spec(spec_path);
    if (!loaded.ok) {
        writer.error(loaded.error.format());
        return 1;
    }

    std::vector<model::Endpoint> endpoints = model::extract_endpoints(loaded.spec.paths);
    std::string title = loaded.spec.title.value_or("untitled");
    if (loaded.spec.version.has_value()) {
        title += " " + *loaded.spec.version;
    }
    writer.info("Loaded " + std::to_string(endpoints.size()) + " endpoints from " + title);

    // 2. Анализатор
    auto builder = analysis::AnalyzerBuilder::create();
    builder.endpoints(endpoints)
        .root(cmd.dir)
        .excludes(cmd.excludes)
        .unused_only(cmd.unused_only)
        .num_threads(cmd.num_threads)
        .use_ignore_files(!cmd.no_ignore)
        .writer(&writer);
    if (!remote) {
        builder.exclude_file(spec_path);
    }
    if (cmd.pattern.has_value()) {
        builder.pattern(*cmd.pattern);
    }
    if (cmd.max_file_size.has_value()) {
        builder.max_file_size(*cmd.max_file_size);
    }

    auto build = builder.build();
    if (!build.ok) {
        writer.error(build.error);
        return 1;
    }

    writer.info("Searching for endpoint usage in '" + platform::path_to_utf8(cmd.dir) + "'...");

    analysis::AnalysisResult analysis = build.analyzer->run();
    if (!analysis.ok) {
        writer.error(analysis.error);
        return 1;
    }

    writer.info("Scanned " + std::to_string(analysis.summary.total_files_scanned) + " files in " +
                std::to_string(analysis.summary.elapsed.count()) + " ms");

    // 3. Отчёт
    output::ReportContext ctx;
    ctx.api_spec = spec_location;
    ctx.search_dir = platform::path_to_utf8(cmd.dir);
    ctx.excludes = cmd.excludes;
    ctx.unused_only = cmd.unused_only;
    ctx.pattern = cmd.pattern;
    ctx.truncate = cmd.truncate;
    ctx.generated = output::format_timestamp_utc(std::time(nullptr));

    output::write_report(writer, cmd.format, analysis.summary, ctx);

    if (writer.has_output_file()) {
        writer.info("Report saved to " + platform::path_to_utf8(*cmd.output));
    }
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace epcheck;

    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    out_cfg.no_colors = parse_result.global.no_colors;
    if (parse_result.ok) {
        if (const auto* check = std::get_if<cli::CheckCommand>(&parse_result.command)) {
            out_cfg.format = check->format;
            out_cfg.output_path = check->output;
        }
    }
    output::Writer writer(out_cfg);

    // Ошибки парсинга идут без префикса [x], напрямую в stderr
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    if (out_cfg.output_path.has_value() && !writer.has_output_file()) {
        writer.error("failed to open output file '" +
                     platform::path_to_utf8(*out_cfg.output_path) + "'");
        return 1;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else {
                return run_check(cmd, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
