// ==============================================================================
// epcheck/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv (формат сообщений об ошибках как у clap)
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// Подкоманда "check" необязательна: "epcheck -s api.yaml" и
// "epcheck check -s api.yaml" эквивалентны.
//
// ==============================================================================

#ifndef EPCHECK_CLI_HPP
#define EPCHECK_CLI_HPP

#include <epcheck/output.hpp>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace epcheck::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;         // -v (repeatable)
    bool quiet = false;      // -q, --quiet
    bool no_colors = false;  // --no-colors
};

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// check - анализ использования эндпоинтов
struct CheckCommand {
    std::optional<std::filesystem::path> spec;       // -s, --spec
    std::filesystem::path dir = ".";                 // -d, --dir
    output::Format format = output::Format::Table;   // -f, --format
    std::optional<std::string> pattern;              // -p, --pattern
    bool unused_only = false;                        // --unused-only
    std::vector<std::string> excludes;               // -e, --exclude (repeatable)
    unsigned int num_threads = 0;                    // --num-threads (0 = CPU count)
    std::optional<std::uint64_t> max_file_size;      // --max-file-size
    bool no_ignore = false;                          // --no-ignore
    bool truncate = false;                           // --truncate
    std::optional<std::filesystem::path> output;     // -o, --output
};

/// help - показать справку
struct HelpCommand {};

/// version - показать версию
struct VersionCommand {};

using Command = std::variant<CheckCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

// ----------------------------------------------------------------------------
// API парсинга
// ----------------------------------------------------------------------------

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Генерировать текст --help
std::string render_help();

/// Генерировать текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

/// Версия программы
constexpr const char* VERSION = "0.1.0";

/// Описание программы
constexpr const char* ABOUT = "Fast OpenAPI endpoint usage checker";

}  // namespace epcheck::cli

#endif  // EPCHECK_CLI_HPP
