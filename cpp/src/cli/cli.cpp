// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Собственный разбор argv без сторонних библиотек. Сообщения об ошибках
// повторяют формат clap: "error: ...", строка Usage и подсказка про --help.
//
// ==============================================================================

#include "epcheck/cli.hpp"

#include "epcheck/platform.hpp"

#include <charconv>
#include <cstring>

namespace epcheck::cli {

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

namespace {

constexpr const char* USAGE = "Usage: epcheck [check] [OPTIONS]";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

/// "-v", "-vv", "-vvv"
bool is_verbose_flag(const char* arg) {
    if (arg[0] != '-' || arg[1] != 'v') {
        return false;
    }
    for (const char* p = arg + 1; *p != '\0'; ++p) {
        if (*p != 'v') {
            return false;
        }
    }
    return true;
}

std::string render_usage_error(const std::string& error_msg) {
    return error_msg + "\n\n" + USAGE + "\n\nFor more information, try '--help'.\n";
}

std::optional<std::uint64_t> parse_unsigned(const char* text) {
    std::uint64_t value = 0;
    const char* end = text + std::strlen(text);
    auto [ptr, ec] = std::from_chars(text, end, value);
    if (ec != std::errc() || ptr != end || text == end) {
        return std::nullopt;
    }
    return value;
}

/// Курсор по argv для опций со значением: "--spec X", "--spec=X", "-s X"
class ArgCursor {
public:
    ArgCursor(int argc, char** argv) : argc_(argc), argv_(argv) {}

    bool done() const { return index_ >= argc_; }
    const char* current() const { return argv_[index_]; }
    void advance() { ++index_; }

    /// Проверить, совпадает ли текущий аргумент с опцией
    /// @param value Значение опции (из "--long=X" или следующего аргумента)
    /// @param missing true если значение не передано
    bool take(const char* short_name, const char* long_name, const char*& value, bool& missing) {
        const char* arg = current();
        missing = false;

        if ((short_name != nullptr && str_eq(arg, short_name)) || str_eq(arg, long_name)) {
            if (index_ + 1 >= argc_) {
                missing = true;
                return true;
            }
            ++index_;
            value = argv_[index_];
            return true;
        }

        size_t long_len = std::strlen(long_name);
        if (std::strncmp(arg, long_name, long_len) == 0 && arg[long_len] == '=') {
            value = arg + long_len + 1;
            return true;
        }
        return false;
    }

private:
    int argc_;
    char** argv_;
    int index_ = 1;
};

std::string missing_value_error(const char* long_name, const char* value_name) {
    return render_usage_error(std::string("error: a value is required for '") + long_name + " <" +
                              value_name + ">' but none was supplied");
}

std::string invalid_value_error(const char* value, const char* long_name, const char* value_name,
                                const char* reason) {
    return render_usage_error(std::string("error: invalid value '") + value + "' for '" +
                              long_name + " <" + value_name + ">': " + reason);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("epcheck ") + VERSION + "\n";
}

std::string render_help() {
    return std::string(ABOUT) +
           "\n"
           "\n"
           "Usage: epcheck [check] [OPTIONS]\n"
           "\n"
           "Commands:\n"
           "  check  Check which specification endpoints are used in a codebase (default)\n"
           "  help   Print this message\n"
           "\n"
           "Options:\n"
           "  -s, --spec <SPEC>              OpenAPI specification file or http(s) URL (JSON or\n"
           "                                 YAML). If not provided, searches for openapi/swagger\n"
           "                                 files in the current and parent directories\n"
           "  -d, --dir <DIR>                Directory to search for endpoint usage [default: .]\n"
           "  -f, --format <FORMAT>          Output format [default: table] [possible values:\n"
           "                                 table, json]\n"
           "  -p, --pattern <PATTERN>        Filter endpoints by regex on \"METHOD path\"\n"
           "      --unused-only              Show only unused endpoints\n"
           "  -e, --exclude <PATTERN>        Exclude paths (gitignore syntax, repeatable)\n"
           "      --num-threads <N>          Worker threads (default: num of CPUs)\n"
           "      --max-file-size <BYTES>    Skip files larger than this [default: 16777216]\n"
           "      --no-ignore                Do not honor .gitignore/.ignore files\n"
           "      --truncate                 Truncate long file lists\n"
           "  -o, --output <OUTPUT>          Save the report to a file\n"
           "      --no-colors                Disable colored output\n"
           "  -v...                          Print verbose output\n"
           "  -q, --quiet                    Suppress informational output\n"
           "  -h, --help                     Print help\n"
           "  -V, --version                  Print version\n"
           "\n"
           "Examples:\n"
           "\n"
           "    Check a spec against the current directory:\n"
           "        epcheck -s openapi.yaml\n"
           "\n"
           "    List unused endpoints under src/ as JSON:\n"
           "        epcheck check -s api.json -d src --unused-only -f json\n"
           "\n"
           "    Only GET endpoints, ignoring generated clients:\n"
           "        epcheck -s api.yaml -p '^GET ' -e 'generated/'\n"
           "\n"
           "    Use a specification served over HTTP:\n"
           "        epcheck -s https://example.com/openapi.json -d src\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.ok = false;

    CheckCommand check;
    ArgCursor cursor(argc, argv);

    // Необязательная подкоманда на первой позиции
    if (!cursor.done()) {
        const char* first = cursor.current();
        if (str_eq(first, "check")) {
            cursor.advance();
        } else if (str_eq(first, "help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        }
    }

    for (; !cursor.done(); cursor.advance()) {
        const char* arg = cursor.current();
        const char* value = nullptr;
        bool missing = false;

        if (str_eq(arg, "-h") || str_eq(arg, "--help")) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (is_verbose_flag(arg)) {
            result.global.verbose += static_cast<int>(std::strlen(arg) - 1);
        } else if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result.global.quiet = true;
        } else if (str_eq(arg, "--no-colors")) {
            result.global.no_colors = true;
        } else if (str_eq(arg, "--unused-only")) {
            check.unused_only = true;
        } else if (str_eq(arg, "--no-ignore")) {
            check.no_ignore = true;
        } else if (str_eq(arg, "--truncate")) {
            check.truncate = true;
        } else if (cursor.take("-s", "--spec", value, missing)) {
            if (missing) {
                result.diagnostic.stderr_message = missing_value_error("--spec", "SPEC");
                return result;
            }
            check.spec = platform::path_from_utf8(value);
        } else if (cursor.take("-d", "--dir", value, missing)) {
            if (missing) {
                result.diagnostic.stderr_message = missing_value_error("--dir", "DIR");
                return result;
            }
            check.dir = platform::path_from_utf8(value);
        } else if (cursor.take("-f", "--format", value, missing)) {
            if (missing) {
                result.diagnostic.stderr_message = missing_value_error("--format", "FORMAT");
                return result;
            }
            auto format = output::format_from_string(value);
            if (!format) {
                result.diagnostic.stderr_message = invalid_value_error(
                    value, "--format", "FORMAT", "[possible values: table, json]");
                return result;
            }
            check.format = *format;
        } else if (cursor.take("-p", "--pattern", value, missing)) {
            if (missing) {
                result.diagnostic.stderr_message = missing_value_error("--pattern", "PATTERN");
                return result;
            }
            check.pattern = std::string(value);
        } else if (cursor.take("-e", "--exclude", value, missing)) {
            if (missing) {
                result.diagnostic.stderr_message = missing_value_error("--exclude", "PATTERN");
                return result;
            }
            check.excludes.emplace_back(value);
        } else if (cursor.take(nullptr, "--num-threads", value, missing)) {
            if (missing) {
                result.diagnostic.stderr_message = missing_value_error("--num-threads", "N");
                return result;
            }
            auto n = parse_unsigned(value);
            if (!n || *n > 4096) {
                result.diagnostic.stderr_message = invalid_value_error(
                    value, "--num-threads", "N", "expected a number between 0 and 4096");
                return result;
            }
            check.num_threads = static_cast<unsigned int>(*n);
        } else if (cursor.take(nullptr, "--max-file-size", value, missing)) {
            if (missing) {
                result.diagnostic.stderr_message = missing_value_error("--max-file-size", "BYTES");
                return result;
            }
            auto n = parse_unsigned(value);
            if (!n) {
                result.diagnostic.stderr_message = invalid_value_error(
                    value, "--max-file-size", "BYTES", "invalid digit found in string");
                return result;
            }
            check.max_file_size = *n;
        } else if (cursor.take("-o", "--output", value, missing)) {
            if (missing) {
                result.diagnostic.stderr_message = missing_value_error("--output", "OUTPUT");
                return result;
            }
            check.output = platform::path_from_utf8(value);
        } else {
            // Неизвестная опция или лишний позиционный аргумент
            result.diagnostic.stderr_message =
                render_usage_error(std::string("error: unexpected argument '") + arg + "' found");
            return result;
        }
    }

    result.ok = true;
    result.command = check;
    return result;
}

}  // namespace epcheck::cli
