// ==============================================================================
// output.cpp - Пользовательский вывод и логирование
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr.
// Байты первичны: std::endl не используется, переводы строк пишутся явно.
//
// ==============================================================================

#include "epcheck/output.hpp"

#include "epcheck/platform.hpp"

#include <algorithm>
#include <cstdio>

namespace epcheck::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

// ANSI SGR (Select Graphic Rendition) коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

// Unicode box-drawing characters (UTF-8)
constexpr const char* BOX_V = "\xe2\x94\x82";      // │ U+2502
constexpr const char* BOX_H = "\xe2\x94\x80";      // ─ U+2500
constexpr const char* BOX_TL = "\xe2\x94\x8c";     // ┌ U+250C
constexpr const char* BOX_TR = "\xe2\x94\x90";     // ┐ U+2510
constexpr const char* BOX_BL = "\xe2\x94\x94";     // └ U+2514
constexpr const char* BOX_BR = "\xe2\x94\x98";     // ┘ U+2518
constexpr const char* BOX_LT = "\xe2\x94\x9c";     // ├ U+251C
constexpr const char* BOX_RT = "\xe2\x94\xa4";     // ┤ U+2524
constexpr const char* BOX_TT = "\xe2\x94\xac";     // ┬ U+252C
constexpr const char* BOX_BT = "\xe2\x94\xb4";     // ┴ U+2534
constexpr const char* BOX_CROSS = "\xe2\x94\xbc";  // ┼ U+253C

std::string prefixed(std::string_view prefix, std::string_view message) {
    std::string result(prefix);
    result += ' ';
    result.append(message);
    result += '\n';
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Format
// ----------------------------------------------------------------------------

const char* format_to_string(Format format) {
    switch (format) {
    case Format::Json:
        return "json";
    case Format::Table:
    default:
        return "table";
    }
}

std::optional<Format> format_from_string(std::string_view name) {
    if (name == "table") {
        return Format::Table;
    }
    if (name == "json") {
        return Format::Json;
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.output_path.has_value()) {
        open_output_file();
    }
}

Writer::~Writer() {
    close_output_file();
    std::fflush(stdout);
    std::fflush(stderr);
}

void Writer::write(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_unlocked(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    write_unlocked(s, bytes);
    write_unlocked(s, "\n");
}

void Writer::write_unlocked(Stream s, std::string_view bytes) {
    FILE* f = nullptr;

    // stdout перенаправляется в файл отчёта, если он открыт
    if (s == Stream::Stdout && output_file_ != nullptr) {
        f = output_file_;
    } else {
        f = get_file(s);
    }

    if (f != nullptr && !bytes.empty()) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

bool Writer::use_color(Stream s) const {
    if (config_.no_colors) {
        return false;
    }
    // В файл отчёта ANSI коды не пишутся
    if (s == Stream::Stdout && output_file_ != nullptr) {
        return false;
    }
    return supports_color(s);
}

void Writer::emit(std::string_view prefix, Color color, std::string_view message) {
    std::string line = prefixed(prefix, message);

    std::lock_guard<std::mutex> lock(mutex_);
    if (use_color(Stream::Stderr)) {
        write_unlocked(Stream::Stderr, ansi_color_code(color));
        write_unlocked(Stream::Stderr, prefix);
        write_unlocked(Stream::Stderr, ANSI_RESET);
        write_unlocked(Stream::Stderr, std::string_view(line).substr(prefix.size()));
    } else {
        write_unlocked(Stream::Stderr, line);
    }
}

void Writer::info(std::string_view message) {
    // Подавляем информационные сообщения при --quiet
    if (config_.quiet) {
        return;
    }
    emit("[+]", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    emit("[!]", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    emit("[x]", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    emit("[*]", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    emit("[~]", Color::Magenta, message);
}

void Writer::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
    }
}

bool Writer::open_output_file() {
    if (!config_.output_path.has_value()) {
        return false;
    }

    const auto& path = config_.output_path.value();

#ifdef _WIN32
    output_file_ = _wfopen(path.c_str(), L"wb");
#else
    std::string path_str = platform::path_to_utf8(path);
    output_file_ = std::fopen(path_str.c_str(), "wb");
#endif

    return output_file_ != nullptr;
}

void Writer::close_output_file() {
    if (output_file_ != nullptr) {
        std::fflush(output_file_);
        std::fclose(output_file_);
        output_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Table
// ----------------------------------------------------------------------------

Table::Table() = default;

void Table::set_headers(const std::vector<std::string>& headers) {
    headers_ = headers;
}

void Table::add_row(const std::vector<std::string>& cells) {
    rows_.push_back(cells);
}

std::vector<size_t> Table::column_widths() const {
    size_t num_cols = headers_.size();
    for (const auto& row : rows_) {
        num_cols = std::max(num_cols, row.size());
    }

    std::vector<size_t> widths(num_cols, 0);
    for (size_t i = 0; i < headers_.size(); ++i) {
        widths[i] = std::max(widths[i], display_width(headers_[i]));
    }
    for (const auto& row : rows_) {
        for (size_t i = 0; i < row.size(); ++i) {
            widths[i] = std::max(widths[i], display_width(row[i]));
        }
    }
    return widths;
}

// position: 'T' (верх), 'M' (разделитель заголовка), 'B' (низ)
std::string Table::format_line(char position, const std::vector<size_t>& widths) const {
    const char* left = BOX_LT;
    const char* middle = BOX_CROSS;
    const char* right = BOX_RT;
    if (position == 'T') {
        left = BOX_TL;
        middle = BOX_TT;
        right = BOX_TR;
    } else if (position == 'B') {
        left = BOX_BL;
        middle = BOX_BT;
        right = BOX_BR;
    }

    std::string line = left;
    for (size_t i = 0; i < widths.size(); ++i) {
        for (size_t j = 0; j < widths[i] + 2; ++j) {
            line += BOX_H;
        }
        if (i + 1 < widths.size()) {
            line += middle;
        }
    }
    line += right;
    return line;
}

std::string Table::format_row(const std::vector<std::string>& cells,
                              const std::vector<size_t>& widths) const {
    std::string line = BOX_V;

    for (size_t i = 0; i < widths.size(); ++i) {
        line += ' ';

        const std::string empty;
        const std::string& cell = (i < cells.size()) ? cells[i] : empty;
        line += cell;

        size_t width = display_width(cell);
        if (width < widths[i]) {
            line.append(widths[i] - width, ' ');
        }

        line += ' ';
        line += BOX_V;
    }

    return line;
}

std::string Table::to_string() const {
    std::vector<size_t> widths = column_widths();
    std::string result;

    // ┌───┬───┐
    result += format_line('T', widths);
    result += '\n';

    if (!headers_.empty()) {
        result += format_row(headers_, widths);
        result += '\n';

        // ├───┼───┤
        result += format_line('M', widths);
        result += '\n';
    }

    for (const auto& row : rows_) {
        result += format_row(row, widths);
        result += '\n';
    }

    // └───┴───┘
    result += format_line('B', widths);
    result += '\n';

    return result;
}

void Table::print(Writer& w) const {
    w.write(Stream::Stdout, to_string());
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

size_t display_width(std::string_view text) {
    // Считаем байты, не являющиеся continuation bytes (10xxxxxx)
    size_t width = 0;
    for (char c : text) {
        if ((static_cast<unsigned char>(c) & 0xC0) != 0x80) {
            ++width;
        }
    }
    return width;
}

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace epcheck::output
