// ==============================================================================
// pattern.cpp - Компилятор паттернов эндпоинтов
// ==============================================================================
//
// Паттерны компилируются в std::regex (ECMAScript | optimize).
// Ошибки std::regex_error перехватываются в add_family() и не
// прерывают построение таблицы для остальных эндпоинтов.
//
// ==============================================================================

#include "epcheck/pattern.hpp"

#include <algorithm>
#include <cstring>

namespace epcheck::pattern {

namespace {

// Открывающая/закрывающая кавычка: ' " `
constexpr const char* QUOTE = R"re(['"`])re";

// METHOD ( QUOTE
constexpr const char* CALL_OPEN = R"re(\s*\(\s*)re";

// Необязательный базовый префикс: '/api/v1' в '/api/v1/users'
constexpr const char* BASE_PREFIX = R"re((?:/[^'"`\r\n]*)?)re";

// Значение плейсхолдера: не разделитель, не кавычка, не перевод строки
constexpr const char* PARAM_VALUE = R"re([^/'"`\r\n]+)re";

constexpr const char* CALL_CLOSE = R"re(\s*\))re";

constexpr const char* REGEX_METACHARACTERS = "\\^$.|?*+()[]{}";

const auto MATCHER_FLAGS = std::regex::ECMAScript | std::regex::optimize;

// Максимальная длина окна вызова, передаваемого в std::regex
constexpr size_t MAX_CALL_LENGTH = 4096;

// Пробельные символы ECMAScript \s в локали "C"
bool is_regex_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\v' || c == '\f' || c == '\r';
}

bool is_quote(char c) {
    return c == '\'' || c == '"' || c == '`';
}

size_t skip_spaces(std::string_view text, size_t pos) {
    while (pos < text.size() && is_regex_space(text[pos])) {
        ++pos;
    }
    return pos;
}

/// Конец окна вызова METHOD ( 'argument' ) начиная с pos
///
/// Окно покрывает токен метода, открывающую скобку, аргумент в кавычках и
/// закрывающую скобку, если она есть. Аргумент не содержит кавычек и
/// переводов строки, поэтому любое совпадение паттерна лежит внутри окна.
/// @return npos если в позиции нет такого вызова или он длиннее MAX_CALL_LENGTH
size_t call_window_end(std::string_view content, size_t pos, size_t needle_size) {
    const size_t limit = std::min(content.size(), pos + MAX_CALL_LENGTH);
    std::string_view text = content.substr(0, limit);

    size_t i = skip_spaces(text, pos + needle_size);
    if (i >= text.size() || text[i] != '(') {
        return std::string_view::npos;
    }
    i = skip_spaces(text, i + 1);
    if (i >= text.size() || !is_quote(text[i])) {
        return std::string_view::npos;
    }

    size_t close = text.find_first_of("'\"`\r\n", i + 1);
    if (close == std::string_view::npos || !is_quote(text[close])) {
        return std::string_view::npos;
    }

    i = skip_spaces(text, close + 1);
    if (i < text.size() && text[i] == ')') {
        return i + 1;
    }
    return close + 1;
}

}  // namespace

// ----------------------------------------------------------------------------
// Варианты
// ----------------------------------------------------------------------------

const char* idiom_variant_to_string(IdiomVariant variant) {
    switch (variant) {
    case IdiomVariant::Literal:
        return "literal";
    case IdiomVariant::Template:
        return "template";
    case IdiomVariant::Loose:
        return "loose";
    case IdiomVariant::LooseTemplate:
        return "loose-template";
    }
    return "literal";
}

std::string CompileFailure::format() const {
    return "cannot compile pattern for '" + endpoint.to_string() + "' - " + message;
}

// ----------------------------------------------------------------------------
// PatternTable
// ----------------------------------------------------------------------------

bool PatternTable::add_family(const model::Endpoint& endpoint,
                              const std::vector<PatternSource>& sources) {
    std::vector<PatternEntry> family;
    family.reserve(sources.size());

    for (const auto& src : sources) {
        try {
            PatternEntry entry;
            entry.endpoint = endpoint;
            entry.variant = src.variant;
            entry.method_case = src.method_case;
            entry.source = src.source;
            entry.needle = src.needle;
            entry.matcher = std::regex(src.source, MATCHER_FLAGS);
            family.push_back(std::move(entry));
        } catch (const std::regex_error& e) {
            failures_.push_back(CompileFailure{endpoint, src.source, e.what()});
            return false;
        }
    }

    for (auto& entry : family) {
        entries_.push_back(std::move(entry));
    }
    return true;
}

// ----------------------------------------------------------------------------
// Построение паттернов
// ----------------------------------------------------------------------------

std::string escape_regex(std::string_view text) {
    std::string result;
    result.reserve(text.size() * 2);
    for (char c : text) {
        if (c != '\0' && std::strchr(REGEX_METACHARACTERS, c) != nullptr) {
            result += '\\';
        }
        result += c;
    }
    return result;
}

bool has_template_params(std::string_view path) {
    size_t open = path.find('{');
    while (open != std::string_view::npos) {
        size_t close = path.find('}', open + 1);
        if (close == std::string_view::npos) {
            return false;
        }
        if (close > open + 1) {
            return true;
        }
        open = path.find('{', close + 1);
    }
    return false;
}

std::string path_to_template_regex(std::string_view path) {
    std::string result;
    size_t pos = 0;

    while (pos < path.size()) {
        size_t open = path.find('{', pos);
        if (open == std::string_view::npos) {
            break;
        }
        size_t close = path.find('}', open + 1);
        if (close == std::string_view::npos) {
            break;
        }
        if (close == open + 1) {
            // "{}" - не плейсхолдер, остаётся литералом
            result += escape_regex(path.substr(pos, close + 1 - pos));
            pos = close + 1;
            continue;
        }
        result += escape_regex(path.substr(pos, open - pos));
        result += PARAM_VALUE;
        pos = close + 1;
    }

    result += escape_regex(path.substr(pos));
    return result;
}

std::string build_pattern(std::string_view method_token, std::string_view path_regex,
                          bool allow_prefix, bool require_close_paren) {
    std::string pattern = escape_regex(method_token);
    pattern += CALL_OPEN;
    pattern += QUOTE;
    if (allow_prefix) {
        pattern += BASE_PREFIX;
    }
    pattern.append(path_regex);
    pattern += QUOTE;
    if (require_close_paren) {
        pattern += CALL_CLOSE;
    }
    return pattern;
}

std::vector<PatternSource> generate_family(const model::Endpoint& endpoint) {
    std::vector<PatternSource> family;

    const std::string literal = escape_regex(endpoint.path);
    const bool templated = has_template_params(endpoint.path);
    const std::string templ = templated ? path_to_template_regex(endpoint.path) : std::string();

    for (MethodCase mc : {MethodCase::Upper, MethodCase::Lower}) {
        std::string token = (mc == MethodCase::Upper) ? model::http_method_to_string(endpoint.method)
                                                      : model::http_method_to_lower(endpoint.method);

        family.push_back({IdiomVariant::Literal, mc, build_pattern(token, literal, true, true), token});
        if (templated) {
            family.push_back(
                {IdiomVariant::Template, mc, build_pattern(token, templ, true, true), token});
        }
        family.push_back({IdiomVariant::Loose, mc, build_pattern(token, literal, false, false), token});
        if (templated) {
            family.push_back(
                {IdiomVariant::LooseTemplate, mc, build_pattern(token, templ, false, false), token});
        }
    }

    return family;
}

PatternTable compile(const std::vector<model::Endpoint>& endpoints) {
    PatternTable table;
    for (const auto& endpoint : endpoints) {
        table.add_family(endpoint, generate_family(endpoint));
    }
    return table;
}

// ----------------------------------------------------------------------------
// Сопоставление
// ----------------------------------------------------------------------------

size_t count_matches(std::string_view content, const PatternEntry& entry) {
    if (entry.needle.empty()) {
        return 0;
    }

    const char* const begin = content.data();

    size_t count = 0;
    size_t pos = content.find(entry.needle);
    std::cmatch m;

    while (pos != std::string_view::npos) {
        auto flags = std::regex_constants::match_continuous;
        if (pos > 0) {
            flags |= std::regex_constants::match_prev_avail;
        }

        size_t window_end = call_window_end(content, pos, entry.needle.size());
        if (window_end == std::string_view::npos) {
            pos = content.find(entry.needle, pos + 1);
            continue;
        }

        if (std::regex_search(begin + pos, begin + window_end, m, entry.matcher, flags)) {
            ++count;
            size_t len = static_cast<size_t>(m.length(0));
            pos = content.find(entry.needle, pos + (len > 0 ? len : 1));
        } else {
            pos = content.find(entry.needle, pos + 1);
        }
    }

    return count;
}

}  // namespace epcheck::pattern
