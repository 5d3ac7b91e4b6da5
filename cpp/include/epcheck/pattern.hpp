// ==============================================================================
// epcheck/pattern.hpp - Компилятор паттернов эндпоинтов
// ==============================================================================
//
// Назначение:
// - Для каждого Endpoint строится семейство регулярных выражений,
//   распознающих типичные вызовы HTTP клиентов:
//     api.get('/users/42')   client.GET("/api/v1/users")   http.post(`/orders`, body)
// - PatternTable: плоская упорядоченная таблица (endpoint, matcher)
// - count_matches(): подсчёт непересекающихся совпадений в тексте
//
// Порядок таблицы детерминирован: порядок эндпоинтов, затем регистр
// метода (Upper, Lower), затем вариант (Literal, Template, Loose,
// LooseTemplate). Таблица после построения только читается и
// разделяется потоками сканера без синхронизации.
//
// ==============================================================================

#ifndef EPCHECK_PATTERN_HPP
#define EPCHECK_PATTERN_HPP

#include <epcheck/endpoint.hpp>
#include <cstddef>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace epcheck::pattern {

// ============================================================================
// Варианты паттернов
// ============================================================================

enum class IdiomVariant {
    Literal,       // METHOD ( 'prefix?PATH' )
    Template,      // METHOD ( 'prefix?/users/[^/]+' ), только для {param}
    Loose,         // METHOD ( 'PATH'  - без закрывающей скобки
    LooseTemplate  // METHOD ( '/users/[^/]+'  - без закрывающей скобки
};

enum class MethodCase { Upper, Lower };

const char* idiom_variant_to_string(IdiomVariant variant);

// ============================================================================
// PatternEntry
// ============================================================================

/// Исходный текст одного паттерна до компиляции
struct PatternSource {
    IdiomVariant variant = IdiomVariant::Literal;
    MethodCase method_case = MethodCase::Upper;
    std::string source;  // ECMAScript regex
    std::string needle;  // литерал, с которого начинается любое совпадение
};

/// Скомпилированный паттерн
struct PatternEntry {
    model::Endpoint endpoint;
    IdiomVariant variant = IdiomVariant::Literal;
    MethodCase method_case = MethodCase::Upper;
    std::string source;
    std::string needle;
    std::regex matcher;
};

/// Эндпоинт, исключённый из таблицы из-за ошибки компиляции
struct CompileFailure {
    model::Endpoint endpoint;
    std::string pattern;
    std::string message;

    /// "cannot compile pattern for 'GET /x' - <message>"
    std::string format() const;
};

// ============================================================================
// PatternTable
// ============================================================================

class PatternTable {
public:
    /// Скомпилировать семейство паттернов эндпоинта
    ///
    /// Если хотя бы один паттерн не компилируется, ни один паттерн
    /// эндпоинта не добавляется, а ошибка сохраняется в failures().
    /// @return true если семейство добавлено
    bool add_family(const model::Endpoint& endpoint, const std::vector<PatternSource>& sources);

    const std::vector<PatternEntry>& entries() const { return entries_; }
    const std::vector<CompileFailure>& failures() const { return failures_; }

    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<PatternEntry> entries_;
    std::vector<CompileFailure> failures_;
};

// ============================================================================
// Построение паттернов
// ============================================================================

/// Экранировать метасимволы regex: \ ^ $ . | ? * + ( ) [ ] { }
std::string escape_regex(std::string_view text);

/// Есть ли в пути плейсхолдеры вида {name} (имя непустое)
bool has_template_params(std::string_view path);

/// Путь -> regex: литералы экранируются, {name} -> [^/'"`\r\n]+
std::string path_to_template_regex(std::string_view path);

/// Собрать текст одного паттерна
/// @param method_token Токен метода в нужном регистре ("GET" / "get")
/// @param path_regex Уже экранированный путь или шаблон
/// @param allow_prefix Разрешить базовый префикс "/..." перед путём
/// @param require_close_paren Требовать "\s*)" после закрывающей кавычки
std::string build_pattern(std::string_view method_token, std::string_view path_regex,
                          bool allow_prefix, bool require_close_paren);

/// Семейство исходных паттернов эндпоинта в детерминированном порядке
std::vector<PatternSource> generate_family(const model::Endpoint& endpoint);

/// Построить таблицу для набора эндпоинтов
PatternTable compile(const std::vector<model::Endpoint>& endpoints);

// ============================================================================
// Сопоставление
// ============================================================================

/// Число непересекающихся совпадений entry в тексте (слева направо)
///
/// Любое совпадение начинается с needle, поэтому regex запускается
/// только в позициях вхождения needle и только на окне одного вызова
/// (не длиннее 4 KiB). Длинные строки без кавычек не доходят до regex.
size_t count_matches(std::string_view content, const PatternEntry& entry);

}  // namespace epcheck::pattern

#endif  // EPCHECK_PATTERN_HPP
