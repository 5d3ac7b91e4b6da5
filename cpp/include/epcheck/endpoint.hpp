// ==============================================================================
// epcheck/endpoint.hpp - Модель эндпоинтов
// ==============================================================================
//
// Назначение:
// - HttpMethod: восемь HTTP методов
// - Endpoint: неизменяемая пара (path, method)
// - extract_endpoints(): таблица путей спецификации -> набор Endpoint
//
// Endpoint сравнивается и хешируется структурно. Порядок (operator<)
// совпадает с порядком сортировки результатов: путь, затем метод.
//
// ==============================================================================

#ifndef EPCHECK_ENDPOINT_HPP
#define EPCHECK_ENDPOINT_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace epcheck::model {

// ============================================================================
// HttpMethod
// ============================================================================

enum class HttpMethod { Get, Post, Put, Delete, Patch, Head, Options, Trace };

/// Разобрать токен метода без учёта регистра ("get", "Post", "DELETE")
/// @return nullopt для неизвестного токена
std::optional<HttpMethod> http_method_from_string(std::string_view token);

/// Канонический токен в верхнем регистре ("GET")
const char* http_method_to_string(HttpMethod method);

/// Токен в нижнем регистре ("get")
const char* http_method_to_lower(HttpMethod method);

// ============================================================================
// Endpoint
// ============================================================================

struct Endpoint {
    std::string path;
    HttpMethod method = HttpMethod::Get;

    /// "METHOD path", например "GET /users/{id}"
    std::string to_string() const;

    bool operator==(const Endpoint& other) const {
        return method == other.method && path == other.path;
    }
    bool operator!=(const Endpoint& other) const { return !(*this == other); }

    /// Порядок: path (побайтово), затем токен метода (побайтово)
    bool operator<(const Endpoint& other) const;

    /// Хеш для unordered-контейнеров
    struct Hash {
        std::size_t operator()(const Endpoint& e) const;
    };
};

// ============================================================================
// Таблица путей
// ============================================================================

/// path -> объявленные токены методов (как в документе, любой регистр)
using PathTable = std::map<std::string, std::vector<std::string>>;

/// Построить набор эндпоинтов из таблицы путей
///
/// Нераспознанные токены (parameters, summary, x-*) пропускаются молча.
/// Дубликаты схлопываются, порядок - первого появления.
std::vector<Endpoint> extract_endpoints(const PathTable& paths);

}  // namespace epcheck::model

#endif  // EPCHECK_ENDPOINT_HPP
