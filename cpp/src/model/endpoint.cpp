// ==============================================================================
// endpoint.cpp - Модель эндпоинтов
// ==============================================================================

#include "epcheck/endpoint.hpp"

#include <cctype>
#include <cstring>
#include <functional>
#include <unordered_set>

namespace epcheck::model {

namespace {

struct MethodName {
    HttpMethod method;
    const char* upper;
    const char* lower;
};

constexpr MethodName METHOD_NAMES[] = {
    {HttpMethod::Get, "GET", "get"},         {HttpMethod::Post, "POST", "post"},
    {HttpMethod::Put, "PUT", "put"},         {HttpMethod::Delete, "DELETE", "delete"},
    {HttpMethod::Patch, "PATCH", "patch"},   {HttpMethod::Head, "HEAD", "head"},
    {HttpMethod::Options, "OPTIONS", "options"}, {HttpMethod::Trace, "TRACE", "trace"},
};

bool iequals(std::string_view a, const char* b) {
    size_t len = std::strlen(b);
    if (a.size() != len) {
        return false;
    }
    for (size_t i = 0; i < len; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) != static_cast<unsigned char>(b[i])) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ----------------------------------------------------------------------------
// HttpMethod
// ----------------------------------------------------------------------------

std::optional<HttpMethod> http_method_from_string(std::string_view token) {
    for (const auto& entry : METHOD_NAMES) {
        if (iequals(token, entry.lower)) {
            return entry.method;
        }
    }
    return std::nullopt;
}

const char* http_method_to_string(HttpMethod method) {
    for (const auto& entry : METHOD_NAMES) {
        if (entry.method == method) {
            return entry.upper;
        }
    }
    return "GET";
}

const char* http_method_to_lower(HttpMethod method) {
    for (const auto& entry : METHOD_NAMES) {
        if (entry.method == method) {
            return entry.lower;
        }
    }
    return "get";
}

// ----------------------------------------------------------------------------
// Endpoint
// ----------------------------------------------------------------------------

std::string Endpoint::to_string() const {
    std::string result = http_method_to_string(method);
    result += ' ';
    result += path;
    return result;
}

bool Endpoint::operator<(const Endpoint& other) const {
    int cmp = path.compare(other.path);
    if (cmp != 0) {
        return cmp < 0;
    }
    return std::strcmp(http_method_to_string(method), http_method_to_string(other.method)) < 0;
}

std::size_t Endpoint::Hash::operator()(const Endpoint& e) const {
    std::size_t h = std::hash<std::string>{}(e.path);
    std::size_t m = std::hash<int>{}(static_cast<int>(e.method));
    return h ^ (m + 0x9e3779b9 + (h << 6) + (h >> 2));
}

// ----------------------------------------------------------------------------
// extract_endpoints
// ----------------------------------------------------------------------------

std::vector<Endpoint> extract_endpoints(const PathTable& paths) {
    std::vector<Endpoint> endpoints;
    std::unordered_set<Endpoint, Endpoint::Hash> seen;

    for (const auto& [path, tokens] : paths) {
        for (const auto& token : tokens) {
            auto method = http_method_from_string(token);
            if (!method) {
                continue;
            }
            Endpoint endpoint{path, *method};
            if (seen.insert(endpoint).second) {
                endpoints.push_back(std::move(endpoint));
            }
        }
    }

    return endpoints;
}

}  // namespace epcheck::model
