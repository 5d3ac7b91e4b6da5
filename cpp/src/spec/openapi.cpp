// ==============================================================================
// openapi.cpp - Загрузка OpenAPI спецификаций
// ==============================================================================
//
// JSON разбирается RapidJSON (DOM), YAML разбирается yaml-cpp.
// Исключения yaml-cpp перехватываются здесь и превращаются в SpecError.
// Удалённые спецификации скачиваются через libcurl (easy interface).
//
// ==============================================================================

#include "epcheck/openapi.hpp"

#include "epcheck/platform.hpp"

#include <curl/curl.h>
#include <fstream>
#include <memory>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <sstream>
#include <system_error>
#include <yaml-cpp/yaml.h>

namespace epcheck::spec {

namespace {

// ----------------------------------------------------------------------------
// JSON
// ----------------------------------------------------------------------------

std::optional<std::string> json_string_member(const rapidjson::Value& obj, const char* name) {
    auto it = obj.FindMember(name);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        return std::nullopt;
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

bool parse_json(std::string_view content, ApiSpec& spec, std::string& error) {
    rapidjson::Document doc;
    doc.Parse(content.data(), content.size());

    if (doc.HasParseError()) {
        error = std::string("JSON parse error: ") + rapidjson::GetParseError_En(doc.GetParseError()) +
                " at offset " + std::to_string(doc.GetErrorOffset());
        return false;
    }
    if (!doc.IsObject()) {
        error = "document root is not an object";
        return false;
    }

    auto paths_it = doc.FindMember("paths");
    if (paths_it == doc.MemberEnd() || !paths_it->value.IsObject()) {
        error = "document has no 'paths' object";
        return false;
    }

    spec.openapi = json_string_member(doc, "openapi");
    if (!spec.openapi) {
        spec.openapi = json_string_member(doc, "swagger");
    }
    auto info_it = doc.FindMember("info");
    if (info_it != doc.MemberEnd() && info_it->value.IsObject()) {
        spec.title = json_string_member(info_it->value, "title");
        spec.version = json_string_member(info_it->value, "version");
    }

    for (auto it = paths_it->value.MemberBegin(); it != paths_it->value.MemberEnd(); ++it) {
        std::string path(it->name.GetString(), it->name.GetStringLength());
        auto& tokens = spec.paths[path];

        // Не-объектный path item не объявляет методов
        if (!it->value.IsObject()) {
            continue;
        }
        for (auto m = it->value.MemberBegin(); m != it->value.MemberEnd(); ++m) {
            tokens.emplace_back(m->name.GetString(), m->name.GetStringLength());
        }
    }

    return true;
}

// ----------------------------------------------------------------------------
// YAML
// ----------------------------------------------------------------------------

std::optional<std::string> yaml_scalar(const YAML::Node& node, const char* name) {
    const YAML::Node value = node[name];
    if (!value || !value.IsScalar()) {
        return std::nullopt;
    }
    return value.as<std::string>();
}

bool parse_yaml(std::string_view content, ApiSpec& spec, std::string& error) {
    try {
        YAML::Node root = YAML::Load(std::string(content));

        if (!root.IsMap()) {
            error = "document root is not a mapping";
            return false;
        }

        const YAML::Node paths = root["paths"];
        if (!paths || !paths.IsMap()) {
            error = "document has no 'paths' mapping";
            return false;
        }

        spec.openapi = yaml_scalar(root, "openapi");
        if (!spec.openapi) {
            spec.openapi = yaml_scalar(root, "swagger");
        }
        const YAML::Node info = root["info"];
        if (info && info.IsMap()) {
            spec.title = yaml_scalar(info, "title");
            spec.version = yaml_scalar(info, "version");
        }

        // Записи с нескалярным ключом пропускаются по одной
        for (const auto& item : paths) {
            if (!item.first.IsScalar()) {
                continue;
            }
            auto& tokens = spec.paths[item.first.Scalar()];
            if (!item.second.IsMap()) {
                continue;
            }
            for (const auto& op : item.second) {
                if (op.first.IsScalar()) {
                    tokens.push_back(op.first.Scalar());
                }
            }
        }

        return true;

    } catch (const YAML::Exception& e) {
        error = std::string("YAML parse error: ") + e.what();
        return false;
    }
}

// ----------------------------------------------------------------------------
// HTTP
// ----------------------------------------------------------------------------

constexpr long FETCH_CONNECT_TIMEOUT_SECONDS = 10;
constexpr long FETCH_TIMEOUT_SECONDS = 60;
constexpr long FETCH_MAX_REDIRECTS = 10;
constexpr curl_off_t FETCH_MAX_BYTES = 64 * 1024 * 1024;
constexpr const char* FETCH_USER_AGENT = "epcheck/0.1.0";

/// curl_global_init один раз на процесс
struct CurlGlobal {
    CURLcode code;

    CurlGlobal() : code(curl_global_init(CURL_GLOBAL_DEFAULT)) {}
    ~CurlGlobal() {
        if (code == CURLE_OK) {
            curl_global_cleanup();
        }
    }
};

struct CurlEasyDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

size_t append_body(char* data, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

bool fetch_url(const std::string& url, std::string& body, std::string& error) {
    static const CurlGlobal global;
    if (global.code != CURLE_OK) {
        error = std::string("libcurl initialization failed: ") + curl_easy_strerror(global.code);
        return false;
    }

    std::unique_ptr<CURL, CurlEasyDeleter> handle(curl_easy_init());
    if (!handle) {
        error = "libcurl initialization failed";
        return false;
    }
    CURL* h = handle.get();

    char error_buffer[CURL_ERROR_SIZE] = {};

    CURLcode rc = curl_easy_setopt(h, CURLOPT_URL, url.c_str());
    if (rc == CURLE_OK) {
        rc = curl_easy_setopt(h, CURLOPT_ERRORBUFFER, error_buffer);
    }
    if (rc == CURLE_OK) {
        rc = curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &append_body);
    }
    if (rc == CURLE_OK) {
        rc = curl_easy_setopt(h, CURLOPT_WRITEDATA, &body);
    }
    if (rc == CURLE_OK) {
        rc = curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, 1L);
    }
    if (rc == CURLE_OK) {
        rc = curl_easy_setopt(h, CURLOPT_MAXREDIRS, FETCH_MAX_REDIRECTS);
    }
    if (rc == CURLE_OK) {
        rc = curl_easy_setopt(h, CURLOPT_FAILONERROR, 1L);
    }
    if (rc == CURLE_OK) {
        rc = curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
    }
    if (rc == CURLE_OK) {
        rc = curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT, FETCH_CONNECT_TIMEOUT_SECONDS);
    }
    if (rc == CURLE_OK) {
        rc = curl_easy_setopt(h, CURLOPT_TIMEOUT, FETCH_TIMEOUT_SECONDS);
    }
    if (rc == CURLE_OK) {
        rc = curl_easy_setopt(h, CURLOPT_MAXFILESIZE_LARGE, FETCH_MAX_BYTES);
    }
    if (rc == CURLE_OK) {
        rc = curl_easy_setopt(h, CURLOPT_USERAGENT, FETCH_USER_AGENT);
    }
    if (rc == CURLE_OK) {
        rc = curl_easy_perform(h);
    }

    if (rc != CURLE_OK) {
        error = std::string("failed to fetch URL: ") +
                (error_buffer[0] != '\0' ? error_buffer : curl_easy_strerror(rc));
        return false;
    }
    return true;
}

bool starts_with(std::string_view text, std::string_view prefix) {
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace

// ----------------------------------------------------------------------------
// Формат и ошибки
// ----------------------------------------------------------------------------

SpecFormat spec_format_from_path(const std::filesystem::path& path) {
    std::string ext = platform::path_to_utf8(path.extension());
    if (ext == ".json") {
        return SpecFormat::Json;
    }
    if (ext == ".yaml" || ext == ".yml") {
        return SpecFormat::Yaml;
    }
    return SpecFormat::Auto;
}

std::string SpecError::format() const {
    if (path.empty()) {
        return "failed to load specification - " + message;
    }
    return "failed to load specification '" + path + "' - " + message;
}

// ----------------------------------------------------------------------------
// Загрузка
// ----------------------------------------------------------------------------

LoadResult parse_spec(std::string_view content, SpecFormat format, std::string_view origin) {
    LoadResult result;
    result.error.path = std::string(origin);

    std::string error;
    bool ok = false;

    switch (format) {
    case SpecFormat::Json:
        ok = parse_json(content, result.spec, error);
        break;
    case SpecFormat::Yaml:
        ok = parse_yaml(content, result.spec, error);
        break;
    case SpecFormat::Auto:
        ok = parse_json(content, result.spec, error);
        if (!ok) {
            result.spec = ApiSpec{};
            ok = parse_yaml(content, result.spec, error);
        }
        break;
    }

    if (!ok) {
        result.spec = ApiSpec{};
        result.error.message = error;
        return result;
    }

    result.ok = true;
    return result;
}

LoadResult load_spec(const std::filesystem::path& path) {
    std::string path_str = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        LoadResult result;
        result.error = SpecError{"file not found or not a regular file", path_str};
        return result;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        LoadResult result;
        result.error = SpecError{"could not open file", path_str};
        return result;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        LoadResult result;
        result.error = SpecError{"I/O error while reading file", path_str};
        return result;
    }

    return parse_spec(buffer.str(), spec_format_from_path(path), path_str);
}

bool is_spec_url(std::string_view location) {
    return starts_with(location, "http://") || starts_with(location, "https://");
}

SpecFormat spec_format_from_url(std::string_view url) {
    size_t end = url.find_first_of("?#");
    if (end != std::string_view::npos) {
        url = url.substr(0, end);
    }
    size_t scheme = url.find("://");
    size_t path_start = url.find('/', scheme == std::string_view::npos ? 0 : scheme + 3);
    if (path_start == std::string_view::npos) {
        return SpecFormat::Auto;
    }
    return spec_format_from_path(platform::path_from_utf8(std::string(url.substr(path_start))));
}

LoadResult load_spec_url(const std::string& url) {
    std::string body;
    std::string error;
    if (!fetch_url(url, body, error)) {
        LoadResult result;
        result.error = SpecError{error, url};
        return result;
    }
    return parse_spec(body, spec_format_from_url(url), url);
}

const std::vector<std::string>& default_spec_names() {
    static const std::vector<std::string> names = {
        "openapi.json", "openapi.yaml", "openapi.yml",
        "swagger.json", "swagger.yaml", "swagger.yml",
    };
    return names;
}

std::optional<std::filesystem::path> find_spec(const std::filesystem::path& start_dir) {
    std::error_code ec;
    std::filesystem::path dir = std::filesystem::absolute(start_dir, ec);
    if (ec) {
        dir = start_dir;
    }

    while (true) {
        for (const auto& name : default_spec_names()) {
            std::filesystem::path candidate = dir / name;
            if (std::filesystem::is_regular_file(candidate, ec)) {
                return candidate;
            }
        }
        if (!dir.has_parent_path() || dir.parent_path() == dir) {
            break;
        }
        dir = dir.parent_path();
    }

    return std::nullopt;
}

}  // namespace epcheck::spec
