// ==============================================================================
// epcheck/openapi.hpp - Загрузка OpenAPI спецификаций
// ==============================================================================
//
// Назначение:
// - Чтение OpenAPI/Swagger документа (JSON через RapidJSON, YAML через yaml-cpp)
// - Извлечение таблицы путей: path -> ключи path item (токены методов)
// - Поиск спецификации в текущем и родительских каталогах
// - Загрузка спецификации по http:// или https:// URL (libcurl)
//
// Документ не валидируется: требуется только корневой объект с объектом
// "paths". Остальное содержимое игнорируется.
//
// ==============================================================================

#ifndef EPCHECK_OPENAPI_HPP
#define EPCHECK_OPENAPI_HPP

#include <epcheck/endpoint.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace epcheck::spec {

// ============================================================================
// ApiSpec
// ============================================================================

/// Загруженная спецификация
struct ApiSpec {
    std::optional<std::string> openapi;  // "openapi" или "swagger" версия
    std::optional<std::string> title;    // info.title
    std::optional<std::string> version;  // info.version
    model::PathTable paths;              // path -> токены методов
};

/// Формат документа
enum class SpecFormat {
    Json,
    Yaml,
    Auto  // JSON, при неудаче YAML
};

/// Определить формат по расширению: .json / .yaml / .yml, иначе Auto
SpecFormat spec_format_from_path(const std::filesystem::path& path);

// ============================================================================
// Ошибки
// ============================================================================

struct SpecError {
    std::string message;
    std::string path;  // пусто при разборе строки без origin

    /// "failed to load specification '<path>' - <message>"
    std::string format() const;
};

struct LoadResult {
    bool ok = false;
    ApiSpec spec;
    SpecError error;

    explicit operator bool() const { return ok; }
};

// ============================================================================
// Загрузка
// ============================================================================

/// Разобрать документ из строки
/// @param content Текст документа
/// @param format Формат (Auto: JSON, затем YAML)
/// @param origin Путь для сообщений об ошибках
LoadResult parse_spec(std::string_view content, SpecFormat format, std::string_view origin = {});

/// Прочитать и разобрать файл спецификации
LoadResult load_spec(const std::filesystem::path& path);

/// Является ли значение --spec адресом http:// или https://
bool is_spec_url(std::string_view location);

/// Формат по расширению последнего сегмента URL (без ?query и #fragment)
SpecFormat spec_format_from_url(std::string_view url);

/// Скачать и разобрать спецификацию по URL
///
/// Ошибки сети и HTTP статусы >= 400 возвращаются как SpecError
/// с path = url.
LoadResult load_spec_url(const std::string& url);

/// Имена файлов, которые ищет find_spec (в порядке приоритета)
const std::vector<std::string>& default_spec_names();

/// Найти спецификацию в start_dir и его родителях
/// @return Путь к первому найденному файлу или nullopt
std::optional<std::filesystem::path> find_spec(const std::filesystem::path& start_dir);

}  // namespace epcheck::spec

#endif  // EPCHECK_OPENAPI_HPP
