// ==============================================================================
// epcheck/discovery.hpp - Поиск исходных файлов
// ==============================================================================
//
// Назначение:
// - Рекурсивный обход дерева (скрытые файлы включаются)
// - Фильтрация по списку расширений исходников
// - Правила игнорирования: --exclude > .gitignore/.ignore (глубже
//   сильнее) > .git/info/exclude > глобальный git ignore
// - Детерминированный порядок результатов (сортировка)
//
// Каталог .git никогда не обходится.
//
// ==============================================================================

#ifndef EPCHECK_DISCOVERY_HPP
#define EPCHECK_DISCOVERY_HPP

#include <filesystem>
#include <string>
#include <unordered_set>
#include <vector>

namespace epcheck::output {
class Writer;
}

namespace epcheck::io {

// ----------------------------------------------------------------------------
// DiscoveryOptions - параметры поиска файлов
// ----------------------------------------------------------------------------

/// Расширения исходников по умолчанию (без точки, case-sensitive)
const std::unordered_set<std::string>& default_source_extensions();

struct DiscoveryOptions {
    /// Допустимые расширения (БЕЗ точки: "ts", не ".ts")
    std::unordered_set<std::string> extensions = default_source_extensions();

    /// Включать файлы без расширения, если в имени нет точки (скрипты)
    bool include_extensionless = true;

    /// Учитывать .gitignore, .ignore и .git/info/exclude
    bool use_vcs_ignore = true;

    /// Учитывать глобальный git ignore
    bool use_global_ignore = true;

    /// Пользовательские исключения (синтаксис gitignore, от корня)
    std::vector<std::string> excludes;

    /// Конкретные файлы, исключаемые из результата (файл спецификации)
    std::vector<std::filesystem::path> excluded_files;

    /// Куда писать предупреждения об ошибках обхода (nullptr - молча)
    output::Writer* log = nullptr;
};

// ----------------------------------------------------------------------------
// discover_files - основная функция поиска
// ----------------------------------------------------------------------------

/// Проверить, является ли файл кандидатом по имени
///
/// Кандидат: расширение из списка или (include_extensionless) имя без точки.
bool is_candidate_file(const std::filesystem::path& file_path, const DiscoveryOptions& opt);

/// Найти файлы-кандидаты в дереве root
///
/// @param root Корневой каталог обхода
/// @param opt Параметры поиска
/// @return Отсортированный по пути список найденных файлов
///
/// Ошибки отдельных записей (нет доступа к подкаталогу, битая запись)
/// выводятся предупреждением через opt.log, обход продолжается.
/// Пустой результат - не ошибка.
///
/// @throws std::runtime_error если root не существует или не каталог
std::vector<std::filesystem::path> discover_files(const std::filesystem::path& root,
                                                  const DiscoveryOptions& opt);

}  // namespace epcheck::io

#endif  // EPCHECK_DISCOVERY_HPP
