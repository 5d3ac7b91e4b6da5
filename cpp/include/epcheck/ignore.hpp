// ==============================================================================
// epcheck/ignore.hpp - Правила игнорирования (gitignore)
// ==============================================================================
//
// Назначение:
// - glob_match(): glob с учётом разделителя '/' (*, ?, [...], **)
// - IgnoreRules: набор правил одного источника (.gitignore, .ignore,
//   .git/info/exclude, глобальный ignore, --exclude)
// - global_ignore_file(): путь к глобальному git ignore
//
// Синтаксис строки правила:
//   # комментарий, пустые строки пропускаются
//   !pattern      - отмена игнорирования (whitelist)
//   pattern/      - только каталоги
//   /pattern      - привязка к каталогу источника
//   a/b           - '/' в начале или середине тоже привязывает
//   \# \!         - экранирование первого символа
//
// Все пути в API относительные и в generic форме ("src/app/main.ts").
// Внутри набора побеждает последнее совпавшее правило.
//
// ==============================================================================

#ifndef EPCHECK_IGNORE_HPP
#define EPCHECK_IGNORE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace epcheck::io {

// ============================================================================
// Glob
// ============================================================================

/// Сопоставить путь с glob паттерном целиком
///
/// '*' и '?' не совпадают с '/'. "**" как целый сегмент совпадает
/// с любым числом каталогов ("**/x", "a/**/b", "a/**").
bool glob_match(std::string_view pattern, std::string_view path);

// ============================================================================
// IgnoreRules
// ============================================================================

enum class IgnoreMatch {
    None,      // Ни одно правило не совпало
    Ignore,    // Путь игнорируется
    Whitelist  // Путь явно разрешён правилом "!"
};

struct IgnoreRule {
    std::string pattern;  // без '!', '/' в начале и в конце
    std::string base;     // каталог источника относительно корня ("" для корня)
    bool negated = false;
    bool dir_only = false;
    bool anchored = false;
};

class IgnoreRules {
public:
    /// Разобрать строку правила
    /// @param line Строка из ignore-файла или --exclude
    /// @param base Каталог, относительно которого действует правило
    /// @return false для комментариев и пустых строк
    bool add_rule(std::string_view line, std::string_view base = {});

    /// Загрузить правила из файла
    /// @return Число добавленных правил; 0 если файла нет
    /// @throws std::runtime_error если файл существует, но не читается
    size_t add_file(const std::filesystem::path& file, std::string_view base = {});

    /// Проверить путь (последнее совпавшее правило побеждает)
    /// @param rel_path Путь относительно корня обхода
    /// @param is_dir Является ли путь каталогом
    IgnoreMatch match(std::string_view rel_path, bool is_dir) const;

    bool is_ignored(std::string_view rel_path, bool is_dir) const {
        return match(rel_path, is_dir) == IgnoreMatch::Ignore;
    }

    const std::vector<IgnoreRule>& rules() const { return rules_; }
    size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

private:
    std::vector<IgnoreRule> rules_;
};

/// Глобальный git ignore: $XDG_CONFIG_HOME/git/ignore или ~/.config/git/ignore
/// @return nullopt если ни переменная, ни домашний каталог не известны
std::optional<std::filesystem::path> global_ignore_file();

}  // namespace epcheck::io

#endif  // EPCHECK_IGNORE_HPP
