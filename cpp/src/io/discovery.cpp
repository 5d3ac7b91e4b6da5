// ==============================================================================
// discovery.cpp - Поиск исходных файлов
// ==============================================================================
//
// Обход в глубину с помощью std::filesystem::directory_iterator.
// Правила .gitignore/.ignore каждого каталога образуют стек слоёв:
// более глубокий слой проверяется раньше и побеждает.
//
// Символические ссылки не обходятся и в результат не попадают.
//
// ==============================================================================

#include "epcheck/discovery.hpp"

#include "epcheck/ignore.hpp"
#include "epcheck/output.hpp"
#include "epcheck/platform.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

namespace epcheck::io {

namespace {

constexpr const char* GIT_DIR = ".git";

const char* const IGNORE_FILE_NAMES[] = {".gitignore", ".ignore"};

// ----------------------------------------------------------------------------
// Walker - состояние одного обхода
// ----------------------------------------------------------------------------

class Walker {
public:
    Walker(const std::filesystem::path& root, const DiscoveryOptions& opt) : root_(root), opt_(opt) {
        for (const auto& pattern : opt_.excludes) {
            user_rules_.add_rule(pattern);
        }

        if (opt_.use_vcs_ignore) {
            // Глобальные правила слабее .git/info/exclude: добавляются раньше
            if (opt_.use_global_ignore) {
                if (auto global = global_ignore_file()) {
                    load_rules(base_rules_, *global, {});
                }
            }
            load_rules(base_rules_, root_ / GIT_DIR / "info" / "exclude", {});
        }

        for (const auto& file : opt_.excluded_files) {
            std::error_code ec;
            auto canonical = std::filesystem::weakly_canonical(file, ec);
            excluded_.push_back(ec ? file : canonical);
            excluded_names_.insert(platform::path_to_utf8(file.filename()));
        }
    }

    std::vector<std::filesystem::path> run() {
        walk(root_, std::string());
        return std::move(result_);
    }

private:
    void warn(const std::string& message) const {
        if (opt_.log != nullptr) {
            opt_.log->warn(message);
        }
    }

    void load_rules(IgnoreRules& rules, const std::filesystem::path& file, std::string_view base) {
        try {
            size_t added = rules.add_file(file, base);
            if (added > 0 && opt_.log != nullptr && opt_.log->trace_enabled()) {
                opt_.log->trace("loaded " + std::to_string(added) + " ignore rules from " +
                                platform::path_to_utf8(file));
            }
        } catch (const std::runtime_error& e) {
            warn(e.what());
        }
    }

    /// Проверить путь по всем источникам в порядке приоритета
    bool is_ignored(const std::string& rel, bool is_dir) const {
        IgnoreMatch m = user_rules_.match(rel, is_dir);
        if (m != IgnoreMatch::None) {
            return m == IgnoreMatch::Ignore;
        }
        if (!opt_.use_vcs_ignore) {
            return false;
        }
        for (auto it = layers_.rbegin(); it != layers_.rend(); ++it) {
            m = it->match(rel, is_dir);
            if (m != IgnoreMatch::None) {
                return m == IgnoreMatch::Ignore;
            }
        }
        return base_rules_.is_ignored(rel, is_dir);
    }

    bool is_excluded_file(const std::filesystem::path& path) const {
        if (excluded_names_.count(platform::path_to_utf8(path.filename())) == 0) {
            return false;
        }
        std::error_code ec;
        auto canonical = std::filesystem::weakly_canonical(path, ec);
        const auto& candidate = ec ? path : canonical;
        return std::find(excluded_.begin(), excluded_.end(), candidate) != excluded_.end();
    }

    void walk(const std::filesystem::path& dir, const std::string& rel) {
        if (opt_.use_vcs_ignore) {
            layers_.emplace_back();
            for (const char* name : IGNORE_FILE_NAMES) {
                load_rules(layers_.back(), dir / name, rel);
            }
        }

        std::error_code ec;
        std::filesystem::directory_iterator it(dir, ec);
        if (ec) {
            warn("failed to read directory '" + platform::path_to_utf8(dir) + "' - " + ec.message());
        } else {
            for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
                visit(*it, rel);
            }
            if (ec) {
                warn("failed to read directory entry in '" + platform::path_to_utf8(dir) + "' - " +
                     ec.message());
            }
        }

        if (opt_.use_vcs_ignore) {
            layers_.pop_back();
        }
    }

    void visit(const std::filesystem::directory_entry& entry, const std::string& parent_rel) {
        std::string name = platform::path_to_utf8(entry.path().filename());
        std::string rel = parent_rel.empty() ? name : parent_rel + "/" + name;

        std::error_code ec;
        if (entry.is_symlink(ec)) {
            return;
        }
        std::filesystem::file_status status = entry.status(ec);
        if (ec) {
            warn("failed to get metadata for '" + platform::path_to_utf8(entry.path()) + "' - " +
                 ec.message());
            return;
        }

        if (std::filesystem::is_directory(status)) {
            if (name == GIT_DIR || is_ignored(rel, true)) {
                return;
            }
            walk(entry.path(), rel);
            return;
        }

        // Сокеты, устройства и прочие специальные файлы пропускаются
        if (!std::filesystem::is_regular_file(status)) {
            return;
        }
        if (!is_candidate_file(entry.path(), opt_) || is_ignored(rel, false)) {
            return;
        }
        if (!excluded_.empty() && is_excluded_file(entry.path())) {
            return;
        }
        result_.push_back(entry.path());
    }

    std::filesystem::path root_;
    const DiscoveryOptions& opt_;

    IgnoreRules user_rules_;
    IgnoreRules base_rules_;
    std::vector<IgnoreRules> layers_;

    std::vector<std::filesystem::path> excluded_;
    std::unordered_set<std::string> excluded_names_;

    std::vector<std::filesystem::path> result_;
};

}  // namespace

// ----------------------------------------------------------------------------
// Публичный API
// ----------------------------------------------------------------------------

const std::unordered_set<std::string>& default_source_extensions() {
    static const std::unordered_set<std::string> extensions = {
        "js",   "ts",   "jsx",  "tsx",  "py",   "rb",     "php",   "java", "scala", "kt",
        "swift", "go",  "rs",   "cpp",  "c",    "h",      "hpp",   "cs",   "fs",    "vb",
        "clj",  "cljs", "elm",  "ex",   "exs",  "hs",     "ml",    "fsx",  "dart",  "lua",
        "pl",   "pm",   "tcl",  "r",    "sh",   "bash",   "zsh",   "fish", "ps1",   "sql",
        "xml",  "json", "yaml", "yml",  "toml", "ini",    "cfg",   "conf", "md",    "txt",
        "html", "htm",  "css",  "scss", "sass", "less",   "vue",   "svelte", "astro",
    };
    return extensions;
}

bool is_candidate_file(const std::filesystem::path& file_path, const DiscoveryOptions& opt) {
    std::string filename = platform::path_to_utf8(file_path.filename());

    // ".bashrc": у path расширения нет, но точка в имени есть
    size_t dot = filename.rfind('.');
    if (dot == std::string::npos) {
        return opt.include_extensionless;
    }
    if (dot == 0) {
        return false;
    }

    // case-sensitive сравнение без точки
    return opt.extensions.count(filename.substr(dot + 1)) > 0;
}

std::vector<std::filesystem::path> discover_files(const std::filesystem::path& root,
                                                  const DiscoveryOptions& opt) {
    std::error_code ec;
    std::filesystem::file_status status = std::filesystem::status(root, ec);

    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw std::runtime_error("failed to get metadata for search directory '" +
                                 platform::path_to_utf8(root) + "' - " + ec.message());
    }
    if (!std::filesystem::exists(status)) {
        throw std::runtime_error("search directory does not exist - " + platform::path_to_utf8(root));
    }
    if (!std::filesystem::is_directory(status)) {
        throw std::runtime_error("search path is not a directory - " + platform::path_to_utf8(root));
    }

    std::filesystem::directory_iterator probe(root, ec);
    if (ec) {
        throw std::runtime_error("failed to read search directory '" + platform::path_to_utf8(root) +
                                 "' - " + ec.message());
    }

    Walker walker(root, opt);
    std::vector<std::filesystem::path> result = walker.run();

    // Порядок directory_iterator зависит от ОС: сортировка для детерминизма
    std::sort(result.begin(), result.end());

    return result;
}

}  // namespace epcheck::io
