// ==============================================================================
// ignore.cpp - Правила игнорирования (gitignore)
// ==============================================================================

#include "epcheck/ignore.hpp"

#include "epcheck/platform.hpp"

#include <fstream>
#include <stdexcept>
#include <system_error>

namespace epcheck::io {

namespace {

// ----------------------------------------------------------------------------
// Glob
// ----------------------------------------------------------------------------

/// Сопоставить класс символов [...] начиная с p[pi] == '['
/// @param next Позиция после ']' при успешном разборе
/// @return nullopt если класс не закрыт (тогда '[' - литерал)
std::optional<bool> match_bracket(std::string_view p, size_t pi, char c, size_t& next) {
    size_t i = pi + 1;
    bool negate = false;
    if (i < p.size() && (p[i] == '!' || p[i] == '^')) {
        negate = true;
        ++i;
    }

    bool matched = false;
    bool first = true;
    while (i < p.size() && (first || p[i] != ']')) {
        first = false;
        char lo = p[i];
        if (lo == '\\' && i + 1 < p.size()) {
            lo = p[++i];
        }
        char hi = lo;
        if (i + 2 < p.size() && p[i + 1] == '-' && p[i + 2] != ']') {
            hi = p[i + 2];
            if (hi == '\\' && i + 3 < p.size()) {
                hi = p[i + 3];
                ++i;
            }
            i += 2;
        }
        if (c >= lo && c <= hi) {
            matched = true;
        }
        ++i;
    }

    if (i >= p.size()) {
        return std::nullopt;
    }
    next = i + 1;
    return matched != negate;
}

bool glob_impl(std::string_view p, size_t pi, std::string_view t, size_t ti) {
    while (pi < p.size()) {
        char c = p[pi];

        if (c == '*') {
            size_t pj = pi;
            while (pj < p.size() && p[pj] == '*') {
                ++pj;
            }
            bool whole_segment = (pj - pi >= 2) && (pi == 0 || p[pi - 1] == '/') &&
                                 (pj == p.size() || p[pj] == '/');

            if (whole_segment) {
                // "a/**" - всё внутри
                if (pj == p.size()) {
                    return true;
                }
                // "**/" - ноль или больше каталогов
                size_t rest = pj + 1;
                if (glob_impl(p, rest, t, ti)) {
                    return true;
                }
                for (size_t k = ti; k < t.size(); ++k) {
                    if (t[k] == '/' && glob_impl(p, rest, t, k + 1)) {
                        return true;
                    }
                }
                return false;
            }

            // '*' - любая последовательность без '/'
            for (size_t k = ti;; ++k) {
                if (glob_impl(p, pj, t, k)) {
                    return true;
                }
                if (k >= t.size() || t[k] == '/') {
                    return false;
                }
            }
        }

        if (ti >= t.size()) {
            return false;
        }

        if (c == '?') {
            if (t[ti] == '/') {
                return false;
            }
            ++pi;
            ++ti;
            continue;
        }

        if (c == '[') {
            size_t next = 0;
            auto bracket = match_bracket(p, pi, t[ti], next);
            if (bracket.has_value()) {
                if (!*bracket || t[ti] == '/') {
                    return false;
                }
                pi = next;
                ++ti;
                continue;
            }
            // Незакрытый '[' сравнивается как литерал
        }

        if (c == '\\' && pi + 1 < p.size()) {
            ++pi;
            c = p[pi];
        }

        if (c != t[ti]) {
            return false;
        }
        ++pi;
        ++ti;
    }

    return ti == t.size();
}

/// Убрать завершающие пробелы (кроме экранированных) и '\r'
std::string_view trim_trailing(std::string_view line) {
    while (!line.empty()) {
        char last = line.back();
        if (last == '\r' || last == '\n') {
            line.remove_suffix(1);
            continue;
        }
        if (last == ' ' || last == '\t') {
            if (line.size() >= 2 && line[line.size() - 2] == '\\') {
                break;
            }
            line.remove_suffix(1);
            continue;
        }
        break;
    }
    return line;
}

/// Последний компонент пути
std::string_view basename_of(std::string_view path) {
    size_t slash = path.rfind('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

}  // namespace

bool glob_match(std::string_view pattern, std::string_view path) {
    return glob_impl(pattern, 0, path, 0);
}

// ----------------------------------------------------------------------------
// IgnoreRules
// ----------------------------------------------------------------------------

bool IgnoreRules::add_rule(std::string_view line, std::string_view base) {
    line = trim_trailing(line);
    if (line.empty() || line.front() == '#') {
        return false;
    }

    IgnoreRule rule;

    if (line.front() == '!') {
        rule.negated = true;
        line.remove_prefix(1);
    } else if (line.size() >= 2 && line[0] == '\\' && (line[1] == '!' || line[1] == '#')) {
        line.remove_prefix(1);
    }

    if (!line.empty() && line.back() == '/') {
        rule.dir_only = true;
        while (!line.empty() && line.back() == '/') {
            line.remove_suffix(1);
        }
    }

    if (!line.empty() && line.front() == '/') {
        rule.anchored = true;
        while (!line.empty() && line.front() == '/') {
            line.remove_prefix(1);
        }
    }

    if (line.empty()) {
        return false;
    }

    if (line.find('/') != std::string_view::npos) {
        rule.anchored = true;
    }

    rule.pattern = std::string(line);
    rule.base = std::string(base);
    while (!rule.base.empty() && rule.base.back() == '/') {
        rule.base.pop_back();
    }

    rules_.push_back(std::move(rule));
    return true;
}

size_t IgnoreRules::add_file(const std::filesystem::path& file, std::string_view base) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(file, ec)) {
        return 0;
    }

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        throw std::runtime_error("failed to read ignore file - " + platform::path_to_utf8(file));
    }

    size_t added = 0;
    std::string line;
    while (std::getline(in, line)) {
        if (add_rule(line, base)) {
            ++added;
        }
    }
    return added;
}

IgnoreMatch IgnoreRules::match(std::string_view rel_path, bool is_dir) const {
    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
        const IgnoreRule& rule = *it;

        if (rule.dir_only && !is_dir) {
            continue;
        }

        std::string_view sub = rel_path;
        if (!rule.base.empty()) {
            if (sub.size() <= rule.base.size() || sub.compare(0, rule.base.size(), rule.base) != 0 ||
                sub[rule.base.size()] != '/') {
                continue;
            }
            sub.remove_prefix(rule.base.size() + 1);
        }

        bool matched = rule.anchored ? glob_match(rule.pattern, sub)
                                     : glob_match(rule.pattern, basename_of(sub));
        if (matched) {
            return rule.negated ? IgnoreMatch::Whitelist : IgnoreMatch::Ignore;
        }
    }
    return IgnoreMatch::None;
}

// ----------------------------------------------------------------------------
// Глобальный ignore
// ----------------------------------------------------------------------------

std::optional<std::filesystem::path> global_ignore_file() {
    if (auto xdg = platform::env_var("XDG_CONFIG_HOME")) {
        return platform::path_from_utf8(*xdg) / "git" / "ignore";
    }
    if (auto home = platform::home_directory()) {
        return *home / ".config" / "git" / "ignore";
    }
    return std::nullopt;
}

}  // namespace epcheck::io
