// ==============================================================================
// epcheck/output.hpp - Пользовательский вывод и логирование
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Сообщения с префиксами [+] [!] [x] [*] [~] (уровни логирования)
// - Цветной вывод (ANSI escape codes) при TTY
// - Таблицы с Unicode box-drawing
// - Вывод отчёта в файл (--output)
//
// Writer разделяется между потоками сканера: каждое сообщение
// записывается целиком под внутренним mutex.
//
// ==============================================================================

#ifndef EPCHECK_OUTPUT_HPP
#define EPCHECK_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace epcheck::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

// ----------------------------------------------------------------------------
// Формат отчёта
// ----------------------------------------------------------------------------

enum class Format {
    Table,  // Таблица + сводка (по умолчанию)
    Json    // JSON документ
};

/// "table" / "json"
const char* format_to_string(Format format);

/// Разобрать имя формата; nullopt для неизвестного
std::optional<Format> format_from_string(std::string_view name);

// ----------------------------------------------------------------------------
// ANSI цвета для терминала
// ----------------------------------------------------------------------------

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;             // -q: подавить informational stderr
    int verbose = 0;                // -v: уровень подробности (0..2+)
    bool no_colors = false;         // --no-colors
    Format format = Format::Table;  // Формат отчёта

    // Путь для отчёта (--output); stderr остаётся в терминале
    std::optional<std::filesystem::path> output_path;
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    // Базовый вывод
    // -------------------------------------------------------------------------

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    // Сообщения с префиксами
    // -------------------------------------------------------------------------

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    /// Включён ли уровень debug (чтобы не строить дорогие сообщения зря)
    bool debug_enabled() const { return config_.verbose > 0; }

    /// Включён ли уровень trace
    bool trace_enabled() const { return config_.verbose > 1; }

    // Управление
    // -------------------------------------------------------------------------

    /// Сбросить буферы
    void flush();

    /// Получить текущую конфигурацию
    const OutputConfig& config() const { return config_; }

    /// Проверить, открыт ли файл для вывода
    bool has_output_file() const { return output_file_ != nullptr; }

private:
    /// Открыть файл для вывода (при output_path задан)
    bool open_output_file();

    /// Закрыть файл вывода
    void close_output_file();

    /// Записать байты без блокировки (вызывающий держит mutex_)
    void write_unlocked(Stream s, std::string_view bytes);

    /// Записать сообщение с цветным префиксом целиком
    void emit(std::string_view prefix, Color color, std::string_view message);

    /// Разрешён ли цвет для потока
    bool use_color(Stream s) const;

    /// Получить FILE* для потока
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* output_file_ = nullptr;  // Файл для вывода (если --output)
    std::mutex mutex_;
};

// ----------------------------------------------------------------------------
// Table - форматирование таблиц
// ----------------------------------------------------------------------------

class Table {
public:
    Table();

    /// Добавить заголовки
    void set_headers(const std::vector<std::string>& headers);

    /// Добавить строку данных
    void add_row(const std::vector<std::string>& cells);

    /// Вывести таблицу через Writer (Unicode box-drawing)
    void print(Writer& w) const;

    /// Вывести таблицу в строку
    std::string to_string() const;

    /// Получить количество строк (без заголовка)
    size_t row_count() const { return rows_.size(); }

private:
    /// Вычислить ширину столбцов (в символах UTF-8)
    std::vector<size_t> column_widths() const;

    std::string format_line(char position, const std::vector<size_t>& widths) const;
    std::string format_row(const std::vector<std::string>& cells,
                           const std::vector<size_t>& widths) const;

    std::vector<std::string> headers_;
    std::vector<std::vector<std::string>> rows_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Количество кодовых точек UTF-8 (ширина ячейки таблицы)
size_t display_width(std::string_view text);

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace epcheck::output

#endif  // EPCHECK_OUTPUT_HPP
