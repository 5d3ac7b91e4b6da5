// ==============================================================================
// epcheck/scanner.hpp - Параллельный сканер содержимого
// ==============================================================================
//
// Назначение:
// - Чтение файла целиком с классификацией ошибок (ReadStatus)
// - scan_content(): сопоставление текста со всей таблицей паттернов
// - ContentScanner: пул из N потоков, разбирающий общую очередь файлов
//
// Модель потоков:
// - очередь файлов - атомарный индекс по входному вектору
// - каждый поток копит FileUsage в локальном векторе
// - после join координирующий поток раскладывает записи по индексам,
//   поэтому порядок результата совпадает с порядком входа
// - PatternTable разделяется только на чтение
//
// Нечитаемый файл даёт пустую запись (readable = false) и не прерывает
// сканирование.
//
// ==============================================================================

#ifndef EPCHECK_SCANNER_HPP
#define EPCHECK_SCANNER_HPP

#include <epcheck/endpoint.hpp>
#include <epcheck/pattern.hpp>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace epcheck::output {
class Writer;
}

namespace epcheck::scan {

/// Файлы больше этого размера пропускаются (16 MiB)
constexpr std::uint64_t DEFAULT_MAX_FILE_SIZE = 16ULL * 1024 * 1024;

/// Сколько первых байт проверяется на NUL (признак бинарного файла)
constexpr std::size_t BINARY_PROBE_SIZE = 8192;

// ============================================================================
// Чтение файлов
// ============================================================================

enum class ReadStatus {
    Ok,
    NotFound,
    PermissionDenied,
    IoError,
    Binary,   // NUL в первых BINARY_PROBE_SIZE байтах
    TooLarge  // больше max_file_size
};

const char* read_status_to_string(ReadStatus status);

struct ReadResult {
    ReadStatus status = ReadStatus::Ok;
    std::string content;
    std::string message;  // системное сообщение для IoError/PermissionDenied

    bool ok() const { return status == ReadStatus::Ok; }
};

/// Прочитать текстовый файл целиком
ReadResult read_text_file(const std::filesystem::path& path,
                          std::uint64_t max_file_size = DEFAULT_MAX_FILE_SIZE);

// ============================================================================
// Записи использования
// ============================================================================

struct EndpointHits {
    model::Endpoint endpoint;
    std::size_t count = 0;  // сумма совпадений всех вариантов паттерна
};

/// Результат сканирования одного файла
struct FileUsage {
    std::string path;                   // относительно корня, generic форма
    std::vector<EndpointHits> matches;  // только эндпоинты с count > 0
    bool readable = true;
};

/// Сопоставить текст со всей таблицей
/// @return Эндпоинты с хотя бы одним совпадением, в порядке таблицы
std::vector<EndpointHits> scan_content(std::string_view content, const pattern::PatternTable& table);

/// Путь для отчёта: относительно root, '/' как разделитель
std::string display_path(const std::filesystem::path& file, const std::filesystem::path& root);

// ============================================================================
// ContentScanner
// ============================================================================

struct ScanOptions {
    /// Число рабочих потоков (0 - по числу аппаратных потоков)
    unsigned int num_threads = 0;

    std::uint64_t max_file_size = DEFAULT_MAX_FILE_SIZE;

    /// Корень для относительных путей в FileUsage::path
    std::filesystem::path root;

    /// Логирование (nullptr - молча); Writer потокобезопасен
    output::Writer* log = nullptr;
};

struct ScanStats {
    std::size_t files_total = 0;
    std::size_t files_read = 0;
    std::size_t files_skipped = 0;
    unsigned int threads_used = 0;
};

class ContentScanner {
public:
    ContentScanner(const pattern::PatternTable& table, ScanOptions options);

    /// Просканировать один файл (вызывается из рабочих потоков)
    FileUsage scan_file(const std::filesystem::path& path) const;

    /// Просканировать все файлы пулом потоков
    /// @return По одной записи на файл, в порядке входного вектора
    std::vector<FileUsage> scan_files(const std::vector<std::filesystem::path>& files);

    /// Статистика последнего scan_files()
    const ScanStats& stats() const { return stats_; }

    /// Число потоков с учётом значения по умолчанию
    unsigned int num_threads() const { return num_threads_; }

private:
    const pattern::PatternTable& table_;
    ScanOptions options_;
    unsigned int num_threads_ = 1;
    ScanStats stats_;
};

}  // namespace epcheck::scan

#endif  // EPCHECK_SCANNER_HPP
