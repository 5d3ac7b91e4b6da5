// ==============================================================================
// scanner.cpp - Параллельный сканер содержимого
// ==============================================================================

#include "epcheck/scanner.hpp"

#include "epcheck/output.hpp"
#include "epcheck/platform.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <system_error>
#include <thread>
#include <utility>

namespace epcheck::scan {

namespace {

/// RAII обёртка над FILE*
struct FileCloser {
    void operator()(std::FILE* f) const {
        if (f != nullptr) {
            std::fclose(f);
        }
    }
};

ReadStatus status_from_errno(int err) {
    switch (err) {
    case ENOENT:
    case ENOTDIR:
        return ReadStatus::NotFound;
    case EACCES:
    case EPERM:
        return ReadStatus::PermissionDenied;
    default:
        return ReadStatus::IoError;
    }
}

ReadStatus status_from_error_code(const std::error_code& ec) {
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory) {
        return ReadStatus::NotFound;
    }
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
        return ReadStatus::PermissionDenied;
    }
    return ReadStatus::IoError;
}

}  // namespace

// ----------------------------------------------------------------------------
// Чтение файлов
// ----------------------------------------------------------------------------

const char* read_status_to_string(ReadStatus status) {
    switch (status) {
    case ReadStatus::Ok:
        return "ok";
    case ReadStatus::NotFound:
        return "file not found";
    case ReadStatus::PermissionDenied:
        return "permission denied";
    case ReadStatus::IoError:
        return "I/O error";
    case ReadStatus::Binary:
        return "binary content";
    case ReadStatus::TooLarge:
        return "file too large";
    }
    return "unknown";
}

ReadResult read_text_file(const std::filesystem::path& path, std::uint64_t max_file_size) {
    ReadResult result;

    std::error_code ec;
    std::uintmax_t size = std::filesystem::file_size(path, ec);
    if (ec) {
        result.status = status_from_error_code(ec);
        result.message = ec.message();
        return result;
    }
    if (size > max_file_size) {
        result.status = ReadStatus::TooLarge;
        result.message = std::to_string(size) + " bytes";
        return result;
    }

#ifdef _WIN32
    std::unique_ptr<std::FILE, FileCloser> file(_wfopen(path.c_str(), L"rb"));
#else
    std::unique_ptr<std::FILE, FileCloser> file(std::fopen(path.c_str(), "rb"));
#endif
    if (!file) {
        int err = errno;
        result.status = status_from_errno(err);
        result.message = std::error_code(err, std::generic_category()).message();
        return result;
    }

    // Файл мог вырасти после file_size(): читаем до EOF, но не дальше лимита
    std::string content;
    content.reserve(static_cast<size_t>(size));
    char buffer[64 * 1024];
    while (true) {
        size_t n = std::fread(buffer, 1, sizeof(buffer), file.get());
        if (n > 0) {
            content.append(buffer, n);
            if (content.size() > max_file_size) {
                result.status = ReadStatus::TooLarge;
                result.message = "file grew beyond limit while reading";
                return result;
            }
        }
        if (n < sizeof(buffer)) {
            if (std::ferror(file.get()) != 0) {
                result.status = ReadStatus::IoError;
                result.message = "read failed";
                return result;
            }
            break;
        }
    }

    size_t probe = std::min(content.size(), BINARY_PROBE_SIZE);
    if (std::memchr(content.data(), '\0', probe) != nullptr) {
        result.status = ReadStatus::Binary;
        return result;
    }

    result.content = std::move(content);
    return result;
}

// ----------------------------------------------------------------------------
// Сопоставление
// ----------------------------------------------------------------------------

std::vector<EndpointHits> scan_content(std::string_view content, const pattern::PatternTable& table) {
    std::vector<EndpointHits> hits;

    // Паттерны одного эндпоинта в таблице идут подряд
    for (const auto& entry : table.entries()) {
        size_t count = pattern::count_matches(content, entry);
        if (count == 0) {
            continue;
        }
        if (!hits.empty() && hits.back().endpoint == entry.endpoint) {
            hits.back().count += count;
        } else {
            hits.push_back(EndpointHits{entry.endpoint, count});
        }
    }

    return hits;
}

std::string display_path(const std::filesystem::path& file, const std::filesystem::path& root) {
    if (!root.empty()) {
        std::filesystem::path rel = file.lexically_relative(root);
        if (!rel.empty() && *rel.begin() != "..") {
            return platform::path_to_generic_utf8(rel);
        }
    }
    return platform::path_to_generic_utf8(file);
}

// ----------------------------------------------------------------------------
// ContentScanner
// ----------------------------------------------------------------------------

ContentScanner::ContentScanner(const pattern::PatternTable& table, ScanOptions options)
    : table_(table), options_(std::move(options)) {
    num_threads_ = options_.num_threads > 0 ? options_.num_threads : platform::hardware_threads();
}

FileUsage ContentScanner::scan_file(const std::filesystem::path& path) const {
    FileUsage usage;
    usage.path = display_path(path, options_.root);

    ReadResult read = read_text_file(path, options_.max_file_size);
    if (!read.ok()) {
        usage.readable = false;
        if (options_.log != nullptr) {
            std::string message = "skipping '" + usage.path + "' - " +
                                  read_status_to_string(read.status);
            if (!read.message.empty()) {
                message += " (" + read.message + ")";
            }
            // Бинарные и большие файлы ожидаемы, ошибки доступа - нет
            if (read.status == ReadStatus::Binary || read.status == ReadStatus::TooLarge) {
                options_.log->debug(message);
            } else {
                options_.log->warn(message);
            }
        }
        return usage;
    }

    usage.matches = scan_content(read.content, table_);

    if (options_.log != nullptr && options_.log->trace_enabled()) {
        options_.log->trace("scanned '" + usage.path + "' - " + std::to_string(usage.matches.size()) +
                            " endpoints matched");
    }
    return usage;
}

std::vector<FileUsage> ContentScanner::scan_files(const std::vector<std::filesystem::path>& files) {
    stats_ = ScanStats{};
    stats_.files_total = files.size();

    std::vector<FileUsage> results(files.size());
    if (files.empty()) {
        return results;
    }

    unsigned int workers = static_cast<unsigned int>(std::min<size_t>(num_threads_, files.size()));
    stats_.threads_used = workers;

    std::atomic<size_t> next_index{0};
    std::vector<std::vector<std::pair<size_t, FileUsage>>> partials(workers);

    auto worker = [&](unsigned int worker_id) {
        // Локальное накопление: без блокировок до join
        auto& local = partials[worker_id];

        while (true) {
            size_t index = next_index.fetch_add(1, std::memory_order_relaxed);
            if (index >= files.size()) {
                break;
            }

            try {
                local.emplace_back(index, scan_file(files[index]));
            } catch (const std::exception& e) {
                // Сбой сопоставления (например regex_error) не прерывает сканирование
                FileUsage usage;
                usage.path = display_path(files[index], options_.root);
                usage.readable = false;
                if (options_.log != nullptr) {
                    options_.log->warn("failed to scan '" + usage.path + "' - " + e.what());
                }
                local.emplace_back(index, std::move(usage));
            }
        }
    };

    if (workers == 1) {
        worker(0);
    } else {
        std::vector<std::thread> threads;
        threads.reserve(workers);
        try {
            for (unsigned int t = 0; t < workers; ++t) {
                threads.emplace_back(worker, t);
            }
        } catch (const std::system_error&) {
            // Уже запущенные потоки нужно дождаться до выхода из функции
            next_index.store(files.size());
            for (auto& t : threads) {
                t.join();
            }
            throw;
        }
        for (auto& t : threads) {
            t.join();
        }
    }

    // Слияние выполняет только координирующий поток
    for (auto& local : partials) {
        for (auto& [index, usage] : local) {
            if (usage.readable) {
                ++stats_.files_read;
            } else {
                ++stats_.files_skipped;
            }
            results[index] = std::move(usage);
        }
    }

    return results;
}

}  // namespace epcheck::scan
