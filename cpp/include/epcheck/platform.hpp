// ==============================================================================
// epcheck/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Явные преобразования path <-> UTF-8
// - Определение TTY для цветного вывода
// - Переменные окружения и домашний каталог (глобальный git ignore)
// - Число аппаратных потоков для пула сканера
// - Потокобезопасное преобразование времени в UTC
//
// Вся платформенная специфика изолирована здесь.
//
// ==============================================================================

#ifndef EPCHECK_PLATFORM_HPP
#define EPCHECK_PLATFORM_HPP

#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace epcheck::platform {

// ----------------------------------------------------------------------------
// Преобразования путей
// ----------------------------------------------------------------------------

/// Построить путь из UTF-8 строки (argv, содержимое ignore-файлов)
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Получить UTF-8 представление пути (для вывода и сравнения)
std::string path_to_utf8(const std::filesystem::path& p);

/// UTF-8 представление с разделителем '/' на всех платформах
/// Используется в результатах анализа и при сопоставлении ignore-паттернов
std::string path_to_generic_utf8(const std::filesystem::path& p);

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();

// ----------------------------------------------------------------------------
// Окружение
// ----------------------------------------------------------------------------

/// Значение переменной окружения; nullopt если не задана или пуста
std::optional<std::string> env_var(const char* name);

/// Домашний каталог пользователя (HOME / USERPROFILE)
std::optional<std::filesystem::path> home_directory();

/// Разложить время в UTC (gmtime_r / gmtime_s)
std::tm utc_time(std::time_t t);

/// Число аппаратных потоков, не меньше 1
/// Если std::thread::hardware_concurrency() неизвестно, возвращает 4
unsigned int hardware_threads();

}  // namespace epcheck::platform

#endif  // EPCHECK_PLATFORM_HPP
