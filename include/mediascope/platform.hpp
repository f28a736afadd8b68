// ==============================================================================
// mediascope/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования path <-> UTF-8
// - TTY detection
// - Запуск внешнего процесса с захватом stdout
// - Lossy-декодирование байтов в UTF-8
// - Пути к пользовательской конфигурации
//
// Вся POSIX-специфика изолирована в этом модуле.
//
// ==============================================================================

#ifndef MEDIASCOPE_PLATFORM_HPP
#define MEDIASCOPE_PLATFORM_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediascope::platform {

// ----------------------------------------------------------------------------
// Пути
// ----------------------------------------------------------------------------

/// Создать path из UTF-8 строки
std::filesystem::path path_from_utf8(std::string_view u8str);

/// Преобразовать path в UTF-8 строку
std::string path_to_utf8(const std::filesystem::path& p);

/// Значение переменной окружения (nullopt если не задана или пустая)
std::optional<std::string> env_var(const char* name);

/// Каталог пользовательской конфигурации: $XDG_CONFIG_HOME или $HOME/.config
std::optional<std::filesystem::path> user_config_dir();

// ----------------------------------------------------------------------------
// TTY detection
// ----------------------------------------------------------------------------

bool is_tty_stdout();
bool is_tty_stderr();
bool is_tty_stdin();

// ----------------------------------------------------------------------------
// Внешние процессы
// ----------------------------------------------------------------------------

/// Результат запуска процесса
struct ProcessResult {
    /// false если процесс не удалось запустить (нет бинарника, нет прав)
    bool launched = false;

    /// Весь stdout процесса (байты как есть)
    std::string stdout_data;

    /// Код завершения (128 + сигнал при аварийном завершении)
    int exit_code = 0;

    /// Описание ошибки запуска (при launched == false)
    std::string error;
};

/// Запустить программу синхронно и дождаться завершения
///
/// @param program Имя или путь исполняемого файла (поиск по PATH)
/// @param args Аргументы без argv[0]
/// @return ProcessResult; stderr процесса отбрасывается
///
/// Ненулевой код завершения не считается ошибкой запуска.
ProcessResult run_process(const std::string& program, const std::vector<std::string>& args);

// ----------------------------------------------------------------------------
// Кодировки
// ----------------------------------------------------------------------------

/// Декодировать байты как UTF-8, заменяя некорректные последовательности на U+FFFD
std::string utf8_lossy(std::string_view bytes);

}  // namespace mediascope::platform

#endif  // MEDIASCOPE_PLATFORM_HPP
