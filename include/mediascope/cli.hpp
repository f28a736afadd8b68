// ==============================================================================
// mediascope/cli.hpp - CLI парсинг
// ==============================================================================
//
// Назначение:
// - Парсинг argv (позиционных аргументов нет)
// - Генерация --help / --version
// - Диагностические ошибки CLI
//
// ==============================================================================

#ifndef MEDIASCOPE_CLI_HPP
#define MEDIASCOPE_CLI_HPP

#include <string>
#include <variant>

namespace mediascope::cli {

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

/// Запуск интерактивной сессии (без аргументов)
struct RunCommand {};

/// -h, --help
struct HelpCommand {};

/// -V, --version
struct VersionCommand {};

using Command = std::variant<RunCommand, HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика CLI
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 2;
    std::string stderr_message;
};

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct ParseResult {
    bool ok = false;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help
std::string render_help();

/// Текст --version
std::string render_version();

// ----------------------------------------------------------------------------
// Константы
// ----------------------------------------------------------------------------

constexpr const char* PROGRAM = "mediascope";

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Inspect media files with ffprobe in an interactive terminal table";

}  // namespace mediascope::cli

#endif  // MEDIASCOPE_CLI_HPP
