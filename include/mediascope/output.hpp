// ==============================================================================
// mediascope/output.hpp - Пользовательский вывод и журнал диагностики
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr вне терминального UI
// - Диагностические сообщения с префиксами [+] [!] [x] [*] [~]
// - Журнал в файл (log.path) пока терминал занят UI
// - Цветной вывод (ANSI escape codes) для TTY
//
// ==============================================================================

#ifndef MEDIASCOPE_OUTPUT_HPP
#define MEDIASCOPE_OUTPUT_HPP

#include <cstdio>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace mediascope::output {

// ----------------------------------------------------------------------------
// Потоки вывода
// ----------------------------------------------------------------------------

enum class Stream { Stdout, Stderr };

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
    bool quiet = false;  // подавить informational stderr
    int verbose = 0;     // уровень подробности (0..2+)

    // Файл журнала: диагностика дублируется сюда (без ANSI)
    std::optional<std::filesystem::path> log_path;
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

    /// "[+] <message>" (подавляется при quiet)
    void info(std::string_view message);

    /// "[!] <message>" (подавляется при quiet)
    void warn(std::string_view message);

    /// "[x] <message>" (всегда)
    void error(std::string_view message);

    /// "[*] <message>" (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" (только при verbose > 1)
    void trace(std::string_view message);

    /// Ошибка запуска или завершения: "Error: <message>" в stdout,
    /// "[x] <message>" в файл журнала
    void fatal(std::string_view message);

    // Управление
    // -------------------------------------------------------------------------

    /// Терминал занят UI: диагностика идёт только в файл журнала
    void hold_terminal(bool held) { terminal_held_ = held; }

    bool terminal_held() const { return terminal_held_; }

    /// Сбросить буферы
    void flush();

    /// Получить текущую конфигурацию
    const OutputConfig& config() const { return config_; }

    /// Открыть файл журнала (при log_path задан); false при ошибке открытия
    bool open_log_file();

    /// Закрыть файл журнала
    void close_log_file();

    /// Проверить, открыт ли файл журнала
    bool has_log_file() const { return log_file_ != nullptr; }

private:
    /// Записать диагностическое сообщение с префиксом
    void emit(std::string_view prefix, Color color, std::string_view message);

    /// Записать с цветом
    void write_colored(Stream s, std::string_view message, Color color);

    /// Получить FILE* для потока
    FILE* get_file(Stream s) const;

    OutputConfig config_;
    FILE* log_file_ = nullptr;
    bool terminal_held_ = false;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

/// Получить ANSI escape code для цвета
std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace mediascope::output

#endif  // MEDIASCOPE_OUTPUT_HPP
