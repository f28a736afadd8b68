// ==============================================================================
// output.cpp - Пользовательский вывод и журнал диагностики
// ==============================================================================
//
// Только этот модуль пишет в stdout/stderr вне терминального UI.
// Байты первичны, std::endl не используется.
//
// ==============================================================================

#include "mediascope/output.hpp"

#include "mediascope/platform.hpp"

#include <cstdio>

namespace mediascope::output {

// ----------------------------------------------------------------------------
// ANSI Escape Codes
// ----------------------------------------------------------------------------

namespace {

constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

std::string with_prefix(std::string_view prefix, std::string_view message) {
    std::string result(prefix);
    result += ' ';
    result.append(message);
    result += '\n';
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {
    if (config_.log_path.has_value()) {
        open_log_file();
    }
}

Writer::~Writer() {
    close_log_file();
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    FILE* f = get_file(s);
    if (f != nullptr) {
        std::fwrite(bytes.data(), 1, bytes.size(), f);
    }
}

void Writer::write_line(Stream s, std::string_view bytes) {
    write(s, bytes);
    write(s, "\n");
}

FILE* Writer::get_file(Stream s) const {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::emit(std::string_view prefix, Color color, std::string_view message) {
    // Журнал получает всё, что прошло фильтр уровня
    if (log_file_ != nullptr) {
        std::string line = with_prefix(prefix, message);
        std::fwrite(line.data(), 1, line.size(), log_file_);
        std::fflush(log_file_);
    }

    // Пока UI занимает экран, stderr не трогаем
    if (terminal_held_) {
        return;
    }

    write_colored(Stream::Stderr, prefix, color);
    write(Stream::Stderr, " ");
    write_line(Stream::Stderr, message);
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    emit("[+]", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    emit("[!]", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при quiet
    emit("[x]", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    emit("[*]", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    emit("[~]", Color::Magenta, message);
}

void Writer::fatal(std::string_view message) {
    if (log_file_ != nullptr) {
        std::string line = with_prefix("[x]", message);
        std::fwrite(line.data(), 1, line.size(), log_file_);
        std::fflush(log_file_);
    }

    write(Stream::Stdout, "Error: ");
    write_line(Stream::Stdout, message);
    std::fflush(stdout);
}

void Writer::write_colored(Stream s, std::string_view message, Color color) {
    if (supports_color(s) && color != Color::Default) {
        write(s, ansi_color_code(color));
        write(s, message);
        write(s, ANSI_RESET);
    } else {
        write(s, message);
    }
}

void Writer::flush() {
    std::fflush(stdout);
    std::fflush(stderr);
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
    }
}

bool Writer::open_log_file() {
    if (!config_.log_path.has_value()) {
        return false;
    }
    if (log_file_ != nullptr) {
        return true;
    }

    std::string path_str = platform::path_to_utf8(*config_.log_path);
    // Журнал дописывается между запусками
    log_file_ = std::fopen(path_str.c_str(), "ab");
    return log_file_ != nullptr;
}

void Writer::close_log_file() {
    if (log_file_ != nullptr) {
        std::fflush(log_file_);
        std::fclose(log_file_);
        log_file_ = nullptr;
    }
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace mediascope::output
