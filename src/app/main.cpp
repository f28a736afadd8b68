// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// Точка входа:
// 1. Парсинг argv
// 2. Загрузка конфигурации
// 3. Создание Writer и пробника
// 4. Интерактивная сессия в терминале
// 5. Возврат exit code
//
// ==============================================================================

#include "mediascope/cli.hpp"
#include "mediascope/config.hpp"
#include "mediascope/output.hpp"
#include "mediascope/platform.hpp"
#include "mediascope/probe.hpp"
#include "mediascope/session.hpp"
#include "mediascope/tui.hpp"

#include <clocale>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>

namespace {

// ----------------------------------------------------------------------------
// Интерактивная сессия
// ----------------------------------------------------------------------------

int run_session(const mediascope::config::Config& cfg) {
    using namespace mediascope;

    output::OutputConfig out_cfg;
    out_cfg.verbose = cfg.verbose;
    out_cfg.log_path = cfg.log_path;
    output::Writer writer(out_cfg);

    if (cfg.log_path && !writer.has_log_file()) {
        writer.warn("cannot open log file '" + platform::path_to_utf8(*cfg.log_path) + "'");
    }
    if (cfg.source) {
        writer.debug("config: " + platform::path_to_utf8(*cfg.source));
    }
    writer.debug("probe binary: " + cfg.probe_binary);

    probe::FfprobeProber prober(cfg.probe_binary);
    SessionOptions options;
    options.notification_lifetime = cfg.notification_lifetime;
    Session session(prober, options, {}, &writer);

    std::unique_ptr<tui::Terminal> terminal;
    try {
        terminal = std::make_unique<tui::Terminal>();
    } catch (const std::runtime_error& e) {
        // Ошибки запуска: в stdout, как и ошибки конфигурации
        writer.fatal(e.what());
        return 1;
    }

    writer.hold_terminal(true);
    int code = tui::run(*terminal, session, cfg.presets);
    bool restored = terminal->close();
    writer.hold_terminal(false);

    if (!restored) {
        writer.fatal("failed to restore terminal state");
        return 1;
    }
    writer.debug("session finished with " + std::to_string(session.catalogue().size()) +
                 " file(s)");
    return code;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    using namespace mediascope;

    // 1. Парсинг argv
    cli::ParseResult parse_result = cli::parse(argc, argv);
    if (!parse_result.ok) {
        std::cerr << parse_result.diagnostic.stderr_message;
        return parse_result.diagnostic.exit_code;
    }

    // 2. Dispatch команды
    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                std::cout << cli::render_help();
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                std::cout << cli::render_version();
                return 0;
            } else {
                auto loaded = config::load_default();
                if (!loaded) {
                    output::Writer writer(output::OutputConfig{});
                    writer.fatal(loaded.error.format());
                    return 1;
                }
                return run_session(loaded.config);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// main
// ----------------------------------------------------------------------------

int main(int argc, char** argv) {
    // Широкие символы ncurses зависят от локали окружения
    std::setlocale(LC_ALL, "");

    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    } catch (...) {
        std::cerr << "[x] Unknown error occurred\n";
        return 1;
    }
}
