// ==============================================================================
// mediascope/tui.hpp - Терминальный интерфейс (ncurses)
// ==============================================================================
//
// Назначение:
// - Terminal: RAII-обёртка над экраном ncurses (raw mode, alternate screen)
// - translate_key(): коды ncurses -> KeyEvent
// - render(): отрисовка состояния сессии (только чтение, кроме истечения
//   уведомления)
// - run(): цикл событий
//
// ==============================================================================

#ifndef MEDIASCOPE_TUI_HPP
#define MEDIASCOPE_TUI_HPP

#include <cstdint>
#include <mediascope/config.hpp>
#include <mediascope/key.hpp>
#include <mediascope/probe.hpp>
#include <mediascope/session.hpp>
#include <memory>
#include <optional>

namespace mediascope::tui {

/// Период перерисовки при отсутствии ввода (истечение уведомлений)
constexpr int REDRAW_TIMEOUT_MS = 250;

/// Экран ncurses на время жизни объекта
class Terminal {
public:
    /// @throws std::runtime_error если терминал не удалось инициализировать
    Terminal();
    ~Terminal();

    Terminal(const Terminal&) = delete;
    Terminal& operator=(const Terminal&) = delete;

    /// Ждать клавишу не дольше REDRAW_TIMEOUT_MS; nullopt при таймауте/resize
    std::optional<KeyEvent> read_key();

    /// Отрисовать кадр
    void render(Session& session, const config::FilterPresets& presets);

    /// Вернуть терминал в исходное состояние; false при ошибке
    bool close();

private:
    struct ScreenHandle;
    std::unique_ptr<ScreenHandle> screen_;
    bool colors_ = false;
    probe::SummaryCache summaries_;
};

/// Перевести код ncurses в KeyEvent
/// @param function_key true если код пришёл как KEY_CODE_YES
KeyEvent translate_key(bool function_key, std::uint32_t code);

/// Цикл событий до выхода из сессии
/// @return код завершения процесса
int run(Terminal& terminal, Session& session, const config::FilterPresets& presets);

}  // namespace mediascope::tui

#endif  // MEDIASCOPE_TUI_HPP
