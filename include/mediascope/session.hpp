// ==============================================================================
// mediascope/session.hpp - Интерактивная машина состояний
// ==============================================================================
//
// Назначение:
// - Текущий режим (tagged union): у каждого режима только своё состояние
// - Маршрутизация KeyEvent по режимам
// - Курсор выбора по отфильтрованному представлению (с переходом через край)
// - Жизненный цикл уведомления
// - Вызов движка извлечения и изменение каталога
//
// Переходы не бывают ошибочными: ошибки analyze() превращаются в уведомление.
//
// ==============================================================================

#ifndef MEDIASCOPE_SESSION_HPP
#define MEDIASCOPE_SESSION_HPP

#include <chrono>
#include <cstddef>
#include <functional>
#include <mediascope/catalogue.hpp>
#include <mediascope/key.hpp>
#include <mediascope/notification.hpp>
#include <mediascope/probe.hpp>
#include <mediascope/text_input.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace mediascope {

namespace output {
class Writer;
}  // namespace output

// ----------------------------------------------------------------------------
// Режимы
// ----------------------------------------------------------------------------

enum class Mode { Browsing, AddingFile, EditingFilter, ViewingRawOutput, ViewingHelp };

namespace mode {

struct Browsing {};

struct AddingFile {
    TextInput input;
};

struct EditingFilter {
    TextInput input;
};

struct ViewingRawOutput {
    std::size_t scroll = 0;
};

struct ViewingHelp {};

}  // namespace mode

using ModeState = std::variant<mode::Browsing, mode::AddingFile, mode::EditingFilter,
                               mode::ViewingRawOutput, mode::ViewingHelp>;

// ----------------------------------------------------------------------------
// Вкладки (только для отображения)
// ----------------------------------------------------------------------------

constexpr std::size_t TAB_COUNT = 3;

/// "Files", "Filters", "Stats"
const char* tab_name(std::size_t tab);

// ----------------------------------------------------------------------------
// Session
// ----------------------------------------------------------------------------

enum class Outcome { Continue, Quit };

struct SessionOptions {
    std::chrono::milliseconds notification_lifetime = DEFAULT_NOTIFICATION_LIFETIME;
};

class Session {
public:
    using Clock = Notification::Clock;
    using NowFn = std::function<Clock::time_point()>;

    /// @param prober Пробник для add-file (должен пережить сессию)
    /// @param now Источник времени; пустой = steady_clock::now
    /// @param log Журнал диагностики (может быть nullptr)
    explicit Session(const probe::Prober& prober, SessionOptions options = {}, NowFn now = {},
                     output::Writer* log = nullptr);

    /// Обработать нажатие; Quit только из Browsing
    Outcome handle_key(const KeyEvent& key);

    // Состояние для отображения (только чтение)
    // -------------------------------------------------------------------------

    Mode mode() const;
    const ModeState& mode_state() const { return state_; }
    const Catalogue& catalogue() const { return catalogue_; }

    /// Отфильтрованное представление; пересчитывается при каждом вызове
    std::vector<const MediaRecord*> view() const { return catalogue_.view(); }

    /// Индекс выбранной записи в представлении
    std::size_t selected() const { return selected_; }

    /// Выбранная запись представления или nullptr
    const MediaRecord* selected_record() const;

    std::size_t tab() const { return tab_; }

    /// Смещение прокрутки (только в ViewingRawOutput)
    std::optional<std::size_t> raw_scroll() const;

    /// Буфер ввода (только в AddingFile / EditingFilter)
    const TextInput* edit_buffer() const;

    const std::optional<Notification>& notification() const { return notification_; }

    /// Строка статуса: уведомление, пока не истекло, иначе сообщение режима.
    /// Истёкшее уведомление отбрасывается.
    std::string status_line(Clock::time_point now);
    std::string status_line() { return status_line(now_()); }

    /// Сообщение статуса режима по умолчанию
    static const char* default_status(Mode mode);

    // Операции
    // -------------------------------------------------------------------------

    /// Проанализировать файл и добавить в каталог; итог: в уведомлении
    void add_file(const std::string& path);

    /// Применить "<field>=<value>" как новый фильтр
    void apply_filter(const std::string& text);

    /// Удалить последний фильтр
    void remove_last_filter();

    /// Очистить каталог и фильтры, курсор в 0
    void clear_all();

    /// Курсор вперёд/назад с переходом через край; no-op на пустом представлении
    void select_next();
    void select_previous();

    void notify(std::string message);

private:
    Outcome handle_browsing(const KeyEvent& key);
    void handle_adding_file(const KeyEvent& key);
    void handle_editing_filter(const KeyEvent& key);
    void handle_raw_output(const KeyEvent& key);
    void handle_help(const KeyEvent& key);

    const probe::Prober& prober_;
    SessionOptions options_;
    NowFn now_;
    output::Writer* log_;

    Catalogue catalogue_;
    ModeState state_;
    std::size_t selected_ = 0;
    std::size_t tab_ = 0;
    std::optional<Notification> notification_;
};

}  // namespace mediascope

#endif  // MEDIASCOPE_SESSION_HPP
