// ==============================================================================
// session.cpp - Интерактивная машина состояний
// ==============================================================================
//
// Однопоточная, синхронная: add-file блокирует цикл событий до завершения
// пробника. Отмены нет.
//
// ==============================================================================

#include <iomanip>
#include <locale>
#include <mediascope/extract.hpp>
#include <mediascope/filter.hpp>
#include <mediascope/output.hpp>
#include <mediascope/session.hpp>
#include <sstream>
#include <utility>

namespace mediascope {

namespace {

std::string format_seconds(std::chrono::duration<double> elapsed) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(2) << elapsed.count();
    return oss.str();
}

}  // anonymous namespace

// ----------------------------------------------------------------------------
// Имена
// ----------------------------------------------------------------------------

const char* tab_name(std::size_t tab) {
    switch (tab % TAB_COUNT) {
    case 0:
        return "Files";
    case 1:
        return "Filters";
    default:
        return "Stats";
    }
}

const char* Session::default_status(Mode mode) {
    switch (mode) {
    case Mode::Browsing:
        return "Ready - Press 'h' for help";
    case Mode::AddingFile:
        return "Enter file path...";
    case Mode::EditingFilter:
        return "Enter filter as <field>=<value>...";
    case Mode::ViewingRawOutput:
        return "Viewing raw output - Press Esc to return";
    case Mode::ViewingHelp:
        return "Help - Press Esc to return";
    }
    return "";
}

// ----------------------------------------------------------------------------
// Session
// ----------------------------------------------------------------------------

Session::Session(const probe::Prober& prober, SessionOptions options, NowFn now,
                 output::Writer* log)
    : prober_(prober),
      options_(options),
      now_(now ? std::move(now) : NowFn([] { return Clock::now(); })),
      log_(log),
      state_(mode::Browsing{}) {}

Mode Session::mode() const {
    if (std::holds_alternative<mode::AddingFile>(state_)) {
        return Mode::AddingFile;
    }
    if (std::holds_alternative<mode::EditingFilter>(state_)) {
        return Mode::EditingFilter;
    }
    if (std::holds_alternative<mode::ViewingRawOutput>(state_)) {
        return Mode::ViewingRawOutput;
    }
    if (std::holds_alternative<mode::ViewingHelp>(state_)) {
        return Mode::ViewingHelp;
    }
    return Mode::Browsing;
}

const MediaRecord* Session::selected_record() const {
    auto records = view();
    if (selected_ >= records.size()) {
        return nullptr;
    }
    return records[selected_];
}

std::optional<std::size_t> Session::raw_scroll() const {
    if (const auto* raw = std::get_if<mode::ViewingRawOutput>(&state_)) {
        return raw->scroll;
    }
    return std::nullopt;
}

const TextInput* Session::edit_buffer() const {
    if (const auto* adding = std::get_if<mode::AddingFile>(&state_)) {
        return &adding->input;
    }
    if (const auto* editing = std::get_if<mode::EditingFilter>(&state_)) {
        return &editing->input;
    }
    return nullptr;
}

std::string Session::status_line(Clock::time_point now) {
    if (notification_.has_value()) {
        if (!notification_->is_expired(now)) {
            return notification_->message();
        }
        notification_.reset();
    }
    return default_status(mode());
}

// ----------------------------------------------------------------------------
// Маршрутизация клавиш
// ----------------------------------------------------------------------------

Outcome Session::handle_key(const KeyEvent& key) {
    switch (mode()) {
    case Mode::Browsing:
        return handle_browsing(key);
    case Mode::AddingFile:
        handle_adding_file(key);
        break;
    case Mode::EditingFilter:
        handle_editing_filter(key);
        break;
    case Mode::ViewingRawOutput:
        handle_raw_output(key);
        break;
    case Mode::ViewingHelp:
        handle_help(key);
        break;
    }
    return Outcome::Continue;
}

Outcome Session::handle_browsing(const KeyEvent& key) {
    switch (key.code) {
    case KeyCode::Char:
        switch (key.ch) {
        case U'q':
            return Outcome::Quit;
        case U'a':
            state_ = mode::AddingFile{};
            break;
        case U'f':
            state_ = mode::EditingFilter{};
            break;
        case U'r':
            state_ = mode::ViewingRawOutput{};
            break;
        case U'h':
            state_ = mode::ViewingHelp{};
            break;
        case U'c':
            clear_all();
            break;
        case U'x':
            remove_last_filter();
            break;
        case U'j':
            select_next();
            break;
        case U'k':
            select_previous();
            break;
        default:
            break;
        }
        break;
    case KeyCode::Down:
        select_next();
        break;
    case KeyCode::Up:
        select_previous();
        break;
    case KeyCode::Tab:
        tab_ = (tab_ + 1) % TAB_COUNT;
        break;
    default:
        break;
    }
    return Outcome::Continue;
}

void Session::handle_adding_file(const KeyEvent& key) {
    auto& adding = std::get<mode::AddingFile>(state_);

    if (key.code == KeyCode::Enter) {
        // Значение забираем до смены режима: буфер живёт только в AddingFile
        std::string path = adding.input.value();
        state_ = mode::Browsing{};
        if (!path.empty()) {
            add_file(path);
        }
        return;
    }
    if (key.code == KeyCode::Esc) {
        state_ = mode::Browsing{};
        return;
    }
    adding.input.handle_key(key);
}

void Session::handle_editing_filter(const KeyEvent& key) {
    auto& editing = std::get<mode::EditingFilter>(state_);

    if (key.code == KeyCode::Enter) {
        std::string text = editing.input.value();
        state_ = mode::Browsing{};
        if (!text.empty()) {
            apply_filter(text);
        }
        return;
    }
    if (key.code == KeyCode::Esc) {
        state_ = mode::Browsing{};
        return;
    }
    editing.input.handle_key(key);
}

void Session::handle_raw_output(const KeyEvent& key) {
    auto& raw = std::get<mode::ViewingRawOutput>(state_);

    switch (key.code) {
    case KeyCode::Esc:
        state_ = mode::Browsing{};
        break;
    case KeyCode::Up:
        if (raw.scroll > 0) {
            --raw.scroll;
        }
        break;
    case KeyCode::Down:
        // Верхней границы нет: отображение обрезает само
        ++raw.scroll;
        break;
    default:
        break;
    }
}

void Session::handle_help(const KeyEvent& key) {
    if (key.code == KeyCode::Esc) {
        state_ = mode::Browsing{};
    }
}

// ----------------------------------------------------------------------------
// Операции
// ----------------------------------------------------------------------------

void Session::add_file(const std::string& path) {
    if (log_ != nullptr) {
        log_->debug("probing '" + path + "' with " + prober_.name());
    }

    auto start = now_();
    auto result = extract::analyze(path, prober_);
    auto elapsed = std::chrono::duration<double>(now_() - start);

    if (!result) {
        std::string message = result.error.format();
        if (log_ != nullptr) {
            log_->warn(message);
        }
        notify(std::move(message));
        return;
    }

    if (log_ != nullptr) {
        const auto& r = result.record;
        log_->info("analyzed '" + path + "': " + r.codec + ", " + r.resolution + ", " +
                   r.frame_rate + " fps, " + r.bitrate + " Mbps");
        log_->trace(r.raw_report);
    }

    catalogue_.append(std::move(result.record));
    notify("File analyzed in " + format_seconds(elapsed) + "s");
}

void Session::apply_filter(const std::string& text) {
    auto predicate = filter::parse_filter(text);
    if (!predicate) {
        notify("Invalid filter: expected <field>=<value>");
        return;
    }

    std::string description = predicate->describe();
    catalogue_.add_filter(std::move(*predicate));
    selected_ = 0;

    if (log_ != nullptr) {
        log_->debug("filter added: " + description);
    }
    notify("Filter added: " + description);
}

void Session::remove_last_filter() {
    const auto& filters = catalogue_.filters();
    if (filters.empty()) {
        notify("No active filters");
        return;
    }

    std::string description = filters.back().describe();
    catalogue_.remove_last_filter();
    selected_ = 0;

    if (log_ != nullptr) {
        log_->debug("filter removed: " + description);
    }
    notify("Filter removed: " + description);
}

void Session::clear_all() {
    catalogue_.clear();
    selected_ = 0;
    if (log_ != nullptr) {
        log_->debug("catalogue cleared");
    }
    notify("All files cleared");
}

void Session::select_next() {
    std::size_t count = view().size();
    if (count == 0) {
        return;
    }
    selected_ = (selected_ + 1 >= count) ? 0 : selected_ + 1;
}

void Session::select_previous() {
    std::size_t count = view().size();
    if (count == 0) {
        return;
    }
    selected_ = (selected_ == 0 || selected_ >= count) ? count - 1 : selected_ - 1;
}

void Session::notify(std::string message) {
    notification_.emplace(std::move(message), now_(), options_.notification_lifetime);
}

}  // namespace mediascope
