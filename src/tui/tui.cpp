// ==============================================================================
// tui.cpp - Терминальный интерфейс (ncurses)
// ==============================================================================
//
// Отрисовка только читает состояние сессии. Единственная мутация за кадр:
// отбрасывание истёкшего уведомления в Session::status_line().
//
// ==============================================================================

#ifndef NCURSES_WIDECHAR
#define NCURSES_WIDECHAR 1
#endif

#include <algorithm>
#include <curses.h>
#include <iomanip>
#include <locale>
#include <mediascope/extract.hpp>
#include <mediascope/platform.hpp>
#include <mediascope/probe.hpp>
#include <mediascope/stats.hpp>
#include <mediascope/text_input.hpp>
#include <mediascope/tui.hpp>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mediascope::tui {

struct Terminal::ScreenHandle {
    SCREEN* screen = nullptr;
};

namespace {

// Пары цветов
constexpr short PAIR_TITLE = 1;
constexpr short PAIR_ACCENT = 2;
constexpr short PAIR_MUTED = 3;
constexpr short PAIR_RAW = 4;

// Ширины столбцов таблицы файлов, в процентах
constexpr int COLUMN_PERCENT[] = {25, 12, 15, 15, 8, 15};
constexpr const char* COLUMN_TITLES[] = {"Name", "Container", "Codec", "Resolution", "FPS",
                                         "Bitrate(Mbps)"};
constexpr const char* HIGHLIGHT_SYMBOL = ">> ";
constexpr int HIGHLIGHT_WIDTH = 3;

struct Rect {
    int y = 0;
    int x = 0;
    int h = 0;
    int w = 0;

    Rect inner() const { return Rect{y + 1, x + 1, h - 2, w - 2}; }
};

// Ширина в code points (приближение: один столбец на символ)
int text_width(std::string_view text) {
    return static_cast<int>(decode_utf8(text).size());
}

std::string fit(std::string_view text, int width) {
    if (width <= 0) {
        return {};
    }
    std::u32string cps = decode_utf8(text);
    if (static_cast<int>(cps.size()) > width) {
        cps.resize(static_cast<size_t>(width));
    }
    std::string out;
    for (char32_t c : cps) {
        // Табуляция и прочие управляющие символы ломают разметку
        append_utf8(out, (c < 0x20 || c == 0x7F) ? U' ' : c);
    }
    return out;
}

std::vector<std::string> wrap(std::string_view line, int width) {
    std::vector<std::string> rows;
    std::u32string cps = decode_utf8(line);
    if (cps.empty() || width <= 0) {
        rows.emplace_back();
        return rows;
    }
    for (size_t i = 0; i < cps.size(); i += static_cast<size_t>(width)) {
        std::string row;
        for (size_t j = i; j < std::min(cps.size(), i + static_cast<size_t>(width)); ++j) {
            char32_t c = cps[j];
            append_utf8(row, (c < 0x20 || c == 0x7F) ? U' ' : c);
        }
        rows.push_back(std::move(row));
    }
    return rows;
}

std::string join_histogram(const stats::Histogram& h) {
    if (h.empty()) {
        return "-";
    }
    std::string out;
    for (const auto& [value, count] : h) {
        if (!out.empty()) {
            out += ", ";
        }
        out += value + " (" + std::to_string(count) + ")";
    }
    return out;
}

std::string format_fixed(double value, int precision) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(precision) << value;
    return oss.str();
}

// ----------------------------------------------------------------------------
// Painter: примитивы рисования на stdscr
// ----------------------------------------------------------------------------

class Painter {
public:
    explicit Painter(bool colors) : colors_(colors) {}

    attr_t color(short pair) const { return colors_ ? COLOR_PAIR(pair) : A_NORMAL; }

    void text(int y, int x, std::string_view s, int width, attr_t attr = A_NORMAL) const {
        std::string clipped = fit(s, width);
        if (clipped.empty()) {
            return;
        }
        attron(attr);
        mvaddstr(y, x, clipped.c_str());
        attroff(attr);
    }

    void centered(const Rect& r, int y, std::string_view s, attr_t attr = A_NORMAL) const {
        int width = std::min(text_width(s), r.w);
        int x = r.x + (r.w - width) / 2;
        text(y, x, s, r.w, attr);
    }

    void box(const Rect& r, std::string_view title = {}, attr_t title_attr = A_NORMAL) const {
        if (r.h < 2 || r.w < 2) {
            return;
        }
        mvaddch(r.y, r.x, ACS_ULCORNER);
        mvaddch(r.y, r.x + r.w - 1, ACS_URCORNER);
        mvaddch(r.y + r.h - 1, r.x, ACS_LLCORNER);
        mvaddch(r.y + r.h - 1, r.x + r.w - 1, ACS_LRCORNER);
        mvhline(r.y, r.x + 1, ACS_HLINE, r.w - 2);
        mvhline(r.y + r.h - 1, r.x + 1, ACS_HLINE, r.w - 2);
        mvvline(r.y + 1, r.x, ACS_VLINE, r.h - 2);
        mvvline(r.y + 1, r.x + r.w - 1, ACS_VLINE, r.h - 2);
        if (!title.empty()) {
            text(r.y, r.x + 1, title, r.w - 2, title_attr);
        }
    }

    /// Строки подряд внутри прямоугольника, лишние обрезаются
    void lines(const Rect& r, const std::vector<std::string>& rows, attr_t attr = A_NORMAL) const {
        for (int i = 0; i < r.h && i < static_cast<int>(rows.size()); ++i) {
            text(r.y + i, r.x, rows[static_cast<size_t>(i)], r.w, attr);
        }
    }

private:
    bool colors_;
};

// ----------------------------------------------------------------------------
// Области экрана
// ----------------------------------------------------------------------------

void render_title(const Painter& p, const Rect& r) {
    p.box(r);
    p.centered(r.inner(), r.y + 1, "mediascope - Media Inspector",
               p.color(PAIR_TITLE) | A_BOLD);
}

void render_tabs(const Painter& p, const Rect& r, std::size_t selected) {
    p.box(r);
    Rect in = r.inner();
    int x = in.x + 1;
    for (std::size_t i = 0; i < TAB_COUNT; ++i) {
        if (i > 0) {
            p.text(in.y, x, " | ", in.x + in.w - x);
            x += 3;
        }
        std::string name = tab_name(i);
        attr_t attr = (i == selected) ? (p.color(PAIR_ACCENT) | A_BOLD) : A_NORMAL;
        p.text(in.y, x, name, in.x + in.w - x, attr);
        x += text_width(name);
    }
}

void render_files(const Painter& p, const Rect& r, const Session& session) {
    auto records = session.view();
    if (records.empty()) {
        p.box(r, "Files");
        p.centered(r.inner(), r.y + r.h / 2, "No files loaded. Press 'a' to add files, 'h' for help",
                   p.color(PAIR_MUTED));
        return;
    }

    std::string title = "Files (" + std::to_string(records.size()) + "/" +
                        std::to_string(session.catalogue().size()) + ")";
    p.box(r, title);
    Rect in = r.inner();
    if (in.h < 2 || in.w <= HIGHLIGHT_WIDTH) {
        return;
    }

    // Ширины и позиции столбцов
    int table_w = in.w - HIGHLIGHT_WIDTH;
    std::vector<int> xs;
    std::vector<int> ws;
    int x = in.x + HIGHLIGHT_WIDTH;
    for (int percent : COLUMN_PERCENT) {
        int w = std::max(1, table_w * percent / 100);
        xs.push_back(x);
        ws.push_back(w - 1);  // столбец отделён одним пробелом
        x += w;
    }

    attr_t header = p.color(PAIR_ACCENT) | A_BOLD;
    for (size_t c = 0; c < xs.size(); ++c) {
        p.text(in.y, xs[c], COLUMN_TITLES[c], ws[c], header);
    }

    int visible = in.h - 1;
    std::size_t selected = session.selected();
    std::size_t first = (selected >= static_cast<std::size_t>(visible))
                            ? selected - static_cast<std::size_t>(visible) + 1
                            : 0;

    for (int row = 0; row < visible; ++row) {
        std::size_t index = first + static_cast<std::size_t>(row);
        if (index >= records.size()) {
            break;
        }
        const MediaRecord& rec = *records[index];
        int y = in.y + 1 + row;
        bool highlighted = (index == selected);
        attr_t attr = highlighted ? A_REVERSE : A_NORMAL;
        if (highlighted) {
            mvhline(y, in.x, ' ', in.w);
            mvchgat(y, in.x, in.w, A_REVERSE, 0, nullptr);
            p.text(y, in.x, HIGHLIGHT_SYMBOL, HIGHLIGHT_WIDTH, attr);
        }
        const std::string cells[] = {rec.display_name(), rec.container, rec.codec,
                                     rec.resolution,     rec.frame_rate, rec.bitrate};
        for (size_t c = 0; c < xs.size(); ++c) {
            p.text(y, xs[c], cells[c], ws[c], attr);
        }
    }
}

void render_filters(const Painter& p, const Rect& r, const Session& session,
                    const config::FilterPresets& presets) {
    p.box(r, "Filters");

    std::vector<std::string> rows;
    rows.emplace_back("Active filters (all must match):");
    const auto& filters = session.catalogue().filters();
    if (filters.empty()) {
        rows.emplace_back("  (none)");
    }
    for (size_t i = 0; i < filters.size(); ++i) {
        rows.push_back("  " + std::to_string(i + 1) + ". " + filters[i].describe());
    }
    rows.emplace_back("");
    rows.emplace_back("Presets:");
    for (filter::Field field : filter::all_fields()) {
        auto it = presets.find(field);
        if (it == presets.end() || it->second.empty()) {
            continue;
        }
        std::string line = std::string("  ") + filter::field_name(field) + ": ";
        for (size_t i = 0; i < it->second.size(); ++i) {
            if (i > 0) {
                line += ", ";
            }
            line += it->second[i];
        }
        rows.push_back(std::move(line));
    }
    rows.emplace_back("");
    rows.emplace_back("Press 'f' to add a filter, 'x' to remove the last one");

    p.lines(r.inner(), rows);
}

void render_stats(const Painter& p, const Rect& r, const Session& session,
                  probe::SummaryCache& summaries) {
    p.box(r, "Stats");

    auto records = session.view();
    auto s = stats::compute(records);

    std::vector<std::string> rows;
    rows.push_back("Files in view: " + std::to_string(s.count) + " of " +
                   std::to_string(session.catalogue().size()));
    rows.push_back("Codecs:      " + join_histogram(s.codecs));
    rows.push_back("Containers:  " + join_histogram(s.containers));
    rows.push_back("Resolutions: " + join_histogram(s.resolutions));
    rows.push_back("Frame rates: " + join_histogram(s.frame_rates));
    if (s.mean_bitrate) {
        rows.push_back("Mean bitrate: " + format_fixed(*s.mean_bitrate, 1) + " Mbps (" +
                       std::to_string(s.known_bitrates) + " files)");
    } else {
        rows.emplace_back("Mean bitrate: n/a");
    }
    rows.emplace_back("");

    const MediaRecord* selected = session.selected_record();
    if (selected == nullptr) {
        rows.emplace_back("No file selected");
    } else {
        rows.push_back("Selected: " + selected->display_name());
        const auto& summary = summaries.get(selected->raw_report);
        if (!summary.valid) {
            rows.emplace_back("  Probe report is not valid JSON");
        } else {
            rows.push_back("  Format:   " +
                           (summary.format_name.empty() ? std::string("-") : summary.format_name));
            if (summary.duration_seconds) {
                rows.push_back("  Duration: " + format_fixed(*summary.duration_seconds, 2) + " s");
            }
            if (summary.size_bytes) {
                rows.push_back("  Size:     " + std::to_string(*summary.size_bytes) + " bytes");
            }
            if (summary.bit_rate) {
                rows.push_back("  Bit rate: " + std::to_string(*summary.bit_rate) + " bit/s");
            }
            rows.push_back("  Streams:  " + std::to_string(summary.streams.size()));
            for (size_t i = 0; i < summary.streams.size(); ++i) {
                const auto& st = summary.streams[i];
                rows.push_back("    #" + std::to_string(i) + " " + st.codec_type + "/" +
                               st.codec_name);
            }
        }
    }

    p.lines(r.inner(), rows);
}

/// Диалог ввода; возвращает позицию курсора (y, x)
std::pair<int, int> render_input_dialog(const Painter& p, const Rect& r, std::string_view title,
                                        std::string_view field_title, const TextInput& input,
                                        const std::vector<std::string>& help) {
    p.box(r, title);
    Rect in = r.inner();

    Rect field{in.y, in.x, 3, in.w};
    p.box(field, field_title);
    Rect field_in = field.inner();

    // Горизонтальная прокрутка, чтобы курсор оставался видимым
    std::u32string cps = decode_utf8(input.value());
    int cursor = static_cast<int>(input.cursor());
    int offset = (field_in.w > 0 && cursor >= field_in.w) ? cursor - field_in.w + 1 : 0;
    std::string shown;
    for (size_t i = static_cast<size_t>(offset); i < cps.size(); ++i) {
        append_utf8(shown, cps[i]);
    }
    p.text(field_in.y, field_in.x, shown, field_in.w, p.color(PAIR_ACCENT));

    Rect help_area{in.y + 3, in.x, in.h - 3, in.w};
    p.lines(help_area, help, p.color(PAIR_MUTED));

    return {field_in.y, field_in.x + cursor - offset};
}

void render_raw(const Painter& p, const Rect& r, const Session& session) {
    p.box(r, "Raw FFprobe Output");
    Rect in = r.inner();

    const MediaRecord* selected = session.selected_record();
    if (selected == nullptr) {
        p.text(in.y, in.x, "No file selected", in.w, p.color(PAIR_RAW));
        return;
    }

    std::size_t scroll = session.raw_scroll().value_or(0);
    auto lines = extract::split_lines(selected->raw_report);

    std::vector<std::string> rows;
    for (std::size_t i = scroll; i < lines.size(); ++i) {
        for (auto& row : wrap(lines[i], in.w)) {
            rows.push_back(std::move(row));
        }
        if (static_cast<int>(rows.size()) >= in.h) {
            break;
        }
    }
    p.lines(in, rows, p.color(PAIR_RAW));
}

void render_help(const Painter& p, const Rect& r) {
    p.box(r, "Help");
    const std::vector<std::string> rows = {
        "Key Bindings:",
        "",
        "  q     - Quit application",
        "  a     - Add file",
        "  f     - Add filter (<field>=<value>)",
        "  x     - Remove last filter",
        "  r     - Show raw FFprobe output",
        "  c     - Clear all files",
        "  h     - Show this help",
        "  Up/k  - Previous file",
        "  Down/j - Next file",
        "  Tab   - Switch tabs",
        "",
        "Filter fields: container, codec, resolution, frame_rate (fps), bitrate",
        "Filters match substrings and are combined with AND.",
    };
    Rect in = r.inner();
    p.text(in.y, in.x, rows.front(), in.w, p.color(PAIR_ACCENT) | A_BOLD);
    p.lines(Rect{in.y + 1, in.x, in.h - 1, in.w},
            std::vector<std::string>(rows.begin() + 1, rows.end()));
}

void render_status(const Painter& p, const Rect& r, const std::string& status) {
    p.box(r);
    Rect in = r.inner();
    p.text(in.y, in.x, status, in.w);
}

}  // anonymous namespace

// ============================================================================
// Terminal
// ============================================================================

Terminal::Terminal() : screen_(std::make_unique<ScreenHandle>()) {
    if (!platform::is_tty_stdin() || !platform::is_tty_stdout()) {
        throw std::runtime_error("stdin and stdout must be connected to a terminal");
    }

    SCREEN* screen = newterm(nullptr, stdout, stdin);
    if (screen == nullptr) {
        throw std::runtime_error("failed to initialize terminal");
    }
    screen_->screen = screen;
    set_term(screen);

    cbreak();
    noecho();
    keypad(stdscr, TRUE);
    set_escdelay(25);
    wtimeout(stdscr, REDRAW_TIMEOUT_MS);
    curs_set(0);

    if (has_colors()) {
        start_color();
        use_default_colors();
        init_pair(PAIR_TITLE, COLOR_CYAN, -1);
        init_pair(PAIR_ACCENT, COLOR_YELLOW, -1);
        init_pair(PAIR_MUTED, COLOR_WHITE, -1);
        init_pair(PAIR_RAW, COLOR_GREEN, -1);
        colors_ = true;
    }
}

Terminal::~Terminal() {
    // Явный close() в main сообщает об ошибке; здесь: только при раскрутке стека
    if (screen_ && screen_->screen != nullptr) {
        endwin();
        delscreen(screen_->screen);
        screen_->screen = nullptr;
    }
}

bool Terminal::close() {
    if (!screen_ || screen_->screen == nullptr) {
        return true;
    }
    int rc = endwin();
    delscreen(screen_->screen);
    screen_->screen = nullptr;
    return rc != ERR;
}

std::optional<KeyEvent> Terminal::read_key() {
    wint_t code = 0;
    int rc = wget_wch(stdscr, &code);
    if (rc == ERR) {
        return std::nullopt;
    }
    if (rc == KEY_CODE_YES) {
        if (code == KEY_RESIZE) {
            return std::nullopt;
        }
        return translate_key(true, static_cast<std::uint32_t>(code));
    }
    return translate_key(false, static_cast<std::uint32_t>(code));
}

void Terminal::render(Session& session, const config::FilterPresets& presets) {
    Painter p(colors_);

    erase();
    int h = 0;
    int w = 0;
    getmaxyx(stdscr, h, w);

    if (h < 12 || w < 30) {
        p.text(0, 0, "Terminal too small", w);
        curs_set(0);
        refresh();
        return;
    }

    Rect title{0, 0, 3, w};
    Rect tabs{3, 0, 3, w};
    Rect main{6, 0, h - 9, w};
    Rect status{h - 3, 0, 3, w};

    render_title(p, title);
    render_tabs(p, tabs, session.tab());

    std::optional<std::pair<int, int>> cursor;
    switch (session.mode()) {
    case Mode::Browsing:
        if (session.tab() == 1) {
            render_filters(p, main, session, presets);
        } else if (session.tab() == 2) {
            render_stats(p, main, session, summaries_);
        } else {
            render_files(p, main, session);
        }
        break;
    case Mode::AddingFile:
        cursor = render_input_dialog(p, main, "Add File", "File Path", *session.edit_buffer(),
                                     {"Enter the full path to a video or image file",
                                      "Press Enter to analyze, Esc to cancel", "", "Examples:",
                                      "  /path/to/video.mp4", "  /path/to/image.jpg"});
        break;
    case Mode::EditingFilter:
        cursor = render_input_dialog(
            p, main, "Add Filter", "Filter", *session.edit_buffer(),
            {"Enter <field>=<value>; the field must contain the value",
             "Fields: container, codec, resolution, frame_rate (fps), bitrate",
             "Press Enter to apply, Esc to cancel", "", "Examples:", "  codec=H.264",
             "  resolution=1920", "  bitrate=5"});
        break;
    case Mode::ViewingRawOutput:
        render_raw(p, main, session);
        break;
    case Mode::ViewingHelp:
        render_help(p, main);
        break;
    }

    render_status(p, status, session.status_line());

    if (cursor) {
        curs_set(1);
        move(cursor->first, cursor->second);
    } else {
        curs_set(0);
    }
    refresh();
}

// ============================================================================
// Клавиши и цикл событий
// ============================================================================

KeyEvent translate_key(bool function_key, std::uint32_t code) {
    if (function_key) {
        switch (code) {
        case KEY_UP:
            return KeyEvent::special(KeyCode::Up);
        case KEY_DOWN:
            return KeyEvent::special(KeyCode::Down);
        case KEY_LEFT:
            return KeyEvent::special(KeyCode::Left);
        case KEY_RIGHT:
            return KeyEvent::special(KeyCode::Right);
        case KEY_HOME:
            return KeyEvent::special(KeyCode::Home);
        case KEY_END:
            return KeyEvent::special(KeyCode::End);
        case KEY_PPAGE:
            return KeyEvent::special(KeyCode::PageUp);
        case KEY_NPAGE:
            return KeyEvent::special(KeyCode::PageDown);
        case KEY_BACKSPACE:
            return KeyEvent::special(KeyCode::Backspace);
        case KEY_DC:
            return KeyEvent::special(KeyCode::Delete);
        case KEY_ENTER:
            return KeyEvent::special(KeyCode::Enter);
        case KEY_BTAB:
            return KeyEvent::special(KeyCode::BackTab);
        default:
            return KeyEvent::special(KeyCode::Other);
        }
    }

    switch (code) {
    case '\n':
    case '\r':
        return KeyEvent::special(KeyCode::Enter);
    case 27:
        return KeyEvent::special(KeyCode::Esc);
    case '\t':
        return KeyEvent::special(KeyCode::Tab);
    case 127:
    case 8:
        return KeyEvent::special(KeyCode::Backspace);
    default:
        break;
    }
    if (code < 0x20) {
        return KeyEvent::special(KeyCode::Other);
    }
    return KeyEvent::character(static_cast<char32_t>(code));
}

int run(Terminal& terminal, Session& session, const config::FilterPresets& presets) {
    for (;;) {
        terminal.render(session, presets);

        auto key = terminal.read_key();
        if (!key) {
            continue;
        }
        if (session.handle_key(*key) == Outcome::Quit) {
            return 0;
        }
    }
}

}  // namespace mediascope::tui
