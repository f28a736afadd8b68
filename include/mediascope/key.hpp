// ==============================================================================
// mediascope/key.hpp - Событие нажатия клавиши
// ==============================================================================
//
// Независимое от терминальной библиотеки представление нажатия. Модуль tui
// переводит коды ncurses в KeyEvent; сессия видит только KeyEvent.
//
// ==============================================================================

#ifndef MEDIASCOPE_KEY_HPP
#define MEDIASCOPE_KEY_HPP

namespace mediascope {

enum class KeyCode {
    Char,  // печатный символ в KeyEvent::ch
    Enter,
    Esc,
    Tab,
    BackTab,
    Up,
    Down,
    Left,
    Right,
    Home,
    End,
    PageUp,
    PageDown,
    Backspace,
    Delete,
    Other
};

struct KeyEvent {
    KeyCode code = KeyCode::Other;
    char32_t ch = 0;

    static KeyEvent character(char32_t c) { return KeyEvent{KeyCode::Char, c}; }
    static KeyEvent special(KeyCode code) { return KeyEvent{code, 0}; }

    bool is_char(char32_t c) const { return code == KeyCode::Char && ch == c; }
};

}  // namespace mediascope

#endif  // MEDIASCOPE_KEY_HPP
