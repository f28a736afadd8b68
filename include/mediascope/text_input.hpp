// ==============================================================================
// mediascope/text_input.hpp - Однострочный буфер ввода
// ==============================================================================
//
// Буфер хранит code points; value() возвращает UTF-8. Курсор: позиция в
// code points (0..length).
//
// ==============================================================================

#ifndef MEDIASCOPE_TEXT_INPUT_HPP
#define MEDIASCOPE_TEXT_INPUT_HPP

#include <cstddef>
#include <mediascope/key.hpp>
#include <string>
#include <string_view>

namespace mediascope {

class TextInput {
public:
    TextInput() = default;
    explicit TextInput(std::string_view utf8);

    /// Применить клавишу: вставка, удаление, движение курсора
    /// @return true если клавиша обработана
    bool handle_key(const KeyEvent& key);

    void insert(char32_t c);
    void backspace();
    void delete_forward();
    void move_left();
    void move_right();
    void move_home() { cursor_ = 0; }
    void move_end() { cursor_ = text_.size(); }
    void reset();

    /// Содержимое в UTF-8
    std::string value() const;

    bool empty() const { return text_.empty(); }
    std::size_t length() const { return text_.size(); }
    std::size_t cursor() const { return cursor_; }

private:
    std::u32string text_;
    std::size_t cursor_ = 0;
};

/// Закодировать code point в UTF-8 (некорректные -> U+FFFD)
void append_utf8(std::string& out, char32_t c);

/// Декодировать UTF-8 в code points (некорректные байты -> U+FFFD)
std::u32string decode_utf8(std::string_view utf8);

}  // namespace mediascope

#endif  // MEDIASCOPE_TEXT_INPUT_HPP
