// ==============================================================================
// text_input.cpp - Однострочный буфер ввода
// ==============================================================================

#include <mediascope/platform.hpp>
#include <mediascope/text_input.hpp>

namespace mediascope {

// ----------------------------------------------------------------------------
// UTF-8
// ----------------------------------------------------------------------------

void append_utf8(std::string& out, char32_t c) {
    if (c > 0x10FFFF || (c >= 0xD800 && c <= 0xDFFF)) {
        c = 0xFFFD;
    }
    if (c < 0x80) {
        out += static_cast<char>(c);
    } else if (c < 0x800) {
        out += static_cast<char>(0xC0 | (c >> 6));
        out += static_cast<char>(0x80 | (c & 0x3F));
    } else if (c < 0x10000) {
        out += static_cast<char>(0xE0 | (c >> 12));
        out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (c & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (c >> 18));
        out += static_cast<char>(0x80 | ((c >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((c >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (c & 0x3F));
    }
}

std::u32string decode_utf8(std::string_view utf8) {
    // После utf8_lossy последовательности заведомо корректны
    std::string valid = platform::utf8_lossy(utf8);

    std::u32string out;
    out.reserve(valid.size());
    size_t i = 0;
    while (i < valid.size()) {
        auto b0 = static_cast<unsigned char>(valid[i]);
        size_t len = 1;
        char32_t c = b0;
        if (b0 >= 0xF0) {
            len = 4;
            c = b0 & 0x07;
        } else if (b0 >= 0xE0) {
            len = 3;
            c = b0 & 0x0F;
        } else if (b0 >= 0xC0) {
            len = 2;
            c = b0 & 0x1F;
        }
        for (size_t j = 1; j < len; ++j) {
            c = (c << 6) | (static_cast<unsigned char>(valid[i + j]) & 0x3F);
        }
        out += c;
        i += len;
    }
    return out;
}

// ----------------------------------------------------------------------------
// TextInput
// ----------------------------------------------------------------------------

TextInput::TextInput(std::string_view utf8) : text_(decode_utf8(utf8)), cursor_(text_.size()) {}

bool TextInput::handle_key(const KeyEvent& key) {
    switch (key.code) {
    case KeyCode::Char:
        insert(key.ch);
        return true;
    case KeyCode::Backspace:
        backspace();
        return true;
    case KeyCode::Delete:
        delete_forward();
        return true;
    case KeyCode::Left:
        move_left();
        return true;
    case KeyCode::Right:
        move_right();
        return true;
    case KeyCode::Home:
        move_home();
        return true;
    case KeyCode::End:
        move_end();
        return true;
    default:
        return false;
    }
}

void TextInput::insert(char32_t c) {
    // Управляющие символы в путь не попадают
    if (c < 0x20 || c == 0x7F) {
        return;
    }
    text_.insert(text_.begin() + static_cast<std::ptrdiff_t>(cursor_), c);
    ++cursor_;
}

void TextInput::backspace() {
    if (cursor_ == 0) {
        return;
    }
    --cursor_;
    text_.erase(text_.begin() + static_cast<std::ptrdiff_t>(cursor_));
}

void TextInput::delete_forward() {
    if (cursor_ >= text_.size()) {
        return;
    }
    text_.erase(text_.begin() + static_cast<std::ptrdiff_t>(cursor_));
}

void TextInput::move_left() {
    if (cursor_ > 0) {
        --cursor_;
    }
}

void TextInput::move_right() {
    if (cursor_ < text_.size()) {
        ++cursor_;
    }
}

void TextInput::reset() {
    text_.clear();
    cursor_ = 0;
}

std::string TextInput::value() const {
    std::string out;
    out.reserve(text_.size());
    for (char32_t c : text_) {
        append_utf8(out, c);
    }
    return out;
}

}  // namespace mediascope
