// ==============================================================================
// mediascope/record.hpp - Запись о проанализированном файле
// ==============================================================================
//
// MediaRecord создаётся движком извлечения, принадлежит каталогу и после
// добавления не изменяется.
//
// ==============================================================================

#ifndef MEDIASCOPE_RECORD_HPP
#define MEDIASCOPE_RECORD_HPP

#include <string>

namespace mediascope {

/// Значение поля, которое не удалось определить
constexpr const char* UNKNOWN = "Unknown";

/// Один проанализированный файл
struct MediaRecord {
    std::string name;        // stem пути
    std::string container;   // расширение без точки
    std::string codec;       // H.264 | H.265 | VP9 | AV1 | Hap | MJPEG | Unknown
    std::string resolution;  // 1920x1080 | 1280x720 | 3840x2160 | Unknown
    std::string frame_rate;  // 25 | 30 | 24 | 60 | Unknown
    std::string bitrate;     // Мбит/с с одной цифрой после точки | Unknown
    std::string path;        // путь в том виде, как его ввёл пользователь
    std::string raw_report;  // stdout пробника без изменений

    /// Имя для таблицы: "<name>.<container>"
    std::string display_name() const {
        if (container.empty()) {
            return name;
        }
        return name + "." + container;
    }
};

}  // namespace mediascope

#endif  // MEDIASCOPE_RECORD_HPP
