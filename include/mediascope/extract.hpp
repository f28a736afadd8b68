// ==============================================================================
// mediascope/extract.hpp - Движок извлечения метаданных
// ==============================================================================
//
// Назначение:
// - analyze(): путь файла -> MediaRecord или ExtractionError
// - Упорядоченные таблицы правил (предикат, метка): первое совпадение побеждает
// - Извлечение codec / resolution / frame_rate / bitrate из текста отчёта
//
// Правила: регистрозависимый поиск подстрок. Нераспознанные поля дают
// "Unknown", а не ошибку.
//
// Использование:
// @code
//   probe::FfprobeProber prober;
//   auto result = extract::analyze("/media/clip.mp4", prober);
//   if (!result) {
//       notify(result.error.format());
//   }
// @endcode
//
// ==============================================================================

#ifndef MEDIASCOPE_EXTRACT_HPP
#define MEDIASCOPE_EXTRACT_HPP

#include <functional>
#include <mediascope/probe.hpp>
#include <mediascope/record.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediascope::extract {

// ----------------------------------------------------------------------------
// Таблицы правил
// ----------------------------------------------------------------------------

/// Предикат над фрагментом текста (весь отчёт или одна строка)
using TextPredicate = std::function<bool(std::string_view)>;

/// Правило: если предикат истинен, поле получает label
struct Rule {
    TextPredicate matches;
    std::string label;
};

/// Правила проверяются по порядку, первое совпадение побеждает
using RuleTable = std::vector<Rule>;

/// Истина, если текст содержит хотя бы один из токенов
TextPredicate contains_any(std::vector<std::string> tokens);

/// Истина, если текст содержит все токены
TextPredicate contains_all(std::vector<std::string> tokens);

/// Метка первого сработавшего правила
std::optional<std::string> first_match(const RuleTable& rules, std::string_view text);

/// Кодек: h264, hevc|h265, vp9, av01, hap, mjpeg (по всему отчёту)
const RuleTable& codec_rules();

/// Разрешение: применяется к строке, содержащей "width" и "height"
const RuleTable& resolution_rules();

/// Частота кадров: "N/1" или "\"N\"" по всему отчёту, порядок 25, 30, 24, 60
const RuleTable& frame_rate_rules();

// ----------------------------------------------------------------------------
// Извлечение полей
// ----------------------------------------------------------------------------

std::string extract_codec(std::string_view report);

/// Первая строка с "width" и "height", на которой сработало правило
std::string extract_resolution(std::string_view report);

std::string extract_frame_rate(std::string_view report);

/// Первая строка с "bit_rate" (но не "max_bit_rate"): значение между ':' и ','
/// в бит/с, переводится в Мбит/с с одной цифрой после точки
std::string extract_bitrate(std::string_view report);

/// Разбить текст на строки ('\n', завершающий '\r' отбрасывается)
std::vector<std::string_view> split_lines(std::string_view text);

// ----------------------------------------------------------------------------
// ExtractionError
// ----------------------------------------------------------------------------

enum class ErrorKind {
    PathNotFound,            // Путь не существует
    ProbeInvocationFailure,  // Пробник не удалось запустить
};

struct ExtractionError {
    ErrorKind kind = ErrorKind::PathNotFound;
    std::string message;
    std::string path;

    /// Текст для уведомления пользователю
    std::string format() const;
};

// ----------------------------------------------------------------------------
// analyze
// ----------------------------------------------------------------------------

struct AnalyzeResult {
    bool ok = false;
    MediaRecord record;
    ExtractionError error;

    explicit operator bool() const { return ok; }
};

/// Построить запись из пути и готового отчёта (без запуска пробника)
MediaRecord build_record(const std::string& path, std::string report);

/// Проверить путь, запустить пробник один раз и построить запись
AnalyzeResult analyze(const std::string& path, const probe::Prober& prober);

}  // namespace mediascope::extract

#endif  // MEDIASCOPE_EXTRACT_HPP
