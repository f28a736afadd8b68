// ==============================================================================
// extract.cpp - Движок извлечения метаданных
// ==============================================================================
//
// Эвристики по тексту отчёта. Порядок правил в таблицах: часть контракта.
//
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <locale>
#include <mediascope/extract.hpp>
#include <mediascope/platform.hpp>
#include <sstream>
#include <system_error>
#include <utility>

namespace mediascope::extract {

namespace {

bool contains(std::string_view text, std::string_view token) {
    return text.find(token) != std::string_view::npos;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

// Десятичное число целиком; locale-независимо
std::optional<double> parse_decimal(std::string_view s) {
    if (s.empty()) {
        return std::nullopt;
    }
    std::istringstream iss{std::string(s)};
    iss.imbue(std::locale::classic());
    double value = 0.0;
    if (!(iss >> value)) {
        return std::nullopt;
    }
    if (iss.peek() != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    if (!std::isfinite(value)) {
        return std::nullopt;
    }
    return value;
}

std::string format_one_decimal(double value) {
    std::ostringstream oss;
    oss.imbue(std::locale::classic());
    oss << std::fixed << std::setprecision(1) << value;
    return oss.str();
}

}  // anonymous namespace

// ============================================================================
// Таблицы правил
// ============================================================================

TextPredicate contains_any(std::vector<std::string> tokens) {
    return [tokens = std::move(tokens)](std::string_view text) {
        return std::any_of(tokens.begin(), tokens.end(),
                           [text](const std::string& t) { return contains(text, t); });
    };
}

TextPredicate contains_all(std::vector<std::string> tokens) {
    return [tokens = std::move(tokens)](std::string_view text) {
        return std::all_of(tokens.begin(), tokens.end(),
                           [text](const std::string& t) { return contains(text, t); });
    };
}

std::optional<std::string> first_match(const RuleTable& rules, std::string_view text) {
    for (const auto& rule : rules) {
        if (rule.matches(text)) {
            return rule.label;
        }
    }
    return std::nullopt;
}

const RuleTable& codec_rules() {
    static const RuleTable rules = {
        {contains_any({"h264"}), "H.264"},
        {contains_any({"hevc", "h265"}), "H.265"},
        {contains_any({"vp9"}), "VP9"},
        {contains_any({"av01"}), "AV1"},
        {contains_any({"hap"}), "Hap"},
        {contains_any({"mjpeg"}), "MJPEG"},
    };
    return rules;
}

const RuleTable& resolution_rules() {
    static const RuleTable rules = {
        {contains_all({"1920", "1080"}), "1920x1080"},
        {contains_all({"1280", "720"}), "1280x720"},
        {contains_all({"3840", "2160"}), "3840x2160"},
    };
    return rules;
}

const RuleTable& frame_rate_rules() {
    static const RuleTable rules = {
        {contains_any({"25/1", "\"25\""}), "25"},
        {contains_any({"30/1", "\"30\""}), "30"},
        {contains_any({"24/1", "\"24\""}), "24"},
        {contains_any({"60/1", "\"60\""}), "60"},
    };
    return rules;
}

// ============================================================================
// Извлечение полей
// ============================================================================

std::vector<std::string_view> split_lines(std::string_view text) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) {
            end = text.size();
        }
        std::string_view line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        lines.push_back(line);
        start = end + 1;
    }
    return lines;
}

std::string extract_codec(std::string_view report) {
    return first_match(codec_rules(), report).value_or(UNKNOWN);
}

std::string extract_resolution(std::string_view report) {
    for (std::string_view line : split_lines(report)) {
        // Кандидат: только строка, где встречаются оба слова
        if (!contains(line, "width") || !contains(line, "height")) {
            continue;
        }
        if (auto label = first_match(resolution_rules(), line)) {
            return *label;
        }
    }
    return UNKNOWN;
}

std::string extract_frame_rate(std::string_view report) {
    return first_match(frame_rate_rules(), report).value_or(UNKNOWN);
}

std::string extract_bitrate(std::string_view report) {
    for (std::string_view line : split_lines(report)) {
        if (!contains(line, "bit_rate") || contains(line, "max_bit_rate")) {
            continue;
        }

        // Используется только первая подходящая строка
        size_t colon = line.find(':');
        if (colon == std::string_view::npos) {
            return UNKNOWN;
        }
        size_t comma = line.find(',', colon + 1);
        if (comma == std::string_view::npos) {
            return UNKNOWN;
        }

        std::string raw(line.substr(colon + 1, comma - colon - 1));
        raw.erase(std::remove(raw.begin(), raw.end(), '"'), raw.end());

        auto bits = parse_decimal(trim(raw));
        if (!bits) {
            return UNKNOWN;
        }
        return format_one_decimal(*bits / 1'000'000.0);
    }
    return UNKNOWN;
}

// ============================================================================
// ExtractionError
// ============================================================================

std::string ExtractionError::format() const {
    switch (kind) {
    case ErrorKind::PathNotFound:
        return "File does not exist: " + path;
    case ErrorKind::ProbeInvocationFailure:
        return "Error analyzing file: " + message;
    }
    return message;
}

// ============================================================================
// analyze
// ============================================================================

MediaRecord build_record(const std::string& path, std::string report) {
    MediaRecord record;

    // name/container: только из пути, независимо от отчёта
    auto p = platform::path_from_utf8(path);
    record.name = platform::path_to_utf8(p.stem());
    std::string ext = platform::path_to_utf8(p.extension());
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    record.container = std::move(ext);

    record.codec = extract_codec(report);
    record.resolution = extract_resolution(report);
    record.frame_rate = extract_frame_rate(report);
    record.bitrate = extract_bitrate(report);
    record.path = path;
    record.raw_report = std::move(report);
    return record;
}

AnalyzeResult analyze(const std::string& path, const probe::Prober& prober) {
    AnalyzeResult result;

    std::error_code ec;
    bool exists = std::filesystem::exists(platform::path_from_utf8(path), ec);
    if (ec || !exists) {
        result.error = ExtractionError{ErrorKind::PathNotFound, "file does not exist", path};
        return result;
    }

    auto probed = prober.probe(path);
    if (!probed.ok) {
        result.error = ExtractionError{ErrorKind::ProbeInvocationFailure, probed.error, path};
        return result;
    }

    result.record = build_record(path, std::move(probed.report));
    result.ok = true;
    return result;
}

}  // namespace mediascope::extract
