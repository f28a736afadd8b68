// ==============================================================================
// summary.cpp - Структурная сводка JSON-отчёта ffprobe
// ==============================================================================
//
// RapidJSON DOM. Ошибка разбора даёт valid == false, не исключение.
//
// ==============================================================================

#include <limits>
#include <locale>
#include <mediascope/probe.hpp>
#include <rapidjson/document.h>
#include <sstream>
#include <utility>

namespace mediascope::probe {

namespace {

std::optional<double> parse_double(const std::string& s) {
    std::istringstream iss(s);
    iss.imbue(std::locale::classic());
    double value = 0.0;
    if (!(iss >> value)) {
        return std::nullopt;
    }
    iss >> std::ws;
    if (!iss.eof()) {
        return std::nullopt;
    }
    return value;
}

std::optional<std::uint64_t> parse_u64(const std::string& s) {
    if (s.empty()) {
        return std::nullopt;
    }
    constexpr std::uint64_t max_value = std::numeric_limits<std::uint64_t>::max();
    std::uint64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        auto digit = static_cast<std::uint64_t>(c - '0');
        // Переполнение: значение не показывается
        if (value > (max_value - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

std::string string_member(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd() || !it->value.IsString()) {
        return {};
    }
    return std::string(it->value.GetString(), it->value.GetStringLength());
}

std::optional<double> double_member(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return std::nullopt;
    }
    if (it->value.IsNumber()) {
        return it->value.GetDouble();
    }
    if (it->value.IsString()) {
        return parse_double(it->value.GetString());
    }
    return std::nullopt;
}

std::optional<std::uint64_t> u64_member(const rapidjson::Value& obj, const char* key) {
    auto it = obj.FindMember(key);
    if (it == obj.MemberEnd()) {
        return std::nullopt;
    }
    if (it->value.IsUint64()) {
        return it->value.GetUint64();
    }
    if (it->value.IsString()) {
        return parse_u64(it->value.GetString());
    }
    return std::nullopt;
}

}  // anonymous namespace

ProbeSummary summarize_report(std::string_view report) {
    ProbeSummary summary;

    rapidjson::Document doc;
    doc.Parse(report.data(), report.size());
    if (doc.HasParseError() || !doc.IsObject()) {
        return summary;
    }
    summary.valid = true;

    auto format = doc.FindMember("format");
    if (format != doc.MemberEnd() && format->value.IsObject()) {
        const auto& f = format->value;
        summary.format_name = string_member(f, "format_name");
        summary.duration_seconds = double_member(f, "duration");
        summary.size_bytes = u64_member(f, "size");
        summary.bit_rate = u64_member(f, "bit_rate");
    }

    auto streams = doc.FindMember("streams");
    if (streams != doc.MemberEnd() && streams->value.IsArray()) {
        for (const auto& s : streams->value.GetArray()) {
            if (!s.IsObject()) {
                continue;
            }
            StreamSummary stream;
            stream.codec_type = string_member(s, "codec_type");
            stream.codec_name = string_member(s, "codec_name");
            summary.streams.push_back(std::move(stream));
        }
    }

    return summary;
}

const ProbeSummary& SummaryCache::get(std::string_view report) {
    if (!report_ || *report_ != report) {
        summary_ = summarize_report(report);
        report_ = std::string(report);
        ++parse_count_;
    }
    return summary_;
}

}  // namespace mediascope::probe
