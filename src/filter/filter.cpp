// ==============================================================================
// filter.cpp - Фильтрация каталога
// ==============================================================================

#include <algorithm>
#include <cctype>
#include <mediascope/filter.hpp>

namespace mediascope::filter {

namespace {

std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

std::string to_lower(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

}  // anonymous namespace

// ============================================================================
// Field
// ============================================================================

const std::vector<Field>& all_fields() {
    static const std::vector<Field> fields = {Field::Container, Field::Codec, Field::Resolution,
                                              Field::FrameRate, Field::Bitrate};
    return fields;
}

const char* field_name(Field field) {
    switch (field) {
    case Field::Container:
        return "container";
    case Field::Codec:
        return "codec";
    case Field::Resolution:
        return "resolution";
    case Field::FrameRate:
        return "frame_rate";
    case Field::Bitrate:
        return "bitrate";
    }
    return "unknown";
}

std::optional<Field> field_from_string(std::string_view name) {
    std::string lower = to_lower(trim(name));
    if (lower == "fps") {
        return Field::FrameRate;
    }
    for (Field field : all_fields()) {
        if (lower == field_name(field)) {
            return field;
        }
    }
    return std::nullopt;
}

const std::string& field_value(const MediaRecord& record, Field field) {
    switch (field) {
    case Field::Container:
        return record.container;
    case Field::Codec:
        return record.codec;
    case Field::Resolution:
        return record.resolution;
    case Field::FrameRate:
        return record.frame_rate;
    case Field::Bitrate:
        return record.bitrate;
    }
    return record.container;
}

// ============================================================================
// FilterPredicate
// ============================================================================

bool FilterPredicate::matches(const MediaRecord& record) const {
    return field_value(record, field).find(value) != std::string::npos;
}

std::string FilterPredicate::describe() const {
    return std::string(field_name(field)) + " ~ " + value;
}

// ============================================================================
// View
// ============================================================================

std::vector<const MediaRecord*> view(const std::vector<MediaRecord>& records,
                                     const std::vector<FilterPredicate>& predicates) {
    std::vector<const MediaRecord*> result;
    result.reserve(records.size());

    for (const auto& record : records) {
        bool all = std::all_of(predicates.begin(), predicates.end(),
                               [&record](const FilterPredicate& p) { return p.matches(record); });
        if (all) {
            result.push_back(&record);
        }
    }

    return result;
}

std::optional<FilterPredicate> parse_filter(std::string_view text) {
    auto eq = text.find('=');
    if (eq == std::string_view::npos) {
        return std::nullopt;
    }

    auto field = field_from_string(text.substr(0, eq));
    if (!field) {
        return std::nullopt;
    }

    std::string_view value = trim(text.substr(eq + 1));
    if (value.empty()) {
        return std::nullopt;
    }

    return FilterPredicate{*field, std::string(value)};
}

}  // namespace mediascope::filter
