// ==============================================================================
// mediascope/filter.hpp - Фильтрация каталога
// ==============================================================================
//
// Назначение:
// - Field: поле записи, по которому фильтруем
// - FilterPredicate: одно активное ограничение (substring match)
// - view(): упорядоченная подпоследовательность записей, удовлетворяющих
//   всем предикатам (AND)
// - parse_filter(): разбор пользовательского ввода "<field>=<value>"
//
// ==============================================================================

#ifndef MEDIASCOPE_FILTER_HPP
#define MEDIASCOPE_FILTER_HPP

#include <mediascope/record.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediascope::filter {

// ----------------------------------------------------------------------------
// Field
// ----------------------------------------------------------------------------

enum class Field { Container, Codec, Resolution, FrameRate, Bitrate };

/// Все поля в порядке отображения
const std::vector<Field>& all_fields();

/// Имя поля для ввода и отображения ("container", "frame_rate", ...)
const char* field_name(Field field);

/// Распознать имя поля (без учёта регистра, "fps" = frame_rate)
std::optional<Field> field_from_string(std::string_view name);

/// Значение поля записи
const std::string& field_value(const MediaRecord& record, Field field);

// ----------------------------------------------------------------------------
// FilterPredicate
// ----------------------------------------------------------------------------

struct FilterPredicate {
    Field field = Field::Container;
    std::string value;

    /// Поле записи содержит value как подстроку
    bool matches(const MediaRecord& record) const;

    /// "<field> ~ <value>"
    std::string describe() const;
};

// ----------------------------------------------------------------------------
// View
// ----------------------------------------------------------------------------

/// Упорядоченная подпоследовательность записей, удовлетворяющих всем предикатам
///
/// Пустой набор предикатов даёт все записи. Каталог не изменяется.
std::vector<const MediaRecord*> view(const std::vector<MediaRecord>& records,
                                     const std::vector<FilterPredicate>& predicates);

/// Разобрать "<field>=<value>"; nullopt при неизвестном поле или пустом значении
std::optional<FilterPredicate> parse_filter(std::string_view text);

}  // namespace mediascope::filter

#endif  // MEDIASCOPE_FILTER_HPP
