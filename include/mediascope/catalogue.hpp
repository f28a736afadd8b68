// ==============================================================================
// mediascope/catalogue.hpp - Каталог проанализированных файлов
// ==============================================================================
//
// Назначение:
// - Упорядоченная коллекция MediaRecord (порядок вставки, без дедупликации)
// - Активный набор фильтров, живущий вместе с каталогом
// - clear() очищает и записи, и фильтры
//
// ==============================================================================

#ifndef MEDIASCOPE_CATALOGUE_HPP
#define MEDIASCOPE_CATALOGUE_HPP

#include <cstddef>
#include <mediascope/filter.hpp>
#include <mediascope/record.hpp>
#include <vector>

namespace mediascope {

class Catalogue {
public:
    Catalogue() = default;

    /// Добавить запись в конец
    void append(MediaRecord record);

    /// Очистить записи и активные фильтры
    void clear();

    /// Добавить предикат в конец набора фильтров
    void add_filter(filter::FilterPredicate predicate);

    /// Удалить последний добавленный предикат; false если набор пуст
    bool remove_last_filter();

    const std::vector<MediaRecord>& records() const { return records_; }
    const std::vector<filter::FilterPredicate>& filters() const { return filters_; }

    std::size_t size() const { return records_.size(); }
    bool empty() const { return records_.empty(); }

    /// Текущее представление: записи, прошедшие все фильтры
    std::vector<const MediaRecord*> view() const;

private:
    std::vector<MediaRecord> records_;
    std::vector<filter::FilterPredicate> filters_;
};

}  // namespace mediascope

#endif  // MEDIASCOPE_CATALOGUE_HPP
