// ==============================================================================
// mediascope/stats.hpp - Сводная статистика по представлению
// ==============================================================================

#ifndef MEDIASCOPE_STATS_HPP
#define MEDIASCOPE_STATS_HPP

#include <cstddef>
#include <map>
#include <mediascope/filter.hpp>
#include <mediascope/record.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mediascope::stats {

/// Значение поля -> количество записей (по алфавиту)
using Histogram = std::map<std::string, std::size_t>;

struct ViewStats {
    std::size_t count = 0;
    Histogram codecs;
    Histogram containers;
    Histogram resolutions;
    Histogram frame_rates;

    /// Среднее по записям с известным битрейтом (Мбит/с)
    std::optional<double> mean_bitrate;
    std::size_t known_bitrates = 0;
};

/// Посчитать статистику по записям представления
ViewStats compute(const std::vector<const MediaRecord*>& records);

/// Гистограмма одного поля
Histogram histogram(const std::vector<const MediaRecord*>& records, filter::Field field);

}  // namespace mediascope::stats

#endif  // MEDIASCOPE_STATS_HPP
