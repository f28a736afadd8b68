// ==============================================================================
// stats.cpp - Сводная статистика по представлению
// ==============================================================================

#include <locale>
#include <mediascope/stats.hpp>
#include <sstream>

namespace mediascope::stats {

namespace {

std::optional<double> parse_bitrate(const std::string& s) {
    if (s == UNKNOWN) {
        return std::nullopt;
    }
    std::istringstream iss(s);
    iss.imbue(std::locale::classic());
    double value = 0.0;
    if (!(iss >> value)) {
        return std::nullopt;
    }
    return value;
}

}  // anonymous namespace

Histogram histogram(const std::vector<const MediaRecord*>& records, filter::Field field) {
    Histogram result;
    for (const MediaRecord* record : records) {
        ++result[filter::field_value(*record, field)];
    }
    return result;
}

ViewStats compute(const std::vector<const MediaRecord*>& records) {
    ViewStats stats;
    stats.count = records.size();
    stats.codecs = histogram(records, filter::Field::Codec);
    stats.containers = histogram(records, filter::Field::Container);
    stats.resolutions = histogram(records, filter::Field::Resolution);
    stats.frame_rates = histogram(records, filter::Field::FrameRate);

    double total = 0.0;
    for (const MediaRecord* record : records) {
        if (auto mbps = parse_bitrate(record->bitrate)) {
            total += *mbps;
            ++stats.known_bitrates;
        }
    }
    if (stats.known_bitrates > 0) {
        stats.mean_bitrate = total / static_cast<double>(stats.known_bitrates);
    }

    return stats;
}

}  // namespace mediascope::stats
