// ==============================================================================
// catalogue.cpp - Каталог проанализированных файлов
// ==============================================================================

#include <mediascope/catalogue.hpp>
#include <utility>

namespace mediascope {

void Catalogue::append(MediaRecord record) {
    records_.push_back(std::move(record));
}

void Catalogue::clear() {
    records_.clear();
    filters_.clear();
}

void Catalogue::add_filter(filter::FilterPredicate predicate) {
    filters_.push_back(std::move(predicate));
}

bool Catalogue::remove_last_filter() {
    if (filters_.empty()) {
        return false;
    }
    filters_.pop_back();
    return true;
}

std::vector<const MediaRecord*> Catalogue::view() const {
    return filter::view(records_, filters_);
}

}  // namespace mediascope
