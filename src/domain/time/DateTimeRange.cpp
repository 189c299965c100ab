#include "domain/time/DateTimeRange.hpp"

#include <algorithm>
#include <stdexcept>

namespace mc::domain {

DateTimeRange::DateTimeRange(TimePoint start, TimePoint end) : start_(start), end_(end) {
    if (start > end) {
        throw std::invalid_argument("Range start must be less than or equal to range end");
    }
}

bool DateTimeRange::contains(TimePoint value) const noexcept {
    return start_ <= value && value <= end_;
}

bool DateTimeRange::contains(const DateTimeRange& other) const noexcept {
    return start_ <= other.start_ && other.end_ <= end_;
}

bool DateTimeRange::overlaps(const DateTimeRange& other, Duration minimum_overlap) const noexcept {
    auto overlap_start = std::max(start_, other.start_);
    auto overlap_end = std::min(end_, other.end_);
    return overlap_start < overlap_end && (overlap_end - overlap_start) >= minimum_overlap;
}

std::optional<DateTimeRange> DateTimeRange::intersection(const DateTimeRange& other,
                                                         Duration minimum_overlap) const {
    if (!overlaps(other, minimum_overlap)) return std::nullopt;
    return DateTimeRange(std::max(start_, other.start_), std::min(end_, other.end_));
}

} // namespace mc::domain
