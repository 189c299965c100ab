#pragma once

#include <chrono>
#include <compare>
#include <optional>

namespace mc::domain {

// Closed interval [start, end] of wall-clock instants.
class DateTimeRange {
public:
    using TimePoint = std::chrono::system_clock::time_point;
    using Duration = std::chrono::system_clock::duration;

    // Throws std::invalid_argument when start > end.
    DateTimeRange(TimePoint start, TimePoint end);

    TimePoint start() const noexcept { return start_; }
    TimePoint end() const noexcept { return end_; }

    Duration duration() const noexcept { return end_ - start_; }
    TimePoint middle() const noexcept { return start_ + duration() / 2; }
    bool is_time_point() const noexcept { return start_ == end_; }

    DateTimeRange shifted(Duration offset) const { return {start_ + offset, end_ + offset}; }

    bool contains(TimePoint value) const noexcept;
    bool contains(const DateTimeRange& other) const noexcept;

    // True when the ranges share a strictly positive span that is at least
    // minimum_overlap long. Touching ranges do not overlap.
    bool overlaps(const DateTimeRange& other, Duration minimum_overlap = Duration::zero()) const noexcept;

    std::optional<DateTimeRange> intersection(const DateTimeRange& other,
                                              Duration minimum_overlap = Duration::zero()) const;

    bool operator==(const DateTimeRange&) const = default;

    // Ranges order by length, not by position.
    std::strong_ordering operator<=>(const DateTimeRange& other) const noexcept {
        return duration() <=> other.duration();
    }

private:
    TimePoint start_;
    TimePoint end_;
};

} // namespace mc::domain
