#include "tempo_ngin/core/time_index.hpp"
#include <algorithm>
#include "tempo_ngin/core/time_utils.hpp"

namespace tempo_ngin {

TimeIndex::TimeIndex()
    : stamps_(std::make_shared<const std::vector<Timestamp>>()), offset_(0), length_(0) {}

TimeIndex::TimeIndex(std::shared_ptr<const std::vector<Timestamp>> stamps, size_t offset,
                     size_t length)
    : stamps_(std::move(stamps)), offset_(offset), length_(length) {}

Result<TimeIndex> TimeIndex::create(std::vector<Timestamp> stamps) {
    for (size_t i = 1; i < stamps.size(); ++i) {
        if (stamps[i] == stamps[i - 1]) {
            return make_error<TimeIndex>(ErrorCode::INVALID_DATA,
                                         "Duplicate timestamp " + core::format_date(stamps[i]) +
                                             " at position " + std::to_string(i),
                                         "TimeIndex");
        }
        if (stamps[i] < stamps[i - 1]) {
            return make_error<TimeIndex>(ErrorCode::INVALID_DATA,
                                         "Timestamps are not increasing at position " +
                                             std::to_string(i) + " (" +
                                             core::format_date(stamps[i]) + ")",
                                         "TimeIndex");
        }
    }

    size_t length = stamps.size();
    auto shared = std::make_shared<const std::vector<Timestamp>>(std::move(stamps));
    return TimeIndex(std::move(shared), 0, length);
}

std::optional<size_t> TimeIndex::position_of(const Timestamp& ts) const {
    auto it = std::lower_bound(begin(), end(), ts);
    if (it == end() || *it != ts) {
        return std::nullopt;
    }
    return static_cast<size_t>(it - begin());
}

Result<TimeIndex> TimeIndex::slice(size_t begin_pos, size_t end_pos) const {
    if (begin_pos > end_pos || end_pos > length_) {
        return make_error<TimeIndex>(ErrorCode::INVALID_ARGUMENT,
                                     "Slice [" + std::to_string(begin_pos) + ", " +
                                         std::to_string(end_pos) + ") out of range for size " +
                                         std::to_string(length_),
                                     "TimeIndex");
    }
    return TimeIndex(stamps_, offset_ + begin_pos, end_pos - begin_pos);
}

TimeIndex::Difference TimeIndex::difference(const TimeIndex& other) const {
    Difference diff;
    size_t i = 0;
    size_t j = 0;
    while (i < size() || j < other.size()) {
        if (j >= other.size() || (i < size() && (*this)[i] < other[j])) {
            if (!diff.first_missing) {
                diff.first_missing = (*this)[i];
            }
            ++diff.missing;
            ++i;
        } else if (i >= size() || other[j] < (*this)[i]) {
            if (!diff.first_extra) {
                diff.first_extra = other[j];
            }
            ++diff.extra;
            ++j;
        } else {
            ++i;
            ++j;
        }
    }
    return diff;
}

bool TimeIndex::operator==(const TimeIndex& other) const {
    if (length_ != other.length_) {
        return false;
    }
    if (stamps_ == other.stamps_ && offset_ == other.offset_) {
        return true;
    }
    return std::equal(begin(), end(), other.begin());
}

}  // namespace tempo_ngin
