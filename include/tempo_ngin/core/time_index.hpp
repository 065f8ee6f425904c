// include/tempo_ngin/core/time_index.hpp
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/types.hpp"

namespace tempo_ngin {

/**
 * @brief Ordered, strictly increasing sequence of trading timestamps
 *
 * The reference clock of a run. Copies and slices share the underlying
 * storage; a TimeIndex can only be created through create(), which rejects
 * unsorted or duplicate timestamps.
 */
class TimeIndex {
public:
    /**
     * @brief Summary of how two indices differ
     */
    struct Difference {
        size_t missing{0};  // In the reference but not in the other index
        size_t extra{0};    // In the other index but not in the reference
        std::optional<Timestamp> first_missing;
        std::optional<Timestamp> first_extra;

        bool empty() const {
            return missing == 0 && extra == 0;
        }
    };

    TimeIndex();

    /**
     * @brief Create a validated index
     * @param stamps Timestamps, must be strictly increasing
     * @return Result containing the index or INVALID_DATA
     */
    static Result<TimeIndex> create(std::vector<Timestamp> stamps);

    size_t size() const {
        return length_;
    }

    bool empty() const {
        return length_ == 0;
    }

    const Timestamp& operator[](size_t pos) const {
        return (*stamps_)[offset_ + pos];
    }

    const Timestamp& front() const {
        return (*this)[0];
    }

    const Timestamp& back() const {
        return (*this)[length_ - 1];
    }

    const Timestamp* begin() const {
        return stamps_->data() + offset_;
    }

    const Timestamp* end() const {
        return stamps_->data() + offset_ + length_;
    }

    /**
     * @brief Locate a timestamp by binary search
     * @return Position within this index, or nullopt if absent
     */
    std::optional<size_t> position_of(const Timestamp& ts) const;

    /**
     * @brief Explicit sub-range [begin, end) sharing storage with this index
     */
    Result<TimeIndex> slice(size_t begin, size_t end) const;

    /**
     * @brief Compare timestamps with a reference index
     * @param other Index to compare against this (reference) index
     */
    Difference difference(const TimeIndex& other) const;

    bool operator==(const TimeIndex& other) const;

    bool operator!=(const TimeIndex& other) const {
        return !(*this == other);
    }

private:
    TimeIndex(std::shared_ptr<const std::vector<Timestamp>> stamps, size_t offset, size_t length);

    std::shared_ptr<const std::vector<Timestamp>> stamps_;
    size_t offset_{0};
    size_t length_{0};
};

}  // namespace tempo_ngin
