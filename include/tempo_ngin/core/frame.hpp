// include/tempo_ngin/core/frame.hpp
#pragma once

#include <map>
#include <string>
#include <vector>
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/time_index.hpp"

namespace tempo_ngin {

/**
 * @brief One value per timestamp of a TimeIndex
 */
struct Series {
    TimeIndex index;
    std::vector<double> values;

    /**
     * @brief Build a series, rejecting a length mismatch with the index
     */
    static Result<Series> create(TimeIndex index, std::vector<double> values);

    size_t size() const {
        return values.size();
    }
};

/**
 * @brief Per-asset series keyed by symbol
 * Ordered map so iteration order is deterministic
 */
using SeriesMap = std::map<std::string, Series>;

/**
 * @brief Wide table: one row per timestamp, one column per asset
 */
class Frame {
public:
    Frame() = default;

    /**
     * @brief Build a frame, validating row count and row widths
     * @param index Shared time index
     * @param columns Asset symbols, unique
     * @param rows One row per timestamp, each with columns.size() values
     */
    static Result<Frame> create(TimeIndex index, std::vector<std::string> columns,
                                std::vector<std::vector<double>> rows);

    /**
     * @brief Frame of zeros over the given index and columns
     */
    static Frame zeros(const TimeIndex& index, const std::vector<std::string>& columns);

    /**
     * @brief Build a frame from per-asset series that share one index
     * @return ALIGNMENT_ERROR when any series is indexed differently
     */
    static Result<Frame> from_series(const SeriesMap& series);

    const TimeIndex& index() const {
        return index_;
    }

    const std::vector<std::string>& columns() const {
        return columns_;
    }

    const std::vector<std::vector<double>>& rows() const {
        return rows_;
    }

    const std::vector<double>& row(size_t pos) const {
        return rows_[pos];
    }

    size_t num_rows() const {
        return rows_.size();
    }

    size_t num_columns() const {
        return columns_.size();
    }

    double at(size_t row_pos, size_t col_pos) const {
        return rows_[row_pos][col_pos];
    }

    /**
     * @brief Position of a column, or INVALID_ARGUMENT
     */
    Result<size_t> column_position(const std::string& symbol) const;

    /**
     * @brief Extract one column as a series
     */
    Result<Series> column(const std::string& symbol) const;

    /**
     * @brief Split into per-asset series
     */
    SeriesMap to_series() const;

    /**
     * @brief Explicit row range [begin, end) with a sliced index
     */
    Result<Frame> slice(size_t begin, size_t end) const;

private:
    TimeIndex index_;
    std::vector<std::string> columns_;
    std::vector<std::vector<double>> rows_;
};

}  // namespace tempo_ngin
