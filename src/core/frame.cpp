#include "tempo_ngin/core/frame.hpp"
#include <set>
#include "tempo_ngin/core/time_utils.hpp"

namespace tempo_ngin {

Result<Series> Series::create(TimeIndex index, std::vector<double> values) {
    if (index.size() != values.size()) {
        return make_error<Series>(ErrorCode::ALIGNMENT_ERROR,
                                  "Series has " + std::to_string(values.size()) +
                                      " values for an index of " + std::to_string(index.size()) +
                                      " timestamps",
                                  "Series");
    }
    Series series;
    series.index = std::move(index);
    series.values = std::move(values);
    return series;
}

Result<Frame> Frame::create(TimeIndex index, std::vector<std::string> columns,
                            std::vector<std::vector<double>> rows) {
    std::set<std::string> unique(columns.begin(), columns.end());
    if (unique.size() != columns.size()) {
        return make_error<Frame>(ErrorCode::INVALID_ARGUMENT, "Duplicate column names", "Frame");
    }
    if (rows.size() != index.size()) {
        return make_error<Frame>(ErrorCode::ALIGNMENT_ERROR,
                                 "Frame has " + std::to_string(rows.size()) +
                                     " rows for an index of " + std::to_string(index.size()) +
                                     " timestamps",
                                 "Frame");
    }
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != columns.size()) {
            return make_error<Frame>(ErrorCode::INVALID_DATA,
                                     "Row " + std::to_string(i) + " has " +
                                         std::to_string(rows[i].size()) + " values, expected " +
                                         std::to_string(columns.size()),
                                     "Frame");
        }
    }

    Frame frame;
    frame.index_ = std::move(index);
    frame.columns_ = std::move(columns);
    frame.rows_ = std::move(rows);
    return frame;
}

Frame Frame::zeros(const TimeIndex& index, const std::vector<std::string>& columns) {
    Frame frame;
    frame.index_ = index;
    frame.columns_ = columns;
    frame.rows_.assign(index.size(), std::vector<double>(columns.size(), 0.0));
    return frame;
}

Result<Frame> Frame::from_series(const SeriesMap& series) {
    if (series.empty()) {
        return make_error<Frame>(ErrorCode::INVALID_ARGUMENT, "No series to combine", "Frame");
    }

    const TimeIndex& reference = series.begin()->second.index;
    std::vector<std::string> columns;
    columns.reserve(series.size());

    for (const auto& [symbol, s] : series) {
        if (s.index != reference) {
            auto diff = reference.difference(s.index);
            std::string detail = "Series '" + symbol + "' is not on the shared index";
            if (diff.first_missing) {
                detail += ", missing " + std::to_string(diff.missing) + " (first " +
                          core::format_date(*diff.first_missing) + ")";
            }
            if (diff.first_extra) {
                detail += ", extra " + std::to_string(diff.extra) + " (first " +
                          core::format_date(*diff.first_extra) + ")";
            }
            return make_error<Frame>(ErrorCode::ALIGNMENT_ERROR, detail, "Frame");
        }
        if (s.values.size() != reference.size()) {
            return make_error<Frame>(ErrorCode::ALIGNMENT_ERROR,
                                     "Series '" + symbol + "' length does not match its index",
                                     "Frame");
        }
        columns.push_back(symbol);
    }

    std::vector<std::vector<double>> rows(reference.size(),
                                          std::vector<double>(columns.size(), 0.0));
    size_t col = 0;
    for (const auto& entry : series) {
        const auto& values = entry.second.values;
        for (size_t t = 0; t < values.size(); ++t) {
            rows[t][col] = values[t];
        }
        ++col;
    }

    return Frame::create(reference, std::move(columns), std::move(rows));
}

Result<size_t> Frame::column_position(const std::string& symbol) const {
    for (size_t i = 0; i < columns_.size(); ++i) {
        if (columns_[i] == symbol) {
            return i;
        }
    }
    return make_error<size_t>(ErrorCode::INVALID_ARGUMENT, "Unknown column '" + symbol + "'",
                              "Frame");
}

Result<Series> Frame::column(const std::string& symbol) const {
    auto pos = column_position(symbol);
    if (pos.is_error()) {
        return forward_error<Series>(pos.error());
    }
    std::vector<double> values(rows_.size());
    for (size_t t = 0; t < rows_.size(); ++t) {
        values[t] = rows_[t][pos.value()];
    }
    return Series::create(index_, std::move(values));
}

SeriesMap Frame::to_series() const {
    SeriesMap result;
    for (size_t c = 0; c < columns_.size(); ++c) {
        Series s;
        s.index = index_;
        s.values.resize(rows_.size());
        for (size_t t = 0; t < rows_.size(); ++t) {
            s.values[t] = rows_[t][c];
        }
        result.emplace(columns_[c], std::move(s));
    }
    return result;
}

Result<Frame> Frame::slice(size_t begin, size_t end) const {
    auto sliced_index = index_.slice(begin, end);
    if (sliced_index.is_error()) {
        return forward_error<Frame>(sliced_index.error());
    }
    std::vector<std::vector<double>> rows(rows_.begin() + static_cast<std::ptrdiff_t>(begin),
                                          rows_.begin() + static_cast<std::ptrdiff_t>(end));
    return Frame::create(sliced_index.value(), columns_, std::move(rows));
}

}  // namespace tempo_ngin
