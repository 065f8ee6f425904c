// include/tempo_ngin/data/market_data.hpp
#pragma once

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/frame.hpp"
#include "tempo_ngin/core/time_index.hpp"
#include "tempo_ngin/core/types.hpp"

namespace tempo_ngin {

/**
 * @brief How the market data snapshot was obtained
 */
enum class DataMode {
    SNAPSHOT,  // Frozen snapshot, reproducible
    LIVE       // Refreshable source
};

inline std::string data_mode_to_string(DataMode mode) {
    return mode == DataMode::SNAPSHOT ? "snapshot" : "live";
}

/**
 * @brief Per-asset OHLCV bars against one shared TimeIndex
 *
 * Read-only once created. Every symbol has exactly one bar per timestamp of
 * the index; nothing is filled or reindexed.
 */
class MarketData {
    struct PrivateTag {};

public:
    explicit MarketData(PrivateTag) {}

    /**
     * @brief Create a validated snapshot
     * @param index Reference clock
     * @param bars Bars per symbol, one per timestamp, in index order
     * @param mode How the data was obtained
     * @return ALIGNMENT_ERROR when any symbol's bars are not on the index,
     *         INVALID_DATA for non-positive or non-finite prices
     */
    static Result<std::shared_ptr<const MarketData>> create(
        TimeIndex index, std::unordered_map<std::string, std::vector<Bar>> bars,
        DataMode mode = DataMode::SNAPSHOT);

    const TimeIndex& index() const {
        return index_;
    }

    /**
     * @brief Symbols in sorted order; this order is the run's asset order
     */
    const std::vector<std::string>& symbols() const {
        return symbols_;
    }

    DataMode mode() const {
        return mode_;
    }

    const std::vector<Bar>& bars(size_t symbol_pos) const {
        return bars_[symbol_pos];
    }

    /**
     * @brief Price of one field for every symbol at a position
     */
    std::vector<double> prices_at(size_t pos, PriceField field) const;

private:
    TimeIndex index_;
    std::vector<std::string> symbols_;
    std::vector<std::vector<Bar>> bars_;
    DataMode mode_{DataMode::SNAPSHOT};
};

/**
 * @brief Read-only view of market data truncated at a decision timestamp
 *
 * Positions after as_of are not reachable through the view. A view may also
 * start later than the first bar to bound a training window.
 */
class MarketView {
public:
    /**
     * @brief Create a view over [begin, as_of]
     * @return INVALID_ARGUMENT when the range is empty or out of bounds
     */
    static Result<MarketView> create(std::shared_ptr<const MarketData> data, size_t begin,
                                     size_t as_of);

    MarketView() = default;

    Timestamp as_of() const {
        return data_->index()[as_of_];
    }

    size_t as_of_position() const {
        return as_of_;
    }

    size_t begin_position() const {
        return begin_;
    }

    /**
     * @brief Number of bars visible per symbol
     */
    size_t size() const {
        return as_of_ - begin_ + 1;
    }

    const std::vector<std::string>& symbols() const {
        return data_->symbols();
    }

    /**
     * @brief Visible timestamps
     */
    TimeIndex index() const;

    /**
     * @brief Bar of a symbol at an offset within the view
     */
    const Bar& bar(size_t symbol_pos, size_t offset) const {
        return data_->bars(symbol_pos)[begin_ + offset];
    }

    /**
     * @brief Price history of one symbol within the view
     */
    std::vector<double> prices(size_t symbol_pos, PriceField field) const;

private:
    std::shared_ptr<const MarketData> data_;
    size_t begin_{0};
    size_t as_of_{0};
};

/**
 * @brief Simple asset returns P(t) / P(t-1) - 1 from one price field
 *
 * The first row has no prior price and is zero.
 */
Frame compute_asset_returns(const MarketData& data, PriceField field);

}  // namespace tempo_ngin
