#include "tempo_ngin/data/market_data.hpp"
#include <algorithm>
#include <cmath>
#include "tempo_ngin/core/logger.hpp"
#include "tempo_ngin/core/time_utils.hpp"

namespace tempo_ngin {

namespace {

double field_value(const Bar& bar, PriceField field) {
    return field == PriceField::OPEN ? bar.open : bar.close;
}

}  // namespace

Result<std::shared_ptr<const MarketData>> MarketData::create(
    TimeIndex index, std::unordered_map<std::string, std::vector<Bar>> bars, DataMode mode) {
    using ResultType = std::shared_ptr<const MarketData>;

    if (bars.empty()) {
        return make_error<ResultType>(ErrorCode::INVALID_ARGUMENT, "No symbols provided",
                                      "MarketData");
    }
    if (index.empty()) {
        return make_error<ResultType>(ErrorCode::INVALID_ARGUMENT, "Empty time index",
                                      "MarketData");
    }

    std::vector<std::string> symbols;
    symbols.reserve(bars.size());
    for (const auto& [symbol, _] : bars) {
        symbols.push_back(symbol);
    }
    std::sort(symbols.begin(), symbols.end());

    auto data = std::make_shared<MarketData>(PrivateTag{});
    data->index_ = index;
    data->mode_ = mode;

    for (const auto& symbol : symbols) {
        auto& series = bars.at(symbol);
        if (series.size() != index.size()) {
            return make_error<ResultType>(ErrorCode::ALIGNMENT_ERROR,
                                          "Symbol " + symbol + " has " +
                                              std::to_string(series.size()) + " bars, index has " +
                                              std::to_string(index.size()),
                                          "MarketData");
        }
        for (size_t t = 0; t < series.size(); ++t) {
            const Bar& bar = series[t];
            if (bar.timestamp != index[t]) {
                return make_error<ResultType>(
                    ErrorCode::ALIGNMENT_ERROR,
                    "Symbol " + symbol + " bar " + std::to_string(t) + " is dated " +
                        core::format_date(bar.timestamp) + ", index expects " +
                        core::format_date(index[t]),
                    "MarketData");
            }
            if (!std::isfinite(bar.open) || !std::isfinite(bar.close) || bar.open <= 0.0 ||
                bar.close <= 0.0) {
                return make_error<ResultType>(ErrorCode::INVALID_DATA,
                                              "Symbol " + symbol + " has an invalid price on " +
                                                  core::format_date(bar.timestamp),
                                              "MarketData");
            }
        }
        data->symbols_.push_back(symbol);
        data->bars_.push_back(std::move(series));
    }

    INFO("Loaded " << data->symbols_.size() << " symbols x " << index.size() << " bars ("
                   << data_mode_to_string(mode) << ")");
    return ResultType(std::move(data));
}

std::vector<double> MarketData::prices_at(size_t pos, PriceField field) const {
    std::vector<double> prices(symbols_.size());
    for (size_t i = 0; i < symbols_.size(); ++i) {
        prices[i] = field_value(bars_[i][pos], field);
    }
    return prices;
}

Result<MarketView> MarketView::create(std::shared_ptr<const MarketData> data, size_t begin,
                                      size_t as_of) {
    if (!data) {
        return make_error<MarketView>(ErrorCode::NOT_INITIALIZED, "No market data",
                                      "MarketView");
    }
    if (begin > as_of || as_of >= data->index().size()) {
        return make_error<MarketView>(ErrorCode::INVALID_ARGUMENT,
                                      "View [" + std::to_string(begin) + ", " +
                                          std::to_string(as_of) + "] out of range",
                                      "MarketView");
    }
    MarketView view;
    view.data_ = std::move(data);
    view.begin_ = begin;
    view.as_of_ = as_of;
    return view;
}

TimeIndex MarketView::index() const {
    // Range was validated at creation
    return data_->index().slice(begin_, as_of_ + 1).take();
}

std::vector<double> MarketView::prices(size_t symbol_pos, PriceField field) const {
    const auto& bars = data_->bars(symbol_pos);
    std::vector<double> prices;
    prices.reserve(size());
    for (size_t t = begin_; t <= as_of_; ++t) {
        prices.push_back(field_value(bars[t], field));
    }
    return prices;
}

Frame compute_asset_returns(const MarketData& data, PriceField field) {
    const size_t n = data.symbols().size();
    std::vector<std::vector<double>> rows(data.index().size(), std::vector<double>(n, 0.0));
    for (size_t i = 0; i < n; ++i) {
        const auto& bars = data.bars(i);
        for (size_t t = 1; t < bars.size(); ++t) {
            rows[t][i] = field_value(bars[t], field) / field_value(bars[t - 1], field) - 1.0;
        }
    }
    // Shape follows the validated snapshot
    return Frame::create(data.index(), data.symbols(), std::move(rows)).take();
}

}  // namespace tempo_ngin
