#include "tempo_ngin/execution/execution_module.hpp"
#include <cmath>
#include "tempo_ngin/core/logger.hpp"
#include "tempo_ngin/core/time_utils.hpp"

namespace tempo_ngin {

DelayLine::DelayLine(size_t width, int delay) : width_(width), delay_(delay) {}

Result<WeightVector> DelayLine::push(const WeightVector& target) {
    if (target.size() != width_) {
        return make_error<WeightVector>(ErrorCode::INVALID_ARGUMENT,
                                        "Row of width " + std::to_string(target.size()) +
                                            " pushed into a delay line of width " +
                                            std::to_string(width_),
                                        "DelayLine");
    }
    pending_.push_back(target);
    if (pending_.size() > static_cast<size_t>(delay_)) {
        WeightVector held = std::move(pending_.front());
        pending_.pop_front();
        return held;
    }
    return WeightVector(width_, 0.0);
}

ExecutionModule::ExecutionModule(std::shared_ptr<const ExecutionPolicy> policy)
    : policy_(std::move(policy)) {
    Logger::register_component("ExecutionModule");
    if (!policy_) {
        throw std::invalid_argument("ExecutionModule requires an execution policy");
    }
}

void ExecutionModule::warn_same_bar() const {
    WARN("execution_delay_days=0: same-bar execution, decisions earn the return of the bar "
         "they were made on");
}

Result<void> ExecutionModule::validate_intent(const Intent& intent,
                                              SignalType signal_type) const {
    if (intent.empty()) {
        return make_error<void>(ErrorCode::INTENT_VALIDATION_ERROR, "Intent has no assets",
                                "ExecutionModule");
    }

    const TimeIndex& reference = intent.begin()->second.index;
    for (const auto& [symbol, series] : intent) {
        if (series.index != reference) {
            auto diff = reference.difference(series.index);
            return make_error<void>(ErrorCode::ALIGNMENT_ERROR,
                                    "Intent for '" + symbol + "' is indexed differently (" +
                                        std::to_string(diff.missing) + " missing, " +
                                        std::to_string(diff.extra) + " extra)",
                                    "ExecutionModule");
        }
        if (series.values.size() != reference.size()) {
            return make_error<void>(ErrorCode::ALIGNMENT_ERROR,
                                    "Intent for '" + symbol + "' does not match its index length",
                                    "ExecutionModule");
        }

        size_t invalid = 0;
        size_t first_invalid = 0;
        for (size_t t = 0; t < series.values.size(); ++t) {
            double v = series.values[t];
            bool ok = std::isfinite(v);
            if (ok && signal_type == SignalType::DISCRETE) {
                ok = v == -1.0 || v == 0.0 || v == 1.0;
            }
            if (!ok) {
                if (invalid == 0) {
                    first_invalid = t;
                }
                ++invalid;
            }
        }
        if (invalid > 0) {
            return make_error<void>(
                ErrorCode::INTENT_VALIDATION_ERROR,
                signal_type_to_string(signal_type) + " intent for '" + symbol + "' has " +
                    std::to_string(invalid) + " invalid values (first " +
                    std::to_string(series.values[first_invalid]) + " on " +
                    core::format_date(reference[first_invalid]) + ")",
                "ExecutionModule");
        }
    }
    return Result<void>();
}

Result<void> ExecutionModule::validate_alignment_all(const TimeIndex& reference,
                                                     const std::vector<TimeIndex>& indices) const {
    for (size_t t = 1; t < reference.size(); ++t) {
        if (!(reference[t - 1] < reference[t])) {
            return make_error<void>(ErrorCode::ALIGNMENT_ERROR,
                                    "Reference index is not strictly increasing at position " +
                                        std::to_string(t),
                                    "ExecutionModule");
        }
    }

    for (size_t i = 0; i < indices.size(); ++i) {
        if (indices[i] == reference) {
            continue;
        }
        auto diff = reference.difference(indices[i]);
        std::string message = "object[" + std::to_string(i) + "] index does not match reference.";
        if (diff.missing > 0) {
            message += " Missing " + std::to_string(diff.missing) + " timestamps (first: " +
                       core::format_date(*diff.first_missing) + ").";
        }
        if (diff.extra > 0) {
            message += " Extra " + std::to_string(diff.extra) + " timestamps (first: " +
                       core::format_date(*diff.first_extra) + ").";
        }
        return make_error<void>(ErrorCode::ALIGNMENT_ERROR, message, "ExecutionModule");
    }
    return Result<void>();
}

Result<SeriesMap> ExecutionModule::compute_meta_raw_returns(const Intent& intent,
                                                            const SeriesMap& raw_returns,
                                                            const ExposureMapper* mapper) const {
    if (intent.size() != raw_returns.size()) {
        return make_error<SeriesMap>(ErrorCode::INVALID_ARGUMENT,
                                     "Intent has " + std::to_string(intent.size()) +
                                         " assets, returns have " +
                                         std::to_string(raw_returns.size()),
                                     "ExecutionModule");
    }
    for (const auto& entry : intent) {
        if (raw_returns.find(entry.first) == raw_returns.end()) {
            return make_error<SeriesMap>(ErrorCode::INVALID_ARGUMENT,
                                         "No returns for intent asset '" + entry.first + "'",
                                         "ExecutionModule");
        }
    }

    auto intent_frame = Frame::from_series(intent);
    if (intent_frame.is_error()) {
        return forward_error<SeriesMap>(intent_frame.error());
    }
    auto return_frame = Frame::from_series(raw_returns);
    if (return_frame.is_error()) {
        return forward_error<SeriesMap>(return_frame.error());
    }
    auto aligned = validate_alignment(intent_frame.value().index(), return_frame.value());
    if (aligned.is_error()) {
        return forward_error<SeriesMap>(aligned.error());
    }

    Frame exposure = intent_frame.take();
    if (mapper) {
        std::vector<std::vector<double>> rows;
        rows.reserve(exposure.num_rows());
        for (const auto& row : exposure.rows()) {
            auto mapped = mapper->map(row);
            if (mapped.is_error()) {
                return forward_error<SeriesMap>(mapped.error());
            }
            rows.push_back(mapped.take());
        }
        auto mapped_frame = Frame::create(exposure.index(), exposure.columns(), std::move(rows));
        if (mapped_frame.is_error()) {
            return forward_error<SeriesMap>(mapped_frame.error());
        }
        exposure = mapped_frame.take();
    }

    auto delayed = apply_delay(exposure);
    if (delayed.is_error()) {
        return forward_error<SeriesMap>(delayed.error());
    }

    // Both frames have sorted columns from the same key set
    const Frame& held = delayed.value();
    const Frame& returns = return_frame.value();
    std::vector<std::vector<double>> realized(held.num_rows(),
                                              std::vector<double>(held.num_columns(), 0.0));
    for (size_t t = 0; t < held.num_rows(); ++t) {
        for (size_t i = 0; i < held.num_columns(); ++i) {
            realized[t][i] = held.at(t, i) * returns.at(t, i);
        }
    }

    auto result = Frame::create(held.index(), held.columns(), std::move(realized));
    if (result.is_error()) {
        return forward_error<SeriesMap>(result.error());
    }
    return result.value().to_series();
}

Result<Series> ExecutionModule::apply_delay(const Series& series) const {
    auto frame = Frame::create(series.index, {"value"}, [&series]() {
        std::vector<std::vector<double>> rows;
        rows.reserve(series.values.size());
        for (double v : series.values) {
            rows.push_back({v});
        }
        return rows;
    }());
    if (frame.is_error()) {
        return forward_error<Series>(frame.error());
    }

    auto delayed = apply_delay(frame.value());
    if (delayed.is_error()) {
        return forward_error<Series>(delayed.error());
    }
    return delayed.value().column("value");
}

Result<Frame> ExecutionModule::apply_delay(const Frame& frame) const {
    DelayLine line = make_delay_line(frame.num_columns());
    std::vector<std::vector<double>> rows;
    rows.reserve(frame.num_rows());
    for (const auto& row : frame.rows()) {
        auto held = line.push(row);
        if (held.is_error()) {
            return forward_error<Frame>(held.error());
        }
        rows.push_back(held.take());
    }
    return Frame::create(frame.index(), frame.columns(), std::move(rows));
}

DelayLine ExecutionModule::make_delay_line(size_t width) const {
    if (delay() == 0) {
        warn_same_bar();
    }
    return DelayLine(width, delay());
}

}  // namespace tempo_ngin
