#include "tempo_ngin/backtest/walkforward_result.hpp"
#include "tempo_ngin/core/time_utils.hpp"

namespace tempo_ngin {

namespace {

nlohmann::json frame_to_json(const Frame& frame) {
    nlohmann::json j = nlohmann::json::object();
    for (size_t c = 0; c < frame.num_columns(); ++c) {
        std::vector<double> column(frame.num_rows());
        for (size_t r = 0; r < frame.num_rows(); ++r) {
            column[r] = frame.at(r, c);
        }
        j[frame.columns()[c]] = column;
    }
    return j;
}

}  // namespace

nlohmann::json WalkforwardResult::to_json() const {
    nlohmann::json j;
    std::vector<std::string> dates;
    dates.reserve(index_.size());
    for (const auto& ts : index_) {
        dates.push_back(core::format_date(ts));
    }
    j["index"] = dates;
    j["symbols"] = symbols();
    j["equity_curve"] = equity_curve_;
    j["target_weights"] = frame_to_json(target_weights_);
    j["held_weights"] = frame_to_json(held_weights_);
    j["gross_returns"] = accounting_.gross;
    j["net_returns"] = accounting_.net;
    j["cost_components"] = {{"spread", accounting_.costs.spread},
                            {"slippage", accounting_.costs.slippage},
                            {"impact", accounting_.costs.impact}};
    j["attribution"] = {{"signal", attribution_.signal},
                        {"allocation", attribution_.allocation},
                        {"leverage", attribution_.leverage}};
    j["turnover"] = accounting_.turnover;
    j["leverage"] = leverage_;
    j["warmup"] = warmup_plan_.to_json();
    j["warnings"] = warnings_;
    j["metrics"] = metrics_.to_json();
    j["config"] = config_;
    return j;
}

}  // namespace tempo_ngin
