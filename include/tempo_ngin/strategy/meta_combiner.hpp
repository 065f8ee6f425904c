// include/tempo_ngin/strategy/meta_combiner.hpp
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include "tempo_ngin/core/config_base.hpp"
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/execution/execution_module.hpp"

namespace tempo_ngin {

enum class MetaMethod {
    FIXED_WEIGHT,
    INVERSE_VOLATILITY
};

std::string meta_method_to_string(MetaMethod method);

/**
 * @brief Configuration for combining several strategies into one intent
 */
struct MetaConfig : public ConfigBase {
    MetaMethod method{MetaMethod::FIXED_WEIGHT};
    std::map<std::string, double> weights;  // FIXED_WEIGHT; empty means equal weights
    size_t vol_lookback{60};                // INVERSE_VOLATILITY
    double min_weight{0.0};
    double max_weight{1.0};
    double min_vol{1e-8};

    std::string version{"1.0.0"};

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Trailing strategy history handed to a meta combiner
 *
 * Every timestamp must be strictly before as_of.
 */
struct MetaWindow {
    std::map<std::string, Intent> intents;  // Strategy name -> intent history
    SeriesMap raw_returns;                  // Asset returns on the same index
    Timestamp as_of;
};

/**
 * @brief Strategy-level weighting of intents
 */
class MetaCombiner {
public:
    virtual ~MetaCombiner() = default;

    virtual std::string name() const = 0;

    /**
     * @brief Intent rows needed past the strategy warmup
     */
    virtual size_t warmup_period() const = 0;

    /**
     * @brief Strategy weights from trailing history, summing to one
     */
    virtual Result<std::map<std::string, double>> compute_weights(
        const MetaWindow& window) const = 0;

    /**
     * @brief Weighted sum of the strategies' intent rows
     * @return INVALID_ARGUMENT when names or row widths disagree
     */
    static Result<WeightVector> combine(const std::map<std::string, double>& weights,
                                        const std::map<std::string, WeightVector>& rows);
};

/**
 * @brief Constant strategy weights
 */
class FixedWeightMeta : public MetaCombiner {
public:
    explicit FixedWeightMeta(std::map<std::string, double> weights);

    std::string name() const override {
        return "fixed_weight";
    }

    size_t warmup_period() const override {
        return 0;
    }

    Result<std::map<std::string, double>> compute_weights(
        const MetaWindow& window) const override;

private:
    std::map<std::string, double> weights_;
};

/**
 * @brief Strategy weights inversely proportional to the volatility of each
 * strategy's delayed intent applied to asset returns
 *
 * The first execution-delay rows of the window carry no position and are
 * excluded from the estimate.
 */
class InverseVolatilityMeta : public MetaCombiner {
public:
    InverseVolatilityMeta(MetaConfig config, ExecutionModule execution);

    std::string name() const override {
        return "inverse_volatility";
    }

    size_t warmup_period() const override;

    Result<std::map<std::string, double>> compute_weights(
        const MetaWindow& window) const override;

private:
    Result<double> strategy_volatility(const Intent& intent, const SeriesMap& raw_returns) const;

    MetaConfig config_;
    ExecutionModule execution_;
};

/**
 * @brief Build the combiner for a set of strategies
 * @return INVALID_CONFIG when configured weights do not name exactly the strategies
 */
Result<std::unique_ptr<MetaCombiner>> make_meta_combiner(
    const MetaConfig& config, const std::vector<std::string>& strategy_names,
    const ExecutionModule& execution);

}  // namespace tempo_ngin
