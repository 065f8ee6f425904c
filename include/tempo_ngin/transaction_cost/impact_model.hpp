#pragma once

namespace tempo_ngin {
namespace transaction_cost {

/**
 * @brief Square-root market impact of portfolio turnover
 *
 *   participation = clamp(turnover / participation_scale, min, max)
 *   impact = turnover * k_bps / 10000 * sqrt(participation)
 */
class ImpactModel {
public:
    struct Config {
        double k_bps;                // Impact coefficient
        double participation_scale;  // Turnover that counts as full participation
        double min_participation;    // Floor for participation
        double max_participation;    // Cap for participation

        Config()
            : k_bps(0.0), participation_scale(1.0), min_participation(0.0),
              max_participation(1.0) {}
    };

    explicit ImpactModel(const Config& config = Config());

    /**
     * @brief Impact cost as a fraction of portfolio value
     */
    double calculate_market_impact(double turnover) const;

    /**
     * @brief Participation implied by a turnover, after clamping
     */
    double participation(double turnover) const;

private:
    Config config_;
};

}  // namespace transaction_cost
}  // namespace tempo_ngin
