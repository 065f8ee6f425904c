// include/tempo_ngin/schedule/schedule_resolver.hpp
#pragma once

#include <string>
#include <vector>
#include "tempo_ngin/core/config_base.hpp"
#include "tempo_ngin/core/error.hpp"
#include "tempo_ngin/core/time_index.hpp"

namespace tempo_ngin {

/**
 * @brief How often a layer recomputes
 */
enum class Frequency {
    NONE,  // Once, on the first eligible step
    DAILY,
    WEEKLY,
    MONTHLY,
    QUARTERLY,
    ANNUAL
};

/**
 * @brief Which trading day of a period triggers the recomputation
 */
enum class ScheduleAnchor {
    FIRST_TRADING_DAY,
    LAST_TRADING_DAY,  // An index ending mid-period does not close that period
    ON_OR_AFTER_DAY    // First trading day on or after anchor_day
};

std::string frequency_to_string(Frequency frequency);
std::string schedule_anchor_to_string(ScheduleAnchor anchor);

/**
 * @brief Rebalance calendar of one layer
 */
struct ScheduleConfig : public ConfigBase {
    Frequency frequency{Frequency::DAILY};
    ScheduleAnchor anchor{ScheduleAnchor::FIRST_TRADING_DAY};
    int anchor_day{1};  // ISO weekday (1-7) for WEEKLY, day of month (1-28) otherwise

    std::string version{"1.0.0"};

    ScheduleConfig() = default;
    ScheduleConfig(Frequency f, ScheduleAnchor a = ScheduleAnchor::FIRST_TRADING_DAY, int day = 1)
        : frequency(f), anchor(a), anchor_day(day) {}

    Result<void> validate() const override;

    nlohmann::json to_json() const override;
    void from_json(const nlohmann::json& j) override;
};

/**
 * @brief Sorted positions of the index on which a layer recomputes
 */
class Schedule {
public:
    Schedule() = default;
    explicit Schedule(std::vector<size_t> positions) : positions_(std::move(positions)) {}

    const std::vector<size_t>& positions() const {
        return positions_;
    }

    bool is_scheduled(size_t pos) const;

    size_t size() const {
        return positions_.size();
    }

private:
    std::vector<size_t> positions_;
};

/**
 * @brief Resolves schedules from the calendar of a TimeIndex
 *
 * A pure function of the timestamps and the configuration.
 */
class ScheduleResolver {
public:
    /**
     * @brief Resolve the positions on which a layer recomputes
     * @param config Frequency and anchor
     * @param index Trading calendar
     * @param first_eligible Positions before this are never scheduled
     */
    static Result<Schedule> resolve(const ScheduleConfig& config, const TimeIndex& index,
                                    size_t first_eligible = 0);
};

}  // namespace tempo_ngin
