#include "tempo_ngin/schedule/schedule_resolver.hpp"
#include <algorithm>
#include "tempo_ngin/core/time_utils.hpp"

namespace tempo_ngin {

namespace {

long period_key(const core::CalendarDate& date, Frequency frequency) {
    switch (frequency) {
        case Frequency::WEEKLY:
            return static_cast<long>(date.iso_year) * 100 + date.iso_week;
        case Frequency::MONTHLY:
            return static_cast<long>(date.year) * 12 + (date.month - 1);
        case Frequency::QUARTERLY:
            return static_cast<long>(date.year) * 4 + (date.month - 1) / 3;
        case Frequency::ANNUAL:
            return date.year;
        default:
            return 0;
    }
}

// Whether a date is on or after the anchor of its period
bool reached_anchor(const core::CalendarDate& date, Frequency frequency, int anchor_day) {
    switch (frequency) {
        case Frequency::WEEKLY:
            return date.weekday >= anchor_day;
        case Frequency::MONTHLY:
            return date.day >= anchor_day;
        case Frequency::QUARTERLY: {
            int first_month = ((date.month - 1) / 3) * 3 + 1;
            return date.month > first_month || date.day >= anchor_day;
        }
        case Frequency::ANNUAL:
            return date.month > 1 || date.day >= anchor_day;
        default:
            return true;
    }
}

Frequency frequency_from_string(const std::string& value) {
    if (value == "none")
        return Frequency::NONE;
    if (value == "daily")
        return Frequency::DAILY;
    if (value == "weekly")
        return Frequency::WEEKLY;
    if (value == "monthly")
        return Frequency::MONTHLY;
    if (value == "quarterly")
        return Frequency::QUARTERLY;
    if (value == "annual")
        return Frequency::ANNUAL;
    throw std::invalid_argument("Unknown frequency: " + value);
}

ScheduleAnchor anchor_from_string(const std::string& value) {
    if (value == "first_trading_day")
        return ScheduleAnchor::FIRST_TRADING_DAY;
    if (value == "last_trading_day")
        return ScheduleAnchor::LAST_TRADING_DAY;
    if (value == "on_or_after_day")
        return ScheduleAnchor::ON_OR_AFTER_DAY;
    throw std::invalid_argument("Unknown schedule anchor: " + value);
}

}  // namespace

std::string frequency_to_string(Frequency frequency) {
    switch (frequency) {
        case Frequency::NONE:
            return "none";
        case Frequency::DAILY:
            return "daily";
        case Frequency::WEEKLY:
            return "weekly";
        case Frequency::MONTHLY:
            return "monthly";
        case Frequency::QUARTERLY:
            return "quarterly";
        case Frequency::ANNUAL:
            return "annual";
        default:
            return "unknown";
    }
}

std::string schedule_anchor_to_string(ScheduleAnchor anchor) {
    switch (anchor) {
        case ScheduleAnchor::FIRST_TRADING_DAY:
            return "first_trading_day";
        case ScheduleAnchor::LAST_TRADING_DAY:
            return "last_trading_day";
        case ScheduleAnchor::ON_OR_AFTER_DAY:
            return "on_or_after_day";
        default:
            return "unknown";
    }
}

Result<void> ScheduleConfig::validate() const {
    if (anchor != ScheduleAnchor::ON_OR_AFTER_DAY) {
        return Result<void>();
    }
    int max_day = frequency == Frequency::WEEKLY ? 7 : 28;
    if (anchor_day < 1 || anchor_day > max_day) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "anchor_day must be in [1, " + std::to_string(max_day) + "] for " +
                                    frequency_to_string(frequency) + " schedules",
                                "ScheduleConfig");
    }
    return Result<void>();
}

nlohmann::json ScheduleConfig::to_json() const {
    nlohmann::json j;
    j["frequency"] = frequency_to_string(frequency);
    j["anchor"] = schedule_anchor_to_string(anchor);
    j["anchor_day"] = anchor_day;
    j["version"] = version;
    return j;
}

void ScheduleConfig::from_json(const nlohmann::json& j) {
    if (j.contains("frequency"))
        frequency = frequency_from_string(j.at("frequency").get<std::string>());
    if (j.contains("anchor"))
        anchor = anchor_from_string(j.at("anchor").get<std::string>());
    if (j.contains("anchor_day"))
        anchor_day = j.at("anchor_day").get<int>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

bool Schedule::is_scheduled(size_t pos) const {
    return std::binary_search(positions_.begin(), positions_.end(), pos);
}

Result<Schedule> ScheduleResolver::resolve(const ScheduleConfig& config, const TimeIndex& index,
                                           size_t first_eligible) {
    auto valid = config.validate();
    if (valid.is_error()) {
        return forward_error<Schedule>(valid.error());
    }

    std::vector<size_t> positions;
    const size_t n = index.size();
    if (first_eligible >= n) {
        return Schedule(std::move(positions));
    }

    if (config.frequency == Frequency::NONE) {
        positions.push_back(first_eligible);
        return Schedule(std::move(positions));
    }
    if (config.frequency == Frequency::DAILY) {
        for (size_t t = first_eligible; t < n; ++t) {
            positions.push_back(t);
        }
        return Schedule(std::move(positions));
    }

    std::vector<core::CalendarDate> dates;
    dates.reserve(n);
    for (size_t t = 0; t < n; ++t) {
        dates.push_back(core::to_calendar_date(index[t]));
    }

    long current_period = 0;
    bool period_done = false;
    for (size_t t = 0; t < n; ++t) {
        long key = period_key(dates[t], config.frequency);
        bool new_period = t == 0 || key != current_period;
        if (new_period) {
            current_period = key;
            period_done = false;
        }

        bool hit = false;
        switch (config.anchor) {
            case ScheduleAnchor::FIRST_TRADING_DAY:
                hit = new_period;
                break;
            case ScheduleAnchor::LAST_TRADING_DAY:
                hit = t + 1 < n && period_key(dates[t + 1], config.frequency) != key;
                break;
            case ScheduleAnchor::ON_OR_AFTER_DAY:
                hit = !period_done && reached_anchor(dates[t], config.frequency, config.anchor_day);
                if (hit) {
                    period_done = true;
                }
                break;
        }
        if (hit && t >= first_eligible) {
            positions.push_back(t);
        }
    }
    return Schedule(std::move(positions));
}

}  // namespace tempo_ngin
