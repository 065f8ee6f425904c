#include "tempo_ngin/execution/execution_policy.hpp"

namespace tempo_ngin {

std::string execution_time_to_string(ExecutionTime time) {
    return time == ExecutionTime::NEXT_OPEN ? "next_open" : "next_close";
}

Result<void> ExecutionPolicy::validate() const {
    if (execution_delay_days < 0 || execution_delay_days > MAX_DELAY_DAYS) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "execution_delay_days must be in [0, " +
                                    std::to_string(MAX_DELAY_DAYS) + "], got " +
                                    std::to_string(execution_delay_days),
                                "ExecutionPolicy");
    }

    // Opening executions are priced at the open, closing executions at the close
    bool consistent = (execution_time == ExecutionTime::NEXT_OPEN && price_used == PriceField::OPEN) ||
                      (execution_time == ExecutionTime::NEXT_CLOSE && price_used == PriceField::CLOSE);
    if (!consistent) {
        return make_error<void>(ErrorCode::INVALID_CONFIG,
                                "execution_time " + execution_time_to_string(execution_time) +
                                    " is inconsistent with price_used " +
                                    price_field_to_string(price_used),
                                "ExecutionPolicy");
    }
    return Result<void>();
}

nlohmann::json ExecutionPolicy::to_json() const {
    nlohmann::json j;
    j["signal_time"] = "close";
    j["execution_time"] = execution_time_to_string(execution_time);
    j["price_used"] = price_field_to_string(price_used);
    j["execution_delay_days"] = execution_delay_days;
    j["version"] = version;
    return j;
}

void ExecutionPolicy::from_json(const nlohmann::json& j) {
    if (j.contains("signal_time")) {
        std::string value = j.at("signal_time").get<std::string>();
        if (value != "close") {
            throw std::invalid_argument("Unsupported signal_time: " + value);
        }
        signal_time = SignalTime::CLOSE;
    }
    if (j.contains("execution_time")) {
        std::string value = j.at("execution_time").get<std::string>();
        if (value == "next_open")
            execution_time = ExecutionTime::NEXT_OPEN;
        else if (value == "next_close")
            execution_time = ExecutionTime::NEXT_CLOSE;
        else
            throw std::invalid_argument("Unknown execution_time: " + value);
    }
    if (j.contains("price_used")) {
        std::string value = j.at("price_used").get<std::string>();
        if (value == "open")
            price_used = PriceField::OPEN;
        else if (value == "close")
            price_used = PriceField::CLOSE;
        else
            throw std::invalid_argument("Unknown price_used: " + value);
    }
    if (j.contains("execution_delay_days"))
        execution_delay_days = j.at("execution_delay_days").get<int>();
    if (j.contains("version"))
        version = j.at("version").get<std::string>();
}

Result<std::shared_ptr<const ExecutionPolicy>> make_execution_policy(ExecutionPolicy policy) {
    auto valid = policy.validate();
    if (valid.is_error()) {
        return forward_error<std::shared_ptr<const ExecutionPolicy>>(valid.error());
    }
    return std::shared_ptr<const ExecutionPolicy>(
        std::make_shared<ExecutionPolicy>(std::move(policy)));
}

}  // namespace tempo_ngin
