// include/tempo_ngin/core/types.hpp

#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace tempo_ngin {

/**
 * @brief Timestamp type for consistent time representation
 * Uses std::chrono for type-safe time handling
 */
using Timestamp = std::chrono::system_clock::time_point;

/**
 * @brief Price type with double precision
 */
using Price = double;

/**
 * @brief One row of per-asset values, ordered like the universe
 */
using WeightVector = std::vector<double>;

/**
 * @brief Kind of values a strategy emits as intent
 */
enum class SignalType {
    DISCRETE,   // Values in {-1, 0, +1}
    CONTINUOUS  // Any finite score
};

/**
 * @brief Price column used to realize returns
 */
enum class PriceField {
    OPEN,
    CLOSE
};

/**
 * @brief Market data bar structure
 * Represents OHLCV data for one asset on one trading day
 */
struct Bar {
    Timestamp timestamp;
    Price open;
    Price high;
    Price low;
    Price close;
    double volume;
    std::string symbol;

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v, std::string s)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}
};

inline std::string signal_type_to_string(SignalType type) {
    return type == SignalType::DISCRETE ? "discrete" : "continuous";
}

inline std::string price_field_to_string(PriceField field) {
    return field == PriceField::OPEN ? "open" : "close";
}

}  // namespace tempo_ngin
