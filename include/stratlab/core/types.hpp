// include/stratlab/core/types.hpp

#pragma once

#include <chrono>
#include <string>
#include <utility>

namespace stratlab {

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
 * @brief Quantity type for trade sizes
 * Double to support fractional quantities
 */
using Quantity = double;

/**
 * @brief Trading side enumeration
 */
enum class Side {
    BUY,
    SELL,
    NONE  // Used for invalid/undefined states
};

inline std::string side_to_string(Side side) {
    switch (side) {
        case Side::BUY:
            return "BUY";
        case Side::SELL:
            return "SELL";
        default:
            return "NONE";
    }
}

/**
 * @brief Market data bar structure
 * Represents OHLCV data for any timeframe
 */
struct Bar {
    Timestamp timestamp;
    Price open{0.0};
    Price high{0.0};
    Price low{0.0};
    Price close{0.0};
    double volume{0.0};
    std::string symbol;

    Bar() = default;
    Bar(Timestamp ts, Price o, Price h, Price l, Price c, double v, std::string s)
        : timestamp(ts), open(o), high(h), low(l), close(c), volume(v), symbol(std::move(s)) {}
};

/**
 * @brief Data frequency enumeration
 * Represents the bar timeframe of a series
 */
enum class DataFrequency {
    DAILY,      // 1d
    HOURLY,     // 1h
    MINUTE_15,  // 15m
    MINUTE_5,   // 5m
    MINUTE_1    // 1m
};

inline std::string frequency_to_string(DataFrequency freq) {
    switch (freq) {
        case DataFrequency::DAILY:
            return "1d";
        case DataFrequency::HOURLY:
            return "1h";
        case DataFrequency::MINUTE_15:
            return "15m";
        case DataFrequency::MINUTE_5:
            return "5m";
        case DataFrequency::MINUTE_1:
            return "1m";
        default:
            return "1d";
    }
}

inline DataFrequency frequency_from_string(const std::string& label) {
    if (label == "1h")
        return DataFrequency::HOURLY;
    if (label == "15m")
        return DataFrequency::MINUTE_15;
    if (label == "5m")
        return DataFrequency::MINUTE_5;
    if (label == "1m")
        return DataFrequency::MINUTE_1;
    return DataFrequency::DAILY;
}

/**
 * @brief Duration of one bar for a given frequency
 */
inline std::chrono::seconds frequency_to_duration(DataFrequency freq) {
    switch (freq) {
        case DataFrequency::HOURLY:
            return std::chrono::hours(1);
        case DataFrequency::MINUTE_15:
            return std::chrono::minutes(15);
        case DataFrequency::MINUTE_5:
            return std::chrono::minutes(5);
        case DataFrequency::MINUTE_1:
            return std::chrono::minutes(1);
        case DataFrequency::DAILY:
        default:
            return std::chrono::hours(24);
    }
}

}  // namespace stratlab
