#pragma once

#include <string>
#include <optional>

enum class Direction {
    Long,
    Short
};

// Distance units a level rule may be expressed in
enum class Unit {
    Percent,
    Pips,
    Points
};

enum class ErrorKind {
    NoDirection,
    NoAsset,
    NoTimeframe,
    UnsupportedTimeframe,
    UnknownRule,
    InvalidEntry,
    NoPrice
};

struct SignalError {
    ErrorKind kind;
    std::string message;
};

inline std::string direction_string(Direction d) {
    switch (d) {
        case Direction::Long: return "LONG";
        case Direction::Short: return "SHORT";
    }
    return "LONG";
}

inline std::optional<Direction> direction_from_string(const std::string& s) {
    if (s == "LONG") return Direction::Long;
    if (s == "SHORT") return Direction::Short;
    return std::nullopt;
}

inline std::string unit_string(Unit u) {
    switch (u) {
        case Unit::Percent: return "%";
        case Unit::Pips: return "pips";
        case Unit::Points: return "points";
    }
    return "%";
}

inline std::string error_kind_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::NoDirection: return "no_direction";
        case ErrorKind::NoAsset: return "no_asset";
        case ErrorKind::NoTimeframe: return "no_timeframe";
        case ErrorKind::UnsupportedTimeframe: return "unsupported_timeframe";
        case ErrorKind::UnknownRule: return "unknown_rule";
        case ErrorKind::InvalidEntry: return "invalid_entry";
        case ErrorKind::NoPrice: return "no_price";
    }
    return "unknown";
}
