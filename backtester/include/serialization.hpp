#pragma once

#include <nlohmann/json.hpp>

#include "datatypes.hpp"

namespace backtester {

    using json = nlohmann::json;

    // Record views handed to external stores. Money is written as decimal strings,
    // timestamps as UTC ISO-8601.
    json toJson(const core::Bar& bar);
    json toJson(const core::Order& order);
    json toJson(const core::Position& position);
    json toJson(const core::Trade& trade);
    json toJson(const core::EquityCurvePoint& point);

} // namespace backtester
