/**
 * @file route_variants.hpp
 * @brief Fastest / cheapest / shortest presentations of one itinerary.
 */

#pragma once

#include "itinerary.hpp"

namespace commute {

/// Fare floor applied to the cheapest variant.
constexpr double kMinimumFare = 13.0;

struct RouteVariants {
    Itinerary fastest;
    Itinerary cheapest;
    Itinerary shortest;
};

/**
 * @brief Derive three labelled variants from a base itinerary.
 *
 * Does not re-route. Path and legs are shared with the base; only the
 * headline totals change:
 *  - cheapest: cost max(13, floor(cost * 0.7)), time ceil(time * 1.3)
 *  - shortest: distance round2(distance * 0.95), time ceil(time * 1.1)
 */
RouteVariants expand_variants(const Itinerary& base);

/**
 * @brief Round the exact binary value to two decimals.
 *
 * 2.675 is stored as 2.67499999... and becomes 2.67; exactly
 * representable halves like 0.125 round away from zero.
 */
double round2(double value);

}  // namespace commute
