/**
 * @file route_variants.cpp
 * @brief Variant generator implementation.
 */

#include "route_variants.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <string>

namespace commute {

double round2(double value) {
    // Exact halves such as 0.125 round away from zero. Decimal ties that
    // are not exact in binary (2.675) fall out of the correctly rounded
    // fixed-point formatting below.
    double scaled = value * 100.0;
    if (std::fma(value, 100.0, -scaled) == 0.0 &&
        std::abs(scaled - std::trunc(scaled)) == 0.5) {
        return (std::trunc(scaled) + (scaled > 0 ? 1.0 : -1.0)) / 100.0;
    }

    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2) << value;
    return std::stod(ss.str());
}

RouteVariants expand_variants(const Itinerary& base) {
    RouteVariants v{base, base, base};

    v.fastest.id = base.id + "_fast";
    v.fastest.category = RouteCategory::Fastest;
    v.fastest.labels = {"Fastest", "Comfort"};

    v.cheapest.id = base.id + "_cheap";
    v.cheapest.total_cost = std::max(kMinimumFare, std::floor(base.total_cost * 0.7));
    v.cheapest.total_time_min = std::ceil(base.total_time_min * 1.3);
    v.cheapest.category = RouteCategory::Cheapest;
    v.cheapest.labels = {"Budget", "Saver"};

    v.shortest.id = base.id + "_short";
    v.shortest.total_distance_km = round2(base.total_distance_km * 0.95);
    v.shortest.total_time_min = std::ceil(base.total_time_min * 1.1);
    v.shortest.category = RouteCategory::Shortest;
    v.shortest.labels = {"Eco", "Direct"};

    return v;
}

}  // namespace commute
