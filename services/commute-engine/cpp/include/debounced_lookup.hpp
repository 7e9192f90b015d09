/**
 * @file debounced_lookup.hpp
 * @brief Search-as-you-type and map-pan lookups bound to one input field.
 *
 * Debounce decides whether and when a call happens; the gateway's rate
 * limiter then decides how soon after the previous call it may fire.
 */

#pragma once

#include "debouncer.hpp"
#include "geocoding_gateway.hpp"

#include <functional>
#include <string>
#include <vector>

namespace commute {

/// Default quiet period for place search and map-centre resolution.
constexpr std::chrono::milliseconds kDefaultDebounceQuiet{5000};

/**
 * @brief Debounced place search for one text field.
 *
 * A search still waiting out its quiet period is dropped when this object
 * is destroyed. The gateway and io_context must outlive it, and it must not
 * be destroyed while one of its searches is running on another io thread.
 */
class DebouncedPlaceSearch {
public:
    using Callback = std::function<void(const std::vector<Place>&)>;

    DebouncedPlaceSearch(boost::asio::io_context& io, GeocodingGateway& gateway,
                         Callback on_results,
                         std::chrono::milliseconds quiet = kDefaultDebounceQuiet);

    /**
     * @brief New keystroke: replaces any pending search with this query.
     */
    void on_input(const std::string& query);

    void cancel() { debouncer_.cancel(); }

private:
    GeocodingGateway& gateway_;
    Callback on_results_;
    ResponseOrderGuard guard_;
    Debouncer debouncer_;
};

/**
 * @brief Debounced reverse geocoding of the map centre.
 *
 * Same lifetime rules as DebouncedPlaceSearch: pending lookups are dropped
 * on destruction, a lookup already running must finish first.
 */
class DebouncedReverseGeocode {
public:
    using Callback = std::function<void(const AreaLabel&)>;

    DebouncedReverseGeocode(boost::asio::io_context& io, GeocodingGateway& gateway,
                            Callback on_label,
                            std::chrono::milliseconds quiet = kDefaultDebounceQuiet);

    /**
     * @brief Map centre moved: resolve it once panning settles.
     */
    void on_pan(const Coordinate& center);

    void cancel() { debouncer_.cancel(); }

private:
    GeocodingGateway& gateway_;
    Callback on_label_;
    ResponseOrderGuard guard_;
    Debouncer debouncer_;
};

}  // namespace commute
