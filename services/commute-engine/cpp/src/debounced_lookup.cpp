/**
 * @file debounced_lookup.cpp
 * @brief Debounced gateway lookups.
 */

#include "debounced_lookup.hpp"

namespace commute {

DebouncedPlaceSearch::DebouncedPlaceSearch(boost::asio::io_context& io, GeocodingGateway& gateway,
                                           Callback on_results, std::chrono::milliseconds quiet)
    : gateway_(gateway), on_results_(std::move(on_results)), debouncer_(io, quiet) {}

void DebouncedPlaceSearch::on_input(const std::string& query) {
    debouncer_.submit([this, query] {
        auto reply = gateway_.search_places(query);
        if (guard_.accept(reply.sequence)) {
            on_results_(reply.value);
        }
    });
}

DebouncedReverseGeocode::DebouncedReverseGeocode(boost::asio::io_context& io,
                                                 GeocodingGateway& gateway, Callback on_label,
                                                 std::chrono::milliseconds quiet)
    : gateway_(gateway), on_label_(std::move(on_label)), debouncer_(io, quiet) {}

void DebouncedReverseGeocode::on_pan(const Coordinate& center) {
    debouncer_.submit([this, center] {
        auto reply = gateway_.reverse_geocode(center);
        if (reply.value && guard_.accept(reply.sequence)) {
            on_label_(*reply.value);
        }
    });
}

}  // namespace commute
