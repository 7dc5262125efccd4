#ifndef GEO_INDEX_HPP
#define GEO_INDEX_HPP

#include "geo_error.hpp"
#include "geo_trie.hpp"
#include "geohash.hpp"

#include <cstddef>
#include <shared_mutex>
#include <string>
#include <vector>

// Computes the distance in meters between two points.
using distance_func = double (*)(geo_point a, geo_point b);

// Thread-safe point index. One reader/writer lock guards the whole trie:
// add and del take it exclusively, the read operations take it shared and
// hold it until their copy of the result is complete.
class geo_index
{
public:
    // Uses haversine_distance for distance().
    geo_index();

    // distance() calls func, or returns not_implemented if func is null.
    explicit geo_index(distance_func func);

    geo_index(geo_index const&) = delete;
    geo_index& operator=(geo_index const&) = delete;

    geo_error add(geo_point const& point);

    // Doesn't touch the index.
    geo_error hash(geo_point const& point, std::string& code) const;

    geo_error distance(geo_point const& a, geo_point const& b,
                       double& meters) const;

    geo_error position(std::string const& code,
                       std::vector<geo_point>& points) const;

    geo_error del(std::string const& code);

    geo_error find_by_prefix(std::string const& prefix,
                             std::vector<geo_entry>& entries) const;

    // The cell covered by code, which may be a prefix. Doesn't touch the
    // index.
    geo_error cell(std::string const& code, geo_cell& result) const;

    bool contains(std::string const& code) const;
    std::size_t size() const;
    std::size_t point_count() const;

private:
    mutable std::shared_mutex mutex_;
    geo_trie trie_;
    distance_func distance_;
};

#endif
