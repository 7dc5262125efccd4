#ifndef GEOHASH_HPP
#define GEOHASH_HPP

#include "geo_error.hpp"

#include <cstddef>
#include <string>

constexpr std::size_t geohash_length = 8;
constexpr std::size_t geohash_bits_per_axis = 20;
constexpr std::size_t geohash_bits_per_symbol = 5;
constexpr std::size_t geohash_alphabet_size = 32;

// Symbol i of a code stands for the 5-bit value i. A, I, L and O are left
// out so that no letter reads like a digit.
constexpr char geohash_alphabet[geohash_alphabet_size + 1] =
    "0123456789BCDEFGHJKMNPQRSTUVWXYZ";

static_assert(geohash_length * geohash_bits_per_symbol
              == 2 * geohash_bits_per_axis,
              "a code must hold exactly the interleaved bits of both axes");

struct geo_point
{
    double longitude;
    double latitude;

    // Both coordinates finite and inside [-180,180] x [-90,90].
    bool is_valid() const;

    bool operator==(geo_point const& other) const;
    bool operator!=(geo_point const& other) const;
};

// The bounding box of every point whose code starts with a given prefix.
struct geo_cell
{
    double min_longitude;
    double max_longitude;
    double min_latitude;
    double max_latitude;

    geo_point center() const;
    bool contains(geo_point const& point) const;
};

// Writes the 8-symbol code of point to code. Fails with out_of_range if
// either coordinate is outside its interval or not finite.
geo_error geohash_encode(geo_point const& point, std::string& code);

// Maps an alphabet symbol back to its position in geohash_alphabet. Fails
// with invalid_symbol for any other character, lowercase letters included.
geo_error geohash_symbol_index(char symbol, std::size_t& index);

// True if code is at most geohash_length symbols, all from the alphabet.
// The empty string is a valid (whole world) prefix.
bool geohash_is_valid(std::string const& code);

// Replays the bits of a code or prefix to recover the cell it denotes.
geo_error geohash_decode(std::string const& code, geo_cell& cell);

// Great-circle distance in meters.
double haversine_distance(geo_point a, geo_point b);

#endif
