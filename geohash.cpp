#include "geohash.hpp"

#include <cmath>
#include <cstdint>

namespace
{

constexpr double longitude_min = -180.0;
constexpr double longitude_max = 180.0;
constexpr double latitude_min = -90.0;
constexpr double latitude_max = 90.0;

constexpr double earth_radius_in_meters = 6372797.560856;
constexpr double pi = 3.14159265358979323846;

// Reverse of geohash_alphabet, built from it so the two cannot disagree.
struct symbol_table
{
    signed char index[256];
};

constexpr symbol_table make_symbol_table()
{
    symbol_table table{};
    for (std::size_t c = 0; c < 256; ++c)
        table.index[c] = -1;
    for (std::size_t i = 0; i < geohash_alphabet_size; ++i) {
        auto c = static_cast<unsigned char>(geohash_alphabet[i]);
        table.index[c] = static_cast<signed char>(i);
    }
    return table;
}

constexpr symbol_table symbol_indices = make_symbol_table();

static_assert(symbol_indices.index['0'] == 0, "digits start the alphabet");
static_assert(symbol_indices.index['B'] == 10, "B follows the digits");
static_assert(symbol_indices.index['Z'] == 31, "Z ends the alphabet");
static_assert(symbol_indices.index['A'] == -1, "A is not a symbol");

}

bool geo_point::is_valid() const
{
    return std::isfinite(longitude) && std::isfinite(latitude)
        && longitude >= longitude_min && longitude <= longitude_max
        && latitude >= latitude_min && latitude <= latitude_max;
}

bool geo_point::operator==(geo_point const& other) const
{
    return longitude == other.longitude && latitude == other.latitude;
}

bool geo_point::operator!=(geo_point const& other) const
{
    return !(*this == other);
}

geo_point geo_cell::center() const
{
    return geo_point{(min_longitude + max_longitude) / 2,
                     (min_latitude + max_latitude) / 2};
}

bool geo_cell::contains(geo_point const& point) const
{
    return point.longitude >= min_longitude
        && point.longitude <= max_longitude
        && point.latitude >= min_latitude
        && point.latitude <= max_latitude;
}

// Binary search of value over [low, high], one bit per halving, most
// significant bit first.
static std::uint32_t axis_bits(double value, double low, double high)
{
    std::uint32_t bits = 0;
    for (std::size_t i = 0; i < geohash_bits_per_axis; ++i) {
        double mid = (low + high) / 2;
        bits <<= 1;
        if (value >= mid) {
            bits |= 1;
            low = mid;
        } else {
            high = mid;
        }
    }
    return bits;
}

geo_error geohash_encode(geo_point const& point, std::string& code)
{
    if (!point.is_valid())
        return geo_error::out_of_range;

    std::uint32_t lng = axis_bits(point.longitude,
                                  longitude_min, longitude_max);
    std::uint32_t lat = axis_bits(point.latitude,
                                  latitude_min, latitude_max);

    // Even stream positions take longitude bits, odd positions latitude.
    std::uint64_t stream = 0;
    for (std::size_t i = 0; i < geohash_bits_per_axis; ++i) {
        std::size_t shift = geohash_bits_per_axis - 1 - i;
        stream = (stream << 1) | ((lng >> shift) & 1u);
        stream = (stream << 1) | ((lat >> shift) & 1u);
    }

    std::string result(geohash_length, '0');
    for (std::size_t i = 0; i < geohash_length; ++i) {
        std::size_t shift = (geohash_length - 1 - i) * geohash_bits_per_symbol;
        result[i] = geohash_alphabet[(stream >> shift) & 0x1f];
    }
    code.swap(result);
    return geo_error::ok;
}

geo_error geohash_symbol_index(char symbol, std::size_t& index)
{
    signed char i = symbol_indices.index[static_cast<unsigned char>(symbol)];
    if (i < 0)
        return geo_error::invalid_symbol;
    index = static_cast<std::size_t>(i);
    return geo_error::ok;
}

bool geohash_is_valid(std::string const& code)
{
    if (code.size() > geohash_length)
        return false;
    std::size_t index;
    for (char c : code) {
        if (geohash_symbol_index(c, index) != geo_error::ok)
            return false;
    }
    return true;
}

geo_error geohash_decode(std::string const& code, geo_cell& cell)
{
    if (code.size() > geohash_length)
        return geo_error::invalid_hash;

    geo_cell result{longitude_min, longitude_max, latitude_min, latitude_max};
    bool is_longitude = true;
    for (char c : code) {
        std::size_t index;
        if (geohash_symbol_index(c, index) != geo_error::ok)
            return geo_error::invalid_hash;

        for (std::size_t bit = geohash_bits_per_symbol; bit-- > 0;) {
            bool set = (index >> bit) & 1u;
            double& low = is_longitude ? result.min_longitude
                                       : result.min_latitude;
            double& high = is_longitude ? result.max_longitude
                                        : result.max_latitude;
            double mid = (low + high) / 2;
            if (set)
                low = mid;
            else
                high = mid;
            is_longitude = !is_longitude;
        }
    }
    cell = result;
    return geo_error::ok;
}

static double deg_rad(double degrees)
{
    return degrees * pi / 180.0;
}

double haversine_distance(geo_point a, geo_point b)
{
    double lat1r = deg_rad(a.latitude);
    double lon1r = deg_rad(a.longitude);
    double lat2r = deg_rad(b.latitude);
    double lon2r = deg_rad(b.longitude);
    double u = std::sin((lat2r - lat1r) / 2);
    double v = std::sin((lon2r - lon1r) / 2);
    return 2.0 * earth_radius_in_meters
        * std::asin(std::sqrt(u * u + std::cos(lat1r) * std::cos(lat2r) * v * v));
}
