#include "geohash.hpp"

#include <catch.hpp>

#include <cmath>
#include <cstring>
#include <limits>
#include <set>
#include <string>
#include <vector>

namespace
{

std::string encode(geo_point point)
{
    std::string code;
    REQUIRE(geohash_encode(point, code) == geo_error::ok);
    return code;
}

std::vector<geo_point> world_grid()
{
    std::vector<geo_point> points;
    for (int lon = -180; lon < 180; lon += 15)
        for (int lat = -90; lat <= 90; lat += 10)
            points.push_back(geo_point{lon + 0.123, lat * 0.99});
    return points;
}

}


TEST_CASE("alphabet", "[symbol_index]")
{
    SECTION("every symbol maps back to its position")
    {
        for (std::size_t i = 0; i < geohash_alphabet_size; ++i) {
            std::size_t index = 99;
            CAPTURE(geohash_alphabet[i]);
            REQUIRE(geohash_symbol_index(geohash_alphabet[i], index)
                    == geo_error::ok);
            REQUIRE(index == i);
        }
    }

    SECTION("every other character is rejected")
    {
        for (int c = 0; c < 256; ++c) {
            auto ch = static_cast<char>(c);
            if (std::memchr(geohash_alphabet, ch, geohash_alphabet_size))
                continue;
            std::size_t index = 99;
            CAPTURE(c);
            REQUIRE(geohash_symbol_index(ch, index)
                    == geo_error::invalid_symbol);
            REQUIRE(index == 99);
        }
    }

    SECTION("excluded and lowercase letters")
    {
        std::size_t index;
        for (char c : std::string("AILOabyz"))
            REQUIRE(geohash_symbol_index(c, index)
                    == geo_error::invalid_symbol);
    }
}

TEST_CASE("encoding", "[encode]")
{
    SECTION("known value")
    {
        REQUIRE(encode(geo_point{-122.4194, 37.7749}) == "9Q8YYK8Y");
        REQUIRE(encode(geo_point{2.3522, 48.8566}) == "U09TVW0F");
        REQUIRE(encode(geo_point{139.6917, 35.6895}) == "XN774C06");
    }

    SECTION("corners and origin")
    {
        REQUIRE(encode(geo_point{-180, -90}) == "00000000");
        REQUIRE(encode(geo_point{180, 90}) == "ZZZZZZZZ");
        REQUIRE(encode(geo_point{0, 0}) == "S0000000");
    }

    SECTION("fixed length over the alphabet")
    {
        for (auto const& p : world_grid()) {
            std::string code = encode(p);
            CAPTURE(p.longitude, p.latitude, code);
            REQUIRE(code.size() == geohash_length);
            REQUIRE(geohash_is_valid(code));
            REQUIRE(encode(p) == code);
        }
    }

    SECTION("points in one cell share the code")
    {
        REQUIRE(encode(geo_point{-122.41941, 37.77491})
                == encode(geo_point{-122.4194, 37.7749}));
    }

    SECTION("neighbouring points share a prefix")
    {
        std::string a = encode(geo_point{-122.4194, 37.7749});
        std::string b = encode(geo_point{-122.4193, 37.7750});
        REQUIRE(a != b);
        REQUIRE(a.substr(0, 7) == b.substr(0, 7));
    }
}

TEST_CASE("encoding rejects invalid coordinates", "[encode]")
{
    double nan = std::numeric_limits<double>::quiet_NaN();
    double inf = std::numeric_limits<double>::infinity();

    std::vector<geo_point> bad = {
        {180.0001, 0}, {-180.0001, 0}, {0, 90.0001}, {0, -90.0001},
        {nan, 0}, {0, nan}, {inf, 0}, {0, -inf}
    };

    for (auto const& p : bad) {
        std::string code = "untouched";
        CAPTURE(p.longitude, p.latitude);
        REQUIRE_FALSE(p.is_valid());
        REQUIRE(geohash_encode(p, code) == geo_error::out_of_range);
        REQUIRE(code == "untouched");
    }
}

TEST_CASE("validation", "[is_valid]")
{
    REQUIRE(geohash_is_valid(""));
    REQUIRE(geohash_is_valid("9Q8"));
    REQUIRE(geohash_is_valid("9Q8YYK8Y"));
    REQUIRE_FALSE(geohash_is_valid("9q8"));
    REQUIRE_FALSE(geohash_is_valid("9Q8A"));
    REQUIRE_FALSE(geohash_is_valid("9Q8YYK8Y0"));
}

TEST_CASE("decoding", "[decode]")
{
    geo_cell cell{};

    SECTION("empty prefix is the whole world")
    {
        REQUIRE(geohash_decode("", cell) == geo_error::ok);
        REQUIRE(cell.min_longitude == -180);
        REQUIRE(cell.max_longitude == 180);
        REQUIRE(cell.min_latitude == -90);
        REQUIRE(cell.max_latitude == 90);
    }

    SECTION("single symbol")
    {
        REQUIRE(geohash_decode("9", cell) == geo_error::ok);
        REQUIRE(cell.min_longitude == -135);
        REQUIRE(cell.max_longitude == -90);
        REQUIRE(cell.min_latitude == 0);
        REQUIRE(cell.max_latitude == 45);
    }

    SECTION("full code has the finest resolution")
    {
        REQUIRE(geohash_decode("9Q8YYK8Y", cell) == geo_error::ok);
        REQUIRE(cell.max_longitude - cell.min_longitude
                == Approx(360.0 / (1 << geohash_bits_per_axis)));
        REQUIRE(cell.max_latitude - cell.min_latitude
                == Approx(180.0 / (1 << geohash_bits_per_axis)));
        REQUIRE(cell.contains(geo_point{-122.4194, 37.7749}));
    }

    SECTION("every encoded point lies in its cell")
    {
        for (auto const& p : world_grid()) {
            std::string code = encode(p);
            CAPTURE(code);
            REQUIRE(geohash_decode(code, cell) == geo_error::ok);
            REQUIRE(cell.contains(p));
            REQUIRE(encode(cell.center()) == code);
        }
    }

    SECTION("malformed codes")
    {
        REQUIRE(geohash_decode("9Q8a", cell) == geo_error::invalid_hash);
        REQUIRE(geohash_decode("9Q8YYK8YZ", cell)
                == geo_error::invalid_hash);
    }
}

TEST_CASE("great-circle distance", "[distance]")
{
    geo_point paris{2.3522, 48.8566};
    geo_point london{-0.1278, 51.5074};

    REQUIRE(haversine_distance(paris, paris) == 0);
    REQUIRE(haversine_distance(paris, london) == Approx(343653.0).epsilon(0.001));
    REQUIRE(haversine_distance(london, paris)
            == Approx(haversine_distance(paris, london)));
    REQUIRE(haversine_distance(geo_point{0, 0}, geo_point{1, 0})
            == Approx(111226.3).epsilon(0.001));
}

TEST_CASE("error strings", "[error]")
{
    std::set<std::string> names = {
        geo_error_string(geo_error::ok),
        geo_error_string(geo_error::invalid_hash),
        geo_error_string(geo_error::invalid_symbol),
        geo_error_string(geo_error::out_of_range),
        geo_error_string(geo_error::not_implemented)
    };
    REQUIRE(names.size() == 5);
}
