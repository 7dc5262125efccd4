#include "geo_error.hpp"

char const* geo_error_string(geo_error err)
{
    switch (err) {
    case geo_error::ok:
        return "ok";
    case geo_error::invalid_hash:
        return "invalid hash";
    case geo_error::invalid_symbol:
        return "invalid symbol";
    case geo_error::out_of_range:
        return "coordinate out of range";
    case geo_error::not_implemented:
        return "not implemented";
    }
    return "unknown error";
}
