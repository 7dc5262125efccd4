#ifndef GEO_ERROR_HPP
#define GEO_ERROR_HPP

// Failure kinds reported by the codec, the trie and the index. Operations
// return one of these; ok means the out-parameters were written.
enum class geo_error
{
    ok,
    invalid_hash,
    invalid_symbol,
    out_of_range,
    not_implemented
};

char const* geo_error_string(geo_error err);

#endif
