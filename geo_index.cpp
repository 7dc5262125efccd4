#include "geo_index.hpp"

#include <mutex>

geo_index::geo_index()
    : distance_(haversine_distance)
{}

geo_index::geo_index(distance_func func)
    : distance_(func)
{}

geo_error geo_index::add(geo_point const& point)
{
    // Encoding is pure, so it happens before the lock is taken.
    std::string code;
    geo_error err = geohash_encode(point, code);
    if (err != geo_error::ok)
        return err;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    return trie_.insert(code, point);
}

geo_error geo_index::hash(geo_point const& point, std::string& code) const
{
    return geohash_encode(point, code);
}

geo_error geo_index::distance(geo_point const& a, geo_point const& b,
                              double& meters) const
{
    if (!distance_)
        return geo_error::not_implemented;
    if (!a.is_valid() || !b.is_valid())
        return geo_error::out_of_range;
    meters = distance_(a, b);
    return geo_error::ok;
}

geo_error geo_index::position(std::string const& code,
                              std::vector<geo_point>& points) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trie_.lookup(code, points);
}

geo_error geo_index::del(std::string const& code)
{
    std::unique_lock<std::shared_mutex> lock(mutex_);
    return trie_.erase(code);
}

geo_error geo_index::find_by_prefix(std::string const& prefix,
                                    std::vector<geo_entry>& entries) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trie_.prefix_search(prefix, entries);
}

geo_error geo_index::cell(std::string const& code, geo_cell& result) const
{
    return geohash_decode(code, result);
}

bool geo_index::contains(std::string const& code) const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trie_.contains(code);
}

std::size_t geo_index::size() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trie_.size();
}

std::size_t geo_index::point_count() const
{
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return trie_.point_count();
}
