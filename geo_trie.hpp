#ifndef GEO_TRIE_HPP
#define GEO_TRIE_HPP

#include "geo_error.hpp"
#include "geohash.hpp"

#include <array>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

// All points that were inserted under one exact code, in insertion order.
struct geo_entry
{
    std::string code;
    std::vector<geo_point> points;
};

// A node of the trie. Each node stands for one code symbol: the path of
// symbols from the root spells a code or a prefix of one.
//
// The node holds the following:
//
// (1) One child slot per alphabet symbol, indexed by the symbol's position
// in geohash_alphabet. A node owns its children, so unlinking a child
// destroys the whole subtree below it.
//
// (2) The pass count: the number of distinct codes in the tree whose path
// goes through this node. A node is kept in the tree exactly as long as
// its pass count is non-zero. The root has no pass count.
//
// (3) The entry of the code that ends at this node, if any. A node with an
// entry is a terminal node, and its entry always has at least one point.
struct geo_node
{
    std::array<std::unique_ptr<geo_node>, geohash_alphabet_size> children;
    std::size_t pass_count = 0;
    std::unique_ptr<geo_entry> entry;

    bool terminal() const;
    geo_node* child_at(std::size_t i) const;
};

// Where a walk along a code stopped: nkey symbols were matched and
// current_node is the last node reached, which is the root if nothing
// matched.
struct match_result
{
    std::size_t nkey;
    geo_node* current_node;
};

class geo_trie
{
public:
    geo_trie();

    geo_trie(geo_trie const&) = delete;
    geo_trie& operator=(geo_trie const&) = delete;

    // Encodes point and files it under its code. Returns out_of_range if
    // the point cannot be encoded.
    geo_error insert(geo_point const& point);

    // Copies the points stored under code into points. A path that exists
    // but is not terminal yields no points. Returns invalid_hash, with
    // points cleared, if code has a bad symbol or its path doesn't exist.
    geo_error lookup(std::string const& code,
                     std::vector<geo_point>& points) const;

    // Removes the entry of code with all of its points. Returns
    // invalid_hash, and leaves the tree unchanged, if no entry ends there.
    geo_error erase(std::string const& code);

    // Copies out every entry at or below the node reached by prefix, in
    // pre-order: a node's entry comes before those of its children, and
    // children are visited in alphabet order. An unknown prefix yields no
    // entries, and so does a prefix longer than a code. Returns
    // invalid_hash only if prefix has a bad symbol.
    geo_error prefix_search(std::string const& prefix,
                            std::vector<geo_entry>& entries) const;

    bool contains(std::string const& code) const;

    // Applies the function supplied to each entry in the tree, in the same
    // order as prefix_search.
    void apply(void (*func)(geo_entry const& entry, void* arg),
               void* arg) const;

    void clear();
    void print() const;

    // Number of distinct codes in the tree.
    std::size_t size() const;
    std::size_t point_count() const;

private:
    friend class geo_index;

    // Files point under code, which must be geohash_encode(point). This
    // lets geo_index encode before it takes its lock.
    geo_error insert(std::string const& code, geo_point const& point);

    geo_error match(std::string const& code, match_result& result) const;

    std::unique_ptr<geo_node> root_;
    std::size_t size_;
    std::size_t point_count_;
};

#endif
