#include "geo_trie.hpp"

#include <cassert>
#include <cstdio>
#include <memory>
#include <utility>

bool geo_node::terminal() const
{
    return entry != nullptr;
}

geo_node* geo_node::child_at(std::size_t i) const
{
    assert(i < children.size());
    return children[i].get();
}

// Only for symbols of a code that already passed symbols_valid().
static std::size_t checked_index(char symbol)
{
    std::size_t index = 0;
    geo_error err = geohash_symbol_index(symbol, index);
    assert(err == geo_error::ok);
    (void)err;
    return index;
}

// Unlike geohash_is_valid() this puts no limit on the length: a longer
// code is well formed, it just never resolves.
static bool symbols_valid(std::string const& code)
{
    std::size_t index;
    for (char symbol : code) {
        if (geohash_symbol_index(symbol, index) != geo_error::ok)
            return false;
    }
    return true;
}

geo_trie::geo_trie()
    : root_(new geo_node)
    , size_(0)
    , point_count_(0)
{}

geo_error geo_trie::match(std::string const& code, match_result& result) const
{
    if (!symbols_valid(code))
        return geo_error::invalid_hash;

    std::size_t i = 0; // Number of symbols matched in code.
    geo_node* current_node = root_.get();

    for (; i < code.size(); ++i) {
        std::size_t index = checked_index(code[i]);
        geo_node* next_node = current_node->child_at(index);
        if (!next_node)
            break;
        current_node = next_node;
    }

    result = match_result{i, current_node};
    return geo_error::ok;
}

geo_error geo_trie::insert(geo_point const& point)
{
    std::string code;
    geo_error err = geohash_encode(point, code);
    if (err != geo_error::ok)
        return err;
    return insert(code, point);
}

geo_error geo_trie::insert(std::string const& code, geo_point const& point)
{
    match_result result;
    geo_error err = match(code, result);
    if (err != geo_error::ok)
        return err;
    if (code.size() != geohash_length)
        return geo_error::invalid_hash;

#ifndef NDEBUG
    std::string expected;
    assert(geohash_encode(point, expected) == geo_error::ok
           && expected == code);
#endif

    // A code that is already in the tree only gains a point. Its path was
    // counted when the code was first inserted.
    if (result.nkey == code.size() && result.current_node->terminal()) {
        result.current_node->entry->points.push_back(point);
        ++point_count_;
        return geo_error::ok;
    }

    // Everything that has to be allocated is built off the tree first:
    // the entry, and the chain of nodes for the unmatched tail of code,
    // bottom up. If any allocation throws, the tree hasn't been touched.
    std::unique_ptr<geo_entry> entry(new geo_entry{code, {point}});
    std::unique_ptr<geo_node> tail;
    for (std::size_t i = code.size(); i-- > result.nkey;) {
        std::unique_ptr<geo_node> n(new geo_node);
        n->pass_count = 1;
        if (tail)
            n->children[checked_index(code[i + 1])] = std::move(tail);
        else
            n->entry = std::move(entry);
        tail = std::move(n);
    }

    // Nothing below can throw.
    geo_node* current_node = root_.get();
    for (std::size_t i = 0; i < result.nkey; ++i) {
        current_node = current_node->child_at(checked_index(code[i]));
        ++current_node->pass_count;
    }
    if (tail)
        current_node->children[checked_index(code[result.nkey])] =
            std::move(tail);
    else
        current_node->entry = std::move(entry);

    ++size_;
    ++point_count_;
    return geo_error::ok;
}

geo_error geo_trie::lookup(std::string const& code,
                           std::vector<geo_point>& points) const
{
    match_result result;
    geo_error err = match(code, result);
    if (err == geo_error::ok && result.nkey != code.size())
        err = geo_error::invalid_hash;
    if (err != geo_error::ok) {
        points.clear();
        return err;
    }

    if (result.current_node->terminal())
        points = result.current_node->entry->points;
    else
        points.clear();
    return geo_error::ok;
}

geo_error geo_trie::erase(std::string const& code)
{
    match_result result;
    geo_error err = match(code, result);
    if (err != geo_error::ok)
        return err;
    if (result.nkey != code.size() || !result.current_node->terminal())
        return geo_error::invalid_hash;

    --size_;
    point_count_ -= result.current_node->entry->points.size();

    // Walk the path again, releasing this code's count on every node. The
    // first node that no other code passes through is unlinked, which takes
    // the rest of the path along with it.
    geo_node* current_node = root_.get();
    for (char symbol : code) {
        std::size_t index = checked_index(symbol);
        geo_node* next_node = current_node->child_at(index);
        assert(next_node && next_node->pass_count > 0);
        if (--next_node->pass_count == 0) {
            current_node->children[index].reset();
            return geo_error::ok;
        }
        current_node = next_node;
    }

    // Every node on the path is shared with another code, so only the
    // entry goes.
    current_node->entry.reset();
    return geo_error::ok;
}

static void visit_entries(geo_node const& n,
                          void (*func)(geo_entry const& entry, void* arg),
                          void* arg)
{
    if (n.terminal())
        func(*n.entry, arg);
    for (auto const& child : n.children) {
        if (child)
            visit_entries(*child, func, arg);
    }
}

static void collect_entry(geo_entry const& entry, void* arg)
{
    static_cast<std::vector<geo_entry>*>(arg)->push_back(entry);
}

geo_error geo_trie::prefix_search(std::string const& prefix,
                                  std::vector<geo_entry>& entries) const
{
    entries.clear();

    match_result result;
    geo_error err = match(prefix, result);
    if (err != geo_error::ok)
        return err;
    if (result.nkey != prefix.size())
        return geo_error::ok;

    visit_entries(*result.current_node, collect_entry, &entries);
    return geo_error::ok;
}

bool geo_trie::contains(std::string const& code) const
{
    match_result result;
    return match(code, result) == geo_error::ok
        && result.nkey == code.size()
        && result.current_node->terminal();
}

void geo_trie::apply(void (*func)(geo_entry const& entry, void* arg),
                     void* arg) const
{
    visit_entries(*root_, func, arg);
}

void geo_trie::clear()
{
    for (auto& child : root_->children)
        child.reset();
    size_ = 0;
    point_count_ = 0;
}

std::size_t geo_trie::size() const
{
    return size_;
}

std::size_t geo_trie::point_count() const
{
    return point_count_;
}

static void visit_child(geo_node const& child_node, std::size_t index,
                        std::size_t level)
{
    assert(level > 0);

    for (std::size_t i = 0; i < 4 * (level - 1) + level; ++i)
        std::putchar(' ');
    std::printf("`-> %c (%zu)", geohash_alphabet[index],
                child_node.pass_count);
    if (child_node.terminal())
        std::printf(" [*] %zu", child_node.entry->points.size());
    std::printf("\n");
    for (std::size_t i = 0; i < child_node.children.size(); ++i) {
        if (child_node.children[i])
            visit_child(*child_node.children[i], i, level + 1);
    }
}

void geo_trie::print() const
{
    std::puts("[root]");
    for (std::size_t i = 0; i < root_->children.size(); ++i) {
        if (root_->children[i])
            visit_child(*root_->children[i], i, 1);
    }
}
