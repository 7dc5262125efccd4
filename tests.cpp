// The checks below call into the index, so they must survive release builds.
#undef NDEBUG

#include "geo_index.hpp"
#include "geo_trie.hpp"

#include <cassert>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>
#include <unordered_map>
#include <vector>

constexpr bool show_trees = true;

static std::string code_of(geo_point const& p)
{
    std::string code;
    geo_error err = geohash_encode(p, code);
    assert(err == geo_error::ok);
    (void)err;
    return code;
}

static void smoke_test()
{
    geo_index index;

    geo_point p{-122.4194, 37.7749};

    assert(index.add(p) == geo_error::ok);
    assert(index.contains("9Q8YYK8Y"));
    assert(index.del("9Q8YYK8Y") == geo_error::ok);
    assert(!index.contains("9Q8YYK8Y"));
}

static void insert_test1()
{
    geo_trie tree;

    geo_point a{-122.4194, 37.7749};
    geo_point b{-122.41941, 37.77491};

    assert(tree.insert(a) == geo_error::ok);
    assert(tree.insert(b) == geo_error::ok);
    assert(tree.size() == 1);
    assert(tree.point_count() == 2);

    if (show_trees)
        tree.print();
}

static void insert_test2()
{
    geo_trie tree;

    std::vector<geo_point> points = {
        {-122.4194, 37.7749}, {-122.4193, 37.7750}, {-122.4193, 37.7747},
        {-122.4190, 37.7749}, {2.3522, 48.8566}, {139.6917, 35.6895}
    };

    for (auto& p : points)
        assert(tree.insert(p) == geo_error::ok);
    assert(tree.size() == points.size());

    if (show_trees)
        tree.print();
}

// Erase a code whose path is shared up to the last symbol.
static void erase_test1()
{
    geo_trie tree;

    tree.insert(geo_point{-122.4194, 37.7749});
    tree.insert(geo_point{-122.4193, 37.7750});

    assert(tree.erase("9Q8YYK8Y") == geo_error::ok);
    assert(tree.contains("9Q8YYK8Z"));

    if (show_trees)
        tree.print();
}

// Erase the only code below the root.
static void erase_test2()
{
    geo_trie tree;

    tree.insert(geo_point{2.3522, 48.8566});

    assert(tree.erase("U09TVW0F") == geo_error::ok);
    std::vector<geo_entry> entries;
    assert(tree.prefix_search("", entries) == geo_error::ok);
    assert(entries.empty());

    if (show_trees)
        tree.print();
}

static geo_point random_point()
{
    double x = std::rand() % 16;
    double y = std::rand() % 16;
    return geo_point{13.40 + x * 0.0004, 52.52 + y * 0.0002};
}

static bool fuzz_test(std::size_t operations = 10)
{
    geo_trie tree;
    std::unordered_map<std::string, std::size_t> set;

    for (std::size_t i = 0; i < operations; ++i) {
        if (std::rand() % 2 || set.empty()) {
            geo_point p = random_point();
            std::string code = code_of(p);
            std::printf("insert: %s\n", code.c_str());
            if (tree.insert(p) != geo_error::ok)
                return false;
            ++set[code];
        } else {
            auto idx = static_cast<std::size_t>(std::rand()) % set.size();
            auto it = set.begin();
            while (idx--)
                ++it;
            std::string code = it->first;
            set.erase(it);
            std::printf("erase: %s\n", code.c_str());
            if (tree.erase(code) != geo_error::ok)
                return false;
        }
    }

    assert(set.size() == tree.size());

    return true;
}

int main()
{
    std::srand(static_cast<unsigned>(std::time(nullptr)));
    smoke_test();
    insert_test1();
    insert_test2();
    erase_test1();
    erase_test2();
    for (int i = 0; i < 100; ++i) {
        if (!fuzz_test(1000))
            return EXIT_FAILURE;
    }
}
