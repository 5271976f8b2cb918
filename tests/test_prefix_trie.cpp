#include <catch2/catch.hpp>
#include "PrefixTrie.hpp"

using namespace codesync;

TEST_CASE("Ignored paths cover everything below them", "[trie]") {
    PrefixTrie trie;
    trie.insert("build", PathFlag::IGNORE);

    REQUIRE((trie.check("build") & PathFlag::IGNORE));
    REQUIRE((trie.check("build/out/main.o") & PathFlag::IGNORE));
    REQUIRE(trie.check("src/build.rs") == PathFlag::NONE);
    REQUIRE(trie.check("buildx") == PathFlag::NONE);
}

TEST_CASE("Included paths win over ignored ancestors", "[trie]") {
    PrefixTrie trie;
    trie.insert("vendor", PathFlag::IGNORE);
    trie.insert("vendor/ours", PathFlag::INCLUDE);

    REQUIRE(trie.check("vendor/ours/lib.rs") == PathFlag::INCLUDE);
    REQUIRE(trie.check("vendor/theirs/lib.rs") == PathFlag::IGNORE);
}

TEST_CASE("Directories above an included path are bridges", "[trie]") {
    PrefixTrie trie;
    trie.insert("node_modules", PathFlag::IGNORE);
    trie.insert("node_modules/@corp/ui/src", PathFlag::INCLUDE);

    uint8_t flags = trie.check("node_modules");
    REQUIRE((flags & PathFlag::IGNORE));
    REQUIRE((flags & PathFlag::BRIDGE));

    REQUIRE((trie.check("node_modules/@corp") & PathFlag::BRIDGE));
    REQUIRE_FALSE((trie.check("node_modules/left-pad") & PathFlag::BRIDGE));
    REQUIRE_FALSE((trie.check("node_modules/@corp/ui/src/a.ts") & PathFlag::BRIDGE));
}

TEST_CASE("Paths are normalized on insert", "[trie]") {
    PrefixTrie trie;
    REQUIRE(trie.empty());
    trie.insert("./docs/../generated/", PathFlag::IGNORE);
    REQUIRE_FALSE(trie.empty());
    REQUIRE((trie.check("generated/x.py") & PathFlag::IGNORE));

    trie.clear();
    REQUIRE(trie.empty());
    REQUIRE(trie.check("generated/x.py") == PathFlag::NONE);
}
