#include <gtest/gtest.h>
#include "hashcons/store.hpp"

#include <optional>
#include <sstream>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

using namespace hashcons;

// ============================================================================
// Interned<T> handle tests
// ============================================================================
//
// Each test uses its own InternStore so slot counts are exact.

TEST(InternedTest, DereferenceYieldsValue) {
    InternStore store;
    auto h = store.intern(std::string("hello"));
    EXPECT_EQ(*h, "hello");
    EXPECT_EQ(h->size(), 5u);
    EXPECT_EQ(h.get(), "hello");
}

TEST(InternedTest, EqualityIsSlotIdentity) {
    InternStore store;
    auto a = store.intern(std::string("hello"));
    auto b = store.intern(std::string("hello"));
    auto c = store.intern(std::string("world"));

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_TRUE(Interned<std::string>::sameSlot(a, b));
    EXPECT_EQ(&*a, &*b);
}

TEST(InternedTest, CompareWithPlainValue) {
    InternStore store;
    auto a = store.intern(std::string("hello"));
    EXPECT_TRUE(a == std::string("hello"));
    EXPECT_FALSE(a == std::string("world"));
}

TEST(InternedTest, SameValueInDifferentStoresIsDifferentSlot) {
    InternStore first;
    InternStore second;
    auto a = first.intern(std::string("shared"));
    auto b = second.intern(std::string("shared"));
    EXPECT_NE(a, b);
    EXPECT_TRUE(a == *b);
}

TEST(InternedTest, UseCountTracksHolders) {
    InternStore store;
    auto a = store.intern(std::string("hello"));
    auto b = store.intern(std::string("hello"));
    auto c = store.intern(std::string("world"));

    // Bucket + handles
    EXPECT_EQ(a.useCount(), 3);
    EXPECT_EQ(c.useCount(), 2);

    {
        auto aa = a;
        auto cc = c;
        EXPECT_EQ(a.useCount(), 4);
        EXPECT_EQ(c.useCount(), 3);
    }

    EXPECT_EQ(a.useCount(), 3);
    EXPECT_EQ(c.useCount(), 2);
}

TEST(InternedTest, MoveDoesNotChangeCount) {
    InternStore store;
    auto a = store.intern(std::string("moved"));
    EXPECT_EQ(a.useCount(), 2);

    auto b = std::move(a);
    EXPECT_EQ(b.useCount(), 2);
    EXPECT_EQ(*b, "moved");
}

TEST(InternedTest, OrderingUsesPayload) {
    InternStore store;
    auto apple = store.intern(std::string("apple"));
    auto banana = store.intern(std::string("banana"));

    EXPECT_LT(apple, banana);
    EXPECT_GT(banana, apple);
    EXPECT_LT(apple, std::string("apricot"));
}

TEST(InternedTest, StreamOutput) {
    InternStore store;
    auto h = store.intern(42);
    std::ostringstream oss;
    oss << h;
    EXPECT_EQ(oss.str(), "Interned(42)");
}

TEST(InternedTest, HashableInUnorderedSet) {
    InternStore store;
    std::unordered_set<Interned<std::string>> set;
    set.insert(store.intern(std::string("hashtest:a")));
    set.insert(store.intern(std::string("hashtest:b")));
    set.insert(store.intern(std::string("hashtest:a")));  // Duplicate

    EXPECT_EQ(set.size(), 2u);
    EXPECT_EQ(std::hash<Interned<std::string>>{}(store.intern(std::string("hashtest:a"))),
              static_cast<size_t>(hashValue(std::string("hashtest:a"))));
}

TEST(InternedTest, StdHashIsNoexcept) {
    static_assert(noexcept(std::hash<Interned<std::string>>{}(
        std::declval<const Interned<std::string>&>())));
    static_assert(noexcept(std::hash<Interned<int>>{}(std::declval<const Interned<int>&>())));
    SUCCEED();
}

TEST(InternedTest, NestedHandles) {
    InternStore store;
    using Path = std::vector<Interned<std::string>>;

    Path p1{store.intern(std::string("usr")), store.intern(std::string("lib"))};
    Path p2{store.intern(std::string("usr")), store.intern(std::string("lib"))};

    auto a = store.intern(std::move(p1));
    auto b = store.intern(std::move(p2));
    EXPECT_EQ(a, b);
    EXPECT_EQ(store.size<Path>(), 1u);
    EXPECT_EQ(store.size<std::string>(), 2u);

    // The outer slot keeps its inner handles alive
    EXPECT_EQ(store.gc(), 0u);
    EXPECT_EQ(*(*a)[0], "usr");
}

TEST(InternedTest, HandleSurvivesStoreClear) {
    InternStore store;
    auto h = store.intern(std::string("survivor"));
    store.clear();

    EXPECT_EQ(store.size(), 0u);
    EXPECT_EQ(*h, "survivor");
    EXPECT_EQ(h.useCount(), 1);
}

TEST(InternedTest, HandleOutlivesStore) {
    std::optional<Interned<std::string>> h;
    {
        InternStore store;
        h = store.intern(std::string("orphan"));
    }
    EXPECT_EQ(**h, "orphan");
    EXPECT_EQ(h->useCount(), 1);
}
