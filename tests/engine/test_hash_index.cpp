/**
 * @file test_hash_index.cpp
 * @brief Unit tests for the name hash and the reverse lookup index
 */

#include <gtest/gtest.h>

#include "ability/AbilityHash.hpp"

#include "utils/TestHelpers.hpp"

#include <vector>

using namespace Forge::Ability;
using namespace Forge::Test;

// =============================================================================
// Hash Function Tests
// =============================================================================

static_assert(AbilityHash("") == 0u);
static_assert(AbilityHash("a") == 97u);
static_assert(AbilityHash("Fire") == 159183310u);

TEST(AbilityHashTest, KnownValues) {
    EXPECT_EQ(1177106u, AbilityHash("DMG"));
    EXPECT_EQ(3182672069u, AbilityHash("Fire_DMG"));
    EXPECT_EQ(3301789414u, AbilityHash("Ice_DMG"));
}

static_assert(AbilityHash("\xC3\xA9") == 0xE9u);

TEST(AbilityHashTest, HashesUtf16CodeUnits) {
    // U+00E9 and U+20AC are single code units
    EXPECT_EQ(0xE9u, AbilityHash("\xC3\xA9"));
    EXPECT_EQ(0x20ACu, AbilityHash("\xE2\x82\xAC"));
    EXPECT_EQ(AbilityHash("A") * 131u + 0xE9u, AbilityHash("A\xC3\xA9"));

    // U+1F600 is the surrogate pair D83D DE00
    EXPECT_EQ(0xD83Du * 131u + 0xDE00u, AbilityHash("\xF0\x9F\x98\x80"));
}

TEST(AbilityHashTest, MalformedUtf8HashesBytes) {
    EXPECT_EQ(0xFFu, AbilityHash("\xFF"));
    EXPECT_EQ(0xC3u, AbilityHash("\xC3"));
    EXPECT_EQ(0xC3u * 131u + 'A', AbilityHash("\xC3" "A"));
    EXPECT_EQ(0xE0u * 131u + 0x80u, AbilityHash("\xE0\x80"));
}

TEST(AbilityHashTest, WrapsAt32Bits) {
    EXPECT_EQ(3634734395u, AbilityHash("BUSPBWQG"));
    EXPECT_EQ(AbilityHash("BUSPBWQG"), AbilityHash("PWPPNFFJ"));
}

// =============================================================================
// NameHashIndex Tests
// =============================================================================

TEST(NameHashIndexTest, LooksUpInsertedNames) {
    NameHashIndex index;
    index.Insert("Fire_DMG");
    index.Insert("Ice_DMG");

    EXPECT_EQ(2u, index.Size());
    EXPECT_EQ("Fire_DMG", index.Lookup(3182672069u).value());
    EXPECT_EQ("Ice_DMG", index.Lookup(3301789414u).value());
    EXPECT_TRUE(index.Contains(AbilityHash("Fire_DMG")));
}

TEST(NameHashIndexTest, UnknownHash) {
    NameHashIndex index;
    index.Insert("Fire_DMG");

    EXPECT_FALSE(index.Lookup(12345u).has_value());
    EXPECT_EQ("unknown", index.LookupOrUnknown(12345u));
    EXPECT_EQ("Fire_DMG", index.LookupOrUnknown(AbilityHash("Fire_DMG")));
}

TEST(NameHashIndexTest, ReinsertingSameNameIsNotCollision) {
    NameHashIndex index;
    index.Insert("DMG");
    index.Insert("DMG");

    EXPECT_EQ(1u, index.Size());
    EXPECT_TRUE(index.GetCollisions().empty());
}

TEST(NameHashIndexTest, LaterNameWinsOnCollision) {
    NameHashIndex index;
    index.SetLogCollisions(false);
    index.Insert(77u, "First");
    index.Insert(77u, "Second");

    EXPECT_EQ("Second", index.Lookup(77u).value());
    ASSERT_EQ(1u, index.GetCollisions().size());

    const auto& collision = index.GetCollisions().front();
    EXPECT_EQ(77u, collision.hash);
    EXPECT_EQ("First", collision.previous);
    EXPECT_EQ("Second", collision.replacement);
}

TEST(NameHashIndexTest, RealCollisionRecorded) {
    NameHashIndex index;
    index.SetLogCollisions(false);
    index.Insert("BUSPBWQG");
    index.Insert("PWPPNFFJ");

    EXPECT_EQ(1u, index.Size());
    EXPECT_EQ("PWPPNFFJ", index.LookupOrUnknown(3634734395u));
    EXPECT_EQ(1u, index.GetCollisions().size());
}

TEST(NameHashIndexTest, BuildIndexesEveryConfigName) {
    std::vector<ConfigAbility> configs{
        MakeConfigAbility("Fire", {{"Fire_DMG", 10.0f}, {"Fire_CD", 6.0f}}, {"Fire_Burn"}),
        MakeConfigAbility("Ice", {{"Ice_DMG", 8.0f}}),
    };

    NameHashIndex index = NameHashIndex::Build(configs, false);

    EXPECT_EQ(6u, index.Size());
    for (const char* name : {"Fire", "Fire_DMG", "Fire_CD", "Fire_Burn", "Ice", "Ice_DMG"}) {
        EXPECT_EQ(name, index.LookupOrUnknown(AbilityHash(name))) << name;
    }
    EXPECT_TRUE(index.GetCollisions().empty());
}

TEST(NameHashIndexTest, BuildSharedNamesAcrossAbilities) {
    std::vector<ConfigAbility> configs{
        MakeConfigAbility("Fire", {{"DMG", 10.0f}}),
        MakeConfigAbility("Ice", {{"DMG", 8.0f}}),
    };

    NameHashIndex index = NameHashIndex::Build(configs, false);

    EXPECT_EQ(3u, index.Size());
    EXPECT_TRUE(index.GetCollisions().empty());
}

TEST(NameHashIndexTest, BuildFollowsDeclaredOrderOnCollision) {
    AbilityConfigParser parser;
    auto configs = parser.ParseString(R"([
        {"abilityName": "Slash", "abilitySpecials": {"PWPPNFFJ": 1.0, "BUSPBWQG": 2.0}},
        {"abilityName": "Burst", "modifiers": {"PWPPNFFJ": {}, "BUSPBWQG": {}}}
    ])");
    ASSERT_TRUE(configs.has_value()) << configs.error();

    NameHashIndex index = NameHashIndex::Build(*configs, false);

    EXPECT_EQ("BUSPBWQG", index.LookupOrUnknown(3634734395u));
    ASSERT_EQ(3u, index.GetCollisions().size());
    EXPECT_EQ("PWPPNFFJ", index.GetCollisions()[0].previous);
    EXPECT_EQ("BUSPBWQG", index.GetCollisions()[0].replacement);
}

TEST(NameHashIndexTest, BuildFromNothing) {
    NameHashIndex index = NameHashIndex::Build({}, false);
    EXPECT_EQ(0u, index.Size());
    EXPECT_EQ("unknown", index.LookupOrUnknown(0u));
}
