/**
 * @file test_talent_modifier.cpp
 * @brief Unit tests for talent modifiers applied to skill depots
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "ability/TalentModifier.hpp"

#include "utils/TestHelpers.hpp"
#include "mocks/MockServices.hpp"

#include <nlohmann/json.hpp>

using namespace Forge::Ability;
using namespace Forge::Test;
using json = nlohmann::json;
using ::testing::Return;

// =============================================================================
// ModifyAbility Tests
// =============================================================================

class ModifyAbilityTest : public ::testing::Test {
protected:
    void SetUp() override {
        depot = MakeDepot("Fire", {{"DMG", 10.0f}, {"CD", 7.0f}});
    }

    SkillDepot depot;
};

TEST_F(ModifyAbilityTest, IndexedDeltaAddsParam) {
    const ParamList params{5.0};
    TalentModifier modifier(MakeModifyAbility("Fire", "DMG", std::string("%0")));

    ASSERT_TRUE(ApplyModifier(modifier, depot, params).has_value());
    EXPECT_SPECIAL_EQ(depot, "Fire", "DMG", 15.0f);
}

TEST_F(ModifyAbilityTest, LiteralDeltaAndRatio) {
    TalentModifier modifier(MakeModifyAbility("Fire", "DMG", 2.0, 1.5));

    ASSERT_TRUE(ApplyModifier(modifier, depot, {}).has_value());
    EXPECT_SPECIAL_EQ(depot, "Fire", "DMG", 18.0f);
}

TEST_F(ModifyAbilityTest, LiteralZeroRatioKeepsValue) {
    TalentModifier modifier(MakeModifyAbility("Fire", "CD", ParamSpec{}, 0.0));

    ASSERT_TRUE(ApplyModifier(modifier, depot, {}).has_value());
    EXPECT_SPECIAL_EQ(depot, "Fire", "CD", 7.0f);
}

TEST_F(ModifyAbilityTest, IndexedZeroRatioZeroesValue) {
    const ParamList params{0.0};
    TalentModifier modifier(MakeModifyAbility("Fire", "CD", ParamSpec{}, std::string("%0")));

    ASSERT_TRUE(ApplyModifier(modifier, depot, params).has_value());
    EXPECT_SPECIAL_EQ(depot, "Fire", "CD", 0.0f);
}

TEST_F(ModifyAbilityTest, NoDeltaNoRatioLeavesValue) {
    TalentModifier modifier(MakeModifyAbility("Fire", "DMG"));

    ASSERT_TRUE(ApplyModifier(modifier, depot, {}).has_value());
    EXPECT_SPECIAL_EQ(depot, "Fire", "DMG", 10.0f);
}

TEST_F(ModifyAbilityTest, UnknownAbilityLeavesDepotUnchanged) {
    const json before = depot.ToJson();
    TalentModifier modifier(MakeModifyAbility("Ice", "DMG", 5.0));

    auto result = ApplyModifier(modifier, depot, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(EngineError::UnknownAbility, result.error());
    EXPECT_EQ(before, depot.ToJson());
}

TEST_F(ModifyAbilityTest, UnknownSpecial) {
    TalentModifier modifier(MakeModifyAbility("Fire", "Range", 5.0));

    auto result = ApplyModifier(modifier, depot, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(EngineError::UnknownSpecial, result.error());
}

TEST_F(ModifyAbilityTest, BadRatioDoesNotApplyDelta) {
    const ParamList params{5.0};
    TalentModifier modifier(MakeModifyAbility("Fire", "DMG", std::string("%0"), std::string("%3")));

    auto result = ApplyModifier(modifier, depot, params);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(EngineError::IndexOutOfRange, result.error());
    EXPECT_SPECIAL_EQ(depot, "Fire", "DMG", 10.0f);
}

TEST_F(ModifyAbilityTest, MalformedReference) {
    TalentModifier modifier(MakeModifyAbility("Fire", "DMG", std::string("%x")));

    auto result = ApplyModifier(modifier, depot, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(EngineError::MalformedReference, result.error());
    EXPECT_SPECIAL_EQ(depot, "Fire", "DMG", 10.0f);
}

TEST_F(ModifyAbilityTest, RepeatedApplicationCompounds) {
    TalentModifier modifier(MakeModifyAbility("Fire", "DMG", ParamSpec{}, 2.0));

    ASSERT_TRUE(ApplyModifier(modifier, depot, {}).has_value());
    ASSERT_TRUE(ApplyModifier(modifier, depot, {}).has_value());
    EXPECT_SPECIAL_EQ(depot, "Fire", "DMG", 40.0f);
}

// =============================================================================
// Predicate Gating Tests
// =============================================================================

TEST_F(ModifyAbilityTest, GatedModifierSkippedReportsSuccess) {
    MockPredicateContext context;
    context.SetAltitude(PredicateTarget::Self, 2.0f);

    ByTargetAltitude airborne;
    airborne.logic = LogicType::GreaterOrEqual;
    airborne.value = 5.0f;
    TalentModifier modifier(MakeModifyAbility("Fire", "DMG", 5.0), {airborne});

    ASSERT_TRUE(ApplyModifier(modifier, depot, {}, context).has_value());
    EXPECT_SPECIAL_EQ(depot, "Fire", "DMG", 10.0f);
}

TEST_F(ModifyAbilityTest, GatedModifierAppliesWhenPredicatesHold) {
    MockPredicateContext context;
    context.SetAltitude(PredicateTarget::Self, 5.0f);

    ByTargetAltitude airborne;
    airborne.logic = LogicType::GreaterOrEqual;
    airborne.value = 5.0f;
    TalentModifier modifier(MakeModifyAbility("Fire", "DMG", 5.0), {airborne});

    ASSERT_TRUE(ApplyModifier(modifier, depot, {}, context).has_value());
    EXPECT_SPECIAL_EQ(depot, "Fire", "DMG", 15.0f);
}

TEST_F(ModifyAbilityTest, GateSkippedEvenWhenModifierWouldFail) {
    ByHasAbilityState frozen;
    frozen.state = AbilityState::ElementFreeze;
    TalentModifier modifier(MakeModifyAbility("Missing", "DMG", 5.0), {frozen});

    EXPECT_TRUE(ApplyModifier(modifier, depot, {}).has_value());
}

// =============================================================================
// Other Modifier Kinds
// =============================================================================

TEST(ModifySkillCDTest, AppliesDeltaAndRatio) {
    SkillDepot depot;
    depot.skillCooldowns[10013] = 10.0f;

    ModifySkillCD mod;
    mod.skillId = 10013;
    mod.cdDelta = -2.0;
    mod.cdRatio = std::string("%0");

    const ParamList params{0.5};
    ASSERT_TRUE(ApplyModifierKind(mod, depot, params).has_value());
    EXPECT_FLOAT_EQ(4.0f, depot.skillCooldowns[10013]);
}

TEST(ModifySkillCDTest, UnknownSkill) {
    SkillDepot depot;
    ModifySkillCD mod;
    mod.skillId = 42;
    mod.cdDelta = 1.0;

    auto result = ApplyModifierKind(mod, depot, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(EngineError::UnknownSkill, result.error());
    EXPECT_TRUE(depot.skillCooldowns.empty());
}

TEST(AddTalentExtraLevelTest, AccumulatesLevels) {
    SkillDepot depot;
    AddTalentExtraLevel mod;
    mod.talentType = "Skill";
    mod.extraLevel = 3;

    ASSERT_TRUE(ApplyModifierKind(mod, depot, {}).has_value());
    ASSERT_TRUE(ApplyModifierKind(mod, depot, {}).has_value());
    EXPECT_EQ(6, depot.GetExtraLevel("Skill"));
    EXPECT_EQ(0, depot.GetExtraLevel("Burst"));
}

TEST(UnlockTalentParamTest, RequiresAbility) {
    SkillDepot depot = MakeDepot("Fire", {{"DMG", 1.0f}});

    UnlockTalentParam mod;
    mod.abilityName = "Fire";
    mod.talentParam = "Ignite";
    ASSERT_TRUE(ApplyModifierKind(mod, depot, {}).has_value());
    EXPECT_TRUE(depot.IsTalentParamUnlocked("Fire", "Ignite"));

    mod.abilityName = "Ice";
    auto result = ApplyModifierKind(mod, depot, {});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(EngineError::UnknownAbility, result.error());
    EXPECT_FALSE(depot.IsTalentParamUnlocked("Ice", "Ignite"));
}

TEST(TalentModifierTest, TypeNames) {
    EXPECT_STREQ("ModifyAbility", TalentModifierTypeName(ModifyAbility{}));
    EXPECT_STREQ("ModifySkillCD", TalentModifierTypeName(ModifySkillCD{}));
    EXPECT_STREQ("AddTalentExtraLevel", TalentModifierTypeName(AddTalentExtraLevel{}));
    EXPECT_STREQ("UnlockTalentParam", TalentModifierTypeName(UnlockTalentParam{}));
}

// =============================================================================
// Serialization Tests
// =============================================================================

TEST(TalentModifierJsonTest, ParsesModifyAbility) {
    auto parsed = TalentModifierFromJson(json::parse(R"({
        "$type": "ModifyAbility",
        "abilityName": "Fire",
        "paramSpecial": "DMG",
        "paramDelta": "%0",
        "paramRatio": 1.25,
        "predicates": [
            {"$type": "ByTargetHPRatio", "target": "Target", "logic": "Less", "value": 0.5}
        ]
    })"));
    ASSERT_TRUE(parsed.has_value()) << parsed.error();

    const auto& mod = std::get<ModifyAbility>(parsed->kind);
    EXPECT_EQ("Fire", mod.abilityName);
    EXPECT_EQ("DMG", mod.paramSpecial);
    EXPECT_EQ("%0", std::get<std::string>(mod.paramDelta));
    EXPECT_DOUBLE_EQ(1.25, std::get<double>(mod.paramRatio));
    ASSERT_EQ(1u, parsed->predicates.size());
    EXPECT_TRUE(std::holds_alternative<ByTargetHPRatio>(parsed->predicates[0]));
}

TEST(TalentModifierJsonTest, MissingFieldsAreAbsent) {
    auto parsed = TalentModifierFromJson(json::parse(R"({
        "$type": "ModifySkillCD", "skillId": 10013
    })"));
    ASSERT_TRUE(parsed.has_value()) << parsed.error();

    const auto& mod = std::get<ModifySkillCD>(parsed->kind);
    EXPECT_EQ(10013u, mod.skillId);
    EXPECT_TRUE(IsAbsent(mod.cdDelta));
    EXPECT_TRUE(IsAbsent(mod.cdRatio));
    EXPECT_TRUE(parsed->predicates.empty());
}

TEST(TalentModifierJsonTest, RejectsInvalidInput) {
    EXPECT_FALSE(TalentModifierFromJson(json::parse(R"({"abilityName": "Fire"})")).has_value());
    EXPECT_FALSE(TalentModifierFromJson(json::parse(R"({"$type": "Teleport"})")).has_value());
    EXPECT_FALSE(TalentModifierFromJson(json::parse(R"({"$type": "ModifyAbility", "abilityName": "Fire"})")).has_value());
    EXPECT_FALSE(TalentModifierFromJson(json::parse(R"({
        "$type": "ModifyAbility", "abilityName": "Fire", "paramSpecial": "DMG", "paramDelta": [1]
    })")).has_value());
    EXPECT_FALSE(TalentModifierFromJson(json::parse(R"({
        "$type": "UnlockTalentParam", "abilityName": "Fire", "talentParam": "Ignite",
        "predicates": [{"$type": "ByNothing"}]
    })")).has_value());
}

TEST(TalentModifierJsonTest, WritesOnlyPresentSpecs) {
    TalentModifier modifier(MakeModifyAbility("Fire", "DMG", std::string("%1")));
    json j = TalentModifierToJson(modifier);

    EXPECT_EQ("ModifyAbility", j["$type"]);
    EXPECT_EQ("Fire", j["abilityName"]);
    EXPECT_EQ("%1", j["paramDelta"]);
    EXPECT_FALSE(j.contains("paramRatio"));
}
