#include <gtest/gtest.h>
#include "viewer/graphics/idle_clip_selector.h"

using CVW::Graphics::IdleClipSelector;

TEST(IdleClipSelectorTest, SkipsTransitionIntoIdle) {
    auto name = IdleClipSelector::findIdleName({"attack1", "idle_in1", "idle_base"});
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "idle_base");
}

TEST(IdleClipSelectorTest, IsIdleClip) {
    EXPECT_TRUE(IdleClipSelector::isIdleClip("Idle1"));
    EXPECT_TRUE(IdleClipSelector::isIdleClip("Idle_Loop.anm"));
    EXPECT_TRUE(IdleClipSelector::isIdleClip("idle_inactive"));
    EXPECT_FALSE(IdleClipSelector::isIdleClip("Idle_In"));
    EXPECT_FALSE(IdleClipSelector::isIdleClip("Idle-In2"));
    EXPECT_FALSE(IdleClipSelector::isIdleClip("idle_in3.anm"));
    EXPECT_FALSE(IdleClipSelector::isIdleClip("Run_to_Idle"));
    EXPECT_FALSE(IdleClipSelector::isIdleClip("Attack1"));
}

TEST(IdleClipSelectorTest, HyphenatedTransitionsAreNotIdle) {
    EXPECT_FALSE(IdleClipSelector::isIdleClip("Run-to-Idle"));
    EXPECT_FALSE(IdleClipSelector::isIdleClip("Idle-to-Run"));
    EXPECT_FALSE(IdleClipSelector::isIdleClip("Idle-To-Run.anm"));
    EXPECT_FALSE(IdleClipSelector::isIdleClip("Idle_to_Run"));

    auto name = IdleClipSelector::findIdleName({"Idle-to-Run", "Idle_Variant"});
    ASSERT_TRUE(name.has_value());
    EXPECT_EQ(*name, "Idle_Variant");
}

TEST(IdleClipSelectorTest, RankedPatterns) {
    EXPECT_EQ(IdleClipSelector::findIdleName({"Idle2", "Idle1"}).value_or(""), "Idle1");
    EXPECT_EQ(IdleClipSelector::findIdleName({"Idle1", "Idle_Base.anm"}).value_or(""), "Idle_Base.anm");
    EXPECT_EQ(IdleClipSelector::findIdleName({"Spell1", "Idle3"}).value_or(""), "Idle3");
}

TEST(IdleClipSelectorTest, PreferredClipWinsWhenPresent) {
    const std::vector<std::string> clips = {"Idle1", "Dance", "Idle_Old"};
    EXPECT_EQ(IdleClipSelector::findIdleName(clips, std::string("Idle_Old")).value_or(""), "Idle_Old");
    EXPECT_EQ(IdleClipSelector::findIdleName(clips, std::string("Dance")).value_or(""), "Dance");
    // Exact names only
    EXPECT_EQ(IdleClipSelector::findIdleName(clips, std::string("idle_old")).value_or(""), "Idle1");
}

TEST(IdleClipSelectorTest, PreferredListTriedInOrder) {
    const std::vector<std::string> clips = {"IdleA", "Fiddlesticks_Idle2_Loop", "Idle1"};
    const std::vector<std::string> preferred = {"Missing", "Fiddlesticks_Idle2_Loop", "IdleA"};
    EXPECT_EQ(IdleClipSelector::findIdleName(clips, preferred).value_or(""), "Fiddlesticks_Idle2_Loop");

    const std::vector<std::string> none = {"Missing"};
    EXPECT_EQ(IdleClipSelector::findIdleName(clips, none).value_or(""), "Idle1");
}

TEST(IdleClipSelectorTest, NoIdleFallsBackToFirstClip) {
    EXPECT_EQ(IdleClipSelector::findIdleName({"Run", "Attack"}).value_or(""), "Run");
    EXPECT_FALSE(IdleClipSelector::findIdleName({}).has_value());
}

TEST(IdleClipSelectorTest, AllIdleNames_LoopReplacesPlainAndSortsNaturally) {
    auto names = IdleClipSelector::findAllIdleNames({"Idle10", "Idle1", "Attack", "Idle1_Loop", "Idle2", "Idle_In"});
    EXPECT_EQ(names, (std::vector<std::string>{"Idle1_Loop", "Idle2", "Idle10"}));
}

TEST(IdleClipSelectorTest, AllIdleNames_Empty) {
    EXPECT_TRUE(IdleClipSelector::findAllIdleNames({"Run", "Attack"}).empty());
    EXPECT_TRUE(IdleClipSelector::findAllIdleNames({}).empty());
}

TEST(IdleClipSelectorTest, NaturalLess) {
    EXPECT_TRUE(IdleClipSelector::naturalLess("idle2", "Idle10"));
    EXPECT_FALSE(IdleClipSelector::naturalLess("Idle10", "idle2"));
    EXPECT_FALSE(IdleClipSelector::naturalLess("a", "A"));
    EXPECT_FALSE(IdleClipSelector::naturalLess("A", "a"));
    EXPECT_TRUE(IdleClipSelector::naturalLess("Idle", "Idle1"));
    EXPECT_FALSE(IdleClipSelector::naturalLess("idle01", "idle1"));
}
