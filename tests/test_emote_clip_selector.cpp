#include <gtest/gtest.h>
#include "viewer/graphics/emote_clip_selector.h"

using namespace CVW::Graphics;

TEST(EmoteClipSelectorTest, BareClipIsOneShot) {
    auto variants = EmoteClipSelector::findEmoteVariants({"Idle1", "Joke", "Run"}, EmoteType::Joke);
    ASSERT_EQ(variants.size(), 1u);
    EXPECT_FALSE(variants[0].intro.has_value());
    EXPECT_EQ(variants[0].main, "Joke");
    EXPECT_FALSE(variants[0].outro.has_value());
    EXPECT_FALSE(variants[0].loops);
}

TEST(EmoteClipSelectorTest, LoopWithIntro_IgnoresOutro) {
    auto variants = EmoteClipSelector::findEmoteVariants(
        {"Dance_Into", "Dance_Loop", "Dance_Outro"}, EmoteType::Dance);
    ASSERT_EQ(variants.size(), 1u);
    EXPECT_EQ(variants[0], (EmoteVariant{std::string("Dance_Into"), "Dance_Loop", std::nullopt, true}));
}

TEST(EmoteClipSelectorTest, LoopUsesBareClipAsIntro) {
    auto variants = EmoteClipSelector::findEmoteVariants({"taunt", "TAUNT_LOOP"}, EmoteType::Taunt);
    ASSERT_EQ(variants.size(), 1u);
    EXPECT_EQ(variants[0].intro.value_or(""), "taunt");
    EXPECT_EQ(variants[0].main, "TAUNT_LOOP");
    EXPECT_TRUE(variants[0].loops);
}

TEST(EmoteClipSelectorTest, IntroOnlyBecomesMain) {
    auto variants = EmoteClipSelector::findEmoteVariants({"Laugh_In", "Laugh_Out"}, EmoteType::Laugh);
    ASSERT_EQ(variants.size(), 1u);
    EXPECT_EQ(variants[0], (EmoteVariant{std::nullopt, "Laugh_In", std::string("Laugh_Out"), false}));
}

TEST(EmoteClipSelectorTest, NumberedTakesInOrder) {
    auto variants = EmoteClipSelector::findEmoteVariants(
        {"Joke3", "Joke2_In", "Joke2_Loop", "Joke", "Joke3_Outro", "Joke_Extra"}, EmoteType::Joke);
    ASSERT_EQ(variants.size(), 3u);
    EXPECT_EQ(variants[0].main, "Joke");
    EXPECT_EQ(variants[1].main, "Joke3");
    EXPECT_EQ(variants[1].outro.value_or(""), "Joke3_Outro");
    EXPECT_EQ(variants[2].main, "Joke2_Loop");
    EXPECT_EQ(variants[2].intro.value_or(""), "Joke2_In");
}

TEST(EmoteClipSelectorTest, NoMatchingClips) {
    EXPECT_TRUE(EmoteClipSelector::findEmoteVariants({"Idle1", "Jokester"}, EmoteType::Joke).empty());
    EXPECT_TRUE(EmoteClipSelector::findEmoteVariants({}, EmoteType::Dance).empty());
}

TEST(EmoteClipSelectorTest, AvailableEmotesInFixedOrder) {
    auto emotes = EmoteClipSelector::availableEmotes({"Laugh", "Dance_Loop", "Joke", "Idle1"});
    ASSERT_EQ(emotes.size(), 3u);
    EXPECT_EQ(emotes[0].first, EmoteType::Joke);
    EXPECT_EQ(emotes[1].first, EmoteType::Dance);
    EXPECT_EQ(emotes[2].first, EmoteType::Laugh);
    EXPECT_STREQ(emoteTypeName(emotes[1].first), "dance");
}

TEST(EmoteClipSelectorTest, PhasesOfOneShot) {
    auto phases = EmoteClipSelector::phases({std::string("Joke_In"), "Joke", std::string("Joke_Out"), false});
    ASSERT_EQ(phases.size(), 3u);
    EXPECT_EQ(phases[0].clip, "Joke_In");
    EXPECT_EQ(phases[1].clip, "Joke");
    EXPECT_EQ(phases[2].clip, "Joke_Out");
    for (const auto& phase : phases) {
        EXPECT_FALSE(phase.loop);
    }
}

TEST(EmoteClipSelectorTest, PhasesOfLoopEndOnRepeatingClip) {
    auto phases = EmoteClipSelector::phases({std::string("Dance"), "Dance_Loop", std::string("Dance_Out"), true});
    ASSERT_EQ(phases.size(), 2u);
    EXPECT_EQ(phases[0].clip, "Dance");
    EXPECT_FALSE(phases[0].loop);
    EXPECT_EQ(phases[1].clip, "Dance_Loop");
    EXPECT_TRUE(phases[1].loop);
}

TEST(EmoteClipSelectorTest, IntroSameAsMainPlayedOnce) {
    auto phases = EmoteClipSelector::phases({std::string("Taunt"), "Taunt", std::nullopt, false});
    ASSERT_EQ(phases.size(), 1u);
    EXPECT_EQ(phases[0].clip, "Taunt");
}
