/*
 * Unit tests for QueryNormalizer
 */
#include <gtest/gtest.h>
#include "../query/QueryNormalizer.h"

using namespace tapsight;

class QueryNormalizerTest : public ::testing::Test {
protected:
    void SetUp() override {
        normalizer = std::make_shared<QueryNormalizer>(Preference::defaults());
    }

    void TearDown() override {}

    QueryNormalizerPtr normalizer;
};

TEST_F(QueryNormalizerTest, NormalizeTrimsAndLowers) {
    NormalizedQueryPtr query = normalizer->normalize("  Click   The  Subscribe ");
    EXPECT_EQ(query->raw, "Click   The  Subscribe");
    EXPECT_EQ(query->working, "click the subscribe");
    EXPECT_EQ(query->searchText, "subscribe");
    EXPECT_FALSE(query->requiresVision);
    EXPECT_FALSE(query->isOrdinal());
    EXPECT_FALSE(query->isEmpty());
}

TEST_F(QueryNormalizerTest, BlankQueryIsEmpty) {
    EXPECT_TRUE(normalizer->normalize("")->isEmpty());
    EXPECT_TRUE(normalizer->normalize(" \t  ")->isEmpty());
}

TEST_F(QueryNormalizerTest, DetectOrdinalAfterVerb) {
    OrdinalQueryPtr ordinal = normalizer->detectOrdinal("tap the second video");
    ASSERT_NE(ordinal, nullptr);
    EXPECT_EQ(ordinal->position, 2);
    EXPECT_EQ(ordinal->itemType, "video");

    ordinal = normalizer->detectOrdinal("click on the first search result");
    ASSERT_NE(ordinal, nullptr);
    EXPECT_EQ(ordinal->position, 1);
    EXPECT_EQ(ordinal->itemType, "search result");
}

TEST_F(QueryNormalizerTest, OnlyTapVerbsLeadOrdinals) {
    EXPECT_EQ(normalizer->detectOrdinal("open first aid kit"), nullptr);
    EXPECT_EQ(normalizer->detectOrdinal("find second chance"), nullptr);
    NormalizedQueryPtr query = normalizer->normalize("open first aid kit");
    EXPECT_FALSE(query->isOrdinal());

    OrdinalQueryPtr ordinal = normalizer->detectOrdinal("press the third tab");
    ASSERT_NE(ordinal, nullptr);
    EXPECT_EQ(ordinal->position, 3);
    EXPECT_EQ(ordinal->itemType, "tab");
}

TEST_F(QueryNormalizerTest, DetectOrdinalForms) {
    OrdinalQueryPtr ordinal = normalizer->detectOrdinal("the last post");
    ASSERT_NE(ordinal, nullptr);
    EXPECT_EQ(ordinal->position, LastPosition);
    EXPECT_EQ(ordinal->itemType, "post");

    ordinal = normalizer->detectOrdinal("3rd photo");
    ASSERT_NE(ordinal, nullptr);
    EXPECT_EQ(ordinal->position, 3);

    ordinal = normalizer->detectOrdinal("fifth item");
    ASSERT_NE(ordinal, nullptr);
    EXPECT_EQ(ordinal->position, 5);
}

TEST_F(QueryNormalizerTest, NoOrdinalWithoutItemType) {
    EXPECT_EQ(normalizer->detectOrdinal("the second"), nullptr);
    EXPECT_EQ(normalizer->detectOrdinal("first"), nullptr);
    EXPECT_EQ(normalizer->detectOrdinal("subscribe button"), nullptr);
    EXPECT_EQ(normalizer->detectOrdinal("sixth video"), nullptr);
}

TEST_F(QueryNormalizerTest, RequiresVisionOnWholeTokens) {
    EXPECT_TRUE(normalizer->requiresVision("red car"));
    EXPECT_TRUE(normalizer->requiresVision("the photo of a dog"));
    EXPECT_TRUE(normalizer->requiresVision("tap the thumbnail"));
    EXPECT_FALSE(normalizer->requiresVision("credit card"));
    EXPECT_FALSE(normalizer->requiresVision("catalog"));
    EXPECT_FALSE(normalizer->requiresVision("settings"));
    // phrase entries need their words adjacent
    EXPECT_FALSE(normalizer->requiresVision("photo gallery of trips"));
}

TEST_F(QueryNormalizerTest, CleanSearchText) {
    EXPECT_EQ(normalizer->cleanSearchText("click the subscribe button"), "subscribe");
    EXPECT_EQ(normalizer->cleanSearchText("open settings"), "open settings");
    // all stop words: fall back to dropping verbs only
    EXPECT_EQ(normalizer->cleanSearchText("tap the video"), "the video");
    // nothing left even then: keep the query as is
    EXPECT_EQ(normalizer->cleanSearchText("tap"), "tap");
}

TEST_F(QueryNormalizerTest, NormalizeOrdinalQuery) {
    NormalizedQueryPtr query = normalizer->normalize("Tap the second video");
    ASSERT_TRUE(query->isOrdinal());
    EXPECT_EQ(query->ordinal->position, 2);
    EXPECT_EQ(query->ordinal->itemType, "video");
    EXPECT_FALSE(query->requiresVision);
}

TEST_F(QueryNormalizerTest, OrdinalPhrase) {
    EXPECT_EQ(QueryNormalizer::ordinalPhrase(2, "video"), "the second video");
    EXPECT_EQ(QueryNormalizer::ordinalPhrase(LastPosition, "post"), "the last post");
    EXPECT_EQ(QueryNormalizer::ordinalPhrase(7, "item"), "the 7th item");
    EXPECT_EQ(QueryNormalizer::ordinalPosition("2nd"), 2);
    EXPECT_EQ(QueryNormalizer::ordinalPosition("second"), 2);
    EXPECT_EQ(QueryNormalizer::ordinalPosition("video"), 0);
}

TEST_F(QueryNormalizerTest, CustomVisionWords) {
    PreferencePtr preference = Preference::parse("", R"({"visionOnlyWords": ["logo"]})");
    QueryNormalizer custom(preference);
    EXPECT_TRUE(custom.requiresVision("tap the logo"));
    EXPECT_FALSE(custom.requiresVision("red car"));
}
