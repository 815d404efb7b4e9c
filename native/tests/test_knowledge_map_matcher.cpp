/*
 * Unit tests for the knowledge map tier
 */
#include <gtest/gtest.h>
#include "FakeCollaborators.h"
#include "../agent/KnowledgeMapMatcher.h"

using namespace tapsight;

class KnowledgeMapMatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = std::make_shared<FakeDevice>();
        tree = std::make_shared<FakeUiTreeSource>();
        normalizer = std::make_shared<QueryNormalizer>(Preference::defaults());
        matcher = std::make_shared<KnowledgeMapMatcher>(Preference::defaults(), device, tree);
    }

    void TearDown() override {}

    std::shared_ptr<FakeDevice> device;
    std::shared_ptr<FakeUiTreeSource> tree;
    QueryNormalizerPtr normalizer;
    std::shared_ptr<KnowledgeMapMatcher> matcher;
};

TEST_F(KnowledgeMapMatcherTest, LookupExactThenContainment) {
    const KnowledgeEntry *entry = matcher->lookup("unsubscribe");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->first, "unsubscribe");

    entry = matcher->lookup("share now");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->first, "share");

    entry = matcher->lookup("sett");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->first, "settings");

    EXPECT_EQ(matcher->lookup("teleport"), nullptr);
    EXPECT_EQ(matcher->lookup(""), nullptr);
}

TEST_F(KnowledgeMapMatcherTest, LookupUsesKnowledgeIndexForExactKey) {
    PreferencePtr preference = Preference::parse("", R"({
        "knowledge": [
            {"key": "like", "labels": ["Like"]},
            {"key": "dislike", "labels": ["Dislike"]}
        ]
    })");
    KnowledgeMapMatcher custom(preference, device, tree);
    // "like" comes first and is contained in "dislike", the exact key still wins
    const KnowledgeEntry *entry = custom.lookup("dislike");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry, preference->findKnowledge("dislike"));
    EXPECT_EQ(entry->second.front(), "Dislike");

    entry = custom.lookup("like button");
    ASSERT_NE(entry, nullptr);
    EXPECT_EQ(entry->first, "like");
}

TEST_F(KnowledgeMapMatcherTest, TapsClickableElementWithKnownLabel) {
    tree->elements = {
            makeElement("Subscribe", "", Rect(0, 0, 100, 50)),
            makeElement("", "Subscribe to Veritasium", Rect(800, 400, 1000, 500), true,
                        "android.widget.Button"),
    };
    ResolvedTargetPtr target = matcher->attempt(*normalizer->normalize("click subscribe"));
    ASSERT_NE(target, nullptr);
    EXPECT_EQ(target->getTier(), ResolveTier::KNOWLEDGE_MAP);
    EXPECT_EQ(target->getPoint(), Point(900, 450));
    EXPECT_EQ(target->getLabel(), "Subscribe to Veritasium");
    EXPECT_DOUBLE_EQ(target->getScore(), 1.0);
    ASSERT_EQ(device->taps.size(), 1u);
    EXPECT_EQ(device->taps[0], Point(900, 450));
}

TEST_F(KnowledgeMapMatcherTest, LabelContainingDescriptionMatches) {
    // "Send" is contained in the label "Send message"
    tree->elements = {
            makeElement("", "Send", Rect(900, 2200, 1040, 2300), false, "android.widget.ImageButton"),
    };
    ResolvedTargetPtr target = matcher->attempt(*normalizer->normalize("send"));
    ASSERT_NE(target, nullptr);
    EXPECT_EQ(target->getLabel(), "Send");
}

TEST_F(KnowledgeMapMatcherTest, SkipsPassiveElements) {
    tree->elements = {
            makeElement("", "Like", Rect(0, 0, 100, 100), false, "android.widget.ImageView"),
    };
    EXPECT_EQ(matcher->attempt(*normalizer->normalize("like")), nullptr);
    EXPECT_TRUE(device->taps.empty());
}

TEST_F(KnowledgeMapMatcherTest, UnknownKeyDoesNotCaptureTree) {
    tree->elements = {makeElement("", "Teleport", Rect(0, 0, 100, 100))};
    EXPECT_EQ(matcher->attempt(*normalizer->normalize("teleport")), nullptr);
    EXPECT_EQ(tree->captureCalls, 0);
}

TEST_F(KnowledgeMapMatcherTest, EmptyTreeIsMiss) {
    EXPECT_EQ(matcher->attempt(*normalizer->normalize("subscribe")), nullptr);
    EXPECT_EQ(tree->captureCalls, 1);
    EXPECT_TRUE(device->taps.empty());
}

TEST_F(KnowledgeMapMatcherTest, DeviceErrorIsMiss) {
    tree->failCapture = true;
    EXPECT_EQ(matcher->attempt(*normalizer->normalize("subscribe")), nullptr);
}
