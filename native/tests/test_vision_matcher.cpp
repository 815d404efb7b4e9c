/*
 * Unit tests for the vision tier acceptance gate
 */
#include <gtest/gtest.h>
#include "FakeCollaborators.h"
#include "../agent/VisionMatcher.h"

using namespace tapsight;

class VisionMatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        device = std::make_shared<FakeDevice>();
        vision = std::make_shared<FakeVisionEngine>();
        normalizer = std::make_shared<QueryNormalizer>(Preference::defaults());
        matcher = std::make_shared<VisionMatcher>(Preference::defaults(), device, vision);
    }

    void TearDown() override {}

    std::shared_ptr<FakeDevice> device;
    std::shared_ptr<FakeVisionEngine> vision;
    QueryNormalizerPtr normalizer;
    VisionMatcherPtr matcher;
};

TEST_F(VisionMatcherTest, ConfidenceMustExceedFloor) {
    ScreenSize screen{1080, 2400};
    EXPECT_FALSE(matcher->accepts(VisionResult("car", Point(500, 500), 0.4), screen));
    EXPECT_TRUE(matcher->accepts(VisionResult("car", Point(500, 500), 0.41), screen));
    EXPECT_FALSE(matcher->accepts(VisionResult("car", Point(500, 500), 0.0), screen));
}

TEST_F(VisionMatcherTest, CoordinatesAreRequired) {
    EXPECT_FALSE(matcher->accepts(VisionResult("Could not find: car", 0.9), ScreenSize{1080, 2400}));
}

TEST_F(VisionMatcherTest, EdgeGuard) {
    ScreenSize screen{1080, 2400};
    EXPECT_FALSE(matcher->accepts(VisionResult("x", Point(5, 500), 0.9), screen));
    EXPECT_FALSE(matcher->accepts(VisionResult("x", Point(500, 9), 0.9), screen));
    EXPECT_FALSE(matcher->accepts(VisionResult("x", Point(1075, 500), 0.9), screen));
    EXPECT_FALSE(matcher->accepts(VisionResult("x", Point(500, 2395), 0.9), screen));
    EXPECT_TRUE(matcher->accepts(VisionResult("x", Point(10, 10), 0.9), screen));
    EXPECT_TRUE(matcher->accepts(VisionResult("x", Point(1070, 2390), 0.9), screen));
    // unknown screen: no edge check
    EXPECT_TRUE(matcher->accepts(VisionResult("x", Point(3, 3), 0.9), ScreenSize()));
}

TEST_F(VisionMatcherTest, LocateTapsAcceptedResult) {
    vision->results.push_back(std::make_shared<VisionResult>("red car thumbnail", Point(540, 1200), 0.8));
    ResolvedTargetPtr target = matcher->locate("red car");
    ASSERT_NE(target, nullptr);
    EXPECT_EQ(target->getTier(), ResolveTier::VISION);
    EXPECT_EQ(target->getPoint(), Point(540, 1200));
    EXPECT_EQ(target->getLabel(), "red car thumbnail");
    EXPECT_DOUBLE_EQ(target->getScore(), 0.8);
    ASSERT_EQ(device->taps.size(), 1u);
    EXPECT_EQ(device->taps[0], Point(540, 1200));
}

TEST_F(VisionMatcherTest, RejectedResultIsNotTapped) {
    vision->results.push_back(std::make_shared<VisionResult>("red car", Point(2, 1200), 0.9));
    EXPECT_EQ(matcher->locate("red car"), nullptr);
    EXPECT_TRUE(device->taps.empty());
}

TEST_F(VisionMatcherTest, AttemptSendsRawQuery) {
    vision->results.push_back(std::make_shared<VisionResult>("red car", Point(540, 1200), 0.7));
    ASSERT_NE(matcher->attempt(*normalizer->normalize("  Tap the Red Car ")), nullptr);
    ASSERT_EQ(vision->descriptions.size(), 1u);
    EXPECT_EQ(vision->descriptions[0], "Tap the Red Car");
}

TEST_F(VisionMatcherTest, UnknownScreenSkipsEdgeCheck) {
    device->size = ScreenSize();
    vision->results.push_back(std::make_shared<VisionResult>("corner", Point(3, 3), 0.9));
    ResolvedTargetPtr target = matcher->attempt(*normalizer->normalize("red car"));
    ASSERT_NE(target, nullptr);
    EXPECT_EQ(target->getPoint(), Point(3, 3));
}

TEST_F(VisionMatcherTest, RequestFailureIsMiss) {
    vision->failRequest = true;
    EXPECT_EQ(matcher->attempt(*normalizer->normalize("red car")), nullptr);
    EXPECT_TRUE(device->taps.empty());
}

TEST_F(VisionMatcherTest, Availability) {
    EXPECT_TRUE(matcher->isAvailable());
    vision->available = false;
    EXPECT_FALSE(matcher->isAvailable());
    VisionMatcher noEngine(Preference::defaults(), device, nullptr);
    EXPECT_FALSE(noEngine.isAvailable());
}
