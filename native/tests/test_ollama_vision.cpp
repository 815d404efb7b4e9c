/*
 * Unit tests for the Ollama vision engine, without a server
 */
#include <gtest/gtest.h>
#include "FakeCollaborators.h"
#include "../device/OllamaVision.h"
#include <thread>

using namespace tapsight;

class OllamaVisionTest : public ::testing::Test {
protected:
    void SetUp() override {
        screen.width = 1080;
        screen.height = 2400;
    }

    void TearDown() override {}

    ScreenSize screen;
};

TEST_F(OllamaVisionTest, ParseJsonReply) {
    VisionResultPtr result = OllamaVision::parseFindResponse(
            "Sure! {\"found\": true, \"x\": 540, \"y\": 1200, \"confidence\": 85, \"description\": \"red car\"} done",
            "the red car", screen);
    ASSERT_TRUE(result->hasCoordinates());
    EXPECT_EQ(*result->coordinates, Point(540, 1200));
    EXPECT_DOUBLE_EQ(result->confidence, 0.85);
    EXPECT_EQ(result->description, "red car");
}

TEST_F(OllamaVisionTest, ParseNotFound) {
    VisionResultPtr result = OllamaVision::parseFindResponse("{\"found\": false}", "red car", screen);
    EXPECT_FALSE(result->hasCoordinates());
    EXPECT_DOUBLE_EQ(result->confidence, 0.0);
    EXPECT_EQ(result->description, "Could not find: red car");
}

TEST_F(OllamaVisionTest, ParseMissingOrInvalidCoordinates) {
    VisionResultPtr result = OllamaVision::parseFindResponse("{\"found\": true, \"confidence\": 70}",
                                                             "red car", screen);
    EXPECT_FALSE(result->hasCoordinates());
    EXPECT_DOUBLE_EQ(result->confidence, 0.7);
    EXPECT_EQ(result->description, "red car");

    result = OllamaVision::parseFindResponse("{\"found\": true, \"x\": \"540\", \"y\": 1200}", "red car", screen);
    EXPECT_FALSE(result->hasCoordinates());
    EXPECT_DOUBLE_EQ(result->confidence, 0.5);
}

TEST_F(OllamaVisionTest, ParseDropsOffscreenCoordinates) {
    VisionResultPtr result = OllamaVision::parseFindResponse(
            "{\"found\": true, \"x\": 5000, \"y\": 100, \"confidence\": 90}", "red car", screen);
    EXPECT_FALSE(result->hasCoordinates());
    EXPECT_DOUBLE_EQ(result->confidence, 0.9);
}

TEST_F(OllamaVisionTest, ParseFreeTextCoordinates) {
    VisionResultPtr result = OllamaVision::parseFindResponse("The car is at coordinates (300, 400).",
                                                             "red car", screen);
    ASSERT_TRUE(result->hasCoordinates());
    EXPECT_EQ(*result->coordinates, Point(300, 400));
    EXPECT_DOUBLE_EQ(result->confidence, 0.6);
    EXPECT_EQ(result->description, "red car");
}

TEST_F(OllamaVisionTest, ParseUnreadableReply) {
    VisionResultPtr result = OllamaVision::parseFindResponse("I cannot see any car", "red car", screen);
    EXPECT_FALSE(result->hasCoordinates());
    EXPECT_DOUBLE_EQ(result->confidence, 0.3);
    EXPECT_EQ(result->description, "I cannot see any car");

    result = OllamaVision::parseFindResponse("{found: yes}", "red car", screen);
    EXPECT_FALSE(result->hasCoordinates());
    EXPECT_DOUBLE_EQ(result->confidence, 0.3);
}

TEST_F(OllamaVisionTest, ExtractCoordinatesFromText) {
    PointPtr point = OllamaVision::extractCoordinatesFromText("tap position 700, 800", screen);
    ASSERT_NE(point, nullptr);
    EXPECT_EQ(*point, Point(700, 800));

    point = OllamaVision::extractCoordinatesFromText("x: 12, y: 34", screen);
    ASSERT_NE(point, nullptr);
    EXPECT_EQ(*point, Point(12, 34));

    EXPECT_EQ(OllamaVision::extractCoordinatesFromText("(5000, 10)", screen), nullptr);
    point = OllamaVision::extractCoordinatesFromText("(5000, 10)", ScreenSize());
    ASSERT_NE(point, nullptr);
    EXPECT_EQ(point->x, 5000);
    EXPECT_EQ(OllamaVision::extractCoordinatesFromText("nothing here", screen), nullptr);
}

TEST_F(OllamaVisionTest, BuildFindPrompt) {
    std::string prompt = OllamaVision::buildFindPrompt("red car", ScreenSize{720, 1600});
    EXPECT_NE(prompt.find("resolution: 720x1600"), std::string::npos);
    EXPECT_NE(prompt.find("Find the element: \"red car\""), std::string::npos);
    EXPECT_NE(prompt.find("x must be between 0 and 720"), std::string::npos);
    EXPECT_NE(prompt.find("y must be between 0 and 1600"), std::string::npos);
    EXPECT_NE(prompt.find("Return ONLY the JSON"), std::string::npos);
}

TEST_F(OllamaVisionTest, ScreenSizeHint) {
    auto device = std::make_shared<FakeDevice>();
    auto cache = std::make_shared<ScreenshotCache>(device, std::chrono::milliseconds(3000));
    OllamaVision vision(Preference::defaults(), cache);
    EXPECT_EQ(vision.getScreenSize().width, 1080);
    EXPECT_EQ(vision.getScreenSize().height, 2400);
    vision.setScreenSize(ScreenSize{720, 1600});
    EXPECT_EQ(vision.getScreenSize().width, 720);
    vision.setScreenSize(ScreenSize());
    EXPECT_EQ(vision.getScreenSize().height, 1600);
}

TEST_F(OllamaVisionTest, BackgroundCaptureRefreshesCache) {
    auto device = std::make_shared<FakeDevice>();
    auto cache = std::make_shared<ScreenshotCache>(device, std::chrono::milliseconds(3000));
    OllamaVision vision(Preference::parse("tapsight.vision.precaptureIntervalMs=10\n", ""), cache);
    vision.stopBackgroundCapture();
    EXPECT_FALSE(vision.isCapturing());

    vision.startBackgroundCapture();
    vision.startBackgroundCapture();
    EXPECT_TRUE(vision.isCapturing());
    for (int i = 0; i < 200 && cache->getCaptureCount() < 2; i++)
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    vision.stopBackgroundCapture();
    EXPECT_FALSE(vision.isCapturing());
    EXPECT_GE(cache->getCaptureCount(), 2);
    EXPECT_NE(cache->peek(), nullptr);

    int stoppedAt = cache->getCaptureCount();
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_EQ(cache->getCaptureCount(), stoppedAt);
    vision.stopBackgroundCapture();
}
