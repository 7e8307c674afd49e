#include <gtest/gtest.h>
#include "../include/cv_utils.h"
#include "../include/landmark_set.h"
#include "test_helpers.h"

using namespace DeskMonitor;

TEST(CVUtilsTest, EarIsZeroWhenLidsTouch)
{
    std::vector<cv::Point2f> eye = {{0, 0}, {2, 0}, {4, 0}, {6, 0}, {4, 0}, {2, 0}};
    EXPECT_DOUBLE_EQ(CVUtils::calculateEAR(eye), 0.0);
}

TEST(CVUtilsTest, EarIsZeroWithoutHorizontalExtent)
{
    std::vector<cv::Point2f> eye = {{3, 0}, {3, -1}, {3, -1}, {3, 0}, {3, 1}, {3, 1}};
    EXPECT_NO_THROW(CVUtils::calculateEAR(eye));
    EXPECT_DOUBLE_EQ(CVUtils::calculateEAR(eye), 0.0);
}

TEST(CVUtilsTest, EarMatchesFormula)
{
    // vertical pairs 2 and 2, horizontal 4 -> (2 + 2) / (2 * 4)
    std::vector<cv::Point2f> eye = {{0, 0}, {1, -1}, {3, -1}, {4, 0}, {3, 1}, {1, 1}};
    EXPECT_NEAR(CVUtils::calculateEAR(eye), 0.5, 1e-9);
}

TEST(CVUtilsTest, EarRejectsWrongPointCount)
{
    std::vector<cv::Point2f> eye = {{0, 0}, {1, 1}};
    EXPECT_DOUBLE_EQ(CVUtils::calculateEAR(eye), 0.0);
}

TEST(CVUtilsTest, SyntheticFaceHasRequestedEar)
{
    LandmarkSet face = Testing::makeFace(0.27);
    auto left = CVUtils::pixelPoints(face, LandmarkIndices::LEFT_EYE, cv::Size(1, 1));
    auto right = CVUtils::pixelPoints(face, LandmarkIndices::RIGHT_EYE, cv::Size(1, 1));
    EXPECT_NEAR(CVUtils::calculateEAR(left), 0.27, 1e-4);
    EXPECT_NEAR(CVUtils::calculateEAR(right), 0.27, 1e-4);
}

TEST(CVUtilsTest, CentroidAndExtent)
{
    std::vector<cv::Point2f> points = {{0, 0}, {4, 2}, {2, 4}};
    cv::Point2f c = CVUtils::centroid(points);
    EXPECT_NEAR(c.x, 2.0, 1e-6);
    EXPECT_NEAR(c.y, 2.0, 1e-6);
    EXPECT_NEAR(CVUtils::horizontalExtent(points), 4.0, 1e-6);
    EXPECT_DOUBLE_EQ(CVUtils::horizontalExtent({}), 0.0);
}

TEST(LandmarkSetTest, RejectsWrongSizeAndIndex)
{
    EXPECT_THROW(LandmarkSet{std::vector<cv::Point3f>(68)}, std::invalid_argument);
    LandmarkSet landmarks;
    EXPECT_THROW(landmarks.at(468), std::out_of_range);
    EXPECT_THROW(landmarks.set(-1, cv::Point3f()), std::out_of_range);
}

TEST(LandmarkSetTest, PixelScalesByFrame)
{
    LandmarkSet landmarks;
    landmarks.set(10, cv::Point3f(0.5f, 0.25f, 0.0f));
    cv::Point2f p = landmarks.pixel(10, cv::Size(640, 480));
    EXPECT_NEAR(p.x, 320.0, 1e-3);
    EXPECT_NEAR(p.y, 120.0, 1e-3);
}
