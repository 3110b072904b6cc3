#include <gtest/gtest.h>

#include "detection/openingdetector.hpp"

using namespace cloud2bim;

namespace {

/** Sample range in 5 cm steps, exclusive on both ends. */
struct GapSteps {
    int x0, x1, z0, z1;
};

/**
 * 6 m x 3 m wall face pair sampled every 5 cm in its local frame,
 * without the samples inside the gaps.
 */
WallDetection wallWithGaps(const std::vector<GapSteps>& gaps)
{
    WallDetection d;
    d.wall.id = 7;
    d.wall.start = {0, 0};
    d.wall.end = {6, 0};
    d.wall.thickness = 0.2;
    d.wall.height = 3.0;
    int source = 0;
    for (int i = 0; i <= 120; ++i)
        for (int k = 1; k <= 59; ++k) {
            bool skip = false;
            for (const auto& g : gaps)
                if (i > g.x0 && i < g.x1 && k > g.z0 && k < g.z1)
                    skip = true;
            for (float y : {-0.1f, 0.1f}) {
                const int idx = source++;
                if (skip)
                    continue;
                d.localPoints.emplace_back(0.05f * i, y, 0.05f * k);
                d.localSourceIndices.push_back(idx);
            }
        }
    return d;
}

} // namespace

TEST(OpeningDetector, DensityGridRowZeroAtBase)
{
    const std::vector<cv::Point3f> pts = {{0.05f, 0, 0.05f}, {0.05f, 0, 0.2f}, {0.5f, 0, 0.05f}, {9.f, 0, 0}};
    const cv::Mat1i g = OpeningDetector::densityGrid(pts, 0.6, 0.3, 0.15);
    ASSERT_EQ(g.rows, 2);
    ASSERT_EQ(g.cols, 4);
    EXPECT_EQ(g(0, 0), 1);
    EXPECT_EQ(g(1, 0), 1);
    EXPECT_EQ(g(0, 3), 1);
    EXPECT_EQ(cv::sum(g)[0], 3.0);   // the point beyond the wall is ignored
}

TEST(OpeningDetector, VoidMaskComparesWithMedian)
{
    cv::Mat1i counts = (cv::Mat1i(1, 4) << 20, 20, 2, 0);
    const cv::Mat1b mask = OpeningDetector::voidMask(counts, 0.2);
    EXPECT_EQ(mask(0, 0), 0);
    EXPECT_EQ(mask(0, 2), 255);
    EXPECT_EQ(mask(0, 3), 255);
}

TEST(OpeningDetector, SolidWallHasNoOpenings)
{
    EXPECT_TRUE(OpeningDetector::detect(wallWithGaps({}), ProcessingConfig{}).empty());
}

TEST(OpeningDetector, DoorReachesTheFloor)
{
    // x 2.5..3.5, z below 2.1
    const auto openings = OpeningDetector::detect(wallWithGaps({{50, 70, -1, 42}}), ProcessingConfig{});
    ASSERT_EQ(openings.size(), 1u);
    const Opening& door = openings[0];
    EXPECT_EQ(door.type, OpeningType::Door);
    EXPECT_EQ(door.wallId, 7);
    EXPECT_DOUBLE_EQ(door.zMin, 0.0);
    EXPECT_NEAR(door.xMin, 2.5, 0.1);
    EXPECT_NEAR(door.xMax, 3.5, 0.1);
    EXPECT_NEAR(door.zMax, 2.1, 0.1);
    EXPECT_FALSE(door.pointIndices.empty());
}

TEST(OpeningDetector, WindowAboveSill)
{
    // x 4.5..5.5, z 1.0..2.0
    const auto openings = OpeningDetector::detect(wallWithGaps({{90, 110, 20, 40}}), ProcessingConfig{});
    ASSERT_EQ(openings.size(), 1u);
    const Opening& window = openings[0];
    EXPECT_EQ(window.type, OpeningType::Window);
    EXPECT_NEAR(window.xMin, 4.5, 0.1);
    EXPECT_NEAR(window.xMax, 5.5, 0.1);
    EXPECT_NEAR(window.zMin, 1.0, 0.1);
    EXPECT_NEAR(window.zMax, 2.0, 0.1);
}

TEST(OpeningDetector, OpeningsOrderedAlongWall)
{
    const auto openings = OpeningDetector::detect(
        wallWithGaps({{90, 110, 20, 40}, {20, 40, -1, 42}}), ProcessingConfig{});
    ASSERT_EQ(openings.size(), 2u);
    EXPECT_EQ(openings[0].type, OpeningType::Door);
    EXPECT_EQ(openings[1].type, OpeningType::Window);
    EXPECT_LT(openings[0].xMax, openings[1].xMin);
}

TEST(OpeningDetector, NarrowVoidIsIgnored)
{
    // slot narrower than the minimum opening width
    EXPECT_TRUE(OpeningDetector::detect(wallWithGaps({{50, 56, 20, 40}}), ProcessingConfig{}).empty());
}

TEST(OpeningDetector, LowVoidIsNeitherDoorNorWindow)
{
    // z 0.5..1.25: off the floor, top below the window threshold
    EXPECT_TRUE(OpeningDetector::detect(wallWithGaps({{50, 70, 10, 25}}), ProcessingConfig{}).empty());
}

TEST(OpeningDetector, VoidAtWallEndIsNotAnOpening)
{
    EXPECT_TRUE(OpeningDetector::detect(wallWithGaps({{-1, 20, 20, 40}}), ProcessingConfig{}).empty());
}
