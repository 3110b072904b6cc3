#include <gtest/gtest.h>

#include <cmath>

#include "detection/slabdetector.hpp"
#include "synthetic_scenes.hpp"
#include "utils.hpp"

using namespace cloud2bim;

TEST(SlabDetector, HistogramStartsAtLowestPoint)
{
    std::vector<cv::Point3f> pts = {{0, 0, 1.0f}, {0, 0, 1.05f}, {0, 0, 1.31f}};
    double zMin = 0.0;
    const auto hist = SlabDetector::zHistogram(pts, 0.1, zMin);
    EXPECT_FLOAT_EQ(static_cast<float>(zMin), 1.0f);
    ASSERT_EQ(hist.size(), 4u);
    EXPECT_EQ(hist[0], 2);
    EXPECT_EQ(hist[3], 1);
}

TEST(SlabDetector, FlatTopGivesOnePeak)
{
    SlabConfig cfg;
    const std::vector<int> hist = {5, 100, 100, 5, 5, 5, 80, 5};
    const auto peaks = SlabDetector::findPeaks(hist, cfg);
    EXPECT_EQ(peaks, (std::vector<int>{1, 6}));
}

TEST(SlabDetector, WeakBumpIsNotAPeak)
{
    SlabConfig cfg;
    const std::vector<int> hist = {100, 10, 10, 14, 10, 10, 100};
    EXPECT_EQ(SlabDetector::findPeaks(hist, cfg), (std::vector<int>{0, 6}));
}

TEST(SlabDetector, FootprintOfRectangleIsCounterClockwise)
{
    std::vector<cv::Point2d> xy;
    for (double x = 0; x <= 4.0; x += 0.05)
        for (double y = 0; y <= 3.0; y += 0.05)
            xy.emplace_back(x, y);
    const auto ring = SlabDetector::footprint(xy, 0.05, 3);
    ASSERT_GE(ring.size(), 4u);
    const double area = polygonSignedArea(ring);
    EXPECT_GT(area, 0.0);
    EXPECT_NEAR(area, 12.0, 1.0);
}

TEST(SlabDetector, TooFewPointsGiveNoFootprint)
{
    EXPECT_TRUE(SlabDetector::footprint({{0, 0}, {1, 1}}, 0.05, 3).empty());
}

TEST(SlabDetector, FloorAndCeilingOfRoom)
{
    const PreparedCloud cloud = test::prepared(test::singleRoom());
    ProcessingConfig cfg;
    const auto slabs = SlabDetector::detect(cloud, cfg);
    ASSERT_EQ(slabs.size(), 2u);

    // floor surface is the top of the lower slab, ceiling the underside of the upper one
    EXPECT_NEAR(slabs[0].topZ(), 0.0, 0.05);
    EXPECT_NEAR(slabs[0].thickness, 0.2, 1e-9);
    EXPECT_NEAR(slabs[1].bottomZ, 3.0, 0.05);
    EXPECT_EQ(slabs[0].storeyOrdinal, 0);
    EXPECT_EQ(slabs[1].storeyOrdinal, 1);

    for (const auto& s : slabs) {
        EXPECT_FALSE(s.pointIndices.empty());
        ASSERT_GE(s.footprint.size(), 4u);
        EXPECT_NEAR(polygonSignedArea(s.footprint), 4.2 * 6.2, 3.0);
    }
}

TEST(SlabDetector, ExteriorScanTopSlabIsRoofTop)
{
    const PreparedCloud cloud = test::prepared(test::singleRoom());
    ProcessingConfig cfg;
    cfg.exteriorScan = true;
    const auto slabs = SlabDetector::detect(cloud, cfg);
    ASSERT_EQ(slabs.size(), 2u);
    EXPECT_NEAR(slabs[1].topZ(), 3.0, 0.05);
}

TEST(SlabDetector, SingleSurfaceGivesNoSlabs)
{
    test::SceneBuilder b;
    b.sheet(0, 0, 3, 3, 0.0);
    ProcessingConfig cfg;
    EXPECT_TRUE(SlabDetector::detect(test::prepared(b.cloud()), cfg).empty());
}
