#include <gtest/gtest.h>

#include "utils.hpp"
#include "wallgraph/wallgraph.hpp"

using namespace cloud2bim;

namespace {

/* square 0..2 with a dangling spur from (2,2) */
WallGraph squareWithSpur()
{
    WallGraph g;
    const auto a = g.addNode({0, 0})->id();
    const auto b = g.addNode({2, 0})->id();
    const auto c = g.addNode({2, 2})->id();
    const auto d = g.addNode({0, 2})->id();
    const auto e = g.addNode({3, 3})->id();
    g.connect(a, b, 1);
    g.connect(b, c, 2);
    g.connect(c, d, 3);
    g.connect(d, a, 4);
    g.connect(c, e, 5);
    return g;
}

} // namespace

TEST(WallGraph, ConnectIsUndirectedAndIgnoresDuplicates)
{
    WallGraph g;
    const auto a = g.addNode({0, 0})->id();
    const auto b = g.addNode({1, 0})->id();
    EXPECT_TRUE(g.connect(a, b, 1));
    EXPECT_FALSE(g.connect(b, a, 1));
    EXPECT_FALSE(g.connect(a, a, 1));
    EXPECT_FALSE(g.connect(a, 99, 1));
    EXPECT_EQ(g.linkCount(), 1u);
    EXPECT_EQ(g.getNode(b)->links().front().wallId, 1);
}

TEST(WallGraph, RemoveNodeDropsItsLinks)
{
    WallGraph g = squareWithSpur();
    EXPECT_EQ(g.linkCount(), 5u);
    EXPECT_TRUE(g.removeNode(5));
    EXPECT_FALSE(g.removeNode(5));
    EXPECT_EQ(g.linkCount(), 4u);
    EXPECT_EQ(g.getNode(3)->degree(), 2u);
}

TEST(WallGraph, DisconnectBothDirections)
{
    WallGraph g = squareWithSpur();
    EXPECT_TRUE(g.disconnect(1, 2));
    EXPECT_EQ(g.getNode(1)->degree(), 1u);
    EXPECT_EQ(g.getNode(2)->degree(), 1u);
}

TEST(WallGraph, PruneRemovesChainsRepeatedly)
{
    WallGraph g = squareWithSpur();
    g.disconnect(1, 2);
    // with the square open everything collapses
    EXPECT_EQ(g.pruneDangling(), 5u);
    EXPECT_TRUE(g.allNodes().empty());
}

TEST(WallGraph, SquareHasOneBoundedFace)
{
    WallGraph g = squareWithSpur();
    EXPECT_EQ(g.pruneDangling(), 1u);
    const auto faces = g.traceFaces();
    ASSERT_EQ(faces.size(), 2u);

    int bounded = 0;
    for (const auto& f : faces) {
        const double area = polygonSignedArea(f);
        if (area > 0) {
            ++bounded;
            EXPECT_DOUBLE_EQ(area, 4.0);
        } else {
            EXPECT_DOUBLE_EQ(area, -4.0);
        }
    }
    EXPECT_EQ(bounded, 1);
}

TEST(WallGraph, SharedWallGivesTwoRooms)
{
    WallGraph g;
    std::vector<JunctionId> n;
    for (const auto& p : {cv::Point2d(0, 0), cv::Point2d(2, 0), cv::Point2d(4, 0),
                          cv::Point2d(4, 2), cv::Point2d(2, 2), cv::Point2d(0, 2)})
        n.push_back(g.addNode(p)->id());
    for (size_t i = 0; i < n.size(); ++i)
        g.connect(n[i], n[(i + 1) % n.size()], static_cast<int>(i));
    g.connect(n[1], n[4], 10);

    int bounded = 0;
    for (const auto& f : g.traceFaces())
        if (polygonSignedArea(f) > 0) {
            ++bounded;
            EXPECT_DOUBLE_EQ(polygonSignedArea(f), 4.0);
        }
    EXPECT_EQ(bounded, 2);
}
