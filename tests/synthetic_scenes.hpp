#pragma once
/*-----------------------------------------------------------------------------
 *  synthetic_scenes.hpp
 *
 *  Deterministic clouds for the detector and pipeline tests.
 *---------------------------------------------------------------------------*/
#include <cmath>
#include <random>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#include "pointcloud/pointcloud.hpp"

namespace cloud2bim {
namespace test {

/** Rectangular gap in a wall face, in world coordinates of the face. */
struct Gap {
    double alongMin, alongMax, zMin, zMax;
};

class SceneBuilder
{
public:
    explicit SceneBuilder(double step = 0.05, double noise = 0.003, unsigned seed = 42)
        : step_(step), rng_(seed), jitter_(-noise, noise)
    {}

    /** Horizontal sheet of points at height z. */
    SceneBuilder& sheet(double x0, double y0, double x1, double y1, double z)
    {
        for (double x = x0; x <= x1 + 1e-9; x += step_)
            for (double y = y0; y <= y1 + 1e-9; y += step_)
                add(x, y, z);
        return *this;
    }

    /**
     * Both faces of a wall whose centerline runs from (x0,y0) to (x1,y1),
     * sampled from z0 to z1. Gaps are measured along the centerline from
     * its start point.
     */
    SceneBuilder& wall(double x0, double y0, double x1, double y1, double thickness,
                       double z0, double z1, const std::vector<Gap>& gaps = {})
    {
        const double len = std::hypot(x1 - x0, y1 - y0);
        const double dx = (x1 - x0) / len, dy = (y1 - y0) / len;
        const double nx = -dy, ny = dx;
        for (double s = 0.0; s <= len + 1e-9; s += step_)
            for (double z = z0; z <= z1 + 1e-9; z += step_) {
                bool inGap = false;
                for (const auto& g : gaps)
                    if (s > g.alongMin && s < g.alongMax && z > g.zMin && z < g.zMax)
                        inGap = true;
                if (inGap)
                    continue;
                for (double side : {-0.5, 0.5})
                    add(x0 + dx * s + nx * side * thickness,
                        y0 + dy * s + ny * side * thickness, z);
            }
        return *this;
    }

    /** Vertical line of points, too thin for a wall. */
    SceneBuilder& column(double x, double y, double z0, double z1)
    {
        for (double z = z0; z <= z1 + 1e-9; z += step_)
            add(x, y, z);
        return *this;
    }

    PointCloud cloud() const { return cloud_; }
    std::vector<cv::Point3f> points() const { return cloud_.points; }

private:
    void add(double x, double y, double z)
    {
        cloud_.points.emplace_back(static_cast<float>(x + jitter_(rng_)),
                                   static_cast<float>(y + jitter_(rng_)),
                                   static_cast<float>(z + jitter_(rng_)));
    }

    double step_;
    std::mt19937 rng_;
    std::uniform_real_distribution<double> jitter_;
    PointCloud cloud_;
};

/**
 * 4 x 6 m room between a floor at z=0 and a ceiling at z=3, walls 0.2 m
 * thick on the centerlines x=0, x=4, y=0, y=6. The wall x=0 has a door
 * 1 m wide (2.5 < y < 3.5) and 2.1 m high.
 */
inline PointCloud singleRoom(bool withDoor = true)
{
    SceneBuilder b;
    b.sheet(-0.1, -0.1, 4.1, 6.1, 0.0)
     .sheet(-0.1, -0.1, 4.1, 6.1, 3.0)
     .wall(-0.1, 0.0, 4.1, 0.0, 0.2, 0.05, 2.95)
     .wall(-0.1, 6.0, 4.1, 6.0, 0.2, 0.05, 2.95)
     .wall(4.0, -0.1, 4.0, 6.1, 0.2, 0.05, 2.95);
    std::vector<Gap> door;
    if (withDoor)
        door.push_back({2.6, 3.6, -1.0, 2.1});   // along from y=-0.1
    b.wall(0.0, -0.1, 0.0, 6.1, 0.2, 0.05, 2.95, door);
    return b.cloud();
}

/**
 * Two of the single rooms stacked: floor at z=0, a 0.3 m middle slab seen
 * from below at z=3.0 and from above at z=3.3, roof underside at z=6.3.
 * Only the ground floor has the door.
 */
inline PointCloud twoStoreys()
{
    SceneBuilder b;
    b.sheet(-0.1, -0.1, 4.1, 6.1, 0.0)
     .sheet(-0.1, -0.1, 4.1, 6.1, 3.0)
     .sheet(-0.1, -0.1, 4.1, 6.1, 3.3)
     .sheet(-0.1, -0.1, 4.1, 6.1, 6.3);
    for (double base : {0.0, 3.3}) {
        b.wall(-0.1, 0.0, 4.1, 0.0, 0.2, base + 0.05, base + 2.95)
         .wall(-0.1, 6.0, 4.1, 6.0, 0.2, base + 0.05, base + 2.95)
         .wall(4.0, -0.1, 4.0, 6.1, 0.2, base + 0.05, base + 2.95);
        std::vector<Gap> door;
        if (base == 0.0)
            door.push_back({2.6, 3.6, -1.0, 2.1});
        b.wall(0.0, -0.1, 0.0, 6.1, 0.2, base + 0.05, base + 2.95, door);
    }
    return b.cloud();
}

/** Prepared copy of a cloud without any filtering. */
inline PreparedCloud prepared(const PointCloud& cloud)
{
    PreparedCloud p;
    p.points = cloud.points;
    for (size_t i = 0; i < cloud.points.size(); ++i)
        p.sourceIndex.push_back(static_cast<int>(i));
    return p;
}

} // namespace test
} // namespace cloud2bim
