#ifndef POINTCLOUD_H
#define POINTCLOUD_H

#include <vector>
#include <opencv2/core.hpp>

namespace cloud2bim {

/**
 * @brief Decoded scan: coordinates plus an optional parallel colour array.
 *
 * colours is either empty or has one RGB triple in [0,1] per point.
 */
struct PointCloud
{
    std::vector<cv::Point3f> points;
    std::vector<cv::Vec3f>   colours;

    [[nodiscard]] bool   empty() const noexcept { return points.empty(); }
    [[nodiscard]] size_t size()  const noexcept { return points.size(); }
    [[nodiscard]] bool   hasColours() const noexcept { return !colours.empty(); }
};

/** Summary of a cloud, reported with progress. */
struct CloudStats
{
    size_t      numPoints = 0;
    cv::Point3d minBound;
    cv::Point3d maxBound;
    cv::Point3d dimensions;
    double      density = 0.0;   ///< points per m³ of the bounding box, 0 for a flat box
    bool        hasColours = false;
};

/**
 * @brief Cloud after preparation. sourceIndex[i] is the index of points[i]
 *        in the cloud the job received.
 */
struct PreparedCloud
{
    std::vector<cv::Point3f> points;
    std::vector<int>         sourceIndex;

    [[nodiscard]] bool   empty() const noexcept { return points.empty(); }
    [[nodiscard]] size_t size()  const noexcept { return points.size(); }
};

} // namespace cloud2bim

#endif // POINTCLOUD_H
