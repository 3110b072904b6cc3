#ifndef WALLDETECTOR_H
#define WALLDETECTOR_H

#include <vector>
#include <opencv2/core.hpp>

#include "elements.hpp"
#include "storeysplitter.hpp"
#include "../config.hpp"
#include "../utils.hpp"

namespace cloud2bim {

/**
 * @brief A detected wall with the points the opening detector works on.
 *
 * localPoints are in the wall frame: x along start->end from the start
 * point, y across (left of the axis positive), z above the wall base.
 */
struct WallDetection
{
    Wall                     wall;               ///< id stays 0 until numbered by the caller
    std::vector<cv::Point3f> localPoints;
    std::vector<int>         localSourceIndices; ///< parallel to localPoints
};

/**
 * @brief Straight walls of one storey from a vertical-coverage occupancy grid.
 *
 * The grid is aligned to the dominant wall direction, runs of wall cells
 * along both grid axes become wall candidates, and each candidate gets its
 * centerline and thickness from the face peaks of the across-wall profile.
 */
class WallDetector {
public:
    /** Walls of the storey, horizontal runs first, each group sorted by position. */
    static std::vector<WallDetection> detect(const StoreyCloud& storey,
                                             const ProcessingConfig& config);

    /**
     * Cells whose occupied height layers cover at least minCoverage of the
     * storey height (and at least two layers).
     */
    static cv::Mat1b wallCellMask(const std::vector<cv::Point2d>& xy,
                                  const std::vector<float>& z,
                                  const GridInfo& grid,
                                  double baseZ, double topZ,
                                  double minCoverage);

    /** Length-weighted histogram of segment angles modulo 90 degrees. */
    static std::vector<double> computeWeightedAngleHistogram(const std::vector<cv::Vec4i>& lines,
                                                             int resolution);

    /** Moving-average peak of the histogram, in degrees within (-45, 45]. */
    static double findBestAngleFromHistogram(const std::vector<double>& hist,
                                             const OrientationConfig& cfg);

    /**
     * Dominant wall direction of the mask in degrees within (-45, 45].
     * Zero when no segment is found.
     */
    static double findPrincipalAngle(const cv::Mat1b& mask, const OrientationConfig& cfg,
                                     int minLineCells);

private:
    struct Frame;
    static bool fitWall(const std::vector<int>& members, const Frame& frame,
                        const StoreyCloud& storey, const ProcessingConfig& config,
                        WallDetection& out);
};

} // namespace cloud2bim

#endif // WALLDETECTOR_H
