#ifndef OPENINGDETECTOR_H
#define OPENINGDETECTOR_H

#include <vector>
#include <opencv2/core.hpp>

#include "elements.hpp"
#include "walldetector.hpp"
#include "../config.hpp"

namespace cloud2bim {

/**
 * @brief Doors and windows as bounded low-density voids of a wall's
 *        (length x height) occupancy raster.
 */
class OpeningDetector {
public:
    /** Openings of one wall ordered by xMin, then zMin. */
    static std::vector<Opening> detect(const WallDetection& wall,
                                       const ProcessingConfig& config);

    /** Point counts per cell, row 0 at the wall base, column 0 at the start point. */
    static cv::Mat1i densityGrid(const std::vector<cv::Point3f>& local,
                                 double length, double height, double cell);

    /** 255 where the count is below ratio * median of the occupied cells. */
    static cv::Mat1b voidMask(const cv::Mat1i& counts, double ratio);
};

} // namespace cloud2bim

#endif // OPENINGDETECTOR_H
