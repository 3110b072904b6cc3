#ifndef SLABDETECTOR_H
#define SLABDETECTOR_H

#include <vector>
#include <opencv2/core.hpp>

#include "elements.hpp"
#include "../config.hpp"
#include "../pointcloud/pointcloud.hpp"

namespace cloud2bim {

/**
 * @brief Finds horizontal slabs from the vertical point density profile.
 *
 * Peaks of the z histogram are floor and ceiling surfaces. Close surfaces
 * are merged into one slab, a lone surface gets the configured thickness.
 */
class SlabDetector {
public:
    /** One peak of the z histogram. */
    struct Surface {
        double z = 0.0;             ///< median z of the points in the peak bin
        std::vector<int> inliers;   ///< indices into the prepared cloud
    };

    /** Slabs ordered by ascending elevation. Fewer than two peaks give none. */
    static std::vector<Slab> detect(const PreparedCloud& cloud,
                                    const ProcessingConfig& config);

    /** Point counts per z bin, bin 0 starting at zMin. */
    static std::vector<int> zHistogram(const std::vector<cv::Point3f>& points,
                                       double zStep, double& zMin);

    /** Indices of bins that are local maxima and pass both density tests. */
    static std::vector<int> findPeaks(const std::vector<int>& hist, const SlabConfig& cfg);

    /**
     * Concave outline of the XY points: raster at resolution, close, fill
     * holes, largest outer contour simplified by one resolution step.
     * Returns an empty ring when the points do not form a region.
     */
    static std::vector<cv::Point2d> footprint(const std::vector<cv::Point2d>& xy,
                                              double resolution, int closeCells);

private:
    static Surface extractSurface(const std::vector<cv::Point3f>& points,
                                  double zMin, double zStep, int bin, double halfThickness);
};

} // namespace cloud2bim

#endif // SLABDETECTOR_H
