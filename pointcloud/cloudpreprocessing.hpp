#ifndef CLOUDPREPROCESSING_H
#define CLOUDPREPROCESSING_H

#include <vector>
#include "pointcloud.hpp"
#include "../config.hpp"

namespace cloud2bim {

/**
 * @brief Utility routines applied to a scan before element detection.
 */
class CloudPreprocessing {
public:
    /** Bounds, dimensions and density of the cloud. */
    static CloudStats computeStats(const PointCloud& cloud);

    /**
     * Full preparation: dilution, optional voxel down-sampling, optional
     * statistical outlier removal, rounding to millimetres. Throws
     * InputError when the cloud is empty before or after preparation, or
     * when the colour array does not match the points.
     */
    static PreparedCloud prepare(const PointCloud& cloud, const PreprocessingConfig& config);

    /** Keep every factor-th entry of the index list. */
    static std::vector<int> dilute(const std::vector<int>& indices, int factor);

    /** One representative per voxel: the point nearest the voxel centroid. */
    static std::vector<int> voxelDownsample(const std::vector<cv::Point3f>& points,
                                            const std::vector<int>& indices,
                                            double voxelSize);

    /**
     * Drop points whose mean distance to their k nearest neighbours exceeds
     * mean + stdRatio * sigma of that distance over the subset.
     */
    static std::vector<int> removeStatisticalOutliers(const std::vector<cv::Point3f>& points,
                                                      const std::vector<int>& indices,
                                                      int neighbours,
                                                      double stdRatio);

    /** Round to 3 decimals (millimetres). */
    static cv::Point3f roundToMillimetres(const cv::Point3f& p);
};

} // namespace cloud2bim

#endif // CLOUDPREPROCESSING_H
