#include "cloudpreprocessing.hpp"
#include "../errors.hpp"

#include <opencv2/flann.hpp>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <iostream>
#include <limits>
#include <numeric>
#include <unordered_map>

namespace cloud2bim {

CloudStats CloudPreprocessing::computeStats(const PointCloud& cloud)
{
    CloudStats stats;
    stats.numPoints = cloud.size();
    stats.hasColours = cloud.hasColours();
    if (cloud.empty())
        return stats;

    cv::Point3d lo(cloud.points[0]), hi(cloud.points[0]);
    for (const auto& p : cloud.points) {
        lo.x = std::min<double>(lo.x, p.x); hi.x = std::max<double>(hi.x, p.x);
        lo.y = std::min<double>(lo.y, p.y); hi.y = std::max<double>(hi.y, p.y);
        lo.z = std::min<double>(lo.z, p.z); hi.z = std::max<double>(hi.z, p.z);
    }
    stats.minBound = lo;
    stats.maxBound = hi;
    stats.dimensions = hi - lo;
    const double volume = stats.dimensions.x * stats.dimensions.y * stats.dimensions.z;
    stats.density = volume > 0.0 ? static_cast<double>(stats.numPoints) / volume : 0.0;
    return stats;
}

std::vector<int> CloudPreprocessing::dilute(const std::vector<int>& indices, int factor)
{
    if (factor <= 1)
        return indices;
    std::vector<int> kept;
    kept.reserve(indices.size() / factor + 1);
    for (size_t i = 0; i < indices.size(); i += static_cast<size_t>(factor))
        kept.push_back(indices[i]);
    return kept;
}

std::vector<int> CloudPreprocessing::voxelDownsample(const std::vector<cv::Point3f>& points,
                                                     const std::vector<int>& indices,
                                                     double voxelSize)
{
    struct Voxel {
        cv::Point3d sum{0, 0, 0};
        std::vector<int> members;
    };

    // 21 bits per axis is plenty for a building at centimetre voxels.
    auto key = [voxelSize](const cv::Point3f& p) -> std::int64_t {
        auto q = [voxelSize](float v) {
            return static_cast<std::int64_t>(std::floor(v / voxelSize)) & 0x1FFFFF;
        };
        return (q(p.x) << 42) | (q(p.y) << 21) | q(p.z);
    };

    std::unordered_map<std::int64_t, Voxel> voxels;
    std::vector<std::int64_t> order;   // first-seen order keeps the output deterministic
    for (int idx : indices) {
        const auto& p = points[idx];
        const auto k = key(p);
        auto it = voxels.find(k);
        if (it == voxels.end()) {
            it = voxels.emplace(k, Voxel{}).first;
            order.push_back(k);
        }
        it->second.sum += cv::Point3d(p);
        it->second.members.push_back(idx);
    }

    std::vector<int> kept;
    kept.reserve(order.size());
    for (auto k : order) {
        const Voxel& v = voxels[k];
        const cv::Point3d centroid = v.sum * (1.0 / v.members.size());
        int best = v.members.front();
        double bestDist = std::numeric_limits<double>::max();
        for (int idx : v.members) {
            const cv::Point3d d = cv::Point3d(points[idx]) - centroid;
            const double dist = d.dot(d);
            if (dist < bestDist) {
                bestDist = dist;
                best = idx;
            }
        }
        kept.push_back(best);
    }
    std::sort(kept.begin(), kept.end());
    return kept;
}

std::vector<int> CloudPreprocessing::removeStatisticalOutliers(const std::vector<cv::Point3f>& points,
                                                               const std::vector<int>& indices,
                                                               int neighbours,
                                                               double stdRatio)
{
    const int n = static_cast<int>(indices.size());
    if (neighbours < 1 || n <= neighbours)
        return indices;

    cv::Mat data(n, 3, CV_32F);
    for (int i = 0; i < n; ++i) {
        const auto& p = points[indices[i]];
        data.at<float>(i, 0) = p.x;
        data.at<float>(i, 1) = p.y;
        data.at<float>(i, 2) = p.z;
    }

    cv::flann::Index tree(data, cv::flann::KDTreeIndexParams(4));
    cv::Mat knnIdx, knnDist;
    // the query point itself comes back as the first neighbour
    tree.knnSearch(data, knnIdx, knnDist, neighbours + 1, cv::flann::SearchParams(64));

    std::vector<double> meanDist(n, 0.0);
    for (int i = 0; i < n; ++i) {
        double sum = 0.0;
        for (int j = 1; j <= neighbours; ++j)
            sum += std::sqrt(static_cast<double>(knnDist.at<float>(i, j)));
        meanDist[i] = sum / neighbours;
    }

    const double mean = std::accumulate(meanDist.begin(), meanDist.end(), 0.0) / n;
    double var = 0.0;
    for (double d : meanDist)
        var += (d - mean) * (d - mean);
    const double sigma = std::sqrt(var / n);
    const double limit = mean + stdRatio * sigma;

    std::vector<int> kept;
    kept.reserve(indices.size());
    for (int i = 0; i < n; ++i)
        if (meanDist[i] <= limit)
            kept.push_back(indices[i]);
    return kept;
}

cv::Point3f CloudPreprocessing::roundToMillimetres(const cv::Point3f& p)
{
    auto r = [](float v) { return static_cast<float>(std::round(static_cast<double>(v) * 1000.0) / 1000.0); };
    return {r(p.x), r(p.y), r(p.z)};
}

PreparedCloud CloudPreprocessing::prepare(const PointCloud& cloud, const PreprocessingConfig& config)
{
    if (cloud.empty())
        throw InputError("Point cloud is empty after loading");
    if (cloud.hasColours() && cloud.colours.size() != cloud.points.size())
        throw InputError("Colour array length " + std::to_string(cloud.colours.size()) +
                         " does not match point count " + std::to_string(cloud.points.size()));

    std::vector<int> indices(cloud.size());
    std::iota(indices.begin(), indices.end(), 0);

    if (config.dilute) {
        indices = dilute(indices, config.dilutionFactor);
        std::cout << "Diluted point cloud to " << indices.size() << " points (factor "
                  << config.dilutionFactor << ")" << std::endl;
    }
    if (config.voxelDownsample) {
        indices = voxelDownsample(cloud.points, indices, config.voxelSize);
        std::cout << "Downsampled to " << indices.size() << " points" << std::endl;
    }
    if (config.removeOutliers) {
        indices = removeStatisticalOutliers(cloud.points, indices,
                                            config.outlierNeighbours, config.noiseThreshold);
        std::cout << "After noise removal: " << indices.size() << " points" << std::endl;
    }

    PreparedCloud prepared;
    prepared.points.reserve(indices.size());
    prepared.sourceIndex.reserve(indices.size());
    for (int idx : indices) {
        const auto& p = cloud.points[idx];
        if (!std::isfinite(p.x) || !std::isfinite(p.y) || !std::isfinite(p.z))
            continue;
        prepared.points.push_back(roundToMillimetres(p));
        prepared.sourceIndex.push_back(idx);
    }

    if (prepared.empty())
        throw InputError("Point cloud is empty after loading");
    return prepared;
}

} // namespace cloud2bim
