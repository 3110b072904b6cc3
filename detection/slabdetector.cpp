#include "slabdetector.hpp"
#include "../utils.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace cloud2bim {

std::vector<int> SlabDetector::zHistogram(const std::vector<cv::Point3f>& points,
                                          double zStep, double& zMin)
{
    if (points.empty())
        return {};
    float lo = points[0].z, hi = points[0].z;
    for (const auto& p : points) {
        lo = std::min(lo, p.z);
        hi = std::max(hi, p.z);
    }
    zMin = lo;
    const int bins = static_cast<int>(std::floor((hi - lo) / zStep)) + 1;
    std::vector<int> hist(bins, 0);
    for (const auto& p : points) {
        int b = static_cast<int>(std::floor((p.z - zMin) / zStep));
        hist[std::clamp(b, 0, bins - 1)]++;
    }
    return hist;
}

std::vector<int> SlabDetector::findPeaks(const std::vector<int>& hist, const SlabConfig& cfg)
{
    std::vector<double> occupied;
    int maxCount = 0;
    for (int c : hist) {
        if (c > 0)
            occupied.push_back(c);
        maxCount = std::max(maxCount, c);
    }
    if (occupied.empty())
        return {};

    const double minCount = std::max(cfg.peakToMedianRatio * median(occupied),
                                      cfg.minPeakFraction * maxCount);
    const int n = static_cast<int>(hist.size());
    std::vector<int> peaks;
    for (int i = 0; i < n; ++i) {
        const int left  = i > 0 ? hist[i - 1] : 0;
        const int right = i + 1 < n ? hist[i + 1] : 0;
        // strict on the left so a flat top yields one peak
        if (hist[i] > left && hist[i] >= right && hist[i] >= minCount)
            peaks.push_back(i);
    }
    return peaks;
}

SlabDetector::Surface SlabDetector::extractSurface(const std::vector<cv::Point3f>& points,
                                                   double zMin, double zStep, int bin,
                                                   double halfThickness)
{
    const double binLo = zMin + bin * zStep;
    const double binHi = binLo + zStep;
    std::vector<double> binZ;
    for (const auto& p : points)
        if (p.z >= binLo && p.z < binHi)
            binZ.push_back(p.z);

    Surface s;
    s.z = binZ.empty() ? binLo + 0.5 * zStep : median(binZ);
    for (int i = 0; i < static_cast<int>(points.size()); ++i)
        if (std::abs(points[i].z - s.z) <= halfThickness)
            s.inliers.push_back(i);
    return s;
}

std::vector<cv::Point2d> SlabDetector::footprint(const std::vector<cv::Point2d>& xy,
                                                 double resolution, int closeCells)
{
    if (xy.size() < 3)
        return {};

    const GridInfo g = makeGrid(xy, resolution, closeCells + 1);
    cv::Mat1b raster = cv::Mat1b::zeros(g.rows, g.cols);
    for (const auto& p : xy)
        raster(worldToCell(p, g)) = 255;

    raster = fillHoles(closeBinary(raster, 2 * closeCells + 1));

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(raster, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_NONE);
    if (contours.empty())
        return {};
    auto largest = std::max_element(contours.begin(), contours.end(),
        [](const std::vector<cv::Point>& a, const std::vector<cv::Point>& b) {
            return cv::contourArea(a) < cv::contourArea(b);
        });

    std::vector<cv::Point> simplified;
    cv::approxPolyDP(*largest, simplified, 1.0, true);   // one cell == one resolution step

    std::vector<cv::Point2d> ring;
    ring.reserve(simplified.size());
    for (const auto& c : simplified)
        ring.push_back(cellToWorld(cv::Point2d(c.x, c.y), g));
    ring = removeDuplicateVertices(ring);
    if (ring.size() < 3 || std::abs(polygonSignedArea(ring)) < resolution * resolution)
        return {};
    if (polygonSignedArea(ring) < 0.0)
        std::reverse(ring.begin(), ring.end());
    return ring;
}

std::vector<Slab> SlabDetector::detect(const PreparedCloud& cloud, const ProcessingConfig& config)
{
    const SlabConfig& cfg = config.slab;
    double zMin = 0.0;
    const auto hist = zHistogram(cloud.points, cfg.zStep, zMin);
    const auto peaks = findPeaks(hist, cfg);

    std::cout << "Slab scan: " << hist.size() << " z bins, " << peaks.size()
              << " density peaks" << std::endl;
    if (peaks.size() < 2) {
        std::cerr << "[warn] Fewer than two horizontal density peaks, no slabs" << std::endl;
        return {};
    }

    std::vector<Surface> surfaces;
    for (int bin : peaks)
        surfaces.push_back(extractSurface(cloud.points, zMin, cfg.zStep, bin,
                                          0.5 * std::max(cfg.bottomThickness, cfg.topThickness)));
    std::sort(surfaces.begin(), surfaces.end(),
              [](const Surface& a, const Surface& b) { return a.z < b.z; });

    /* ---------- group close surfaces --------------------------------------- */
    std::vector<std::vector<const Surface*>> groups;
    for (const auto& s : surfaces) {
        if (!groups.empty()) {
            const Surface* last = groups.back().back();
            const double t = groups.size() == 1 ? cfg.bottomThickness : cfg.topThickness;
            if (s.z - last->z < t + cfg.zStep) {
                groups.back().push_back(&s);
                continue;
            }
        }
        groups.push_back({&s});
    }

    std::vector<Slab> slabs;
    const size_t nGroups = groups.size();
    for (size_t gi = 0; gi < nGroups; ++gi) {
        const auto& group = groups[gi];
        const bool lowest = gi == 0;
        const bool highest = gi + 1 == nGroups;
        const double configured = lowest ? cfg.bottomThickness : cfg.topThickness;

        const double zLo = group.front()->z;
        const double zHi = group.back()->z;
        const double span = zHi - zLo;

        Slab slab;
        if (span > 0.5 * configured) {
            slab.bottomZ = zLo;
            slab.thickness = span;
        } else {
            const double z = 0.5 * (zLo + zHi);
            slab.thickness = configured;
            if (highest && !lowest && !config.exteriorScan)
                slab.bottomZ = z;                 // ceiling underside
            else
                slab.bottomZ = z - configured;    // floor or roof top surface
        }

        std::vector<cv::Point2d> xy;
        for (const Surface* s : group)
            for (int idx : s->inliers) {
                xy.emplace_back(cloud.points[idx].x, cloud.points[idx].y);
                slab.pointIndices.push_back(cloud.sourceIndex[idx]);
            }
        std::sort(slab.pointIndices.begin(), slab.pointIndices.end());
        slab.pointIndices.erase(std::unique(slab.pointIndices.begin(), slab.pointIndices.end()),
                                slab.pointIndices.end());

        slab.footprint = footprint(xy, config.resolution(), config.gridCoefficient);
        if (slab.footprint.empty())
            std::cerr << "[warn] Slab at z=" << slab.bottomZ << " has no usable footprint" << std::endl;
        slabs.push_back(std::move(slab));
    }

    for (size_t i = 0; i < slabs.size(); ++i) {
        slabs[i].storeyOrdinal = static_cast<int>(i);
        std::cout << "  slab " << i << ": bottom " << std::fixed << std::setprecision(3)
                  << slabs[i].bottomZ << " thickness " << slabs[i].thickness
                  << std::defaultfloat << ", " << slabs[i].pointIndices.size() << " points, "
                  << slabs[i].footprint.size() << " footprint vertices" << std::endl;
    }
    return slabs;
}

} // namespace cloud2bim
