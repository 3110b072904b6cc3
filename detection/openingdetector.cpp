#include "openingdetector.hpp"
#include "../utils.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace cloud2bim {

cv::Mat1i OpeningDetector::densityGrid(const std::vector<cv::Point3f>& local,
                                       double length, double height, double cell)
{
    const int cols = std::max(1, static_cast<int>(std::ceil(length / cell)));
    const int rows = std::max(1, static_cast<int>(std::ceil(height / cell)));
    cv::Mat1i counts = cv::Mat1i::zeros(rows, cols);
    for (const auto& p : local) {
        const int c = static_cast<int>(std::floor(p.x / cell));
        const int r = static_cast<int>(std::floor(p.z / cell));
        if (c < 0 || c >= cols || r < 0 || r >= rows)
            continue;
        counts(r, c)++;
    }
    return counts;
}

cv::Mat1b OpeningDetector::voidMask(const cv::Mat1i& counts, double ratio)
{
    std::vector<double> occupied;
    for (int r = 0; r < counts.rows; ++r)
        for (int c = 0; c < counts.cols; ++c)
            if (counts(r, c) > 0)
                occupied.push_back(counts(r, c));

    cv::Mat1b mask = cv::Mat1b::zeros(counts.size());
    if (occupied.empty())
        return mask;
    const double limit = ratio * median(occupied);
    for (int r = 0; r < counts.rows; ++r)
        for (int c = 0; c < counts.cols; ++c)
            if (counts(r, c) < limit)
                mask(r, c) = 255;
    return mask;
}

namespace {

struct Candidate {
    Opening opening;
    double area = 0.0;
};

bool overlaps(const Opening& a, const Opening& b)
{
    return a.xMin < b.xMax && b.xMin < a.xMax && a.zMin < b.zMax && b.zMin < a.zMax;
}

} // namespace

std::vector<Opening> OpeningDetector::detect(const WallDetection& detection,
                                             const ProcessingConfig& config)
{
    const Wall& wall = detection.wall;
    const OpeningConfig& oc = config.opening;
    const double cell = config.cellSize();
    const double length = wall.length();
    const double height = wall.height;
    const auto& pts = detection.localPoints;

    if (pts.empty())
        return {};

    const cv::Mat1i counts = densityGrid(pts, length, height, cell);
    const cv::Mat1b voids = voidMask(counts, oc.voidDensityRatio);

    cv::Mat1i labels;
    cv::Mat stats, centroids;
    const int n = cv::connectedComponentsWithStats(voids, labels, stats, centroids, 4, CV_32S);

    std::vector<Candidate> candidates;
    for (int l = 1; l < n; ++l) {
        const int left = stats.at<int>(l, cv::CC_STAT_LEFT);
        const int row0 = stats.at<int>(l, cv::CC_STAT_TOP);
        const int w = stats.at<int>(l, cv::CC_STAT_WIDTH);
        const int h = stats.at<int>(l, cv::CC_STAT_HEIGHT);
        const int area = stats.at<int>(l, cv::CC_STAT_AREA);

        // open to a wall end or above the top: not an opening
        if (left == 0 || left + w >= counts.cols || row0 + h >= counts.rows)
            continue;
        if (static_cast<double>(area) / (w * h) < oc.minRectangularity)
            continue;

        const double xc0 = left * cell, xc1 = (left + w) * cell;
        const double zc0 = row0 * cell, zc1 = (row0 + h) * cell;
        const double xMid = 0.5 * (xc0 + xc1), zMid = 0.5 * (zc0 + zc1);

        /* ---------- snap the cell rectangle to the framing points -------- */
        double xMin = xc0, xMax = xc1, zMin = zc0, zMax = zc1;
        double bestL = -std::numeric_limits<double>::max(), bestR = std::numeric_limits<double>::max();
        double bestB = -std::numeric_limits<double>::max(), bestT = std::numeric_limits<double>::max();
        for (const auto& p : pts) {
            const bool inRows = p.z >= zc0 && p.z <= zc1;
            const bool inCols = p.x >= xc0 && p.x <= xc1;
            if (inRows) {
                if (p.x < xMid && std::abs(p.x - xc0) <= cell) bestL = std::max(bestL, double(p.x));
                if (p.x > xMid && std::abs(p.x - xc1) <= cell) bestR = std::min(bestR, double(p.x));
            }
            if (inCols) {
                if (p.z < zMid && std::abs(p.z - zc0) <= cell) bestB = std::max(bestB, double(p.z));
                if (p.z > zMid && std::abs(p.z - zc1) <= cell) bestT = std::min(bestT, double(p.z));
            }
        }
        if (bestL > -std::numeric_limits<double>::max()) xMin = bestL;
        if (bestR < std::numeric_limits<double>::max())  xMax = bestR;
        if (bestT < std::numeric_limits<double>::max())  zMax = bestT;
        if (row0 == 0)
            zMin = 0.0;
        else if (bestB > -std::numeric_limits<double>::max())
            zMin = bestB;

        xMin = std::clamp(xMin, 0.0, length);
        xMax = std::clamp(xMax, 0.0, length);
        zMin = std::clamp(zMin, 0.0, height);
        zMax = std::clamp(zMax, 0.0, height);

        const double ow = xMax - xMin, oh = zMax - zMin;
        if (ow < oc.minWidth || oh < oc.minHeight)
            continue;
        if (std::max(ow / oh, oh / ow) > oc.maxAspectRatio)
            continue;

        Opening o;
        o.wallId = wall.id;
        o.xMin = xMin;
        o.xMax = xMax;
        o.zMax = zMax;
        if (zMin <= oc.doorZMax && oh >= oc.doorMinHeight) {
            o.type = OpeningType::Door;
            o.zMin = 0.0;
        } else if (zMax > oc.minZTop) {
            o.type = OpeningType::Window;
            o.zMin = zMin;
        } else {
            std::cout << "[info] Wall " << wall.id << ": ambiguous void at x=" << xMin
                      << " z=" << zMin << " discarded" << std::endl;
            continue;
        }
        candidates.push_back({o, o.width() * o.height()});
    }

    /* ---------- overlaps: larger opening wins ---------------------------- */
    std::stable_sort(candidates.begin(), candidates.end(),
                     [](const Candidate& a, const Candidate& b) { return a.area > b.area; });
    std::vector<Opening> openings;
    for (auto& c : candidates) {
        const bool clash = std::any_of(openings.begin(), openings.end(),
                                       [&](const Opening& o) { return overlaps(o, c.opening); });
        if (clash) {
            std::cerr << "[warn] Wall " << wall.id << ": " << toString(c.opening.type)
                      << " at x=" << c.opening.xMin << " overlaps a larger opening, dropped" << std::endl;
            continue;
        }
        openings.push_back(std::move(c.opening));
    }

    std::sort(openings.begin(), openings.end(), [](const Opening& a, const Opening& b) {
        if (a.xMin != b.xMin)
            return a.xMin < b.xMin;
        return a.zMin < b.zMin;
    });

    for (auto& o : openings) {
        for (size_t i = 0; i < pts.size(); ++i) {
            const auto& p = pts[i];
            if (p.x >= o.xMin - cell && p.x <= o.xMax + cell &&
                p.z >= o.zMin - cell && p.z <= o.zMax + cell)
                o.pointIndices.push_back(detection.localSourceIndices[i]);
        }
        std::cout << "  wall " << wall.id << ": " << toString(o.type) << " " << o.width()
                  << " x " << o.height() << " at x=" << o.xMin << std::endl;
    }
    return openings;
}

} // namespace cloud2bim
