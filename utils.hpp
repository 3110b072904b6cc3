#ifndef UTILS_H
#define UTILS_H

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>
#include <opencv2/opencv.hpp>

namespace cloud2bim {

/**
 * Raster laid over a planar region. Column index grows with x, row index
 * grows with y (no image-style flip), cell (0,0) starts at (originX, originY).
 */
struct GridInfo {
    double resolution = 1.0;
    double originX = 0.0;
    double originY = 0.0;
    int rows = 0;
    int cols = 0;
};

// Grid covering all points with padCells spare cells on every side.
static GridInfo makeGrid(const std::vector<cv::Point2d>& pts, double resolution, int padCells = 1)
{
    if (pts.empty() || resolution <= 0.0)
        throw std::runtime_error("makeGrid: no points or non-positive resolution");
    double minX = pts[0].x, maxX = pts[0].x, minY = pts[0].y, maxY = pts[0].y;
    for (const auto& p : pts) {
        minX = std::min(minX, p.x); maxX = std::max(maxX, p.x);
        minY = std::min(minY, p.y); maxY = std::max(maxY, p.y);
    }
    GridInfo g;
    g.resolution = resolution;
    g.originX = minX - padCells * resolution;
    g.originY = minY - padCells * resolution;
    g.cols = static_cast<int>(std::floor((maxX - g.originX) / resolution)) + 1 + padCells;
    g.rows = static_cast<int>(std::floor((maxY - g.originY) / resolution)) + 1 + padCells;
    return g;
}

// World coordinates -> cell index (x = column, y = row), clamped to the grid.
static cv::Point worldToCell(const cv::Point2d& p, const GridInfo& g)
{
    int c = static_cast<int>(std::floor((p.x - g.originX) / g.resolution));
    int r = static_cast<int>(std::floor((p.y - g.originY) / g.resolution));
    return {std::clamp(c, 0, g.cols - 1), std::clamp(r, 0, g.rows - 1)};
}

// Cell centre (or a contour point in cell units) in world coordinates.
static cv::Point2d cellToWorld(const cv::Point2d& cell, const GridInfo& g)
{
    return {g.originX + (cell.x + 0.5) * g.resolution,
            g.originY + (cell.y + 0.5) * g.resolution};
}

static cv::Point2d rotatePoint(const cv::Point2d& p, double angleRad)
{
    const double c = std::cos(angleRad), s = std::sin(angleRad);
    return {p.x * c - p.y * s, p.x * s + p.y * c};
}

/** Shoelace area, positive for counter-clockwise rings. */
static double polygonSignedArea(const std::vector<cv::Point2d>& poly)
{
    double a = 0.0;
    for (size_t i = 0, n = poly.size(); i < n; ++i) {
        const auto& p = poly[i];
        const auto& q = poly[(i + 1) % n];
        a += p.x * q.y - q.x * p.y;
    }
    return 0.5 * a;
}

static double pointSegmentDistance(const cv::Point2d& p, const cv::Point2d& a, const cv::Point2d& b,
                                   double* tOut = nullptr)
{
    const cv::Point2d ab = b - a;
    const double ab2 = ab.dot(ab);
    double t = 0.0;
    if (ab2 > 1e-18)
        t = std::clamp((p - a).dot(ab) / ab2, 0.0, 1.0);
    if (tOut) *tOut = t;
    const cv::Point2d proj = a + t * ab;
    return std::hypot(proj.x - p.x, proj.y - p.y);
}

/** Linear-interpolated quantile, q in [0,1]. Values are taken by copy. */
static double percentile(std::vector<double> values, double q)
{
    if (values.empty())
        throw std::runtime_error("percentile of empty sequence");
    std::sort(values.begin(), values.end());
    const double pos = std::clamp(q, 0.0, 1.0) * (values.size() - 1);
    const size_t lo = static_cast<size_t>(std::floor(pos));
    const size_t hi = std::min(lo + 1, values.size() - 1);
    return values[lo] + (pos - lo) * (values[hi] - values[lo]);
}

static double median(std::vector<double> values)
{
    return percentile(std::move(values), 0.5);
}

// Drops repeated consecutive vertices and a closing copy of the first one.
static std::vector<cv::Point2d> removeDuplicateVertices(const std::vector<cv::Point2d>& ring,
                                                        double eps = 1e-6)
{
    std::vector<cv::Point2d> out;
    out.reserve(ring.size());
    for (const auto& p : ring) {
        if (!out.empty() && std::hypot(p.x - out.back().x, p.y - out.back().y) <= eps)
            continue;
        out.push_back(p);
    }
    while (out.size() > 1 && std::hypot(out.front().x - out.back().x,
                                        out.front().y - out.back().y) <= eps)
        out.pop_back();
    return out;
}

// Morphological closing of a binary mask with a square kernel.
static cv::Mat1b closeBinary(const cv::Mat1b& src, int kernelSize = 3)
{
    CV_Assert(src.type() == CV_8UC1);
    cv::Mat1b result;
    cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(kernelSize, kernelSize));
    cv::morphologyEx(src, result, cv::MORPH_CLOSE, kernel);
    return result;
}

// Hole filling: everything inside an outer contour becomes 255.
static cv::Mat1b fillHoles(const cv::Mat1b& src)
{
    CV_Assert(src.type() == CV_8UC1);
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(src.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);
    cv::Mat1b filled = cv::Mat1b::zeros(src.size());
    cv::drawContours(filled, contours, -1, cv::Scalar(255), cv::FILLED);
    return filled;
}

} // namespace cloud2bim

#endif // UTILS_H
