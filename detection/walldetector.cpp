#include "walldetector.hpp"

#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <iostream>

namespace cloud2bim {

/* Storey points in the principal frame plus what every candidate needs. */
struct WallDetector::Frame
{
    std::vector<cv::Point2d> uv;        ///< storey points rotated by -theta
    double theta = 0.0;                 ///< radians
    cv::Point2d axis;                   ///< run direction in the rotated frame
    cv::Point2d normal;                 ///< left normal of axis
    cv::Point2d centroid;               ///< mean of uv
    std::vector<cv::Point2f> boundary;  ///< world polygon for the exterior test
};

cv::Mat1b WallDetector::wallCellMask(const std::vector<cv::Point2d>& xy,
                                     const std::vector<float>& z,
                                     const GridInfo& grid,
                                     double baseZ, double topZ,
                                     double minCoverage)
{
    const double height = topZ - baseZ;
    const int layersCount = std::max(1, static_cast<int>(std::ceil(height / grid.resolution)));
    std::vector<cv::Mat1b> layers(layersCount);
    for (auto& l : layers)
        l = cv::Mat1b::zeros(grid.rows, grid.cols);

    for (size_t i = 0; i < xy.size(); ++i) {
        int k = static_cast<int>(std::floor((z[i] - baseZ) / grid.resolution));
        k = std::clamp(k, 0, layersCount - 1);
        layers[k](worldToCell(xy[i], grid)) = 1;
    }

    cv::Mat1b coverage = cv::Mat1b::zeros(grid.rows, grid.cols);
    for (const auto& l : layers)
        coverage += l;

    const int required = std::max(2, static_cast<int>(std::ceil(minCoverage * layersCount)));
    cv::Mat1b mask;
    cv::threshold(coverage, mask, required - 1, 255, cv::THRESH_BINARY);
    return mask;
}

std::vector<double> WallDetector::computeWeightedAngleHistogram(const std::vector<cv::Vec4i>& lines,
                                                                int resolution)
{
    std::vector<double> hist(resolution, 0.0);
    for (const auto& line : lines) {
        const int x0 = line[0], y0 = line[1], x1 = line[2], y1 = line[3];
        const double angle = std::atan2(static_cast<double>(y1 - y0),
                                        static_cast<double>(x1 - x0)) * 180.0 / CV_PI;
        double angle90 = std::fmod(angle, 90.0);
        if (angle90 < 0)
            angle90 += 90.0;
        int bin = static_cast<int>(std::floor(angle90 / 90.0 * resolution));
        bin = std::clamp(bin, 0, resolution - 1);
        hist[bin] += std::hypot(x1 - x0, y1 - y0);
    }
    return hist;
}

double WallDetector::findBestAngleFromHistogram(const std::vector<double>& hist,
                                                const OrientationConfig& cfg)
{
    const int k = cfg.windowHalfSize;
    const int n = 2 * k + 1;

    // wrap around: the last k bins precede bin 0
    std::vector<double> augmented;
    augmented.insert(augmented.end(), hist.end() - k, hist.end());
    augmented.insert(augmented.end(), hist.begin(), hist.end());
    augmented.insert(augmented.end(), hist.begin(), hist.begin() + k);

    int maxIndex = 0;
    double maxVal = -1.0;
    for (size_t i = 0; i + n <= augmented.size(); ++i) {
        double sum = 0.0;
        for (int j = 0; j < n; ++j)
            sum += augmented[i + j];
        if (sum / n > maxVal) {
            maxVal = sum / n;
            maxIndex = static_cast<int>(i);
        }
    }

    double theta = (static_cast<double>(maxIndex) / hist.size()) * 90.0;
    if (theta > 45.0)
        theta -= 90.0;
    return theta;
}

double WallDetector::findPrincipalAngle(const cv::Mat1b& mask, const OrientationConfig& cfg,
                                        int minLineCells)
{
    std::vector<cv::Vec4i> lines;
    cv::HoughLinesP(mask, lines, 1, CV_PI / 180.0, std::max(5, minLineCells),
                    minLineCells, cfg.maxLineGapCells);
    if (lines.empty())
        return 0.0;

    const auto hist = computeWeightedAngleHistogram(lines, cfg.histogramResolution);
    const double coarse = findBestAngleFromHistogram(hist, cfg);

    // refine with the weighted mean of the segments inside the window
    const double binWidth = 90.0 / cfg.histogramResolution;
    const double window = (cfg.windowHalfSize + 1) * binWidth;
    double sum = 0.0, weight = 0.0;
    for (const auto& l : lines) {
        const double angle = std::atan2(static_cast<double>(l[3] - l[1]),
                                        static_cast<double>(l[2] - l[0])) * 180.0 / CV_PI;
        double d = std::fmod(angle - coarse, 90.0);
        if (d > 45.0) d -= 90.0;
        if (d <= -45.0) d += 90.0;
        if (std::abs(d) <= window) {
            const double len = std::hypot(l[2] - l[0], l[3] - l[1]);
            sum += d * len;
            weight += len;
        }
    }
    double theta = weight > 0.0 ? coarse + sum / weight : coarse;
    if (theta > 45.0) theta -= 90.0;
    if (theta <= -45.0) theta += 90.0;
    return theta;
}

/* ---------- one candidate -------------------------------------------------- */
namespace {

struct Face {
    double position = 0.0;
    double weight = 0.0;
};

// [1 2 1] smoothed histogram of the across-wall coordinate
std::vector<double> acrossProfile(const std::vector<double>& across, double lo, double bin, int bins)
{
    std::vector<double> raw(bins, 0.0);
    for (double v : across) {
        int b = static_cast<int>(std::floor((v - lo) / bin));
        raw[std::clamp(b, 0, bins - 1)] += 1.0;
    }
    std::vector<double> smooth(bins, 0.0);
    for (int i = 0; i < bins; ++i) {
        const double l = i > 0 ? raw[i - 1] : 0.0;
        const double r = i + 1 < bins ? raw[i + 1] : 0.0;
        smooth[i] = (l + 2.0 * raw[i] + r) / 4.0;
    }
    return smooth;
}

double refineFace(const std::vector<double>& across, double centre, double radius)
{
    double sum = 0.0;
    int n = 0;
    for (double v : across)
        if (std::abs(v - centre) <= radius) {
            sum += v;
            ++n;
        }
    return n > 0 ? sum / n : centre;
}

double stdDev(const std::vector<double>& v)
{
    double mean = 0.0;
    for (double x : v) mean += x;
    mean /= v.size();
    double var = 0.0;
    for (double x : v) var += (x - mean) * (x - mean);
    return std::sqrt(var / v.size());
}

} // namespace

bool WallDetector::fitWall(const std::vector<int>& members, const Frame& frame,
                           const StoreyCloud& storey, const ProcessingConfig& config,
                           WallDetection& out)
{
    const WallConfig& wc = config.wall;
    const double res = config.resolution();
    const double cell = config.cellSize();

    std::vector<double> along, acrossAll, acrossMid;
    along.reserve(members.size());
    for (int i : members) {
        const cv::Point2d& p = frame.uv[i];
        const double a = p.dot(frame.axis);
        const double c = p.dot(frame.normal);
        along.push_back(a);
        acrossAll.push_back(c);
        const double z = storey.points[i].z;
        if (z >= storey.baseZ + cell && z <= storey.topZ - cell)
            acrossMid.push_back(c);
    }
    const std::vector<double>& across = acrossMid.size() >= 10 ? acrossMid : acrossAll;

    const double spread = percentile(across, 0.95) - percentile(across, 0.05);
    if (spread > wc.maxThickness + 2.0 * res)
        return false;

    const double alongMin = percentile(along, 0.01);
    const double alongMax = percentile(along, 0.99);
    const double length = alongMax - alongMin;
    if (length < wc.minLength)
        return false;

    /* ---------- faces ---------------------------------------------------- */
    const double bin = 0.5 * res;
    const double lo = *std::min_element(across.begin(), across.end()) - bin;
    const double hi = *std::max_element(across.begin(), across.end()) + bin;
    const int bins = std::max(3, static_cast<int>(std::ceil((hi - lo) / bin)));
    const auto profile = acrossProfile(across, lo, bin, bins);

    const int p1 = static_cast<int>(std::max_element(profile.begin(), profile.end()) - profile.begin());
    int p2 = -1;
    for (int i = 0; i < bins; ++i) {
        const double l = i > 0 ? profile[i - 1] : 0.0;
        const double r = i + 1 < bins ? profile[i + 1] : 0.0;
        const double sep = std::abs(i - p1) * bin;
        if (profile[i] >= l && profile[i] >= r && profile[i] >= 0.25 * profile[p1] &&
            sep >= wc.minThickness && sep <= wc.maxThickness &&
            (p2 < 0 || profile[i] > profile[p2]))
            p2 = i;
    }

    const bool exterior = config.exteriorScan ||
        (!frame.boundary.empty() && [&]() {
            const cv::Point2d midRot = frame.axis * (0.5 * (alongMin + alongMax)) +
                                       frame.normal * median(across);
            const cv::Point2d mid = rotatePoint(midRot, frame.theta);
            const double d = cv::pointPolygonTest(frame.boundary,
                                                  cv::Point2f(static_cast<float>(mid.x),
                                                              static_cast<float>(mid.y)), true);
            return std::abs(d) <= wc.maxThickness + cell;
        }());

    const double f1 = refineFace(across, lo + (p1 + 0.5) * bin, 1.5 * bin);
    double thickness = 0.0, centre = 0.0;
    if (p2 >= 0) {
        const double f2 = refineFace(across, lo + (p2 + 0.5) * bin, 1.5 * bin);
        thickness = std::clamp(std::abs(f2 - f1), wc.minThickness, wc.maxThickness);
        centre = 0.5 * (f1 + f2);
    } else {
        thickness = std::clamp(exterior ? wc.exteriorThickness : 4.0 * stdDev(across),
                               wc.minThickness, wc.maxThickness);
        // the body lies behind the visible face: away from the room for an
        // interior scan, towards the building for an exterior one
        const double inward = frame.centroid.dot(frame.normal) >= f1 ? 1.0 : -1.0;
        const double side = config.exteriorScan ? inward : -inward;
        centre = f1 + side * 0.5 * thickness;
    }

    /* ---------- result --------------------------------------------------- */
    Wall& w = out.wall;
    w.storey = storey.index;
    w.start = rotatePoint(frame.axis * alongMin + frame.normal * centre, frame.theta);
    w.end = rotatePoint(frame.axis * alongMax + frame.normal * centre, frame.theta);
    w.thickness = thickness;
    w.material = config.ifc.materialForWalls;
    w.label = exterior ? WallLabel::Exterior : WallLabel::Interior;
    w.baseZ = storey.baseZ;
    w.height = storey.clearHeight();

    const double halfBand = 0.5 * thickness + cell;
    for (size_t i = 0; i < frame.uv.size(); ++i) {
        const double x = frame.uv[i].dot(frame.axis) - alongMin;
        const double y = frame.uv[i].dot(frame.normal) - centre;
        if (x < 0.0 || x > length || std::abs(y) > halfBand)
            continue;
        out.localPoints.emplace_back(static_cast<float>(x), static_cast<float>(y),
                                     static_cast<float>(storey.points[i].z - storey.baseZ));
        out.localSourceIndices.push_back(storey.sourceIndex[i]);
    }
    w.pointIndices = out.localSourceIndices;
    std::sort(w.pointIndices.begin(), w.pointIndices.end());
    return true;
}

/* ---------- storey --------------------------------------------------------- */
std::vector<WallDetection> WallDetector::detect(const StoreyCloud& storey,
                                                const ProcessingConfig& config)
{
    if (storey.empty()) {
        std::cout << "[info] Storey " << storey.index << " has no points, no walls" << std::endl;
        return {};
    }

    const WallConfig& wc = config.wall;
    const double cell = config.cellSize();
    const int lineCells = std::max(3, static_cast<int>(std::ceil(wc.minLength / cell)));

    std::vector<cv::Point2d> xy;
    std::vector<float> z;
    xy.reserve(storey.points.size());
    z.reserve(storey.points.size());
    for (const auto& p : storey.points) {
        xy.emplace_back(p.x, p.y);
        z.push_back(p.z);
    }

    /* ---------- orientation ---------------------------------------------- */
    const GridInfo worldGrid = makeGrid(xy, cell, 2);
    const cv::Mat1b worldMask = wallCellMask(xy, z, worldGrid, storey.baseZ, storey.topZ,
                                             wc.minVerticalCoverage);
    const double thetaDeg = findPrincipalAngle(worldMask, wc.orientation, lineCells);

    Frame frame;
    frame.theta = thetaDeg * CV_PI / 180.0;
    frame.uv.reserve(xy.size());
    cv::Point2d sum(0, 0);
    for (const auto& p : xy) {
        frame.uv.push_back(rotatePoint(p, -frame.theta));
        sum += frame.uv.back();
    }
    frame.centroid = sum * (1.0 / frame.uv.size());

    if (!storey.boundingPolygon.empty()) {
        for (const auto& p : storey.boundingPolygon)
            frame.boundary.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
    } else {
        std::vector<cv::Point2f> pts;
        pts.reserve(xy.size());
        for (const auto& p : xy)
            pts.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));
        cv::convexHull(pts, frame.boundary);
    }

    /* ---------- runs in the principal frame ------------------------------ */
    const GridInfo grid = makeGrid(frame.uv, cell, 2);
    const cv::Mat1b mask = closeBinary(wallCellMask(frame.uv, z, grid, storey.baseZ, storey.topZ,
                                                    wc.minVerticalCoverage), 3);

    std::vector<cv::Point> cellOf(frame.uv.size());
    for (size_t i = 0; i < frame.uv.size(); ++i)
        cellOf[i] = worldToCell(frame.uv[i], grid);

    std::vector<WallDetection> walls;
    const cv::Size kernels[2] = {cv::Size(lineCells, 1), cv::Size(1, lineCells)};
    const cv::Point2d axes[2] = {cv::Point2d(1, 0), cv::Point2d(0, 1)};

    for (int dir = 0; dir < 2; ++dir) {
        cv::Mat1b runs;
        cv::morphologyEx(mask, runs, cv::MORPH_OPEN,
                         cv::getStructuringElement(cv::MORPH_RECT, kernels[dir]));
        cv::Mat1i labels;
        cv::Mat stats, centroids;
        const int count = cv::connectedComponentsWithStats(runs, labels, stats, centroids, 8, CV_32S);
        if (count <= 1)
            continue;

        std::vector<std::vector<int>> members(count);
        for (size_t i = 0; i < cellOf.size(); ++i) {
            const int l = labels(cellOf[i]);
            if (l > 0)
                members[l].push_back(static_cast<int>(i));
        }

        frame.axis = axes[dir];
        frame.normal = cv::Point2d(-frame.axis.y, frame.axis.x);

        std::vector<std::pair<cv::Point2d, WallDetection>> found;
        for (int l = 1; l < count; ++l) {
            if (members[l].size() < 3)
                continue;
            WallDetection d;
            if (fitWall(members[l], frame, storey, config, d)) {
                const cv::Point2d s = rotatePoint(d.wall.start, -frame.theta);
                found.emplace_back(cv::Point2d(s.dot(frame.normal), s.dot(frame.axis)), std::move(d));
            }
        }
        std::sort(found.begin(), found.end(),
                  [](const auto& a, const auto& b) {
                      if (std::abs(a.first.x - b.first.x) > 1e-6)
                          return a.first.x < b.first.x;
                      return a.first.y < b.first.y;
                  });
        for (auto& f : found)
            walls.push_back(std::move(f.second));
    }

    std::cout << "Storey " << storey.index << ": orientation " << std::fixed << std::setprecision(2)
              << thetaDeg << " deg, " << walls.size() << " walls" << std::defaultfloat << std::endl;
    for (const auto& w : walls)
        std::cout << "  wall " << toString(w.wall.label) << " length " << w.wall.length()
                  << " thickness " << w.wall.thickness << std::endl;
    return walls;
}

} // namespace cloud2bim
