#include "zonedetector.hpp"
#include "../utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <set>

namespace cloud2bim {

namespace {

constexpr double kParamEps = 1e-6;
constexpr int kMaxSplitPasses = 1000;

int findRoot(std::vector<int>& parent, int i)
{
    while (parent[i] != i) {
        parent[i] = parent[parent[i]];
        i = parent[i];
    }
    return i;
}

double cross(const cv::Point2d& a, const cv::Point2d& b)
{
    return a.x * b.y - a.y * b.x;
}

} // namespace

void ZoneDetector::snapEndpoints(const std::vector<Wall>& walls, double snap,
                                 std::vector<cv::Point2d>& vertices,
                                 std::vector<Segment>& segments)
{
    std::vector<cv::Point2d> ends;
    std::vector<int> ids;
    for (const auto& w : walls) {
        if (w.length() <= kParamEps) {
            std::cerr << "[warn] Wall " << w.id << " has no length, ignored for zones" << std::endl;
            continue;
        }
        ends.push_back(w.start);
        ends.push_back(w.end);
        ids.push_back(w.id);
    }

    std::vector<int> parent(ends.size());
    std::iota(parent.begin(), parent.end(), 0);
    for (size_t i = 0; i < ends.size(); ++i)
        for (size_t j = i + 1; j < ends.size(); ++j)
            if (std::hypot(ends[i].x - ends[j].x, ends[i].y - ends[j].y) <= snap)
                parent[findRoot(parent, static_cast<int>(i))] = findRoot(parent, static_cast<int>(j));

    // one vertex per cluster at the cluster centroid, numbered by first member
    std::vector<int> vertexOf(ends.size(), -1);
    std::vector<int> rootVertex(ends.size(), -1);
    std::vector<cv::Point2d> sums;
    std::vector<int> counts;
    for (size_t i = 0; i < ends.size(); ++i) {
        const int r = findRoot(parent, static_cast<int>(i));
        if (rootVertex[r] < 0) {
            rootVertex[r] = static_cast<int>(sums.size());
            sums.emplace_back(0, 0);
            counts.push_back(0);
        }
        vertexOf[i] = rootVertex[r];
        sums[vertexOf[i]] += ends[i];
        counts[vertexOf[i]]++;
    }
    vertices.clear();
    for (size_t v = 0; v < sums.size(); ++v)
        vertices.push_back(sums[v] * (1.0 / counts[v]));

    segments.clear();
    for (size_t w = 0; w < ids.size(); ++w) {
        const int a = vertexOf[2 * w], b = vertexOf[2 * w + 1];
        if (a != b)
            segments.push_back({a, b, ids[w]});
    }
}

bool ZoneDetector::splitTJunctions(const std::vector<cv::Point2d>& vertices,
                                   std::vector<Segment>& segments, double snap)
{
    for (size_t s = 0; s < segments.size(); ++s) {
        const Segment seg = segments[s];
        const cv::Point2d& a = vertices[seg.a];
        const cv::Point2d& b = vertices[seg.b];
        for (int k = 0; k < static_cast<int>(vertices.size()); ++k) {
            if (k == seg.a || k == seg.b)
                continue;
            double t = 0.0;
            const double d = pointSegmentDistance(vertices[k], a, b, &t);
            if (d <= snap && t > kParamEps && t < 1.0 - kParamEps) {
                segments[s] = {seg.a, k, seg.wallId};
                segments.push_back({k, seg.b, seg.wallId});
                return true;
            }
        }
    }
    return false;
}

bool ZoneDetector::splitCrossings(std::vector<cv::Point2d>& vertices,
                                  std::vector<Segment>& segments)
{
    for (size_t i = 0; i < segments.size(); ++i) {
        for (size_t j = i + 1; j < segments.size(); ++j) {
            const Segment s1 = segments[i], s2 = segments[j];
            if (s1.a == s2.a || s1.a == s2.b || s1.b == s2.a || s1.b == s2.b)
                continue;
            const cv::Point2d p = vertices[s1.a], r = vertices[s1.b] - p;
            const cv::Point2d q = vertices[s2.a], s = vertices[s2.b] - q;
            const double denom = cross(r, s);
            if (std::abs(denom) < 1e-12)
                continue;
            const double t = cross(q - p, s) / denom;
            const double u = cross(q - p, r) / denom;
            if (t <= kParamEps || t >= 1.0 - kParamEps || u <= kParamEps || u >= 1.0 - kParamEps)
                continue;

            const int k = static_cast<int>(vertices.size());
            vertices.push_back(p + r * t);
            segments[i] = {s1.a, k, s1.wallId};
            segments[j] = {s2.a, k, s2.wallId};
            segments.push_back({k, s1.b, s1.wallId});
            segments.push_back({k, s2.b, s2.wallId});
            return true;
        }
    }
    return false;
}

WallGraph ZoneDetector::buildGraph(const std::vector<Wall>& walls, double snappingDistance)
{
    std::vector<cv::Point2d> vertices;
    std::vector<Segment> segments;
    snapEndpoints(walls, snappingDistance, vertices, segments);

    int passes = 0;
    while (passes++ < kMaxSplitPasses && splitTJunctions(vertices, segments, snappingDistance)) {}
    while (passes++ < 2 * kMaxSplitPasses && splitCrossings(vertices, segments)) {}
    if (passes >= 2 * kMaxSplitPasses)
        std::cerr << "[warn] Wall graph splitting did not settle" << std::endl;

    WallGraph graph;
    std::vector<JunctionId> nodeOf(vertices.size(), 0);
    std::set<int> used;
    for (const auto& s : segments) {
        used.insert(s.a);
        used.insert(s.b);
    }
    for (int v : used)
        nodeOf[v] = graph.addNode(vertices[v])->id();
    for (const auto& s : segments)
        graph.connect(nodeOf[s.a], nodeOf[s.b], s.wallId);

    graph.pruneDangling();
    return graph;
}

StoreyZones ZoneDetector::detect(const std::vector<Wall>& walls, double height,
                                 const ZoneConfig& config)
{
    StoreyZones zones;
    if (walls.empty())
        return zones;

    const WallGraph graph = buildGraph(walls, config.snappingDistance);
    int n = 0;
    for (auto& ring : graph.traceFaces()) {
        ring = removeDuplicateVertices(ring);
        if (ring.size() < 3)
            continue;
        const double area = polygonSignedArea(ring);
        if (area < config.minArea)       // outer faces are clockwise, area < 0
            continue;
        Zone z;
        z.polygon = std::move(ring);
        z.height = height;
        z.area = area;
        zones.emplace("Zone " + std::to_string(++n), std::move(z));
    }

    if (zones.empty())
        std::cout << "[info] No closed zones among " << walls.size() << " walls" << std::endl;
    else
        std::cout << "Found " << zones.size() << " zones" << std::endl;
    return zones;
}

} // namespace cloud2bim
