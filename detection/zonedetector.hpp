#ifndef ZONEDETECTOR_H
#define ZONEDETECTOR_H

#include <vector>
#include <opencv2/core.hpp>

#include "elements.hpp"
#include "../config.hpp"
#include "../wallgraph/wallgraph.hpp"

namespace cloud2bim {

/**
 * @brief Rooms of one storey as the bounded faces of the wall centerline graph.
 */
class ZoneDetector {
public:
    /** Centerline piece between two vertices of the snapped vertex list. */
    struct Segment {
        int a = 0;
        int b = 0;
        int wallId = 0;
    };

    /**
     * Zones named "Zone 1", "Zone 2", ... in tracing order. An open or
     * empty wall set yields no zones.
     */
    static StoreyZones detect(const std::vector<Wall>& walls, double height,
                              const ZoneConfig& config);

    /**
     * Snap endpoints, split at T-junctions and crossings, and build the
     * graph with dangling links pruned.
     */
    static WallGraph buildGraph(const std::vector<Wall>& walls, double snappingDistance);

private:
    static void snapEndpoints(const std::vector<Wall>& walls, double snap,
                              std::vector<cv::Point2d>& vertices,
                              std::vector<Segment>& segments);
    static bool splitTJunctions(const std::vector<cv::Point2d>& vertices,
                                std::vector<Segment>& segments, double snap);
    static bool splitCrossings(std::vector<cv::Point2d>& vertices,
                               std::vector<Segment>& segments);
};

} // namespace cloud2bim

#endif // ZONEDETECTOR_H
