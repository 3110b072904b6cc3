#ifndef STOREYSPLITTER_H
#define STOREYSPLITTER_H

#include <vector>
#include <opencv2/core.hpp>

#include "elements.hpp"
#include "../pointcloud/pointcloud.hpp"

namespace cloud2bim {

/** Points between two consecutive slabs. */
struct StoreyCloud
{
    int                      index{0};        ///< index of the lower slab
    double                   baseZ{0.0};      ///< top of the lower slab
    double                   topZ{0.0};       ///< bottom of the upper slab
    std::vector<cv::Point2d> boundingPolygon; ///< footprint of the upper slab
    std::vector<cv::Point3f> points;
    std::vector<int>         sourceIndex;     ///< parallel to points

    [[nodiscard]] double clearHeight() const noexcept { return topZ - baseZ; }
    [[nodiscard]] bool   empty() const noexcept { return points.empty(); }
};

class StoreySplitter {
public:
    /**
     * One storey per pair of consecutive slabs. A point belongs to the
     * storey when lower.top < z < upper.bottom, both bounds exclusive.
     */
    static std::vector<StoreyCloud> split(const PreparedCloud& cloud,
                                          const std::vector<Slab>& slabs);
};

} // namespace cloud2bim

#endif // STOREYSPLITTER_H
