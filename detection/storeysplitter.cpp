#include "storeysplitter.hpp"

#include <iostream>

namespace cloud2bim {

std::vector<StoreyCloud> StoreySplitter::split(const PreparedCloud& cloud,
                                               const std::vector<Slab>& slabs)
{
    std::vector<StoreyCloud> storeys;
    for (size_t i = 0; i + 1 < slabs.size(); ++i) {
        StoreyCloud s;
        s.index = static_cast<int>(i);
        s.baseZ = slabs[i].topZ();
        s.topZ = slabs[i + 1].bottomZ;
        s.boundingPolygon = slabs[i + 1].footprint;

        for (size_t k = 0; k < cloud.points.size(); ++k) {
            const float z = cloud.points[k].z;
            if (z > s.baseZ && z < s.topZ) {
                s.points.push_back(cloud.points[k]);
                s.sourceIndex.push_back(cloud.sourceIndex[k]);
            }
        }
        std::cout << "Storey " << i << ": " << s.points.size() << " points between z="
                  << s.baseZ << " and z=" << s.topZ << std::endl;
        if (s.topZ <= s.baseZ)
            std::cerr << "[warn] Storey " << i << " has no clear height" << std::endl;
        storeys.push_back(std::move(s));
    }
    return storeys;
}

} // namespace cloud2bim
