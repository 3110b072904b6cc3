#ifndef POINTMAPPING_H
#define POINTMAPPING_H

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

#include "../detection/elements.hpp"

namespace cloud2bim {

/**
 * @brief Element id -> source point indices, written next to the IFC model.
 *
 * Layout: {"slabs": {...}, "walls": {...}, "openings": {...}}, two-space
 * indentation, every "points" array on a single line.
 */
class PointMapping
{
public:
    using Json = nlohmann::ordered_json;

    static constexpr std::size_t kMaxPoints = 300;

    static Json build(const DetectionResult& result);

    /** Replace every non-finite number in the tree by null. */
    static void normalize(Json& value);

    /** Pretty print with the points arrays kept on one line. */
    static std::string format(const Json& mapping);

    /** build + normalize + format, written to path. Throws IoError. */
    static void save(const DetectionResult& result, const std::string& path);
};

} // namespace cloud2bim

#endif // POINTMAPPING_H
