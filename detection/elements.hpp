#pragma once
/*-----------------------------------------------------------------------------
 *  elements.hpp
 *
 *  Building elements produced by the detectors. Plain values, created once
 *  per job and read by the IFC writer and the point mapping.
 *---------------------------------------------------------------------------*/
#include <cmath>
#include <map>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

namespace cloud2bim {

/* ---------- slabs --------------------------------------------------------- */
struct Slab
{
    int                      storeyOrdinal{0};  ///< 0-based, ascending with elevation
    double                   bottomZ{0.0};
    double                   thickness{0.0};
    std::vector<cv::Point2d> footprint;         ///< closed ring, last vertex != first
    std::vector<int>         pointIndices;      ///< source indices of the inliers

    [[nodiscard]] double topZ() const noexcept { return bottomZ + thickness; }
};

/* ---------- walls --------------------------------------------------------- */
enum class WallLabel { Interior, Exterior };

inline const char* toString(WallLabel l) noexcept
{
    return l == WallLabel::Exterior ? "exterior" : "interior";
}

struct Wall
{
    int              id{0};          ///< global, sequential from 1
    int              storey{0};      ///< index of the slab the wall stands on
    cv::Point2d      start;
    cv::Point2d      end;
    double           thickness{0.0};
    std::string      material;
    WallLabel        label{WallLabel::Interior};
    double           baseZ{0.0};
    double           height{0.0};
    std::vector<int> pointIndices;

    [[nodiscard]] double length() const noexcept
    {
        return std::hypot(end.x - start.x, end.y - start.y);
    }
};

/* ---------- openings ------------------------------------------------------ */
enum class OpeningType { Door, Window };

inline const char* toString(OpeningType t) noexcept
{
    return t == OpeningType::Door ? "door" : "window";
}

/**
 * Ranges are in the owning wall's local frame: x along start->end from the
 * start point, z above the wall base.
 */
struct Opening
{
    int              wallId{0};
    OpeningType      type{OpeningType::Window};
    double           xMin{0.0};
    double           xMax{0.0};
    double           zMin{0.0};
    double           zMax{0.0};
    std::vector<int> pointIndices;

    [[nodiscard]] double width()  const noexcept { return xMax - xMin; }
    [[nodiscard]] double height() const noexcept { return zMax - zMin; }
};

/* ---------- zones --------------------------------------------------------- */
struct Zone
{
    std::vector<cv::Point2d> polygon;   ///< counter-clockwise ring
    double                   height{0.0};
    double                   area{0.0};
};

/** Orders "Zone 2" before "Zone 10": shorter names first, then lexicographic. */
struct ZoneNameLess
{
    bool operator()(const std::string& a, const std::string& b) const noexcept
    {
        return a.size() != b.size() ? a.size() < b.size() : a < b;
    }
};

/** Zones of one storey by name, in numbering order. */
using StoreyZones = std::map<std::string, Zone, ZoneNameLess>;

/** Everything the detectors found in one job. */
struct DetectionResult
{
    std::vector<Slab>        slabs;
    std::vector<Wall>        walls;
    std::vector<Opening>     openings;
    std::vector<StoreyZones> zones;     ///< one entry per storey, possibly empty
};

} // namespace cloud2bim
