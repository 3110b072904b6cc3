#include "config.hpp"
#include "errors.hpp"

namespace cloud2bim {

namespace {

void requirePositive(double value, const std::string& key)
{
    if (!(value > 0.0))
        throw InputError("Invalid configuration: '" + key + "' must be positive, got " +
                         std::to_string(value));
}

void requireUnitInterval(double value, const std::string& key)
{
    if (!(value >= 0.0 && value <= 1.0))
        throw InputError("Invalid configuration: '" + key + "' must lie in [0, 1], got " +
                         std::to_string(value));
}

} // namespace

void ProcessingConfig::validate() const
{
    requirePositive(preprocessing.voxelSize, "preprocessing.voxel_size");
    if (preprocessing.dilutionFactor < 1)
        throw InputError("Invalid configuration: 'dilution_factor' must be at least 1");
    requirePositive(preprocessing.noiseThreshold, "preprocessing.noise_threshold");
    if (preprocessing.outlierNeighbours < 1)
        throw InputError("Invalid configuration: 'preprocessing.outlier_neighbours' must be at least 1");
    if (gridCoefficient < 1)
        throw InputError("Invalid configuration: 'detection.grid_coefficient' must be at least 1");

    requirePositive(slab.bottomThickness, "detection.slab.bottom_thickness");
    requirePositive(slab.topThickness, "detection.slab.top_thickness");
    requirePositive(slab.zStep, "detection.slab.z_step");
    requirePositive(slab.peakToMedianRatio, "detection.slab.peak_to_median_ratio");
    requireUnitInterval(slab.minPeakFraction, "detection.slab.min_peak_fraction");

    requirePositive(wall.minLength, "detection.wall.min_width");
    requirePositive(wall.minThickness, "detection.wall.min_thickness");
    requirePositive(wall.maxThickness, "detection.wall.max_thickness");
    requirePositive(wall.exteriorThickness, "detection.wall.thickness");
    if (wall.minThickness > wall.maxThickness)
        throw InputError("Invalid configuration: 'detection.wall.min_thickness' exceeds 'detection.wall.max_thickness'");
    if (wall.exteriorThickness < wall.minThickness || wall.exteriorThickness > wall.maxThickness)
        throw InputError("Invalid configuration: 'detection.wall.thickness' must lie between "
                         "'detection.wall.min_thickness' and 'detection.wall.max_thickness', got " +
                         std::to_string(wall.exteriorThickness));
    requireUnitInterval(wall.minVerticalCoverage, "detection.wall.min_vertical_coverage");
    if (wall.orientation.histogramResolution < 4)
        throw InputError("Invalid configuration: orientation histogram needs at least 4 bins");
    if (wall.orientation.windowHalfSize < 0 ||
        2 * wall.orientation.windowHalfSize + 1 > wall.orientation.histogramResolution)
        throw InputError("Invalid configuration: orientation window does not fit the histogram");

    requirePositive(opening.minWidth, "min_opening_width");
    requirePositive(opening.minHeight, "min_opening_height");
    requirePositive(opening.maxAspectRatio, "max_opening_aspect_ratio");
    if (opening.doorZMax < 0.0)
        throw InputError("Invalid configuration: 'door_z_max' must not be negative");
    requirePositive(opening.doorMinHeight, "door_min_height");
    requirePositive(opening.minZTop, "opening_min_z_top");
    requireUnitInterval(opening.voidDensityRatio, "opening.void_density_ratio");
    requireUnitInterval(opening.minRectangularity, "opening.min_rectangularity");

    requirePositive(zone.snappingDistance, "zone_snapping_distance");
    if (zone.minArea < 0.0)
        throw InputError("Invalid configuration: 'min_zone_area' must not be negative");

    for (double c : ifc.windowColour)
        requireUnitInterval(c, "ifc.window_colour_rgb");
    for (double c : ifc.doorColour)
        requireUnitInterval(c, "ifc.door_colour_rgb");
    requireUnitInterval(ifc.windowTransparency, "ifc.window_transparency");
    requirePositive(ifc.windowPaneThickness, "ifc.window_pane_thickness");
    requirePositive(ifc.doorLeafThickness, "ifc.door_leaf_thickness");
    if (ifc.siteLatitude < -90.0 || ifc.siteLatitude > 90.0)
        throw InputError("Invalid configuration: 'ifc.site_latitude' out of range");
    if (ifc.siteLongitude < -180.0 || ifc.siteLongitude > 180.0)
        throw InputError("Invalid configuration: 'ifc.site_longitude' out of range");

    if (output.directory.empty())
        throw InputError("Invalid configuration: 'output.directory' is empty");
}

} // namespace cloud2bim
