#include "configloader.hpp"
#include "../errors.hpp"

#include <iostream>

namespace cloud2bim {

namespace {

/* Copy node[key] into value when present; conversion failures name the key. */
template<typename T>
void read(const YAML::Node& node, const char* key, T& value, const std::string& prefix = {})
{
    if (!node || !node.IsMap() || !node[key])
        return;
    try {
        value = node[key].as<T>();
    } catch (const YAML::Exception& e) {
        throw InputError("Invalid configuration value for '" + prefix + key + "': " + e.what());
    }
}

void readColour(const YAML::Node& node, const char* key, ColourRgb& colour)
{
    if (!node || !node[key])
        return;
    std::vector<double> rgb;
    read(node, key, rgb, "ifc.");
    if (rgb.size() != 3)
        throw InputError(std::string("Invalid configuration value for 'ifc.") + key +
                         "': expected three components");
    colour = {rgb[0], rgb[1], rgb[2]};
}

} // namespace

ProcessingConfig ConfigLoader::fromNode(const YAML::Node& root)
{
    ProcessingConfig cfg;
    if (!root || root.IsNull()) {
        cfg.validate();
        return cfg;
    }
    if (!root.IsMap())
        throw InputError("Invalid configuration: top level must be a mapping");

    read(root, "exterior_scan", cfg.exteriorScan);
    read(root, "dilute_pointcloud", cfg.preprocessing.dilute);
    read(root, "dilution_factor", cfg.preprocessing.dilutionFactor);

    if (root["preprocessing"]) {
        const auto pre = root["preprocessing"];
        read(pre, "voxel_size", cfg.preprocessing.voxelSize, "preprocessing.");
        read(pre, "voxel_downsample", cfg.preprocessing.voxelDownsample, "preprocessing.");
        read(pre, "remove_outliers", cfg.preprocessing.removeOutliers, "preprocessing.");
        read(pre, "noise_threshold", cfg.preprocessing.noiseThreshold, "preprocessing.");
        read(pre, "outlier_neighbours", cfg.preprocessing.outlierNeighbours, "preprocessing.");
    }

    if (root["detection"])
        parseDetection(root["detection"], cfg);

    read(root, "zone_snapping_distance", cfg.zone.snappingDistance);
    read(root, "min_zone_area", cfg.zone.minArea);

    read(root, "min_opening_width", cfg.opening.minWidth);
    read(root, "min_opening_height", cfg.opening.minHeight);
    read(root, "max_opening_aspect_ratio", cfg.opening.maxAspectRatio);
    read(root, "door_z_max", cfg.opening.doorZMax);
    read(root, "door_min_height", cfg.opening.doorMinHeight);
    read(root, "opening_min_z_top", cfg.opening.minZTop);
    if (root["opening"]) {
        const auto op = root["opening"];
        read(op, "void_density_ratio", cfg.opening.voidDensityRatio, "opening.");
        read(op, "min_rectangularity", cfg.opening.minRectangularity, "opening.");
    }

    if (root["ifc"])
        parseIfc(root["ifc"], cfg.ifc);

    if (root["output"])
        read(root["output"], "directory", cfg.output.directory, "output.");

    cfg.validate();
    return cfg;
}

void ConfigLoader::parseDetection(const YAML::Node& node, ProcessingConfig& cfg)
{
    read(node, "grid_coefficient", cfg.gridCoefficient, "detection.");

    if (const auto slab = node["slab"]) {
        double thickness = 0.0;
        read(slab, "thickness", thickness, "detection.slab.");
        if (thickness > 0.0) {
            cfg.slab.bottomThickness = thickness;
            cfg.slab.topThickness = thickness;
        }
        read(slab, "bottom_thickness", cfg.slab.bottomThickness, "detection.slab.");
        read(slab, "top_thickness", cfg.slab.topThickness, "detection.slab.");
        read(slab, "z_step", cfg.slab.zStep, "detection.slab.");
        read(slab, "peak_to_median_ratio", cfg.slab.peakToMedianRatio, "detection.slab.");
        read(slab, "min_peak_fraction", cfg.slab.minPeakFraction, "detection.slab.");
    }

    if (const auto wall = node["wall"]) {
        read(wall, "min_width", cfg.wall.minLength, "detection.wall.");
        read(wall, "min_thickness", cfg.wall.minThickness, "detection.wall.");
        read(wall, "max_thickness", cfg.wall.maxThickness, "detection.wall.");
        read(wall, "thickness", cfg.wall.exteriorThickness, "detection.wall.");
        read(wall, "min_vertical_coverage", cfg.wall.minVerticalCoverage, "detection.wall.");
        if (const auto o = wall["orientation"]) {
            read(o, "histogram_resolution", cfg.wall.orientation.histogramResolution,
                 "detection.wall.orientation.");
            read(o, "window_half_size", cfg.wall.orientation.windowHalfSize,
                 "detection.wall.orientation.");
            read(o, "max_line_gap_cells", cfg.wall.orientation.maxLineGapCells,
                 "detection.wall.orientation.");
        }
    }
}

void ConfigLoader::parseIfc(const YAML::Node& node, IfcConfig& ifc)
{
    const std::string p = "ifc.";
    read(node, "project_name", ifc.projectName, p);
    read(node, "project_long_name", ifc.projectLongName, p);
    read(node, "version", ifc.version, p);
    read(node, "building_name", ifc.buildingName, p);
    read(node, "building_type", ifc.buildingType, p);
    read(node, "building_phase", ifc.buildingPhase, p);
    read(node, "site_latitude", ifc.siteLatitude, p);
    read(node, "site_longitude", ifc.siteLongitude, p);
    read(node, "site_elevation", ifc.siteElevation, p);
    read(node, "author_name", ifc.authorName, p);
    read(node, "author_surname", ifc.authorSurname, p);
    read(node, "organization", ifc.organization, p);

    read(node, "material_for_objects", ifc.materialForObjects, p);
    read(node, "material_for_walls", ifc.materialForWalls, p);
    read(node, "material_for_floors", ifc.materialForFloors, p);
    read(node, "material_for_roofs", ifc.materialForRoofs, p);
    read(node, "material_for_windows", ifc.materialForWindows, p);
    read(node, "material_for_doors", ifc.materialForDoors, p);

    readColour(node, "window_colour_rgb", ifc.windowColour);
    readColour(node, "door_colour_rgb", ifc.doorColour);
    read(node, "window_transparency", ifc.windowTransparency, p);
    read(node, "window_pane_thickness", ifc.windowPaneThickness, p);
    read(node, "door_leaf_thickness", ifc.doorLeafThickness, p);
}

ProcessingConfig ConfigLoader::loadFile(const std::string& path)
{
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw InputError("Failed to load config file " + path + ": " + e.what());
    }
    std::cout << "Loaded config from: " << path << std::endl;
    return fromNode(root);
}

} // namespace cloud2bim
