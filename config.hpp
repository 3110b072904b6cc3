#pragma once
#include <array>
#include <string>
#include <vector>

namespace cloud2bim {

    /** Point cloud preparation before detection. */
    struct PreprocessingConfig {
        double voxelSize = 0.05;       ///< planar resolution of all rasters (m)
        bool dilute = false;           ///< keep only every n-th point
        int dilutionFactor = 10;       ///< n for dilution
        bool voxelDownsample = false;  ///< one point per voxel of voxelSize
        bool removeOutliers = false;   ///< statistical outlier removal
        double noiseThreshold = 2.0;   ///< std ratio for outlier removal
        int outlierNeighbours = 20;    ///< k nearest neighbours for outlier removal
    };

    /** Parameters of the vertical density scan. */
    struct SlabConfig {
        double bottomThickness = 0.2;     ///< thickness of the lowest slab
        double topThickness = 0.2;        ///< thickness of upper slabs
        double zStep = 0.15;              ///< histogram bin height
        double peakToMedianRatio = 2.0;   ///< peak must exceed ratio * median bin
        double minPeakFraction = 0.25;    ///< peak must exceed fraction * max bin
    };

    /** Probabilistic Hough parameters used to find the wall orientation. */
    struct OrientationConfig {
        int histogramResolution = 90;  ///< number of angle bins over 90 degrees
        int windowHalfSize = 2;        ///< half window of the moving average
        int maxLineGapCells = 2;       ///< maximum gap inside one Hough segment
    };

    /** Wall detection thresholds. */
    struct WallConfig {
        double minLength = 0.5;            ///< shortest accepted wall (m)
        double minThickness = 0.08;        ///< thinnest accepted wall (m)
        double maxThickness = 0.5;         ///< thickest accepted wall (m)
        double exteriorThickness = 0.3;    ///< thickness of single-faced exterior walls
        double minVerticalCoverage = 0.25; ///< part of storey height a wall cell must cover
        OrientationConfig orientation;
    };

    /** Door/window void classification. */
    struct OpeningConfig {
        double minWidth = 0.4;
        double minHeight = 0.6;
        double maxAspectRatio = 4.0;
        double doorZMax = 0.1;            ///< door bottom must be this close to the floor
        double doorMinHeight = 1.6;
        double minZTop = 1.6;             ///< window top must be above this
        double voidDensityRatio = 0.2;    ///< void cell: count < ratio * median count
        double minRectangularity = 0.6;   ///< void area / bounding rectangle area
    };

    /** Room tracing. */
    struct ZoneConfig {
        double snappingDistance = 0.8; ///< endpoints closer than this share a node
        double minArea = 1.0;          ///< smaller faces are not rooms (m²)
    };

    using ColourRgb = std::array<double, 3>;

    /** Project metadata and presentation used by the IFC writer. */
    struct IfcConfig {
        std::string projectName = "Cloud2BIM Project";
        std::string projectLongName = "Generated by Cloud2BIM";
        std::string version = "1.0";
        std::string buildingName = "Building";
        std::string buildingType;
        std::string buildingPhase = "Construction";
        double siteLatitude = 0.0;      ///< decimal degrees
        double siteLongitude = 0.0;     ///< decimal degrees
        double siteElevation = 0.0;     ///< m
        std::string authorName = "Cloud2BIM";
        std::string authorSurname = "System";
        std::string organization = "Cloud2BIM";

        std::string materialForObjects = "Concrete";
        std::string materialForWalls = "Concrete";
        std::string materialForFloors = "Concrete";
        std::string materialForRoofs = "Concrete";
        std::string materialForWindows = "Glass";
        std::string materialForDoors = "Wood";

        ColourRgb windowColour = {0.0, 0.0, 1.0};
        double windowTransparency = 0.7;
        ColourRgb doorColour = {1.0, 0.0, 0.0};

        double windowPaneThickness = 0.01; ///< glass solid filling a window void
        double doorLeafThickness = 0.05;   ///< leaf solid filling a door void
    };

    /** Where a job writes its files. */
    struct OutputConfig {
        std::string directory = ".";
    };

    /** Complete immutable options record of one job. */
    struct ProcessingConfig {
        bool exteriorScan = false;     ///< scanned from outside, topmost slab is a roof
        int gridCoefficient = 3;       ///< occupancy cell = voxelSize * gridCoefficient
        PreprocessingConfig preprocessing;
        SlabConfig slab;
        WallConfig wall;
        OpeningConfig opening;
        ZoneConfig zone;
        IfcConfig ifc;
        OutputConfig output;

        /** Planar resolution shared by every detector. */
        double resolution() const { return preprocessing.voxelSize; }
        /** Edge length of one occupancy cell. */
        double cellSize() const { return preprocessing.voxelSize * gridCoefficient; }

        /** Throws InputError naming the first invalid value. */
        void validate() const;
    };

} // namespace cloud2bim
