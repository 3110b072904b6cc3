#include "reconstructor.hpp"
#include "../errors.hpp"
#include "../detection/openingdetector.hpp"
#include "../detection/slabdetector.hpp"
#include "../detection/storeysplitter.hpp"
#include "../detection/walldetector.hpp"
#include "../detection/zonedetector.hpp"
#include "../export/pointmapping.hpp"
#include "../ifc/ifcmodelbuilder.hpp"
#include "../pointcloud/cloudpreprocessing.hpp"

#include <filesystem>
#include <iostream>

namespace fs = std::filesystem;

namespace cloud2bim {

const char* toString(ErrorKind kind) noexcept
{
    switch (kind) {
    case ErrorKind::None:      return "none";
    case ErrorKind::Input:     return "input";
    case ErrorKind::Detection: return "detection";
    case ErrorKind::Geometry:  return "geometry";
    case ErrorKind::Io:        return "io";
    case ErrorKind::Internal:  return "internal";
    }
    return "internal";
}

BimReconstructor::BimReconstructor(std::shared_ptr<IProgressSink> sink)
    : sink_(sink ? std::move(sink) : std::make_shared<NullProgressSink>())
{}

DetectionResult BimReconstructor::detect(const PreparedCloud& cloud, const ProcessingConfig& config,
                                         const std::function<void(ProcessingStage)>& onStage)
{
    auto enter = [&](ProcessingStage s) { if (onStage) onStage(s); };
    DetectionResult result;

    enter(ProcessingStage::DetectingSlabs);
    result.slabs = SlabDetector::detect(cloud, config);
    if (result.slabs.empty())
        throw DetectionError("No slabs identified in point cloud");

    enter(ProcessingStage::DetectingWalls);
    const auto storeys = StoreySplitter::split(cloud, result.slabs);
    std::vector<std::vector<WallDetection>> detections;
    int nextId = 1;
    for (const auto& storey : storeys) {
        detections.push_back(WallDetector::detect(storey, config));
        for (auto& d : detections.back()) {
            d.wall.id = nextId++;
            result.walls.push_back(d.wall);
        }
    }
    if (result.walls.empty())
        throw DetectionError("No walls identified in point cloud");

    enter(ProcessingStage::DetectingOpenings);
    for (const auto& storeyWalls : detections)
        for (const auto& d : storeyWalls) {
            auto openings = OpeningDetector::detect(d, config);
            result.openings.insert(result.openings.end(),
                                   std::make_move_iterator(openings.begin()),
                                   std::make_move_iterator(openings.end()));
        }
    std::cout << "Detected " << result.openings.size() << " openings" << std::endl;

    enter(ProcessingStage::DetectingZones);
    for (size_t i = 0; i < storeys.size(); ++i) {
        std::vector<Wall> walls;
        for (const auto& d : detections[i])
            walls.push_back(d.wall);
        result.zones.push_back(ZoneDetector::detect(walls, storeys[i].clearHeight(), config.zone));
    }
    return result;
}

JobResult BimReconstructor::run(const std::string& jobId, const ProcessingConfig& config,
                                const PointCloud& cloud) const
{
    JobResult result;
    ProgressClock clock;
    auto advance = [&](ProcessingStage s) {
        result.stage = s;
        result.progress = stagePercent(s);
        sink_->onProgress(s, result.progress, clock.detail(s));
    };
    auto fail = [&](ErrorKind kind, const std::exception& e) {
        result.success = false;
        result.error = kind;
        result.message = e.what();
        std::cerr << "[error] Job " << jobId << " failed during " << toString(result.stage)
                  << ": " << e.what() << std::endl;
        ProgressDetail detail = clock.detail(ProcessingStage::Failed);
        detail.description = result.message;
        sink_->onProgress(ProcessingStage::Failed, result.progress, detail);
    };

    try {
        advance(ProcessingStage::Initializing);
        if (jobId.empty() || jobId.find_first_of("/\\") != std::string::npos)
            throw InputError("Invalid job id '" + jobId + "'");
        config.validate();

        advance(ProcessingStage::LoadingPointCloud);
        if (cloud.empty())
            throw InputError("Point cloud is empty after loading");
        const CloudStats stats = CloudPreprocessing::computeStats(cloud);
        std::cout << "Point cloud: " << stats.numPoints << " points, dimensions "
                  << stats.dimensions.x << " x " << stats.dimensions.y << " x " << stats.dimensions.z
                  << (stats.hasColours ? ", with colours" : "") << std::endl;
        clock.setProcessedPoints(stats.numPoints);

        advance(ProcessingStage::Preprocessing);
        const PreparedCloud prepared = CloudPreprocessing::prepare(cloud, config.preprocessing);

        result.elements = detect(prepared, config, advance);

        const DetectionResult& elements = result.elements;
        result.counts.slabs = elements.slabs.size();
        result.counts.walls = elements.walls.size();
        result.counts.openings = elements.openings.size();
        for (const auto& o : elements.openings)
            (o.type == OpeningType::Door ? result.counts.doors : result.counts.windows)++;
        for (const auto& z : elements.zones)
            result.counts.zones += z.size();

        advance(ProcessingStage::GeneratingIfc);
        const fs::path outDir(config.output.directory);
        try {
            fs::create_directories(outDir);
        } catch (const fs::filesystem_error& e) {
            throw IoError("Cannot create output directory " + outDir.string() + ": " + e.what());
        }
        result.ifcPath = (outDir / (jobId + "_model.ifc")).string();
        result.mappingPath = (outDir / (jobId + "_point_mapping.json")).string();

        IfcModelBuilder builder(config.ifc, config.exteriorScan);
        builder.build(elements);
        builder.write(result.ifcPath);

        advance(ProcessingStage::SavingMapping);
        PointMapping::save(elements, result.mappingPath);

        advance(ProcessingStage::Finished);
        result.success = true;
        result.message = "Processing completed successfully";
    } catch (const InputError& e) {
        fail(ErrorKind::Input, e);
    } catch (const DetectionError& e) {
        fail(ErrorKind::Detection, e);
    } catch (const GeometryError& e) {
        fail(ErrorKind::Geometry, e);
    } catch (const IoError& e) {
        fail(ErrorKind::Io, e);
    } catch (const std::exception& e) {
        fail(ErrorKind::Internal, e);
    }
    return result;
}

} // namespace cloud2bim
