#include "progress.hpp"

#include <fstream>
#include <iomanip>
#include <ostream>
#include <sstream>

namespace cloud2bim {

const char* toString(ProcessingStage stage) noexcept
{
    switch (stage) {
    case ProcessingStage::Initializing:      return "initializing";
    case ProcessingStage::LoadingPointCloud: return "loading_point_cloud";
    case ProcessingStage::Preprocessing:     return "preprocessing";
    case ProcessingStage::DetectingSlabs:    return "detecting_slabs";
    case ProcessingStage::DetectingWalls:    return "detecting_walls";
    case ProcessingStage::DetectingOpenings: return "detecting_openings";
    case ProcessingStage::DetectingZones:    return "detecting_zones";
    case ProcessingStage::GeneratingIfc:     return "generating_ifc";
    case ProcessingStage::SavingMapping:     return "saving_mapping";
    case ProcessingStage::Finished:          return "finished";
    case ProcessingStage::Failed:            return "failed";
    }
    return "unknown";
}

const char* describe(ProcessingStage stage) noexcept
{
    switch (stage) {
    case ProcessingStage::Initializing:      return "Setting up processing environment...";
    case ProcessingStage::LoadingPointCloud: return "Loading and parsing point cloud data...";
    case ProcessingStage::Preprocessing:     return "Cleaning and preparing point cloud...";
    case ProcessingStage::DetectingSlabs:    return "Identifying floor and ceiling surfaces...";
    case ProcessingStage::DetectingWalls:    return "Detecting wall structures...";
    case ProcessingStage::DetectingOpenings: return "Finding doors and windows...";
    case ProcessingStage::DetectingZones:    return "Analyzing spatial zones...";
    case ProcessingStage::GeneratingIfc:     return "Creating BIM model structure...";
    case ProcessingStage::SavingMapping:     return "Saving results and cleanup...";
    case ProcessingStage::Finished:          return "Processing complete";
    case ProcessingStage::Failed:            return "Processing failed";
    }
    return "Processing...";
}

int stagePercent(ProcessingStage stage) noexcept
{
    switch (stage) {
    case ProcessingStage::Initializing:      return 0;
    case ProcessingStage::LoadingPointCloud: return 10;
    case ProcessingStage::Preprocessing:     return 20;
    case ProcessingStage::DetectingSlabs:    return 30;
    case ProcessingStage::DetectingWalls:    return 45;
    case ProcessingStage::DetectingOpenings: return 55;
    case ProcessingStage::DetectingZones:    return 65;
    case ProcessingStage::GeneratingIfc:     return 80;
    case ProcessingStage::SavingMapping:     return 90;
    case ProcessingStage::Finished:          return 100;
    case ProcessingStage::Failed:            return 0;
    }
    return 0;
}

ConsoleProgressSink::ConsoleProgressSink(std::ostream& out)
    : out_(out)
{}

void ConsoleProgressSink::onProgress(ProcessingStage stage, int percent, const ProgressDetail& detail)
{
    std::ostringstream line;
    line << "[" << std::setw(3) << percent << "%] " << detail.description
         << std::fixed << std::setprecision(1)
         << " (" << detail.elapsedSeconds << " s";
    if (detail.memoryMb > 0.0)
        line << ", " << detail.memoryMb << " MB";
    if (detail.pointsPerSecond > 1000.0)
        line << ", " << detail.pointsPerSecond / 1000.0 << "k points/sec";
    else if (detail.pointsPerSecond > 0.0)
        line << ", " << detail.pointsPerSecond << " points/sec";
    line << ")";
    if (stage == ProcessingStage::Failed)
        line << " [" << toString(stage) << "]";
    out_ << line.str() << std::endl;
}

double residentMemoryMb()
{
    std::ifstream status("/proc/self/status");
    std::string line;
    while (std::getline(status, line)) {
        if (line.rfind("VmRSS:", 0) == 0) {
            std::istringstream fields(line.substr(6));
            double kb = 0.0;
            if (fields >> kb)
                return kb / 1024.0;
        }
    }
    return 0.0;
}

ProgressClock::ProgressClock()
    : start_(std::chrono::steady_clock::now())
{}

ProgressDetail ProgressClock::detail(ProcessingStage stage) const
{
    ProgressDetail d;
    d.elapsedSeconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_).count();
    d.memoryMb = residentMemoryMb();
    d.pointsPerSecond = d.elapsedSeconds > 0.0 ? points_ / d.elapsedSeconds : 0.0;
    d.description = describe(stage);
    return d;
}

} // namespace cloud2bim
