#ifndef RECONSTRUCTOR_H
#define RECONSTRUCTOR_H

#include <functional>
#include <memory>
#include <string>

#include "progress.hpp"
#include "../config.hpp"
#include "../detection/elements.hpp"
#include "../pointcloud/pointcloud.hpp"

namespace cloud2bim {

enum class ErrorKind { None, Input, Detection, Geometry, Io, Internal };

const char* toString(ErrorKind kind) noexcept;

struct ElementCounts {
    size_t slabs = 0;
    size_t walls = 0;
    size_t openings = 0;
    size_t doors = 0;
    size_t windows = 0;
    size_t zones = 0;
};

/** Outcome of one job. On failure stage and progress are where it stopped. */
struct JobResult {
    bool            success = false;
    ProcessingStage stage = ProcessingStage::Initializing;
    int             progress = 0;
    std::string     message;
    ErrorKind       error = ErrorKind::None;
    std::string     ifcPath;
    std::string     mappingPath;
    ElementCounts   counts;
    DetectionResult elements;
};

/**
 * @brief Runs the whole point cloud to IFC pipeline for one job.
 *
 * Stages run strictly in sequence. Any exception ends the job as failed;
 * outputs written before the failure are not removed. Instances hold no
 * per-job state, so one reconstructor may run several jobs concurrently
 * when its sink tolerates that.
 */
class BimReconstructor
{
public:
    explicit BimReconstructor(std::shared_ptr<IProgressSink> sink = std::make_shared<NullProgressSink>());

    JobResult run(const std::string& jobId, const ProcessingConfig& config, const PointCloud& cloud) const;

    /** Slabs, walls, openings and zones of a prepared cloud. Throws DetectionError. */
    static DetectionResult detect(const PreparedCloud& cloud, const ProcessingConfig& config,
                                  const std::function<void(ProcessingStage)>& onStage = {});

private:
    std::shared_ptr<IProgressSink> sink_;
};

} // namespace cloud2bim

#endif // RECONSTRUCTOR_H
