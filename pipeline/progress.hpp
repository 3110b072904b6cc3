#ifndef PROGRESS_H
#define PROGRESS_H

#include <chrono>
#include <cstddef>
#include <iosfwd>
#include <string>

namespace cloud2bim {

enum class ProcessingStage {
    Initializing,
    LoadingPointCloud,
    Preprocessing,
    DetectingSlabs,
    DetectingWalls,
    DetectingOpenings,
    DetectingZones,
    GeneratingIfc,
    SavingMapping,
    Finished,
    Failed
};

/** Stable identifier, e.g. "detecting_slabs". */
const char* toString(ProcessingStage stage) noexcept;

/** Human-readable description of what the stage does. */
const char* describe(ProcessingStage stage) noexcept;

/** Nominal completion percentage when the stage starts. */
int stagePercent(ProcessingStage stage) noexcept;

/** Measurements attached to a progress notification. */
struct ProgressDetail {
    double      elapsedSeconds = 0.0;
    double      memoryMb = 0.0;        ///< resident set size, 0 when unknown
    double      pointsPerSecond = 0.0; ///< processed points over elapsed time
    std::string description;
};

/**
 * @brief Receives stage transitions of a job.
 */
class IProgressSink {
public:
    virtual ~IProgressSink() = default;
    virtual void onProgress(ProcessingStage stage, int percent, const ProgressDetail& detail) = 0;
};

/** Default sink: drops everything. */
class NullProgressSink final : public IProgressSink {
public:
    void onProgress(ProcessingStage, int, const ProgressDetail&) override {}
};

/** Prints one line per notification. */
class ConsoleProgressSink final : public IProgressSink {
public:
    explicit ConsoleProgressSink(std::ostream& out);
    void onProgress(ProcessingStage stage, int percent, const ProgressDetail& detail) override;

private:
    std::ostream& out_;
};

/** Resident memory of this process in MB from /proc/self/status, 0 if unavailable. */
double residentMemoryMb();

/**
 * @brief Builds ProgressDetail values for one job.
 */
class ProgressClock {
public:
    ProgressClock();
    void setProcessedPoints(size_t n) noexcept { points_ = n; }
    [[nodiscard]] ProgressDetail detail(ProcessingStage stage) const;

private:
    std::chrono::steady_clock::time_point start_;
    size_t points_ = 0;
};

} // namespace cloud2bim

#endif // PROGRESS_H
