#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "pipeline/progress.hpp"

using namespace cloud2bim;

TEST(Progress, StagePercentagesIncrease)
{
    const ProcessingStage order[] = {
        ProcessingStage::Initializing, ProcessingStage::LoadingPointCloud,
        ProcessingStage::Preprocessing, ProcessingStage::DetectingSlabs,
        ProcessingStage::DetectingWalls, ProcessingStage::DetectingOpenings,
        ProcessingStage::DetectingZones, ProcessingStage::GeneratingIfc,
        ProcessingStage::SavingMapping, ProcessingStage::Finished};
    int last = -1;
    for (auto s : order) {
        EXPECT_GT(stagePercent(s), last) << toString(s);
        last = stagePercent(s);
    }
    EXPECT_EQ(stagePercent(ProcessingStage::Finished), 100);
    EXPECT_EQ(stagePercent(ProcessingStage::DetectingSlabs), 30);
}

TEST(Progress, NamesAndDescriptions)
{
    EXPECT_STREQ(toString(ProcessingStage::DetectingSlabs), "detecting_slabs");
    EXPECT_STREQ(toString(ProcessingStage::Failed), "failed");
    EXPECT_STREQ(describe(ProcessingStage::DetectingWalls), "Detecting wall structures...");
}

TEST(Progress, ConsoleSinkPrintsOneLine)
{
    std::ostringstream out;
    ConsoleProgressSink sink(out);
    ProgressDetail d;
    d.elapsedSeconds = 1.5;
    d.memoryMb = 12.0;
    d.pointsPerSecond = 25000.0;
    d.description = "Finding doors and windows...";
    sink.onProgress(ProcessingStage::DetectingOpenings, 55, d);
    EXPECT_EQ(out.str(), "[ 55%] Finding doors and windows... (1.5 s, 12.0 MB, 25.0k points/sec)\n");
}

TEST(Progress, ClockReportsThroughput)
{
    ProgressClock clock;
    clock.setProcessedPoints(1000);
    const ProgressDetail d = clock.detail(ProcessingStage::Preprocessing);
    EXPECT_GE(d.elapsedSeconds, 0.0);
    EXPECT_GE(d.pointsPerSecond, 0.0);
    EXPECT_EQ(d.description, describe(ProcessingStage::Preprocessing));
    EXPECT_GE(residentMemoryMb(), 0.0);
}
