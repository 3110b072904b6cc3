#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <memory>
#include <vector>

#include "export/pointmapping.hpp"
#include "pipeline/reconstructor.hpp"
#include "synthetic_scenes.hpp"

using namespace cloud2bim;
namespace fs = std::filesystem;

namespace {

/** Records every notification. */
class RecordingSink final : public IProgressSink
{
public:
    void onProgress(ProcessingStage stage, int percent, const ProgressDetail&) override
    {
        stages.push_back(stage);
        percents.push_back(percent);
    }

    std::vector<ProcessingStage> stages;
    std::vector<int> percents;
};

ProcessingConfig configIn(const std::string& dir)
{
    ProcessingConfig cfg;
    cfg.output.directory = (fs::temp_directory_path() / dir).string();
    fs::remove_all(cfg.output.directory);
    return cfg;
}

} // namespace

TEST(BimReconstructor, RoomEndToEnd)
{
    auto sink = std::make_shared<RecordingSink>();
    BimReconstructor reconstructor(sink);
    const ProcessingConfig cfg = configIn("cloud2bim_room_job");

    const JobResult r = reconstructor.run("room", cfg, test::singleRoom());
    ASSERT_TRUE(r.success) << r.message;
    EXPECT_EQ(r.error, ErrorKind::None);
    EXPECT_EQ(r.stage, ProcessingStage::Finished);
    EXPECT_EQ(r.progress, 100);

    EXPECT_EQ(r.counts.slabs, 2u);
    EXPECT_EQ(r.counts.walls, 4u);
    EXPECT_EQ(r.counts.doors, 1u);
    EXPECT_EQ(r.counts.windows, 0u);
    EXPECT_EQ(r.counts.zones, 1u);

    // wall ids are sequential from 1 and openings point at existing walls
    for (size_t i = 0; i < r.elements.walls.size(); ++i)
        EXPECT_EQ(r.elements.walls[i].id, static_cast<int>(i) + 1);
    ASSERT_EQ(r.elements.openings.size(), 1u);
    const Opening& door = r.elements.openings[0];
    EXPECT_NEAR(door.width(), 1.0, 0.2);
    EXPECT_NEAR(door.height(), 2.1, 0.2);

    ASSERT_EQ(r.elements.zones.size(), 1u);
    const Zone& zone = r.elements.zones[0].at("Zone 1");
    EXPECT_GT(zone.area, 20.0);
    EXPECT_LT(zone.area, 30.0);
    EXPECT_NEAR(zone.height, 3.0, 0.1);

    EXPECT_EQ(fs::path(r.ifcPath).filename(), "room_model.ifc");
    EXPECT_EQ(fs::path(r.mappingPath).filename(), "room_point_mapping.json");
    EXPECT_TRUE(fs::exists(r.ifcPath));
    ASSERT_TRUE(fs::exists(r.mappingPath));

    std::ifstream in(r.mappingPath);
    const auto mapping = PointMapping::Json::parse(in);
    EXPECT_EQ(mapping["slabs"].size(), 2u);
    EXPECT_EQ(mapping["walls"].size(), 4u);
    EXPECT_TRUE(mapping["openings"].contains("door_1"));

    ASSERT_FALSE(sink->stages.empty());
    EXPECT_EQ(sink->stages.front(), ProcessingStage::Initializing);
    EXPECT_EQ(sink->stages.back(), ProcessingStage::Finished);
    for (size_t i = 1; i < sink->percents.size(); ++i)
        EXPECT_GT(sink->percents[i], sink->percents[i - 1]);
}

TEST(BimReconstructor, EmptyCloudIsInputError)
{
    auto sink = std::make_shared<RecordingSink>();
    BimReconstructor reconstructor(sink);
    const ProcessingConfig cfg = configIn("cloud2bim_empty_job");

    const JobResult r = reconstructor.run("empty", cfg, PointCloud{});
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::Input);
    EXPECT_EQ(r.stage, ProcessingStage::LoadingPointCloud);
    EXPECT_EQ(r.message, "Point cloud is empty after loading");
    EXPECT_FALSE(fs::exists(fs::path(cfg.output.directory) / "empty_model.ifc"));
    EXPECT_EQ(sink->stages.back(), ProcessingStage::Failed);
}

TEST(BimReconstructor, FlatCloudHasNoSlabs)
{
    test::SceneBuilder b;
    b.sheet(0, 0, 3, 3, 0.0);
    const JobResult r = BimReconstructor().run("flat", configIn("cloud2bim_flat_job"), b.cloud());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::Detection);
    EXPECT_EQ(r.stage, ProcessingStage::DetectingSlabs);
    EXPECT_EQ(r.message, "No slabs identified in point cloud");
}

TEST(BimReconstructor, SlabsWithoutWallsIsDetectionError)
{
    test::SceneBuilder b;
    b.sheet(0, 0, 4, 4, 0.0).sheet(0, 0, 4, 4, 3.0).column(2, 2, 0.05, 2.95);
    const JobResult r = BimReconstructor().run("slabs", configIn("cloud2bim_slabs_job"), b.cloud());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::Detection);
    EXPECT_EQ(r.message, "No walls identified in point cloud");
}

TEST(BimReconstructor, InvalidConfigAndJobId)
{
    BimReconstructor reconstructor;
    ProcessingConfig cfg = configIn("cloud2bim_invalid_job");
    EXPECT_EQ(reconstructor.run("a/b", cfg, test::singleRoom()).error, ErrorKind::Input);
    cfg.preprocessing.voxelSize = -1.0;
    EXPECT_EQ(reconstructor.run("job", cfg, test::singleRoom()).error, ErrorKind::Input);
}

TEST(BimReconstructor, UnwritableOutputIsIoError)
{
    const fs::path blocker = fs::temp_directory_path() / "cloud2bim_blocker_file";
    std::ofstream(blocker) << "x";
    ProcessingConfig cfg;
    cfg.output.directory = (blocker / "out").string();

    const JobResult r = BimReconstructor().run("room", cfg, test::singleRoom());
    EXPECT_FALSE(r.success);
    EXPECT_EQ(r.error, ErrorKind::Io);
    EXPECT_EQ(r.stage, ProcessingStage::GeneratingIfc);
}

TEST(BimReconstructor, DetectReportsEachStage)
{
    std::vector<ProcessingStage> seen;
    BimReconstructor::detect(test::prepared(test::singleRoom()), ProcessingConfig{},
                             [&](ProcessingStage s) { seen.push_back(s); });
    ASSERT_EQ(seen.size(), 4u);
    EXPECT_EQ(seen.front(), ProcessingStage::DetectingSlabs);
    EXPECT_EQ(seen.back(), ProcessingStage::DetectingZones);
}

TEST(BimReconstructor, DetectNumbersWallsAcrossStoreys)
{
    const DetectionResult d = BimReconstructor::detect(test::prepared(test::twoStoreys()),
                                                       ProcessingConfig{});

    // floor, merged middle slab, roof
    ASSERT_EQ(d.slabs.size(), 3u);
    EXPECT_NEAR(d.slabs[1].bottomZ, 3.0, 0.05);
    EXPECT_NEAR(d.slabs[1].thickness, 0.3, 0.05);
    EXPECT_EQ(d.zones.size(), 2u);

    ASSERT_EQ(d.walls.size(), 8u);
    for (size_t i = 0; i < d.walls.size(); ++i) {
        const Wall& w = d.walls[i];
        const int storey = i < 4 ? 0 : 1;
        EXPECT_EQ(w.id, static_cast<int>(i) + 1);
        EXPECT_EQ(w.storey, storey);
        EXPECT_DOUBLE_EQ(w.baseZ, d.slabs[storey].topZ());
        EXPECT_NEAR(w.height, 3.0, 0.1);
    }

    ASSERT_EQ(d.openings.size(), 1u);
    EXPECT_EQ(d.openings[0].type, OpeningType::Door);
    EXPECT_LE(d.openings[0].wallId, 4);
}

TEST(BimReconstructor, DetectIsDeterministic)
{
    const PreparedCloud cloud = test::prepared(test::twoStoreys());
    const DetectionResult a = BimReconstructor::detect(cloud, ProcessingConfig{});
    const DetectionResult b = BimReconstructor::detect(cloud, ProcessingConfig{});

    ASSERT_EQ(a.slabs.size(), b.slabs.size());
    for (size_t i = 0; i < a.slabs.size(); ++i) {
        EXPECT_EQ(a.slabs[i].storeyOrdinal, b.slabs[i].storeyOrdinal);
        EXPECT_EQ(a.slabs[i].bottomZ, b.slabs[i].bottomZ);
        EXPECT_EQ(a.slabs[i].thickness, b.slabs[i].thickness);
        EXPECT_EQ(a.slabs[i].footprint, b.slabs[i].footprint);
        EXPECT_EQ(a.slabs[i].pointIndices, b.slabs[i].pointIndices);
    }

    ASSERT_EQ(a.walls.size(), b.walls.size());
    for (size_t i = 0; i < a.walls.size(); ++i) {
        const Wall& x = a.walls[i];
        const Wall& y = b.walls[i];
        EXPECT_EQ(x.id, y.id);
        EXPECT_EQ(x.storey, y.storey);
        EXPECT_EQ(x.start, y.start);
        EXPECT_EQ(x.end, y.end);
        EXPECT_EQ(x.thickness, y.thickness);
        EXPECT_EQ(x.material, y.material);
        EXPECT_EQ(x.label, y.label);
        EXPECT_EQ(x.baseZ, y.baseZ);
        EXPECT_EQ(x.height, y.height);
        EXPECT_EQ(x.pointIndices, y.pointIndices);
    }

    ASSERT_EQ(a.openings.size(), b.openings.size());
    for (size_t i = 0; i < a.openings.size(); ++i) {
        const Opening& x = a.openings[i];
        const Opening& y = b.openings[i];
        EXPECT_EQ(x.wallId, y.wallId);
        EXPECT_EQ(x.type, y.type);
        EXPECT_EQ(x.xMin, y.xMin);
        EXPECT_EQ(x.xMax, y.xMax);
        EXPECT_EQ(x.zMin, y.zMin);
        EXPECT_EQ(x.zMax, y.zMax);
        EXPECT_EQ(x.pointIndices, y.pointIndices);
    }

    ASSERT_EQ(a.zones.size(), b.zones.size());
    for (size_t s = 0; s < a.zones.size(); ++s) {
        ASSERT_EQ(a.zones[s].size(), b.zones[s].size());
        for (auto ia = a.zones[s].begin(), ib = b.zones[s].begin(); ia != a.zones[s].end(); ++ia, ++ib) {
            EXPECT_EQ(ia->first, ib->first);
            EXPECT_EQ(ia->second.polygon, ib->second.polygon);
            EXPECT_EQ(ia->second.height, ib->second.height);
            EXPECT_EQ(ia->second.area, ib->second.area);
        }
    }
}
