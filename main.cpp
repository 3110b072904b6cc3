#include <iostream>
#include <filesystem>
#include <memory>
#include <string>

#include "config.hpp"
#include "errors.hpp"
#include "io/cloudreader.hpp"
#include "io/configloader.hpp"
#include "pipeline/progress.hpp"
#include "pipeline/reconstructor.hpp"

using namespace cloud2bim;

int main(int argc, char** argv)
{
    if(argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <cloud.xyz|cloud.ptx> [config.yaml] [job_id]" << std::endl;
        return 1;
    }

    std::string cloudFile = argv[1];
    // Without a config argument "default.yml" is used when present, built-in defaults otherwise
    std::string configFile = (argc >= 3) ? argv[2] : "default.yml";
    std::string jobId = (argc >= 4) ? argv[3] : std::filesystem::path(cloudFile).stem().string();

    ProcessingConfig config;
    try {
        if (argc >= 3 || std::filesystem::exists(configFile))
            config = ConfigLoader::loadFile(configFile);
        else
            std::cout << "No config file, using defaults" << std::endl;
    } catch(const InputError &e) {
        std::cerr << "[error] " << e.what() << std::endl;
        return 1;
    }

    PointCloud cloud;
    try {
        cloud = CloudReader::read(cloudFile);
    } catch(const Cloud2BimError &e) {
        std::cerr << "[error] Failed to load point cloud: " << e.what() << std::endl;
        return 1;
    }

    BimReconstructor reconstructor(std::make_shared<ConsoleProgressSink>(std::cout));
    const JobResult result = reconstructor.run(jobId, config, cloud);
    if (!result.success) {
        std::cerr << "[error] " << toString(result.error) << ": " << result.message << std::endl;
        return 1;
    }

    std::cout << "Slabs: " << result.counts.slabs
              << ", walls: " << result.counts.walls
              << ", doors: " << result.counts.doors
              << ", windows: " << result.counts.windows
              << ", zones: " << result.counts.zones << std::endl;
    std::cout << "IFC model saved to " << result.ifcPath << std::endl;
    std::cout << "Point mapping saved to " << result.mappingPath << std::endl;
    return 0;
}
