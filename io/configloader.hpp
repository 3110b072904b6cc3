#ifndef CONFIGLOADER_H
#define CONFIGLOADER_H

#include <string>
#include <yaml-cpp/yaml.h>

#include "../config.hpp"

namespace cloud2bim {

/**
 * @brief Builds a ProcessingConfig from YAML.
 *
 * Keys missing from the document keep their defaults. A key whose value
 * cannot be converted raises InputError naming the key. The returned record
 * is validated.
 */
class ConfigLoader
{
public:
    /** Parse an already loaded YAML document. */
    static ProcessingConfig fromNode(const YAML::Node& root);

    /** Load and parse a YAML file. */
    static ProcessingConfig loadFile(const std::string& path);

private:
    static void parseDetection(const YAML::Node& node, ProcessingConfig& cfg);
    static void parseIfc(const YAML::Node& node, IfcConfig& ifc);
};

} // namespace cloud2bim

#endif // CONFIGLOADER_H
