#include "pointmapping.hpp"
#include "../errors.hpp"

#include <cmath>
#include <fstream>
#include <iostream>
#include <sstream>
#include <utility>
#include <vector>

namespace cloud2bim {

namespace {

PointMapping::Json truncatedPoints(const std::vector<int>& indices)
{
    PointMapping::Json points = PointMapping::Json::array();
    for (size_t i = 0; i < indices.size() && i < PointMapping::kMaxPoints; ++i)
        points.push_back(indices[i]);
    return points;
}

// "[1, 2, 3]": one line, comma and space between items
std::string compactArray(const PointMapping::Json& array)
{
    std::ostringstream os;
    os << '[';
    bool first = true;
    for (const auto& v : array) {
        if (!first)
            os << ", ";
        os << v.dump();
        first = false;
    }
    os << ']';
    return os.str();
}

void replacePoints(PointMapping::Json& node, std::vector<std::pair<std::string, std::string>>& arrays)
{
    if (!node.is_object())
        return;
    for (auto it = node.begin(); it != node.end(); ++it) {
        if (it.key() == "points" && it.value().is_array()) {
            std::string placeholder = "__POINTS_" + std::to_string(arrays.size()) + "__";
            arrays.emplace_back(placeholder, compactArray(it.value()));
            it.value() = placeholder;
        } else {
            replacePoints(it.value(), arrays);
        }
    }
}

} // namespace

PointMapping::Json PointMapping::build(const DetectionResult& result)
{
    Json mapping = Json::object();
    mapping["slabs"] = Json::object();
    mapping["walls"] = Json::object();
    mapping["openings"] = Json::object();

    for (size_t i = 0; i < result.slabs.size(); ++i) {
        const Slab& s = result.slabs[i];
        mapping["slabs"]["slab_" + std::to_string(i + 1)] = {
            {"points", truncatedPoints(s.pointIndices)},
            {"height", s.bottomZ},
            {"thickness", s.thickness},
            {"ifc_type", "IfcSlab"}
        };
    }

    for (const auto& w : result.walls) {
        mapping["walls"]["wall_" + std::to_string(w.id)] = {
            {"points", truncatedPoints(w.pointIndices)},
            {"storey", w.storey + 1},   // storeys count from 1 here
            {"thickness", w.thickness},
            {"label", toString(w.label)},
            {"ifc_type", "IfcWall"}
        };
    }

    for (size_t i = 0; i < result.openings.size(); ++i) {
        const Opening& o = result.openings[i];
        mapping["openings"][std::string(toString(o.type)) + "_" + std::to_string(i + 1)] = {
            {"points", truncatedPoints(o.pointIndices)},
            {"wall_id", "wall_" + std::to_string(o.wallId)},
            {"type", toString(o.type)},
            {"ifc_type", "IfcOpeningElement"}
        };
    }
    return mapping;
}

void PointMapping::normalize(Json& value)
{
    if (value.is_object() || value.is_array()) {
        for (auto& child : value)
            normalize(child);
    } else if (value.is_number_float() && !std::isfinite(value.get<double>())) {
        value = nullptr;
    }
}

std::string PointMapping::format(const Json& mapping)
{
    Json copy = mapping;
    std::vector<std::pair<std::string, std::string>> arrays;
    replacePoints(copy, arrays);

    std::string text = copy.dump(2);
    for (const auto& a : arrays) {
        const std::string quoted = "\"" + a.first + "\"";
        const auto pos = text.find(quoted);
        if (pos != std::string::npos)
            text.replace(pos, quoted.size(), a.second);
    }
    return text;
}

void PointMapping::save(const DetectionResult& result, const std::string& path)
{
    Json mapping = build(result);
    normalize(mapping);

    std::ofstream out(path);
    if (!out)
        throw IoError("Cannot open point mapping for writing: " + path);
    out << format(mapping);
    out.flush();
    if (!out)
        throw IoError("Failed writing point mapping: " + path);
    std::cout << "Point mapping saved to " << path << std::endl;
}

} // namespace cloud2bim
