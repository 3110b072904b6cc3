#ifndef IFCMODELBUILDER_H
#define IFCMODELBUILDER_H

#include <map>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

#define IfcSchema Ifc4
#include <ifcparse/Ifc4.h>
#include <ifcparse/IfcHierarchyHelper.h>

#include "../config.hpp"
#include "../detection/elements.hpp"

namespace cloud2bim {

/**
 * @brief Writes the detected elements as an IFC4 building model.
 *
 * Spatial tree Project > Site > Building > one storey per slab. Walls,
 * openings, windows, doors and spaces hang off the storeys, every placement
 * relative to its parent.
 */
class IfcModelBuilder
{
public:
    explicit IfcModelBuilder(const IfcConfig& config, bool exteriorScan = false);

    IfcModelBuilder(const IfcModelBuilder&) = delete;
    IfcModelBuilder& operator=(const IfcModelBuilder&) = delete;

    /** Adds every element of the result in storey, slab, space, wall order. */
    void build(const DetectionResult& result);

    /** Throws IoError when the file cannot be written. */
    void write(const std::string& path);

private:
    void createRoot();
    void addStorey(const Slab& slab, bool roof);
    void addSpaces(size_t storey, const StoreyZones& zones);
    void addWall(const Wall& wall, const std::vector<const Opening*>& openings);
    void addOpening(const Wall& wall, IfcSchema::IfcWall* ifcWall,
                    IfcSchema::IfcObjectPlacement* wallPlacement,
                    const Opening& opening, const std::string& tag);

    IfcSchema::IfcMaterial* material(const std::string& name);
    void associateMaterial(IfcSchema::IfcObjectDefinition* element, IfcSchema::IfcMaterialSelect* mat,
                           const std::string& name);
    void applyColour(IfcSchema::IfcRepresentationItem* item, const ColourRgb& rgb,
                     double transparency, const std::string& name);

    IfcSchema::IfcShapeRepresentation* body(IfcSchema::IfcProfileDef* profile, double depth,
                                            IfcSchema::IfcRepresentationItem** solidOut = nullptr);
    IfcSchema::IfcProductDefinitionShape* extrusion(IfcSchema::IfcProfileDef* profile, double depth,
                                                    IfcSchema::IfcRepresentationItem** solidOut = nullptr);
    IfcSchema::IfcProfileDef* rectangle(double cx, double cy, double xDim, double yDim);
    IfcSchema::IfcProfileDef* polygonProfile(const std::vector<cv::Point2d>& ring);

    IfcConfig config_;
    bool exteriorScan_;

    IfcHierarchyHelper<IfcSchema> file_;
    IfcSchema::IfcOwnerHistory* owner_ = nullptr;
    IfcSchema::IfcBuilding* building_ = nullptr;
    IfcSchema::IfcObjectPlacement* buildingPlacement_ = nullptr;
    IfcSchema::IfcGeometricRepresentationContext* context_ = nullptr;

    std::vector<IfcSchema::IfcBuildingStorey*> storeys_;
    std::vector<double> storeyElevations_;
    std::map<std::string, IfcSchema::IfcMaterial*> materials_;
    int slabCounter_ = 0;
};

} // namespace cloud2bim

#endif // IFCMODELBUILDER_H
