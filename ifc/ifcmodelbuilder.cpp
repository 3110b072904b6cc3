#include "ifcmodelbuilder.hpp"
#include "../errors.hpp"
#include "../utils.hpp"

#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace cloud2bim {

namespace {

constexpr double kOpeningMargin = 0.01;   // opening solid sticks out of both wall faces

// decimal degrees -> (degrees, minutes, seconds, millionths of a second)
std::vector<int> toCompoundAngle(double decimal)
{
    const int sign = decimal < 0 ? -1 : 1;
    double v = std::abs(decimal);
    const int deg = static_cast<int>(v);
    v = (v - deg) * 60.0;
    const int min = static_cast<int>(v);
    v = (v - min) * 60.0;
    const int sec = static_cast<int>(v);
    const int micro = std::min(999999, static_cast<int>(std::round((v - sec) * 1e6)));
    return {sign * deg, sign * min, sign * sec, sign * micro};
}

std::string twoDigits(int n)
{
    std::ostringstream os;
    os << std::setw(2) << std::setfill('0') << n;
    return os.str();
}

IfcSchema::IfcCartesianPoint* point2(double x, double y)
{
    return new IfcSchema::IfcCartesianPoint(std::vector<double>{x, y});
}

} // namespace

IfcModelBuilder::IfcModelBuilder(const IfcConfig& config, bool exteriorScan)
    : config_(config)
    , exteriorScan_(exteriorScan)
{
    createRoot();
}

/* ---------- project tree ---------------------------------------------------- */
void IfcModelBuilder::createRoot()
{
    owner_ = file_.addOwnerHistory();
    owner_->OwningApplication()->setApplicationFullName(std::string("Cloud2BIM"));
    owner_->OwningApplication()->setApplicationIdentifier(std::string("cloud2bim"));
    owner_->OwningApplication()->setVersion(config_.version);
    owner_->OwningUser()->ThePerson()->setGivenName(config_.authorName);
    owner_->OwningUser()->ThePerson()->setFamilyName(config_.authorSurname);
    owner_->OwningUser()->TheOrganization()->setName(config_.organization);

    file_.header().file_name().author(std::vector<std::string>{config_.authorName + " " + config_.authorSurname});
    file_.header().file_name().organization(std::vector<std::string>{config_.organization});
    file_.header().file_name().originating_system("Cloud2BIM " + config_.version);

    // metre and radian, the helper's addProject would use millimetres
    IfcSchema::IfcUnit::list::ptr units(new IfcSchema::IfcUnit::list);
    auto* length = new IfcSchema::IfcSIUnit(IfcSchema::IfcUnitEnum::IfcUnit_LENGTHUNIT, boost::none,
                                            IfcSchema::IfcSIUnitName::IfcSIUnitName_METRE);
    auto* angle = new IfcSchema::IfcSIUnit(IfcSchema::IfcUnitEnum::IfcUnit_PLANEANGLEUNIT, boost::none,
                                           IfcSchema::IfcSIUnitName::IfcSIUnitName_RADIAN);
    auto* area = new IfcSchema::IfcSIUnit(IfcSchema::IfcUnitEnum::IfcUnit_AREAUNIT, boost::none,
                                          IfcSchema::IfcSIUnitName::IfcSIUnitName_SQUARE_METRE);
    auto* volume = new IfcSchema::IfcSIUnit(IfcSchema::IfcUnitEnum::IfcUnit_VOLUMEUNIT, boost::none,
                                            IfcSchema::IfcSIUnitName::IfcSIUnitName_CUBIC_METRE);
    units->push(length);
    units->push(angle);
    units->push(area);
    units->push(volume);
    auto* assignment = new IfcSchema::IfcUnitAssignment(units);

    IfcSchema::IfcRepresentationContext::list::ptr contexts(new IfcSchema::IfcRepresentationContext::list);
    auto* project = new IfcSchema::IfcProject(IfcParse::IfcGlobalId(), owner_, config_.projectName,
                                              boost::none, boost::none, config_.projectLongName,
                                              config_.buildingPhase, contexts, assignment);
    file_.addEntity(length);
    file_.addEntity(angle);
    file_.addEntity(area);
    file_.addEntity(volume);
    file_.addEntity(assignment);
    file_.addEntity(project);

    context_ = file_.getRepresentationContext("Model");

    auto* site = file_.addSite(project, owner_);
    site->setName(std::string("Site"));
    site->setRefLatitude(toCompoundAngle(config_.siteLatitude));
    site->setRefLongitude(toCompoundAngle(config_.siteLongitude));
    site->setRefElevation(config_.siteElevation);

    building_ = file_.addBuilding(site, owner_);
    building_->setName(config_.buildingName);
    if (!config_.buildingType.empty())
        building_->setObjectType(config_.buildingType);
    buildingPlacement_ = building_->ObjectPlacement();
}

/* ---------- geometry helpers ------------------------------------------------ */
IfcSchema::IfcProfileDef* IfcModelBuilder::rectangle(double cx, double cy, double xDim, double yDim)
{
    auto* position = new IfcSchema::IfcAxis2Placement2D(
        point2(cx, cy), new IfcSchema::IfcDirection(std::vector<double>{1.0, 0.0}));
    return new IfcSchema::IfcRectangleProfileDef(IfcSchema::IfcProfileTypeEnum::IfcProfileType_AREA,
                                                 boost::none, position, xDim, yDim);
}

IfcSchema::IfcProfileDef* IfcModelBuilder::polygonProfile(const std::vector<cv::Point2d>& ring)
{
    IfcSchema::IfcCartesianPoint::list::ptr points(new IfcSchema::IfcCartesianPoint::list);
    for (const auto& p : ring)
        points->push(point2(p.x, p.y));
    points->push(point2(ring.front().x, ring.front().y));
    return new IfcSchema::IfcArbitraryClosedProfileDef(IfcSchema::IfcProfileTypeEnum::IfcProfileType_AREA,
                                                       boost::none, new IfcSchema::IfcPolyline(points));
}

IfcSchema::IfcShapeRepresentation* IfcModelBuilder::body(IfcSchema::IfcProfileDef* profile, double depth,
                                                         IfcSchema::IfcRepresentationItem** solidOut)
{
    auto* position = new IfcSchema::IfcAxis2Placement3D(
        new IfcSchema::IfcCartesianPoint(std::vector<double>{0.0, 0.0, 0.0}), nullptr, nullptr);
    auto* solid = new IfcSchema::IfcExtrudedAreaSolid(
        profile, position, new IfcSchema::IfcDirection(std::vector<double>{0.0, 0.0, 1.0}), depth);
    if (solidOut)
        *solidOut = solid;

    IfcSchema::IfcRepresentationItem::list::ptr items(new IfcSchema::IfcRepresentationItem::list);
    items->push(solid);
    return new IfcSchema::IfcShapeRepresentation(context_, std::string("Body"),
                                                 std::string("SweptSolid"), items);
}

IfcSchema::IfcProductDefinitionShape* IfcModelBuilder::extrusion(IfcSchema::IfcProfileDef* profile, double depth,
                                                                 IfcSchema::IfcRepresentationItem** solidOut)
{
    IfcSchema::IfcRepresentation::list::ptr reps(new IfcSchema::IfcRepresentation::list);
    reps->push(body(profile, depth, solidOut));
    return new IfcSchema::IfcProductDefinitionShape(boost::none, boost::none, reps);
}

/* ---------- materials and styles -------------------------------------------- */
IfcSchema::IfcMaterial* IfcModelBuilder::material(const std::string& name)
{
    auto it = materials_.find(name);
    if (it != materials_.end())
        return it->second;
    auto* m = new IfcSchema::IfcMaterial(name, boost::none, boost::none);
    file_.addEntity(m);
    materials_.emplace(name, m);
    return m;
}

void IfcModelBuilder::associateMaterial(IfcSchema::IfcObjectDefinition* element,
                                        IfcSchema::IfcMaterialSelect* mat,
                                        const std::string& name)
{
    IfcSchema::IfcDefinitionSelect::list::ptr objects(new IfcSchema::IfcDefinitionSelect::list);
    objects->push(element);
    file_.addEntity(new IfcSchema::IfcRelAssociatesMaterial(IfcParse::IfcGlobalId(), owner_, name,
                                                            boost::none, objects, mat));
}

void IfcModelBuilder::applyColour(IfcSchema::IfcRepresentationItem* item, const ColourRgb& rgb,
                                  double transparency, const std::string& name)
{
    auto* colour = new IfcSchema::IfcColourRgb(boost::none, rgb[0], rgb[1], rgb[2]);
    auto* shading = new IfcSchema::IfcSurfaceStyleShading(colour, transparency);
    IfcSchema::IfcSurfaceStyleElementSelect::list::ptr elements(new IfcSchema::IfcSurfaceStyleElementSelect::list);
    elements->push(shading);
    auto* style = new IfcSchema::IfcSurfaceStyle(name, IfcSchema::IfcSurfaceSide::IfcSurfaceSide_BOTH, elements);
    IfcSchema::IfcStyleAssignmentSelect::list::ptr styles(new IfcSchema::IfcStyleAssignmentSelect::list);
    styles->push(style);
    file_.addEntity(new IfcSchema::IfcStyledItem(item, styles, boost::none));
}

/* ---------- storeys and slabs ----------------------------------------------- */
void IfcModelBuilder::addStorey(const Slab& slab, bool roof)
{
    const double elevation = slab.topZ();
    std::ostringstream name;
    name << "Floor " << std::fixed << std::setprecision(2) << elevation << "m";

    auto* storey = file_.addBuildingStorey(building_, owner_);
    storey->setName(name.str());
    storey->setElevation(elevation);
    auto* placement = file_.addLocalPlacement(buildingPlacement_, 0, 0, elevation);
    storey->setObjectPlacement(placement);
    storeys_.push_back(storey);
    storeyElevations_.push_back(elevation);

    const std::string slabName = "Slab " + std::to_string(++slabCounter_);
    const auto ring = removeDuplicateVertices(slab.footprint);
    if (ring.size() < 3 || std::abs(polygonSignedArea(ring)) <= 0.0)
        throw GeometryError(slabName + " has a degenerate footprint, no slab solid");

    auto* slabPlacement = file_.addLocalPlacement(placement, 0, 0, -slab.thickness);
    auto* ifcSlab = new IfcSchema::IfcSlab(
        IfcParse::IfcGlobalId(), owner_, slabName, boost::none, boost::none, slabPlacement,
        extrusion(polygonProfile(ring), slab.thickness), boost::none,
        roof ? IfcSchema::IfcSlabTypeEnum::IfcSlabType_ROOF : IfcSchema::IfcSlabTypeEnum::IfcSlabType_FLOOR);
    file_.addBuildingProduct(ifcSlab, storey, owner_);
    associateMaterial(ifcSlab, material(roof ? config_.materialForRoofs : config_.materialForFloors),
                      slabName + " material");
}

void IfcModelBuilder::addSpaces(size_t storey, const StoreyZones& zones)
{
    auto* storeyPlacement = storeys_[storey]->ObjectPlacement();
    for (const auto& kv : zones) {
        const auto ring = removeDuplicateVertices(kv.second.polygon);
        if (ring.size() < 3) {
            std::cerr << "[warn] " << kv.first << " has fewer than three vertices, no space" << std::endl;
            continue;
        }
        auto* space = new IfcSchema::IfcSpace(
            IfcParse::IfcGlobalId(), owner_, kv.first, boost::none, boost::none,
            file_.addLocalPlacement(storeyPlacement),
            extrusion(polygonProfile(ring), kv.second.height), kv.first,
            IfcSchema::IfcElementCompositionEnum::IfcElementComposition_ELEMENT,
            IfcSchema::IfcSpaceTypeEnum::IfcSpaceType_SPACE, boost::none);
        file_.addEntity(space);
        file_.addRelatedObject<IfcSchema::IfcRelAggregates>(storeys_[storey], space, owner_);
    }
}

/* ---------- walls ----------------------------------------------------------- */
void IfcModelBuilder::addWall(const Wall& wall, const std::vector<const Opening*>& openings)
{
    const std::string name = "Wall " + std::to_string(wall.id);
    const double length = wall.length();
    if (length <= 1e-9)
        throw GeometryError(name + " starts where it ends");
    if (wall.storey < 0 || static_cast<size_t>(wall.storey) >= storeys_.size())
        throw GeometryError(name + " refers to missing storey " + std::to_string(wall.storey));

    auto* storey = storeys_[wall.storey];
    const cv::Point2d dir = (wall.end - wall.start) * (1.0 / length);
    auto* placement = file_.addLocalPlacement(storey->ObjectPlacement(),
                                              wall.start.x, wall.start.y,
                                              wall.baseZ - storeyElevations_[wall.storey],
                                              0, 0, 1, dir.x, dir.y, 0);

    IfcSchema::IfcCartesianPoint::list::ptr axisPoints(new IfcSchema::IfcCartesianPoint::list);
    axisPoints->push(point2(0.0, 0.0));
    axisPoints->push(point2(length, 0.0));
    IfcSchema::IfcRepresentationItem::list::ptr axisItems(new IfcSchema::IfcRepresentationItem::list);
    axisItems->push(new IfcSchema::IfcPolyline(axisPoints));

    IfcSchema::IfcRepresentation::list::ptr reps(new IfcSchema::IfcRepresentation::list);
    reps->push(new IfcSchema::IfcShapeRepresentation(context_, std::string("Axis"),
                                                     std::string("Curve2D"), axisItems));
    reps->push(body(rectangle(0.5 * length, 0.0, length, wall.thickness), wall.height));

    auto* ifcWall = new IfcSchema::IfcWall(
        IfcParse::IfcGlobalId(), owner_, name, boost::none, boost::none, placement,
        new IfcSchema::IfcProductDefinitionShape(boost::none, boost::none, reps), boost::none,
        IfcSchema::IfcWallTypeEnum::IfcWallType_STANDARD);
    file_.addBuildingProduct(ifcWall, storey, owner_);

    IfcSchema::IfcMaterialLayer::list::ptr layers(new IfcSchema::IfcMaterialLayer::list);
    layers->push(new IfcSchema::IfcMaterialLayer(material(wall.material), wall.thickness, boost::none,
                                                 boost::none, boost::none, boost::none, boost::none));
    auto* layerSet = new IfcSchema::IfcMaterialLayerSet(layers, name, boost::none);
    auto* usage = new IfcSchema::IfcMaterialLayerSetUsage(
        layerSet, IfcSchema::IfcLayerSetDirectionEnum::IfcLayerSetDirection_AXIS2,
        IfcSchema::IfcDirectionSenseEnum::IfcDirectionSense_POSITIVE, -0.5 * wall.thickness, boost::none);
    associateMaterial(ifcWall, usage, name + " material");

    auto* wallType = new IfcSchema::IfcWallType(
        IfcParse::IfcGlobalId(), owner_, name + " type", boost::none, boost::none, boost::none,
        boost::none, boost::none, boost::none, IfcSchema::IfcWallTypeEnum::IfcWallType_STANDARD);
    IfcSchema::IfcObject::list::ptr typed(new IfcSchema::IfcObject::list);
    typed->push(ifcWall);
    file_.addEntity(new IfcSchema::IfcRelDefinesByType(IfcParse::IfcGlobalId(), owner_, boost::none,
                                                       boost::none, typed, wallType));

    IfcSchema::IfcProperty::list::ptr props(new IfcSchema::IfcProperty::list);
    props->push(new IfcSchema::IfcPropertySingleValue(
        std::string("IsExternal"), boost::none,
        new IfcSchema::IfcBoolean(wall.label == WallLabel::Exterior), nullptr));
    auto* pset = new IfcSchema::IfcPropertySet(IfcParse::IfcGlobalId(), owner_,
                                               std::string("Pset_WallCommon"), boost::none, props);
    IfcSchema::IfcObjectDefinition::list::ptr described(new IfcSchema::IfcObjectDefinition::list);
    described->push(ifcWall);
    file_.addEntity(new IfcSchema::IfcRelDefinesByProperties(IfcParse::IfcGlobalId(), owner_, boost::none,
                                                             boost::none, described, pset));

    int windows = 0, doors = 0;
    for (const Opening* o : openings) {
        const std::string tag = o->type == OpeningType::Window ? "W" + twoDigits(++windows)
                                                               : "D" + twoDigits(++doors);
        addOpening(wall, ifcWall, placement, *o, tag);
    }
}

void IfcModelBuilder::addOpening(const Wall& wall, IfcSchema::IfcWall* ifcWall,
                                 IfcSchema::IfcObjectPlacement* wallPlacement,
                                 const Opening& o, const std::string& tag)
{
    const double width = o.width();
    const double height = o.height();
    const std::string wallName = "Wall " + std::to_string(wall.id);
    auto* storey = storeys_[wall.storey];

    auto* placement = file_.addLocalPlacement(wallPlacement, o.xMin, 0, o.zMin);
    auto* opening = new IfcSchema::IfcOpeningElement(
        IfcParse::IfcGlobalId(), owner_, "Opening " + tag, wallName, boost::none, placement,
        extrusion(rectangle(0.5 * width, 0.0, width, wall.thickness + 2.0 * kOpeningMargin), height),
        boost::none, IfcSchema::IfcOpeningElementTypeEnum::IfcOpeningElementType_OPENING);
    file_.addEntity(opening);
    file_.addEntity(new IfcSchema::IfcRelVoidsElement(IfcParse::IfcGlobalId(), owner_, boost::none,
                                                      boost::none, ifcWall, opening));

    IfcSchema::IfcRepresentationItem* solid = nullptr;
    IfcSchema::IfcElement* filling = nullptr;
    if (o.type == OpeningType::Window) {
        auto* shape = extrusion(rectangle(0.5 * width, 0.0, width, config_.windowPaneThickness), height, &solid);
        auto* window = new IfcSchema::IfcWindow(
            IfcParse::IfcGlobalId(), owner_, tag, wallName, boost::none, file_.addLocalPlacement(placement),
            shape, tag, height, width, IfcSchema::IfcWindowTypeEnum::IfcWindowType_WINDOW,
            IfcSchema::IfcWindowTypePartitioningEnum::IfcWindowTypePartitioning_SINGLE_PANEL, boost::none);
        file_.addBuildingProduct(window, storey, owner_);

        auto* windowType = new IfcSchema::IfcWindowType(
            IfcParse::IfcGlobalId(), owner_, tag + " type", boost::none, boost::none, boost::none,
            boost::none, boost::none, boost::none, IfcSchema::IfcWindowTypeEnum::IfcWindowType_WINDOW,
            IfcSchema::IfcWindowTypePartitioningEnum::IfcWindowTypePartitioning_SINGLE_PANEL,
            false, boost::none);
        IfcSchema::IfcObject::list::ptr typed(new IfcSchema::IfcObject::list);
        typed->push(window);
        file_.addEntity(new IfcSchema::IfcRelDefinesByType(IfcParse::IfcGlobalId(), owner_, boost::none,
                                                           boost::none, typed, windowType));

        associateMaterial(window, material(config_.materialForWindows), tag + " material");
        applyColour(solid, config_.windowColour, config_.windowTransparency, config_.materialForWindows);
        filling = window;
    } else {
        auto* shape = extrusion(rectangle(0.5 * width, 0.0, width, config_.doorLeafThickness), height, &solid);
        auto* door = new IfcSchema::IfcDoor(
            IfcParse::IfcGlobalId(), owner_, tag, wallName, boost::none, file_.addLocalPlacement(placement),
            shape, tag, height, width, IfcSchema::IfcDoorTypeEnum::IfcDoorType_DOOR,
            IfcSchema::IfcDoorTypeOperationEnum::IfcDoorTypeOperation_SINGLE_SWING_LEFT, boost::none);
        file_.addBuildingProduct(door, storey, owner_);

        associateMaterial(door, material(config_.materialForDoors), tag + " material");
        applyColour(solid, config_.doorColour, 0.0, config_.materialForDoors);
        filling = door;
    }

    file_.addEntity(new IfcSchema::IfcRelFillsElement(IfcParse::IfcGlobalId(), owner_, boost::none,
                                                      boost::none, opening, filling));
}

/* ---------- whole model ----------------------------------------------------- */
void IfcModelBuilder::build(const DetectionResult& result)
{
    const size_t nSlabs = result.slabs.size();
    for (size_t i = 0; i < nSlabs; ++i) {
        const bool roof = exteriorScan_ && nSlabs > 1 && i + 1 == nSlabs;
        try {
            addStorey(result.slabs[i], roof);
        } catch (const GeometryError& e) {
            std::cerr << "[warn] " << e.what() << std::endl;
        }
    }

    // the topmost slab has no storey above it
    for (size_t i = 0; i < result.zones.size() && i + 1 < nSlabs; ++i)
        addSpaces(i, result.zones[i]);

    for (const auto& wall : result.walls) {
        std::vector<const Opening*> openings;
        for (const auto& o : result.openings)
            if (o.wallId == wall.id)
                openings.push_back(&o);
        try {
            addWall(wall, openings);
        } catch (const GeometryError& e) {
            std::cerr << "[warn] " << e.what() << ", skipped" << std::endl;
        }
    }

    std::cout << "IFC model: " << storeys_.size() << " storeys, " << result.walls.size()
              << " walls, " << result.openings.size() << " openings" << std::endl;
}

void IfcModelBuilder::write(const std::string& path)
{
    std::ofstream out(path);
    if (!out)
        throw IoError("Cannot open IFC file for writing: " + path);
    out << file_;
    out.flush();
    if (!out)
        throw IoError("Failed writing IFC file: " + path);
    std::cout << "Saved IFC model to: " << path << std::endl;
}

} // namespace cloud2bim
