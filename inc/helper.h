#define USE_IFC2x3

#ifdef USE_IFC2x3
#define IfcSchema Ifc2x3
#define buildVersion "IFC2X3"
#define SCHEMA_VERSIONS (2x3)
#define SCHEMA_SEQ (2x3)

#elif defined(USE_IFC4)
#define IfcSchema Ifc4
#define buildVersion "IFC4"
#define SCHEMA_VERSIONS (4)
#define SCHEMA_SEQ (4)

#elif defined(USE_IFC4x3)
#define IfcSchema Ifc4x3
#define buildVersion "IFC4X3"
#define SCHEMA_VERSIONS (4x3)
#define SCHEMA_SEQ (4x3)

#else
#error "No IFC version defined"
#endif // USE_IFC

#include "roomData.h"

// IfcOpenShell includes
#include <ifcparse/IfcFile.h>
#include <ifcgeom_schema_agnostic/Kernel.h>
#include <ifcparse/IfcHierarchyHelper.h>

// OpenCascade includes
#include <gp_Pnt.hxx>
#include <gp_Vec.hxx>
#include <TopoDS.hxx>
#include <TopoDS_Face.hxx>
#include <TopoDS_Shape.hxx>

#include <boost/geometry.hpp>
#include <boost/geometry/index/rtree.hpp>

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

typedef bg::model::point<double, 3, bg::cs::cartesian> BoostPoint3D;
typedef bg::model::box<BoostPoint3D> BoostBox3D;
typedef std::pair<bg::model::box<BoostPoint3D>, int> Value;

#ifndef HELPER_HELPER_H
#define HELPER_HELPER_H

// helper functions that can be utilised everywhere
struct helperFunctions{

	/// point managing functions

	/// Convert OpenCascade point to Boost point
	static BoostPoint3D Point3DOTB(const gp_Pnt& oP);
	/// Conver Boost point to OpenCascade point
	static gp_Pnt Point3DBTO(const BoostPoint3D& oP);
	/// round a value to a set amount of decimals
	static double roundTo(double value, int decimals);

	/// bounding box creating code

	/// get the lllpoint and urr point of list of points, returns false if the list is empty or the points coincide
	static bool bBoxDiagonal(const std::vector<gp_Pnt>& pointList, gp_Pnt* lllPoint, gp_Pnt* urrPoint, const double buffer = 0);
	/// construct a bbox from a shape, throws ErrorID::warningFailedObjectConversion if the shape is empty
	static BoostBox3D createBBox(const TopoDS_Shape& shape, double buffer = 0.05);
	/// construct a bbox from a list of points
	static BoostBox3D createBBox(const std::vector<gp_Pnt>& pointList, double buffer = 0.05);
	/// construct a bbox from the urr and lll points
	static BoostBox3D createBBox(const gp_Pnt& p1, const gp_Pnt& p2, double buffer = 0.05);
	/// applies the buffer values to the lll and urr point
	static void applyBuffer(gp_Pnt* lllPoint, gp_Pnt* urrPoint, double buffer = 0.0);
	/// grows the box by the buffer in every direction
	static BoostBox3D expandBBox(const BoostBox3D& bbox, double buffer);
	/// returns the center of a bbox
	static gp_Pnt getBoxCenter(const BoostBox3D& bbox);

	// face creation code

	/// creates a planar face by connecting the 4 points, make sure the 4 points are on a single plane
	static TopoDS_Face createPlanarFace(const gp_Pnt& p0, const gp_Pnt& p1, const gp_Pnt& p2, const gp_Pnt& p3);
	/// compute the area of a face
	static double computeArea(const TopoDS_Face& theFace);

	/// IFC related code

	/// collects the single value properties of a property set as {name : value}
	static nlohmann::json collectPropertyValues(IfcSchema::IfcPropertySet* propertySet);
	/// evaluates if product has glass material related to it
	static bool hasGlassMaterial(IfcSchema::IfcProduct* ifcProduct);
	/// collects the material layers that are associated with the product, thickness is unscaled
	static std::vector<MaterialLayer> getMaterialLayers(IfcSchema::IfcProduct* ifcProduct);
	/// returns the direction ratios of a direction, empty if no direction is supplied
	static std::vector<double> getDirectionRatios(IfcSchema::IfcDirection* direction);
	/// checks if the keyword is present in the string, case insensitive
	static bool containsKeyword(const std::string& string, const std::string& keyword);

	/// write to file code

	/// write list of faces to step, throws ErrorID::errorUnableToWriteFile if the writer fails
	static void writeToSTEP(const std::vector<TopoDS_Face>& theFaceList, const std::string& targetPath);
};

#endif // HELPER_HELPER_H
