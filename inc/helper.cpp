#include "helper.h"
#include "stringManager.h"
#include "errorCollection.h"

#include <iostream>
#include <sstream>
#include <string>
#include <cmath>

#include <boost/algorithm/string.hpp>

#include <Bnd_Box.hxx>
#include <BRepBndLib.hxx>
#include <BRepBuilderAPI_MakeEdge.hxx>
#include <BRepBuilderAPI_MakeFace.hxx>
#include <BRepBuilderAPI_MakeWire.hxx>
#include <BRepGProp.hxx>
#include <GProp_GProps.hxx>
#include <STEPControl_Writer.hxx>
#include <STEPControl_StepModelType.hxx>

BoostPoint3D helperFunctions::Point3DOTB(const gp_Pnt& oP) {
	return BoostPoint3D(oP.X(), oP.Y(), oP.Z());
}

gp_Pnt helperFunctions::Point3DBTO(const BoostPoint3D& oP) {
	return gp_Pnt(bg::get<0>(oP), bg::get<1>(oP), bg::get<2>(oP));
}

double helperFunctions::roundTo(double value, int decimals)
{
	double factor = std::pow(10.0, decimals);
	double roundedValue = std::round(value * factor) / factor;
	if (roundedValue == 0) { return 0; } // no negative zero in the output
	return roundedValue;
}

bool helperFunctions::bBoxDiagonal(const std::vector<gp_Pnt>& pointList, gp_Pnt* lllPoint, gp_Pnt* urrPoint, const double buffer)
{
	if (pointList.empty()) { return false; }

	*lllPoint = pointList[0];
	*urrPoint = pointList[0];

	for (size_t i = 1; i < pointList.size(); i++)
	{
		const gp_Pnt& point = pointList[i];

		if (point.X() < lllPoint->X()) { lllPoint->SetX(point.X()); }
		if (point.Y() < lllPoint->Y()) { lllPoint->SetY(point.Y()); }
		if (point.Z() < lllPoint->Z()) { lllPoint->SetZ(point.Z()); }

		if (point.X() > urrPoint->X()) { urrPoint->SetX(point.X()); }
		if (point.Y() > urrPoint->Y()) { urrPoint->SetY(point.Y()); }
		if (point.Z() > urrPoint->Z()) { urrPoint->SetZ(point.Z()); }
	}
	if (lllPoint->IsEqual(*urrPoint, 1e-6)) { return false; }

	applyBuffer(lllPoint, urrPoint, buffer);
	return true;
}

BoostBox3D helperFunctions::createBBox(const TopoDS_Shape& shape, double buffer)
{
	Bnd_Box boundingBox;
	BRepBndLib::Add(shape, boundingBox);

	if (boundingBox.IsVoid()) { throw ErrorID::warningFailedObjectConversion; }

	Standard_Real minX, minY, minZ, maxX, maxY, maxZ;
	boundingBox.Get(minX, minY, minZ, maxX, maxY, maxZ);

	return BoostBox3D(
		BoostPoint3D(minX - buffer, minY - buffer, minZ - buffer),
		BoostPoint3D(maxX + buffer, maxY + buffer, maxZ + buffer)
	);
}

BoostBox3D helperFunctions::createBBox(const std::vector<gp_Pnt>& pointList, double buffer)
{
	gp_Pnt lll;
	gp_Pnt urr;

	if (pointList.empty()) { return {}; }
	bBoxDiagonal(pointList, &lll, &urr, 0);
	applyBuffer(&lll, &urr, buffer);
	return BoostBox3D(Point3DOTB(lll), Point3DOTB(urr));
}

BoostBox3D helperFunctions::createBBox(const gp_Pnt& p1, const gp_Pnt& p2, double buffer)
{
	// get proper order for the bbox
	gp_Pnt lll(
		std::min(p1.X(), p2.X()),
		std::min(p1.Y(), p2.Y()),
		std::min(p1.Z(), p2.Z())
	);

	gp_Pnt urr(
		std::max(p1.X(), p2.X()),
		std::max(p1.Y(), p2.Y()),
		std::max(p1.Z(), p2.Z())
	);

	applyBuffer(&lll, &urr, buffer);
	return BoostBox3D(Point3DOTB(lll), Point3DOTB(urr));
}

void helperFunctions::applyBuffer(gp_Pnt* lllPoint, gp_Pnt* urrPoint, double buffer)
{
	urrPoint->SetX(urrPoint->X() + buffer);
	urrPoint->SetY(urrPoint->Y() + buffer);
	urrPoint->SetZ(urrPoint->Z() + buffer);
	lllPoint->SetX(lllPoint->X() - buffer);
	lllPoint->SetY(lllPoint->Y() - buffer);
	lllPoint->SetZ(lllPoint->Z() - buffer);
	return;
}

BoostBox3D helperFunctions::expandBBox(const BoostBox3D& bbox, double buffer)
{
	return createBBox(Point3DBTO(bbox.min_corner()), Point3DBTO(bbox.max_corner()), buffer);
}

gp_Pnt helperFunctions::getBoxCenter(const BoostBox3D& bbox)
{
	gp_Pnt lll = Point3DBTO(bbox.min_corner());
	gp_Pnt urr = Point3DBTO(bbox.max_corner());
	return gp_Pnt(
		(lll.X() + urr.X()) / 2,
		(lll.Y() + urr.Y()) / 2,
		(lll.Z() + urr.Z()) / 2
	);
}

TopoDS_Face helperFunctions::createPlanarFace(const gp_Pnt& p0, const gp_Pnt& p1, const gp_Pnt& p2, const gp_Pnt& p3) {

	TopoDS_Edge edge0 = BRepBuilderAPI_MakeEdge(p0, p1);
	TopoDS_Edge edge1 = BRepBuilderAPI_MakeEdge(p1, p2);
	TopoDS_Edge edge2 = BRepBuilderAPI_MakeEdge(p2, p3);
	TopoDS_Edge edge3 = BRepBuilderAPI_MakeEdge(p3, p0);

	return BRepBuilderAPI_MakeFace(BRepBuilderAPI_MakeWire(edge0, edge1, edge2, edge3));
}

double helperFunctions::computeArea(const TopoDS_Face& theFace)
{
	GProp_GProps gprops;
	BRepGProp::SurfaceProperties(theFace, gprops);
	return gprops.Mass();
}

nlohmann::json helperFunctions::collectPropertyValues(IfcSchema::IfcPropertySet* propertySet)
{
	nlohmann::json attributeCollection = nlohmann::json::object();
	if (propertySet == nullptr) { return attributeCollection; }

	IfcSchema::IfcProperty::list::ptr propertyList = propertySet->HasProperties();
	for (auto propertyIt = propertyList->begin(); propertyIt != propertyList->end(); propertyIt++)
	{
		IfcSchema::IfcPropertySingleValue* propertyItem = (*propertyIt)->as<IfcSchema::IfcPropertySingleValue>();
		if (propertyItem == nullptr) { continue; }

		IfcSchema::IfcValue* ifcValue = propertyItem->NominalValue();
		if (ifcValue == nullptr) { continue; }

		std::string propertyIdName = ifcValue->data().type()->name();
		std::string propertyName = propertyItem->Name();

		if (propertyIdName == "IfcIdentifier")
		{
			attributeCollection[propertyName] = ifcValue->as<IfcSchema::IfcIdentifier>()->operator std::string();
		}
		else if (propertyIdName == "IfcText")
		{
			attributeCollection[propertyName] = ifcValue->as<IfcSchema::IfcText>()->operator std::string();
		}
		else if (propertyIdName == "IfcLabel")
		{
			attributeCollection[propertyName] = ifcValue->as<IfcSchema::IfcLabel>()->operator std::string();
		}
		else if (propertyIdName == "IfcLengthMeasure")
		{
			attributeCollection[propertyName] = ifcValue->as<IfcSchema::IfcLengthMeasure>()->operator double();
		}
		else if (propertyIdName == "IfcPositiveLengthMeasure")
		{
			attributeCollection[propertyName] = ifcValue->as<IfcSchema::IfcPositiveLengthMeasure>()->operator double();
		}
		else if (propertyIdName == "IfcAreaMeasure")
		{
			attributeCollection[propertyName] = ifcValue->as<IfcSchema::IfcAreaMeasure>()->operator double();
		}
		else if (propertyIdName == "IfcReal")
		{
			attributeCollection[propertyName] = ifcValue->as<IfcSchema::IfcReal>()->operator double();
		}
		else if (propertyIdName == "IfcThermalTransmittanceMeasure")
		{
			attributeCollection[propertyName] = ifcValue->as<IfcSchema::IfcThermalTransmittanceMeasure>()->operator double();
		}
		else if (propertyIdName == "IfcBoolean")
		{
			attributeCollection[propertyName] = ifcValue->as<IfcSchema::IfcBoolean>()->operator bool();
		}
		else
		{
			ErrorCollection::getInstance().addError(ErrorID::propertyNotImplemented, propertyIdName);
		}
	}
	return attributeCollection;
}

bool helperFunctions::hasGlassMaterial(IfcSchema::IfcProduct* ifcProduct)
{
	IfcSchema::IfcRelAssociates::list::ptr associations = ifcProduct->HasAssociations();
	for (IfcSchema::IfcRelAssociates::list::it it = associations->begin(); it != associations->end(); ++it)
	{
		IfcSchema::IfcRelAssociates* IfcRelAssociates = *it;
		if (IfcRelAssociates->data().type()->name() != "IfcRelAssociatesMaterial")
		{
			continue;
		}

		IfcSchema::IfcRelAssociatesMaterial* MaterialAss = IfcRelAssociates->as<IfcSchema::IfcRelAssociatesMaterial>();
		IfcSchema::IfcMaterialSelect* relMaterial = MaterialAss->RelatingMaterial();
		if (relMaterial->data().type()->name() != "IfcMaterial")
		{
			continue;
		}

		IfcSchema::IfcMaterial* ifcMaterial = relMaterial->as<IfcSchema::IfcMaterial>();
		if (containsKeyword(ifcMaterial->Name(), "GLASS") || containsKeyword(ifcMaterial->Name(), "GLAZED"))
		{
			return true;
		}
	}
	return false;
}

std::vector<MaterialLayer> helperFunctions::getMaterialLayers(IfcSchema::IfcProduct* ifcProduct)
{
	std::vector<MaterialLayer> layerList;

	IfcSchema::IfcRelAssociates::list::ptr associations = ifcProduct->HasAssociations();
	for (IfcSchema::IfcRelAssociates::list::it it = associations->begin(); it != associations->end(); ++it)
	{
		IfcSchema::IfcRelAssociates* IfcRelAssociates = *it;
		if (IfcRelAssociates->data().type()->name() != "IfcRelAssociatesMaterial")
		{
			continue;
		}

		IfcSchema::IfcMaterialSelect* relMaterial = IfcRelAssociates->as<IfcSchema::IfcRelAssociatesMaterial>()->RelatingMaterial();
		std::string materialType = relMaterial->data().type()->name();

		// layers can be stored with or without usage
		IfcSchema::IfcMaterialLayerSet* layerSet = nullptr;
		if (materialType == "IfcMaterialLayerSetUsage")
		{
			layerSet = relMaterial->as<IfcSchema::IfcMaterialLayerSetUsage>()->ForLayerSet();
		}
		else if (materialType == "IfcMaterialLayerSet")
		{
			layerSet = relMaterial->as<IfcSchema::IfcMaterialLayerSet>();
		}
		if (layerSet == nullptr) { continue; }

		IfcSchema::IfcMaterialLayer::list::ptr materialLayerList = layerSet->MaterialLayers();
		for (auto layerIt = materialLayerList->begin(); layerIt != materialLayerList->end(); ++layerIt)
		{
			IfcSchema::IfcMaterialLayer* materialLayer = *layerIt;

			MaterialLayer layer;
			if (materialLayer->Material() != nullptr) { layer.name_ = materialLayer->Material()->Name(); }
			layer.thickness_ = materialLayer->LayerThickness();
			layerList.emplace_back(layer);
		}
		return layerList;
	}
	return layerList;
}

std::vector<double> helperFunctions::getDirectionRatios(IfcSchema::IfcDirection* direction)
{
	if (direction == nullptr) { return {}; }
	return direction->DirectionRatios();
}

bool helperFunctions::containsKeyword(const std::string& string, const std::string& keyword)
{
	return boost::to_upper_copy(string).find(boost::to_upper_copy(keyword)) != std::string::npos;
}

void helperFunctions::writeToSTEP(const std::vector<TopoDS_Face>& theFaceList, const std::string& targetPath)
{
	// the writer is very talkative
	std::stringstream buffer;
	std::streambuf* originalBuffer = std::cout.rdbuf(buffer.rdbuf());

	STEPControl_Writer writer;
	for (const TopoDS_Face& face : theFaceList) { writer.Transfer(face, STEPControl_AsIs); }
	IFSelect_ReturnStatus stat = writer.Write(targetPath.c_str());

	std::cout.rdbuf(originalBuffer);

	if (stat != IFSelect_RetDone) { throw ErrorID::errorUnableToWriteFile; }
	return;
}
