#include "DataManager.h"
#include "helper.h"
#include "stringManager.h"
#include "errorCollection.h"

#include <boost/make_shared.hpp>
#include <boost/optional.hpp>

#include <gp_Dir.hxx>
#include <gp_Lin.hxx>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>

double fileKernelCollection::getSiPrefixValue(const IfcSchema::IfcSIUnit& unitItem) {
	boost::optional<IfcSchema::IfcSIPrefix::Value> prefixOption = unitItem.Prefix();
	if (!prefixOption) { return 1; }

	switch (*prefixOption) {
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_EXA:   return 1e18;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_PETA:  return 1e15;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_TERA:  return 1e12;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_GIGA:  return 1e9;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_MEGA:  return 1e6;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_KILO:  return 1e3;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_HECTO: return 1e2;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_DECA:  return 10;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_DECI:  return 1e-1;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_CENTI: return 1e-2;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_MILLI: return 1e-3;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_MICRO: return 1e-6;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_NANO:  return 1e-9;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_PICO:  return 1e-12;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_FEMTO: return 1e-15;
	case IfcSchema::IfcSIPrefix::IfcSIPrefix_ATTO:	return 1e-18;
	default: return 0;
	}
}

double fileKernelCollection::getSiScaleValue(const IfcSchema::IfcSIUnit& unitItem) {

	double prefixValue = getSiPrefixValue(unitItem);
	if (!prefixValue) { return 0; }

	IfcSchema::IfcSIUnitName::Value unitType = unitItem.Name();
	if (unitType == IfcSchema::IfcSIUnitName::IfcSIUnitName_METRE)
	{
		return prefixValue;
	}
	return 0;
}

fileKernelCollection::fileKernelCollection(const std::string& filePath)
{
	file_ = new IfcParse::IfcFile(filePath);
	if (!file_->good()) { return; }
	kernel_ = std::make_unique<IfcGeom::Kernel>(file_);
	IfcGeom::Kernel* kernelObject = kernel_.get();
	kernelObject->setValue(kernelObject->GV_PRECISION, SettingsCollection::getInstance().spatialTolerance());
	setUnits();
}

void fileKernelCollection::setUnits()
{
	double length = 0;

	IfcSchema::IfcUnitAssignment::list::ptr assignedUnitListObjects = file_->instances_by_type<IfcSchema::IfcUnitAssignment>();
	if (assignedUnitListObjects.get()->size() == 0) {
		ErrorCollection::getInstance().addError(ErrorID::errorNoUnits);
		std::cout << errorWarningStringEnum::getString(ErrorID::errorNoUnits) << std::endl;
		return;
	}
	else if (assignedUnitListObjects.get()->size() > 1)
	{
		ErrorCollection::getInstance().addError(ErrorID::errorMultipleUnits);
		std::cout << errorWarningStringEnum::getString(ErrorID::errorMultipleUnits) << std::endl;
		return;
	}

	IfcSchema::IfcUnitAssignment* assignedUnitListObject = *assignedUnitListObjects->begin();
	IfcSchema::IfcUnit::list::ptr assignedUnitList = assignedUnitListObject->Units();

	for (IfcSchema::IfcUnit::list::it unitIterator = assignedUnitList->begin(); unitIterator != assignedUnitList->end(); ++unitIterator)
	{
		IfcSchema::IfcUnit* currentUnit = *unitIterator;
		if (currentUnit->declaration().name() != "IfcSIUnit") { continue; }

		IfcSchema::IfcSIUnit* currentSiUnit = currentUnit->as<IfcSchema::IfcSIUnit>();
		if (currentSiUnit->UnitType() == IfcSchema::IfcUnitEnum::IfcUnit_LENGTHUNIT)
		{
			length = getSiScaleValue(*currentSiUnit);
		}
	}

	//internalize the data
	if (!length)
	{
		ErrorCollection::getInstance().addError(ErrorID::errorNoLengthUnit);
		std::cout << errorWarningStringEnum::getString(ErrorID::errorNoLengthUnit) << std::endl;
		return;
	}

	length_ = length;

	// print found data to user
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoFoundUnits) << std::endl;
	std::cout << "\tLength multiplier = " << length_ << std::endl << std::endl;
	return;
}


DataManager::DataManager(const std::vector<std::string>& pathList) {
	for (const std::string& path : pathList)
	{
		std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoParsingFile) << path << std::endl;
		if (!findSchema(path)) {
			continue;
		}

		// make new collection
		std::unique_ptr<fileKernelCollection> dataCollection = std::make_unique<fileKernelCollection>(path);

		if (!dataCollection.get()->isGood())
		{
			std::cout << errorWarningStringEnum::getString(ErrorID::warningIfcUnableToParse) << path << std::endl;
			ErrorCollection::getInstance().addError(ErrorID::warningIfcUnableToParse, path);
			continue;
		}

		std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentValidIFCFound) << std::endl;
		std::cout << std::endl;

		datacollection_.emplace_back(std::move(dataCollection));
		dataCollectionSize_++;
		isPopulated_ = true;
	}
	return;
}

bool DataManager::findSchema(const std::string& path, bool quiet) {
	std::ifstream infile(path);
	std::string line;
	int linecount = 0;
	const std::unordered_set<std::string>& ifcVersionList = SettingsCollection::getInstance().getSupportedIfcVersionList();

	while (linecount < 100 && std::getline(infile, line))
	{
		if (!line.empty() && line[0] == '#')
		{
			break;
		}
		if (line.find("FILE_SCHEMA") == std::string::npos)
		{
			linecount++;
			continue;
		}

		for (const std::string& ifcVersion : ifcVersionList)
		{
			if (line.find(ifcVersion) == std::string::npos) {
				continue;
			}
			// IFC4 is contained in IFC4X3
			if (ifcVersion == "IFC4" && line.find("IFC4X3") != std::string::npos) { continue; }

			if (buildVersion != ifcVersion)
			{
				if (!quiet)
				{
					std::cout << errorWarningStringEnum::getString(ErrorID::warningIfcIncomp) + ifcVersion << std::endl;
					ErrorCollection::getInstance().addError(ErrorID::warningIfcIncomp, path);
				}
				return false;
			}
			if (!quiet)
			{
				std::cout << CommunicationStringEnum::getString(CommunicationStringID::indentcompIFCFound) + ifcVersion << std::endl;
			}
			return true;
		}
	}
	if (!quiet)
	{
		std::cout << errorWarningStringEnum::getString(ErrorID::warningIfcNoSchema) << path << std::endl;
		ErrorCollection::getInstance().addError(ErrorID::warningIfcNoSchema, path);
	}
	return false;
}

template<typename IfcType>
void DataManager::timedAddObjectListToIndex(const std::string& typeName)
{
	std::cout << "\t" + typeName + " objects ";
	auto startTime = std::chrono::high_resolution_clock::now();
	for (int i = 0; i < dataCollectionSize_; i++)
	{
		typename IfcType::list::ptr objectList = datacollection_[i]->getFilePtr()->instances_by_type<IfcType>();
		for (auto it = objectList->begin(); it != objectList->end(); ++it)
		{
			addObjectToIndex(*it, i);
		}
	}

	std::cout << "finished in: " <<
		std::chrono::duration_cast<std::chrono::seconds>(std::chrono::high_resolution_clock::now() - startTime).count() <<
		UnitStringEnum::getString(UnitStringID::seconds) << std::endl;
}

void DataManager::timedAddObjectListToIndex(const std::string& typeName)
{
	std::cout << "\t" + typeName + " objects ";
	auto startTime = std::chrono::high_resolution_clock::now();
	for (int i = 0; i < dataCollectionSize_; i++)
	{
		aggregate_of_instance::ptr productList;
		try
		{
			productList = datacollection_[i]->getFilePtr()->instances_by_type(typeName);
		}
		catch (const IfcParse::IfcException&)
		{
			// type is not part of the schema of the file
			ErrorCollection::getInstance().addError(ErrorID::warningIfcIncomp, typeName);
			continue;
		}

		if (productList == nullptr) { continue; }
		for (auto et = productList->begin(); et != productList->end(); ++et)
		{
			IfcSchema::IfcProduct* product = (*et)->as<IfcSchema::IfcProduct>();
			if (product == nullptr) { continue; }
			addObjectToIndex(product, i);
		}
	}

	std::cout << "finished in: " <<
		std::chrono::duration_cast<std::chrono::seconds>(std::chrono::high_resolution_clock::now() - startTime).count() <<
		UnitStringEnum::getString(UnitStringID::seconds) << std::endl;
}

void DataManager::addObjectToIndex(IfcSchema::IfcProduct* product, int fileIdx)
{
	// pass over if dub, subtypes are returned with their supertype
	if (productIndxLookup_.find(product->GlobalId()) != productIndxLookup_.end()) { return; }

	TopoDS_Shape shape = getObjectShape(product);
	if (shape.IsNull())
	{
		ErrorCollection::getInstance().addError(ErrorID::warningFailedObjectConversion, product->GlobalId());
		return;
	}

	BoostBox3D box;
	try
	{
		box = helperFunctions::createBBox(shape, 0);
	}
	catch (const ErrorID&)
	{
		ErrorCollection::getInstance().addError(ErrorID::warningFailedObjectConversion, product->GlobalId());
		return;
	}

	std::string productType = product->data().type()->name();
	std::string productName = product->Name().get_value_or("");
	std::string productTag = "";
	IfcSchema::IfcElement* element = product->as<IfcSchema::IfcElement>();
	if (element != nullptr) { productTag = element->Tag().get_value_or(""); }

	std::optional<WallGeometry> wallGeometry;
	if (productType != "IfcWindow" && productType != "IfcDoor")
	{
		wallGeometry = computeWallGeometry(product, box, fileIdx);
	}

	std::shared_ptr<ElementSpatialData> lookup = std::make_shared<ElementSpatialData>(
		product->GlobalId(),
		productType,
		productName,
		productTag,
		box,
		wallGeometry
	);

	int locationIdx = elementIndex_.addElement(lookup);
	productIndxLookup_.emplace(product->GlobalId(), locationIdx);
	productFileLookup_.emplace(product->GlobalId(), fileIdx);
	return;
}

std::optional<WallGeometry> DataManager::computeWallGeometry(IfcSchema::IfcProduct* product, const BoostBox3D& box, int fileIdx)
{
	std::optional<gp_Trsf> placement = getObjectPlacement(product);
	if (!placement.has_value()) { return std::nullopt; }

	WallGeometry wallGeometry;
	wallGeometry.axis_ = gp_Lin(gp_Pnt(0, 0, 0).Transformed(*placement), gp_Dir(1, 0, 0).Transformed(*placement));

	IfcSchema::IfcLocalPlacement* localPlacement = product->ObjectPlacement()->as<IfcSchema::IfcLocalPlacement>();
	if (localPlacement != nullptr)
	{
		IfcSchema::IfcAxis2Placement3D* relativePlacement = localPlacement->RelativePlacement()->as<IfcSchema::IfcAxis2Placement3D>();
		if (relativePlacement != nullptr)
		{
			std::vector<double> directionRatios = helperFunctions::getDirectionRatios(relativePlacement->RefDirection());
			if (!directionRatios.empty())
			{
				directionRatios.resize(3, 0);
				wallGeometry.referenceDirection_ = gp_Vec(directionRatios[0], directionRatios[1], directionRatios[2]);
			}
		}
	}

	std::optional<double> wallLength = getLengthProperty(product->GlobalId(), fileIdx, IfcPropertyID::psetDimensions, IfcPropertyID::length);
	if (wallLength.has_value())
	{
		wallGeometry.length_ = *wallLength;
	}
	else
	{
		// horizontal extent of the wall
		double dx = box.max_corner().get<0>() - box.min_corner().get<0>();
		double dy = box.max_corner().get<1>() - box.min_corner().get<1>();
		wallGeometry.length_ = std::max(dx, dy);
	}
	return wallGeometry;
}

IfcGeom::Kernel* DataManager::getKernelObject(const std::string& productGuid)
{
	if (dataCollectionSize_ == 1)
	{
		return datacollection_[0]->getKernelPtr();
	}

	auto fileSearch = productFileLookup_.find(productGuid);
	if (fileSearch != productFileLookup_.end()) { return datacollection_[fileSearch->second]->getKernelPtr(); }

	for (int i = 0; i < dataCollectionSize_; i++)
	{
		try { datacollection_[i]->getFilePtr()->instance_by_guid(productGuid); }
		catch (const IfcParse::IfcException&) { continue; }

		return datacollection_[i]->getKernelPtr();
	}
	return nullptr;
}

int DataManager::getFileLocation(const std::string& productGuid) const
{
	auto fileSearch = productFileLookup_.find(productGuid);
	if (fileSearch == productFileLookup_.end()) { return -1; }
	return fileSearch->second;
}

IfcSchema::IfcProduct* DataManager::getIndexedProduct(const std::string& productGuid) const
{
	int fileIdx = getFileLocation(productGuid);
	if (fileIdx == -1) { return nullptr; }

	IfcUtil::IfcBaseClass* productBase = datacollection_[fileIdx]->getFilePtr()->instance_by_guid(productGuid);
	if (productBase == nullptr) { return nullptr; }
	return productBase->as<IfcSchema::IfcProduct>();
}

void DataManager::addPsetToLookup(const std::string& objectGuid, IfcSchema::IfcPropertySet* propertySet)
{
	if (propertySet == nullptr) { return; }
	nlohmann::json& objectProperties = propertyLookup_[objectGuid];

	std::string psetName = propertySet->Name().get_value_or("");
	nlohmann::json psetValues = helperFunctions::collectPropertyValues(propertySet);
	for (auto valueIt = psetValues.begin(); valueIt != psetValues.end(); ++valueIt)
	{
		objectProperties[psetName][valueIt.key()] = valueIt.value();
	}
}

void DataManager::populatePropertyLookup()
{
	for (int i = 0; i < dataCollectionSize_; i++)
	{
		IfcParse::IfcFile* fileObject = datacollection_[i]->getFilePtr();

		// type property sets first so instance values take precedence
		IfcSchema::IfcRelDefinesByType::list::ptr typeRels = fileObject->instances_by_type<IfcSchema::IfcRelDefinesByType>();
		for (auto it = typeRels->begin(); it != typeRels->end(); ++it) {
			IfcSchema::IfcRelDefinesByType* typeRel = *it;
			IfcSchema::IfcTypeObject* typeObject = typeRel->RelatingType();
			if (typeObject == nullptr) { continue; }

			boost::optional<IfcSchema::IfcPropertySetDefinition::list::ptr> psetList = typeObject->HasPropertySets();
			if (!psetList) { continue; }

			IfcSchema::IfcObject::list::ptr relatedObjects = typeRel->RelatedObjects();
			for (auto psetIt = (*psetList)->begin(); psetIt != (*psetList)->end(); ++psetIt)
			{
				IfcSchema::IfcPropertySet* propertySet = (*psetIt)->as<IfcSchema::IfcPropertySet>();
				if (propertySet == nullptr) { continue; }

				for (auto et = relatedObjects->begin(); et != relatedObjects->end(); ++et) {
					addPsetToLookup((*et)->GlobalId(), propertySet);
				}
			}
		}

		IfcSchema::IfcRelDefinesByProperties::list::ptr propteriesRels = fileObject->instances_by_type<IfcSchema::IfcRelDefinesByProperties>();
		for (auto it = propteriesRels->begin(); it != propteriesRels->end(); ++it) {
			IfcSchema::IfcRelDefinesByProperties* propteriesRel = *it;

			IfcSchema::IfcPropertySet* propertySet = propteriesRel->RelatingPropertyDefinition()->as<IfcSchema::IfcPropertySet>();
			if (propertySet == nullptr) { continue; }

			IfcSchema::IfcObject::list::ptr relatedObjects = propteriesRel->RelatedObjects();
			for (auto et = relatedObjects->begin(); et != relatedObjects->end(); ++et) {
				addPsetToLookup((*et)->GlobalId(), propertySet);
			}
		}
	}
}

bool DataManager::hasSetUnits() const {
	for (int i = 0; i < dataCollectionSize_; i++)
	{
		if (!datacollection_[i]->getLengthMultiplier()) { return false; }
	}
	return true;
}

void DataManager::internalizeGeo()
{
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoInternalizingGeo) << std::endl;
	auto startTime = std::chrono::high_resolution_clock::now();

	populatePropertyLookup();

	std::cout <<
		CommunicationStringEnum::getString(CommunicationStringID::indentSuccesFinished) <<
		std::chrono::duration_cast<std::chrono::seconds>(std::chrono::high_resolution_clock::now() - startTime).count() <<
		UnitStringEnum::getString(UnitStringID::seconds) << "\n" << std::endl;
}

void DataManager::indexGeo()
{
	if (elementIndex_.size() > 0) { return; }
	std::cout << CommunicationStringEnum::getString(CommunicationStringID::infoCreateSpatialIndex) << std::endl;

	for (const std::string& wallType : SettingsCollection::getInstance().getWallTypeList())
	{
		timedAddObjectListToIndex(wallType);
	}
	timedAddObjectListToIndex<IfcSchema::IfcWindow>("IfcWindow");
	timedAddObjectListToIndex<IfcSchema::IfcDoor>("IfcDoor");
	std::cout << std::endl;
	return;
}

IfcSchema::IfcRepresentation* DataManager::getProductRepPtr(IfcSchema::IfcProduct* product)
{
	IfcSchema::IfcRepresentation* ifc_representation = nullptr;
	if (product->Representation())
	{
		IfcSchema::IfcProductRepresentation* prodrep = product->Representation();
		IfcSchema::IfcRepresentation::list::ptr reps = prodrep->Representations();

		for (IfcSchema::IfcRepresentation::list::it it = reps->begin(); it != reps->end(); ++it) {
			IfcSchema::IfcRepresentation* rep = *it;
			if (rep->RepresentationIdentifier().get_value_or("") == IfcPropertyEnum::getString(IfcPropertyID::body)) {
				ifc_representation = rep;
				break;
			}
		}
	}
	return ifc_representation;
}

std::optional<gp_Trsf> DataManager::getObjectPlacement(IfcSchema::IfcProduct* product)
{
	if (product->ObjectPlacement() == nullptr) { return std::nullopt; }

	IfcGeom::Kernel* kernelObject = getKernelObject(product->GlobalId());
	if (kernelObject == nullptr) { return std::nullopt; }

	gp_Trsf trsf;
	if (!kernelObject->convert_placement(product->ObjectPlacement(), trsf)) { return std::nullopt; }
	return trsf;
}

TopoDS_Shape DataManager::getObjectShape(IfcSchema::IfcProduct* product)
{
	IfcSchema::IfcRepresentation* ifc_representation = getProductRepPtr(product);
	if (ifc_representation == nullptr) { return {}; }

	IfcGeom::Kernel* kernelObject = getKernelObject(product->GlobalId());
	if (kernelObject == nullptr) { return {}; }

	std::optional<gp_Trsf> trsf = getObjectPlacement(product);
	if (!trsf.has_value()) { return {}; }

	IfcGeom::IteratorSettings iteratorSettings = SettingsCollection::getInstance().iteratorSettings();
	IfcGeom::BRepElement* brep = kernelObject->convert(iteratorSettings, ifc_representation, product);
	if (brep == nullptr) { return {}; }

	gp_Trsf placement;
	kernelObject->convert_placement(ifc_representation, placement);

	TopoDS_Compound comp = brep->geometry().as_compound();
	comp.Move(*trsf * placement); // location in global space
	return comp;
}

nlohmann::json DataManager::getPropertyValue(const std::string& objectGuid, IfcPropertyID psetName, IfcPropertyID propertyName) const
{
	auto objectSearch = propertyLookup_.find(objectGuid);
	if (objectSearch == propertyLookup_.end()) { return nullptr; }

	const nlohmann::json& objectProperties = objectSearch->second;
	std::string psetString = IfcPropertyEnum::getString(psetName);
	if (!objectProperties.contains(psetString)) { return nullptr; }

	const nlohmann::json& psetValues = objectProperties[psetString];
	std::string propertyString = IfcPropertyEnum::getString(propertyName);
	if (!psetValues.contains(propertyString)) { return nullptr; }
	return psetValues[propertyString];
}

std::optional<double> DataManager::getLengthProperty(const std::string& objectGuid, int fileIdx, IfcPropertyID psetName, IfcPropertyID propertyName) const
{
	nlohmann::json value = getPropertyValue(objectGuid, psetName, propertyName);
	if (!value.is_number()) { return std::nullopt; }
	return value.get<double>() * getScaler(fileIdx);
}

const nlohmann::json& DataManager::getObjectProperties(const std::string& objectGuid) const
{
	static const nlohmann::json emptyProperties = nlohmann::json::object();
	auto objectSearch = propertyLookup_.find(objectGuid);
	if (objectSearch == propertyLookup_.end()) { return emptyProperties; }
	return objectSearch->second;
}

std::optional<bool> DataManager::findBoolProperty(const nlohmann::json& objectProperties, IfcPropertyID preferredPset, IfcPropertyID propertyName)
{
	if (!objectProperties.is_object()) { return std::nullopt; }

	std::string psetString = IfcPropertyEnum::getString(preferredPset);
	std::string propertyString = IfcPropertyEnum::getString(propertyName);

	if (objectProperties.contains(psetString))
	{
		const nlohmann::json& psetValues = objectProperties[psetString];
		if (psetValues.contains(propertyString) && psetValues[propertyString].is_boolean())
		{
			return psetValues[propertyString].get<bool>();
		}
	}

	// exporters do not always store the flag in the common pset
	for (auto psetIt = objectProperties.begin(); psetIt != objectProperties.end(); ++psetIt)
	{
		const nlohmann::json& psetValues = psetIt.value();
		if (!psetValues.is_object() || !psetValues.contains(propertyString)) { continue; }
		if (!psetValues[propertyString].is_boolean()) { continue; }
		return psetValues[propertyString].get<bool>();
	}
	return std::nullopt;
}
