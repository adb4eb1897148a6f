#include "helper.h"
#include "openingLocator.h"
#include "settingsCollection.h"
#include "stringManager.h"

// Boost includes
#include <boost/algorithm/string.hpp>
#include <boost/geometry.hpp>
#include <boost/geometry/index/rtree.hpp>

// IfcOpenShell includes
#include <ifcparse/IfcFile.h>
#include <ifcgeom_schema_agnostic/Kernel.h>
#include <ifcparse/IfcHierarchyHelper.h>

// OpenCascade includes
#include <gp_Trsf.hxx>
#include <gp_Vec.hxx>
#include <TopoDS.hxx>

#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#ifndef DATAMANAGER_DATAMANAGER_H
#define DATAMANAGER_DATAMANAGER_H

class fileKernelCollection
{
private:
	IfcParse::IfcFile* file_; //TODO: find out why memory needs to be leaked
	std::unique_ptr<IfcGeom::Kernel> kernel_;

	// The unit multiplier found
	double length_ = 0;

	double getSiPrefixValue(const IfcSchema::IfcSIUnit& unitItem);
	double getSiScaleValue(const IfcSchema::IfcSIUnit& unitItem);

public:
	fileKernelCollection(const std::string& file);

	/// returns the pointer to the file object
	IfcParse::IfcFile* getFilePtr()  { return file_; }
	/// returns the pointer to the kernel object
	IfcGeom::Kernel* getKernelPtr() { return kernel_.get(); }
	/// returns the length multiplier
	double getLengthMultiplier() const { return length_; }
	/// returns if the file object is good (functioning)
	bool isGood() { return file_->good(); }

	/// internalizes the units that are stored in the file
	void setUnits();
};

/// <summary>
/// Manages the IFC file collection
/// </summary>
class DataManager
{
private:
	bool isPopulated_ = false;

	std::vector<std::unique_ptr<fileKernelCollection>> datacollection_;
	int dataCollectionSize_ = 0;

	// walls, windows and doors
	ElementIndex elementIndex_;
	// guid to location in the element index
	std::unordered_map<std::string, int> productIndxLookup_;
	// guid to the file the product is stored in
	std::unordered_map<std::string, int> productFileLookup_;

	// guid to {pset name : {property name : value}}, type psets are overwritten by instance psets
	std::unordered_map<std::string, nlohmann::json> propertyLookup_;

	/// finds the ifc schema that is used in the supplied file
	bool findSchema(const std::string& path, bool quiet = false);

	/// adds all instances of the template type to the index and reports to user
	template <typename IfcType>
	void timedAddObjectListToIndex(const std::string& typeName);
	/// adds all instances of the string type to the index and reports to user
	void timedAddObjectListToIndex(const std::string& typeName);
	/// adds the product to the spatial index
	void addObjectToIndex(IfcSchema::IfcProduct* product, int fileIdx);
	/// computes the world axis, reference direction and length of a wall
	std::optional<WallGeometry> computeWallGeometry(IfcSchema::IfcProduct* product, const BoostBox3D& box, int fileIdx);

	/// get the kernel which contains the product with the supplied product guid
	IfcGeom::Kernel* getKernelObject(const std::string& productGuid);

	/// populate a map that has all the guid related propertysets
	void populatePropertyLookup();
	/// merges the property set into the lookup of the object
	void addPsetToLookup(const std::string& objectGuid, IfcSchema::IfcPropertySet* propertySet);

public:
	/*
	construct and populate a helper
	creates and stores SI unit mulitpliers for length
	creates and stores the file and kernel for quick acess
	*/
	explicit DataManager() {};
	explicit DataManager(const std::vector<std::string>& path);

	/// returns true if helper is well populated
	bool isPopulated() const { return isPopulated_; }
	/// returns true when the length multiplier of every file is not 0
	bool hasSetUnits() const;
	/// returns a pointer to the sourcefile
	IfcParse::IfcFile* getSourceFile(int i) const { return datacollection_[i].get()->getFilePtr(); }
	/// get the total amount of items in the datacollection
	int getSourceFileCount() const { return dataCollectionSize_; }
	/// get the length multiplier of a sourcefile
	double getScaler(int i) const { return datacollection_[i].get()->getLengthMultiplier(); }

	/// get the index of the walls, windows and doors
	const ElementIndex* getElementIndex() const { return &elementIndex_; }
	/// get the file the indexed product is stored in, -1 if not indexed
	int getFileLocation(const std::string& productGuid) const;
	/// get the indexed product, nullptr if not indexed
	IfcSchema::IfcProduct* getIndexedProduct(const std::string& productGuid) const;

	// internalises the property data of the files
	void internalizeGeo();
	// makes a spatial index for the geometry
	void indexGeo();

	/// get the product representation from the object from the kernel
	IfcSchema::IfcRepresentation* getProductRepPtr(IfcSchema::IfcProduct* product);
	/// get the shape of an ifcproduct in meters
	TopoDS_Shape getObjectShape(IfcSchema::IfcProduct* product);
	/// get the world placement of an ifcproduct in meters, nullopt if it has no placement
	std::optional<gp_Trsf> getObjectPlacement(IfcSchema::IfcProduct* product);

	/// returns the property value as stored in the file, null if not present
	nlohmann::json getPropertyValue(const std::string& objectGuid, IfcPropertyID psetName, IfcPropertyID propertyName) const;
	/// returns the property value scaled to meters, nullopt if not present or not a number
	std::optional<double> getLengthProperty(const std::string& objectGuid, int fileIdx, IfcPropertyID psetName, IfcPropertyID propertyName) const;
	/// returns the pset to value lookup of an object, an empty object if it has no psets
	const nlohmann::json& getObjectProperties(const std::string& objectGuid) const;

	/// searches a boolean property in every pset of the lookup, the preferred pset is searched first
	static std::optional<bool> findBoolProperty(const nlohmann::json& objectProperties, IfcPropertyID preferredPset, IfcPropertyID propertyName);
};

#endif // DATAMANAGER_DATAMANAGER_H
