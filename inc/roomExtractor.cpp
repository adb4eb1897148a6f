#include "roomExtractor.h"
#include "errorCollection.h"
#include "settingsCollection.h"
#include "stringManager.h"

#include <iostream>

RoomExtractor::RoomExtractor(DataManager* dataManager)
	: resolver_(SettingsCollection::getInstance().getExcludedRoomList()),
	classifier_(SettingsCollection::getInstance().angularTolerance()),
	locator_(
		dataManager->getElementIndex(),
		classifier_,
		SettingsCollection::getInstance().searchBuffer(),
		SettingsCollection::getInstance().wallPlaneTolerance(),
		SettingsCollection::getInstance().getWallTypeList()
	),
	corrector_(SettingsCollection::getInstance().spatialTolerance())
{
	dataManager_ = dataManager;
}

void RoomExtractor::extract()
{
	bool hasSpaces = false;
	for (int i = 0; i < dataManager_->getSourceFileCount(); i++)
	{
		IfcSchema::IfcSpace::list::ptr spaceList = dataManager_->getSourceFile(i)->instances_by_type<IfcSchema::IfcSpace>();
		for (auto it = spaceList->begin(); it != spaceList->end(); ++it)
		{
			hasSpaces = true;
			processSpace(*it, i);
		}
	}

	if (!hasSpaces)
	{
		ErrorCollection::getInstance().addError(ErrorID::warningIfcNoRoomObjects);
		std::cout << errorWarningStringEnum::getString(ErrorID::warningIfcNoRoomObjects) << std::endl;
	}
}

void RoomExtractor::processSpace(IfcSchema::IfcSpace* space, int fileIdx)
{
	std::optional<RoomRecord> room = extractRoom(space, fileIdx);
	if (!room.has_value()) { return; }

	roomList_.emplace_back(*room);
	extractOpenings(space, *room);
	extractWalls(space, *room, fileIdx);
}

std::optional<RoomRecord> RoomExtractor::extractRoom(IfcSchema::IfcSpace* space, int fileIdx)
{
	RoomRecord room;
	room.code_ = space->Name().get_value_or("");
	room.displayName_ = space->LongName().get_value_or(room.code_);

	if (resolver_.isExcluded(room.displayName_)) { return std::nullopt; }

	if (room.code_.empty())
	{
		ErrorCollection::getInstance().addError(ErrorID::warningIfcNoObjectName, space->GlobalId());
	}

	IfcSchema::IfcRepresentation* representation = dataManager_->getProductRepPtr(space);
	if (representation == nullptr)
	{
		ErrorCollection::getInstance().addError(ErrorID::warningIfcNoRepresentation, space->GlobalId());
		return std::nullopt;
	}

	IfcSchema::IfcRepresentationItem::list::ptr itemList = representation->Items();
	if (itemList->size() == 0)
	{
		ErrorCollection::getInstance().addError(ErrorID::warningIfcNoRepresentation, space->GlobalId());
		return std::nullopt;
	}

	IfcSchema::IfcExtrudedAreaSolid* extrusion = (*itemList->begin())->as<IfcSchema::IfcExtrudedAreaSolid>();
	if (extrusion == nullptr)
	{
		ErrorCollection::getInstance().addError(ErrorID::warningUnsupportedProfile, space->GlobalId());
		return std::nullopt;
	}

	double scaler = dataManager_->getScaler(fileIdx);
	IfcSchema::IfcProfileDef* profile = extrusion->SweptArea();

	ProfileBounds bounds;
	if (profile->as<IfcSchema::IfcRectangleProfileDef>() != nullptr)
	{
		IfcSchema::IfcRectangleProfileDef* rectangle = profile->as<IfcSchema::IfcRectangleProfileDef>();
		bounds = resolver_.resolveRectangle(rectangle->XDim() * scaler, rectangle->YDim() * scaler);
	}
	else if (profile->as<IfcSchema::IfcArbitraryClosedProfileDef>() != nullptr)
	{
		IfcSchema::IfcPolyline* outerCurve = profile->as<IfcSchema::IfcArbitraryClosedProfileDef>()->OuterCurve()->as<IfcSchema::IfcPolyline>();
		if (outerCurve == nullptr)
		{
			ErrorCollection::getInstance().addError(ErrorID::warningUnsupportedProfile, space->GlobalId());
			return std::nullopt;
		}

		std::vector<gp_Pnt> pointList;
		IfcSchema::IfcCartesianPoint::list::ptr ifcPointList = outerCurve->Points();
		for (auto pointIt = ifcPointList->begin(); pointIt != ifcPointList->end(); ++pointIt)
		{
			std::vector<double> coordinates = (*pointIt)->Coordinates();
			coordinates.resize(3, 0);
			pointList.emplace_back(gp_Pnt(coordinates[0] * scaler, coordinates[1] * scaler, coordinates[2] * scaler));
		}
		bounds = resolver_.resolvePolygon(pointList);
	}
	else
	{
		ErrorCollection::getInstance().addError(ErrorID::warningUnsupportedProfile, space->GlobalId());
		return std::nullopt;
	}

	if (bounds.isDegenerate_)
	{
		ErrorCollection::getInstance().addError(ErrorID::warningDegenerateProfile, room.code_);
	}

	room.width_ = bounds.width_;
	room.depth_ = bounds.depth_;
	room.isBoundingBox_ = bounds.isBoundingBox_;

	std::optional<double> height = dataManager_->getLengthProperty(space->GlobalId(), fileIdx, IfcPropertyID::psetDimensions, IfcPropertyID::unboundedHeight);
	if (height.has_value())
	{
		room.height_ = helperFunctions::roundTo(*height, 3);
	}
	else
	{
		ErrorCollection::getInstance().addError(ErrorID::warningNoRoomHeight, room.code_);
		room.height_ = helperFunctions::roundTo(extrusion->Depth() * scaler, 3);
	}
	return room;
}

void RoomExtractor::extractOpenings(IfcSchema::IfcSpace* space, const RoomRecord& room)
{
	TopoDS_Shape spaceShape = dataManager_->getObjectShape(space);
	if (spaceShape.IsNull())
	{
		ErrorCollection::getInstance().addError(ErrorID::warningFailedObjectConversion, space->GlobalId());
		return;
	}

	BoostBox3D spaceBox;
	try
	{
		spaceBox = helperFunctions::createBBox(spaceShape, SettingsCollection::getInstance().searchBuffer());
	}
	catch (const ErrorID&)
	{
		ErrorCollection::getInstance().addError(ErrorID::warningFailedObjectConversion, space->GlobalId());
		return;
	}

	const ElementIndex* elementIndex = dataManager_->getElementIndex();
	for (int locationIdx : elementIndex->query(spaceBox))
	{
		std::shared_ptr<ElementSpatialData> lookup = elementIndex->getLookup(locationIdx);
		const std::string& typeName = lookup->getTypeName();
		if (typeName != "IfcWindow" && typeName != "IfcDoor") { continue; }

		IfcSchema::IfcProduct* product = dataManager_->getIndexedProduct(lookup->getGuid());
		if (product == nullptr) { continue; }
		int fileIdx = dataManager_->getFileLocation(lookup->getGuid());

		if (typeName == "IfcWindow")
		{
			windowList_.emplace_back(extractWindow(product->as<IfcSchema::IfcWindow>(), lookup->getBox(), room, fileIdx));
			continue;
		}

		std::optional<DoorRecord> door = extractDoor(product->as<IfcSchema::IfcDoor>(), room, fileIdx);
		if (door.has_value()) { doorList_.emplace_back(*door); }
	}
}

void RoomExtractor::extractWalls(IfcSchema::IfcSpace* space, const RoomRecord& room, int fileIdx)
{
	double scaler = dataManager_->getScaler(fileIdx);
	std::unordered_set<std::string> foundWallList;

	IfcSchema::IfcRelSpaceBoundary::list::ptr boundaryList = space->BoundedBy();
	for (auto it = boundaryList->begin(); it != boundaryList->end(); ++it)
	{
		IfcSchema::IfcElement* boundingElement = (*it)->RelatedBuildingElement();
		if (boundingElement == nullptr) { continue; }

		IfcSchema::IfcWall* wall = boundingElement->as<IfcSchema::IfcWall>();
		if (wall == nullptr) { continue; }

		// a wall bounds a space with multiple boundaries
		if (foundWallList.find(wall->GlobalId()) != foundWallList.end()) { continue; }
		foundWallList.insert(wall->GlobalId());

		WallRecord wallRecord;
		wallRecord.roomCode_ = room.code_;
		wallRecord.roomName_ = room.displayName_;
		wallRecord.guid_ = wall->GlobalId();
		wallRecord.name_ = wall->Name().get_value_or("");
		wallRecord.tag_ = wall->Tag().get_value_or("");
		wallRecord.isExternal_ = DataManager::findBoolProperty(dataManager_->getObjectProperties(wall->GlobalId()), IfcPropertyID::psetWallCommon, IfcPropertyID::isExternal);

		if (!helperFunctions::containsKeyword(wallRecord.name_, IfcPropertyEnum::getString(IfcPropertyID::roofKeyword)))
		{
			for (MaterialLayer layer : helperFunctions::getMaterialLayers(wall))
			{
				layer.thickness_ = helperFunctions::roundTo(layer.thickness_ * scaler, 3);
				wallRecord.layerList_.emplace_back(layer);
			}
		}
		wallList_.emplace_back(wallRecord);
	}
}

std::optional<RawPlacement> RoomExtractor::readRawPlacement(IfcSchema::IfcProduct* product, int fileIdx)
{
	if (product->ObjectPlacement() == nullptr) { return std::nullopt; }

	IfcSchema::IfcLocalPlacement* localPlacement = product->ObjectPlacement()->as<IfcSchema::IfcLocalPlacement>();
	if (localPlacement == nullptr || localPlacement->PlacementRelTo() == nullptr) { return std::nullopt; }

	IfcSchema::IfcLocalPlacement* hostPlacement = localPlacement->PlacementRelTo()->as<IfcSchema::IfcLocalPlacement>();
	if (hostPlacement == nullptr) { return std::nullopt; }

	IfcSchema::IfcAxis2Placement3D* hostAxisPlacement = hostPlacement->RelativePlacement()->as<IfcSchema::IfcAxis2Placement3D>();
	if (hostAxisPlacement == nullptr) { return std::nullopt; }

	std::vector<double> coordinates = hostAxisPlacement->Location()->Coordinates();
	coordinates.resize(3, 0);

	double scaler = dataManager_->getScaler(fileIdx);
	RawPlacement rawPlacement;
	rawPlacement.rawX_ = coordinates[0] * scaler;
	rawPlacement.rawY_ = coordinates[2] * scaler;

	std::vector<double> directionRatios = helperFunctions::getDirectionRatios(hostAxisPlacement->RefDirection());
	if (!directionRatios.empty())
	{
		directionRatios.resize(3, 0);
		rawPlacement.hostAxis_ = gp_Vec(directionRatios[0], directionRatios[1], directionRatios[2]);
	}
	return rawPlacement;
}

WindowRecord RoomExtractor::extractWindow(IfcSchema::IfcWindow* window, const BoostBox3D& windowBox, const RoomRecord& room, int fileIdx)
{
	ErrorCollection& errorCollection = ErrorCollection::getInstance();
	SettingsCollection& settingsCollection = SettingsCollection::getInstance();
	double scaler = dataManager_->getScaler(fileIdx);

	WindowRecord windowRecord;
	windowRecord.roomCode_ = room.code_;
	windowRecord.guid_ = window->GlobalId();
	windowRecord.name_ = window->Name().get_value_or("");
	windowRecord.tag_ = window->Tag().get_value_or("");

	std::optional<double> height = dataManager_->getLengthProperty(window->GlobalId(), fileIdx, IfcPropertyID::psetTypeDimensions, IfcPropertyID::height);
	std::optional<double> width = dataManager_->getLengthProperty(window->GlobalId(), fileIdx, IfcPropertyID::psetTypeDimensions, IfcPropertyID::width);
	if (!height.has_value() && window->OverallHeight()) { height = *window->OverallHeight() * scaler; }
	if (!width.has_value() && window->OverallWidth()) { width = *window->OverallWidth() * scaler; }

	if (!height.has_value() || !width.has_value())
	{
		errorCollection.addError(ErrorID::warningMissingOpeningDimensions, window->GlobalId());
	}
	windowRecord.height_ = helperFunctions::roundTo(height.value_or(0), 3);
	windowRecord.width_ = helperFunctions::roundTo(width.value_or(0), 3);

	std::optional<double> sillHeight = dataManager_->getLengthProperty(window->GlobalId(), fileIdx, IfcPropertyID::psetConstraints, IfcPropertyID::sillHeight);
	if (sillHeight.has_value()) { windowRecord.sillHeight_ = helperFunctions::roundTo(*sillHeight, 3); }

	std::optional<WallMatch> wallMatch = locator_.locate(windowBox);
	if (!wallMatch.has_value())
	{
		errorCollection.addError(ErrorID::warningNoSupportingWall, window->GlobalId());
		return windowRecord;
	}

	windowRecord.hasWall_ = true;
	windowRecord.wallOrientation_ = wallMatch->orientation_;
	windowRecord.wallLength_ = helperFunctions::roundTo(wallMatch->wallLength_, 3);

	if (windowRecord.wallOrientation_ == Orientation::Unknown)
	{
		errorCollection.addError(ErrorID::warningOrientationUnresolved, window->GlobalId());
	}

	std::optional<RawPlacement> rawPlacement = readRawPlacement(window, fileIdx);
	if (!rawPlacement.has_value())
	{
		// without a location the window can not be placed on the wall
		windowRecord.inRange_ = false;
		errorCollection.addError(ErrorID::warningLocationOutOfRange, window->GlobalId());
		return windowRecord;
	}

	PlacementInput placementInput;
	placementInput.rawX_ = rawPlacement->rawX_;
	placementInput.rawY_ = rawPlacement->rawY_;
	placementInput.wallLength_ = windowRecord.wallLength_;
	placementInput.openingWidth_ = windowRecord.width_;
	placementInput.roomWidth_ = room.width_;
	placementInput.roomDepth_ = room.depth_;

	if (settingsCollection.useDeclaredFrame())
	{
		placementInput.declaredFrame_ = PlacementCorrector::declaredFrame(
			rawPlacement->hostAxis_.value_or(gp_Vec(1, 0, 0)),
			gp_Vec(1, 0, 0),
			settingsCollection.angularTolerance()
		);
	}

	CorrectedPlacement placement = corrector_.correct(placementInput);
	windowRecord.locationX_ = helperFunctions::roundTo(placement.locationX_, 3);
	windowRecord.locationY_ = helperFunctions::roundTo(placement.locationY_, 3);
	windowRecord.frame_ = placement.frame_;
	windowRecord.inRange_ = placement.inRange_;

	if (!placement.inRange_)
	{
		errorCollection.addError(ErrorID::warningLocationOutOfRange, window->GlobalId());
	}
	return windowRecord;
}

bool RoomExtractor::isExternalDoor(const nlohmann::json& objectProperties)
{
	return DataManager::findBoolProperty(objectProperties, IfcPropertyID::psetDoorCommon, IfcPropertyID::isExternal).value_or(false);
}

std::optional<DoorRecord> RoomExtractor::extractDoor(IfcSchema::IfcDoor* door, const RoomRecord& room, int fileIdx)
{
	if (!isExternalDoor(dataManager_->getObjectProperties(door->GlobalId()))) { return std::nullopt; }

	double scaler = dataManager_->getScaler(fileIdx);

	DoorRecord doorRecord;
	doorRecord.roomCode_ = room.code_;
	doorRecord.roomName_ = room.displayName_;
	doorRecord.guid_ = door->GlobalId();
	doorRecord.name_ = door->Name().get_value_or("");
	doorRecord.tag_ = door->Tag().get_value_or("");

	if (!door->OverallHeight() || !door->OverallWidth())
	{
		ErrorCollection::getInstance().addError(ErrorID::warningMissingOpeningDimensions, door->GlobalId());
	}
	doorRecord.height_ = helperFunctions::roundTo(door->OverallHeight().get_value_or(0) * scaler, 3);
	doorRecord.width_ = helperFunctions::roundTo(door->OverallWidth().get_value_or(0) * scaler, 3);
	doorRecord.isGlazed_ =
		helperFunctions::containsKeyword(doorRecord.name_, IfcPropertyEnum::getString(IfcPropertyID::glassKeyword)) ||
		helperFunctions::hasGlassMaterial(door);
	return doorRecord;
}
