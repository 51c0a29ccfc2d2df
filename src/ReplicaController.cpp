#include "ReplicaController.hpp"
#include <sstream>
#include <string>
#include <stdexcept>
#include "ReplicaErrors.hpp"

namespace {

const char* const kMethods[] = {
    "getCollectionNum", "addCollection", "removeCollection", "getCollectionByID",
    "getCollectionByName", "getCollectionIDByName", "hasCollection",
    "addSegment", "removeSegment", "hasSegment", "getSegmentByID", "updateStatistics",
    "getSegmentStatisticsUpdates", "getAllSegmentStatisticsUpdates", "listSegments",
};

class UnknownMethodError : public std::runtime_error {
public:
    explicit UnknownMethodError(const std::string& method)
        : std::runtime_error("Method not found: " + method) {}
};

int64_t requireInt64(const Json::Value& params, const char* key) {
    const Json::Value& value = params[key];
    if (!value.isInt64()) {
        throw std::invalid_argument(std::string("params.") + key + " must be a 64-bit integer");
    }
    return value.asInt64();
}

uint64_t requireUInt64(const Json::Value& params, const char* key) {
    const Json::Value& value = params[key];
    if (!value.isUInt64()) {
        throw std::invalid_argument(std::string("params.") + key + " must be an unsigned integer");
    }
    return value.asUInt64();
}

std::string requireString(const Json::Value& params, const char* key) {
    const Json::Value& value = params[key];
    if (!value.isString()) {
        throw std::invalid_argument(std::string("params.") + key + " must be a string");
    }
    return value.asString();
}

Json::Value collectionToJson(const Collection& collection) {
    Json::Value value(Json::objectValue);
    value["collectionID"] = (Json::Int64)collection.id();
    value["name"] = collection.name();
    value["schema"] = collection.schema();
    return value;
}

}

ReplicaController::ReplicaController(const ReplicaConfig& config) : replica_(config) {}

CollectionReplica& ReplicaController::replica() {
    return replica_;
}

Json::Value ReplicaController::createResponse(const Json::Value& id, const Json::Value& result) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value ReplicaController::createError(const Json::Value& id, int code, const std::string& message) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

Json::Value ReplicaController::listMethods() const {
    Json::Value methods(Json::arrayValue);
    for (const char* method : kMethods) {
        methods.append(method);
    }
    return methods;
}

Json::Value ReplicaController::handleLine(const std::string& line) {
    Json::CharReaderBuilder builder;
    Json::Value request;
    std::string errs;

    std::istringstream iss(line);
    if (!Json::parseFromStream(builder, iss, &request, &errs)) {
        return createError(Json::Value(), kParseError, "JSON parse error: " + errs);
    }
    return handleRequest(request);
}

Json::Value ReplicaController::handleRequest(const Json::Value& request) {
    if (!request.isObject()) {
        return createError(Json::Value(), kInvalidParams, "Request must be a JSON object");
    }
    Json::Value id = request["id"];
    if (!request["method"].isString()) {
        return createError(id, kInvalidParams, "method must be a string");
    }
    std::string method = request["method"].asString();
    Json::Value params = request.get("params", Json::Value(Json::objectValue));
    if (!params.isObject()) {
        return createError(id, kInvalidParams, "params must be an object");
    }
    try {
        return createResponse(id, dispatch(method, params));
    } catch (const UnknownMethodError& e) {
        return createError(id, kMethodNotFound, e.what());
    } catch (const NotFoundError& e) {
        return createError(id, kNotFound, e.what());
    } catch (const DuplicateIdError& e) {
        return createError(id, kDuplicateId, e.what());
    } catch (const std::invalid_argument& e) {
        return createError(id, kInvalidParams, e.what());
    } catch (const std::exception& e) {
        return createError(id, kInternalError, std::string("Error: ") + e.what());
    }
}

Json::Value ReplicaController::dispatch(const std::string& method, const Json::Value& params) {
    Json::Value result(Json::objectValue);

    if (method == "getCollectionNum") {
        result["count"] = replica_.getCollectionNum();
    } else if (method == "addCollection") {
        UniqueID collectionID = requireInt64(params, "collectionID");
        replica_.addCollection(collectionID, params.get("schema", Json::Value(Json::objectValue)));
        result["collectionID"] = (Json::Int64)collectionID;
    } else if (method == "removeCollection") {
        UniqueID collectionID = requireInt64(params, "collectionID");
        replica_.removeCollection(collectionID);
        result["collectionID"] = (Json::Int64)collectionID;
    } else if (method == "getCollectionByID") {
        UniqueID collectionID = requireInt64(params, "collectionID");
        auto collection = replica_.getCollectionByID(collectionID);
        if (!collection) {
            throw NotFoundError("cannot find collection, id = " + std::to_string(collectionID));
        }
        result = collectionToJson(*collection);
    } else if (method == "getCollectionByName") {
        std::string name = requireString(params, "name");
        auto collection = replica_.getCollectionByName(name);
        if (!collection) {
            throw NotFoundError("cannot find collection: " + name);
        }
        result = collectionToJson(*collection);
    } else if (method == "getCollectionIDByName") {
        result["collectionID"] = (Json::Int64)replica_.getCollectionIDByName(requireString(params, "name"));
    } else if (method == "hasCollection") {
        result["exists"] = replica_.hasCollection(requireInt64(params, "collectionID"));
    } else if (method == "addSegment") {
        UniqueID segmentID = requireInt64(params, "segmentID");
        replica_.addSegment(segmentID,
                            requireInt64(params, "collectionID"),
                            requireInt64(params, "partitionID"),
                            requireUInt64(params, "createTime"),
                            positionsFromJson(params["startPositions"]));
        result["segmentID"] = (Json::Int64)segmentID;
    } else if (method == "removeSegment") {
        UniqueID segmentID = requireInt64(params, "segmentID");
        replica_.removeSegment(segmentID);
        result["segmentID"] = (Json::Int64)segmentID;
    } else if (method == "hasSegment") {
        result["exists"] = replica_.hasSegment(requireInt64(params, "segmentID"));
    } else if (method == "getSegmentByID") {
        UniqueID segmentID = requireInt64(params, "segmentID");
        auto segment = replica_.getSegmentByID(segmentID);
        if (!segment) {
            throw NotFoundError("cannot find segment, id = " + std::to_string(segmentID));
        }
        result = segment->toJson();
    } else if (method == "updateStatistics") {
        UniqueID segmentID = requireInt64(params, "segmentID");
        replica_.updateStatistics(segmentID,
                                  requireInt64(params, "numRows"),
                                  requireUInt64(params, "endTime"),
                                  positionsFromJson(params["endPositions"]));
        result["segmentID"] = (Json::Int64)segmentID;
    } else if (method == "getSegmentStatisticsUpdates") {
        result = replica_.getSegmentStatisticsUpdates(requireInt64(params, "segmentID")).toJson();
    } else if (method == "getAllSegmentStatisticsUpdates") {
        Json::Value updates(Json::arrayValue);
        for (const auto& update : replica_.getAllSegmentStatisticsUpdates()) {
            updates.append(update.toJson());
        }
        result["updates"] = updates;
    } else if (method == "listSegments") {
        Json::Value ids(Json::arrayValue);
        for (UniqueID segmentID : replica_.listSegmentIDs()) {
            ids.append((Json::Int64)segmentID);
        }
        result["segmentIDs"] = ids;
    } else if (method == "listMethods") {
        result["methods"] = listMethods();
    } else {
        throw UnknownMethodError(method);
    }
    return result;
}
