#include "ReplicaTypes.hpp"
#include <stdexcept>

Json::Value positionToJson(const MsgPosition& position) {
    Json::Value value(Json::objectValue);
    value["channelName"] = position.channelName;
    value["msgID"] = position.msgID;
    value["timestamp"] = (Json::UInt64)position.timestamp;
    return value;
}

MsgPosition positionFromJson(const Json::Value& value) {
    if (!value.isObject()) {
        throw std::invalid_argument("message position must be an object");
    }
    MsgPosition position;
    position.channelName = value.get("channelName", "").asString();
    position.msgID = value.get("msgID", "").asString();
    position.timestamp = value.get("timestamp", (Json::UInt64)0).asUInt64();
    return position;
}

Json::Value positionsToJson(const MsgPositions& positions) {
    Json::Value array(Json::arrayValue);
    for (const auto& position : positions) {
        array.append(positionToJson(position));
    }
    return array;
}

MsgPositions positionsFromJson(const Json::Value& value) {
    MsgPositions positions;
    if (value.isNull()) {
        return positions;
    }
    if (!value.isArray()) {
        throw std::invalid_argument("message positions must be an array");
    }
    positions.reserve(value.size());
    for (const auto& item : value) {
        positions.push_back(positionFromJson(item));
    }
    return positions;
}
