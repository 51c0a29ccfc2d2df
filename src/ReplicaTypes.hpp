#pragma once
#include <cstdint>
#include <string>
#include <vector>
#include <json/json.h>

using UniqueID = int64_t;
using Timestamp = uint64_t;

// Opaque message-queue checkpoint. Stored and forwarded, never interpreted.
struct MsgPosition {
    std::string channelName;
    std::string msgID;
    Timestamp timestamp = 0;

    bool operator==(const MsgPosition& other) const {
        return channelName == other.channelName && msgID == other.msgID && timestamp == other.timestamp;
    }
    bool operator!=(const MsgPosition& other) const { return !(*this == other); }
};

using MsgPositions = std::vector<MsgPosition>;

Json::Value positionToJson(const MsgPosition& position);
MsgPosition positionFromJson(const Json::Value& value);

Json::Value positionsToJson(const MsgPositions& positions);
// Accepts a JSON array (or null, which yields an empty sequence).
MsgPositions positionsFromJson(const Json::Value& value);
