#include "Segment.hpp"
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>

Json::Value SegmentStatisticsUpdates::toJson() const {
    Json::Value value(Json::objectValue);
    value["segmentID"] = (Json::Int64)segmentID;
    value["memorySize"] = (Json::Int64)memorySize;
    value["numRows"] = (Json::Int64)numRows;
    value["isNewSegment"] = isNewSegment;
    value["createTime"] = (Json::UInt64)createTime;
    value["endTime"] = (Json::UInt64)endTime;
    value["startPositions"] = positionsToJson(startPositions);
    value["endPositions"] = positionsToJson(endPositions);
    return value;
}

Segment::Segment(UniqueID segmentID, UniqueID collectionID, UniqueID partitionID,
                 Timestamp createTime, MsgPositions startPositions)
    : id(segmentID),
      collID(collectionID),
      partID(partitionID),
      rows(0),
      memory(0),
      newFlag(true),
      created(createTime),
      ended(0),
      startPos(std::move(startPositions)) {}

UniqueID Segment::segmentID() const {
    return id;
}

UniqueID Segment::collectionID() const {
    return collID;
}

UniqueID Segment::partitionID() const {
    return partID;
}

int64_t Segment::numRows() const {
    return rows;
}

int64_t Segment::memorySize() const {
    return memory;
}

bool Segment::isNew() const {
    return newFlag;
}

Timestamp Segment::createTime() const {
    return created;
}

Timestamp Segment::endTime() const {
    return ended;
}

const MsgPositions& Segment::startPositions() const {
    return startPos;
}

const MsgPositions& Segment::endPositions() const {
    return endPos;
}

void Segment::applyStatistics(int64_t deltaRows, Timestamp endTime, MsgPositions endPositions) {
    if (deltaRows < 0) {
        throw std::invalid_argument("negative row delta " + std::to_string(deltaRows) +
                                    " for segment " + std::to_string(id));
    }
    if (deltaRows > std::numeric_limits<int64_t>::max() - rows) {
        throw std::invalid_argument("row delta " + std::to_string(deltaRows) +
                                    " overflows row count of segment " + std::to_string(id));
    }
    // memorySize is reset on every update.
    memory = 0;
    rows += deltaRows;
    ended = endTime;
    endPos = std::move(endPositions);
}

SegmentStatisticsUpdates Segment::takeStatistics() {
    SegmentStatisticsUpdates updates;
    updates.segmentID = id;
    updates.memorySize = memory;
    updates.numRows = rows;
    updates.isNewSegment = newFlag;
    updates.createTime = created;
    updates.endTime = ended;
    updates.startPositions = startPos;
    updates.endPositions = endPos;
    newFlag = false;
    return updates;
}

Json::Value Segment::toJson() const {
    Json::Value value(Json::objectValue);
    value["segmentID"] = (Json::Int64)id;
    value["collectionID"] = (Json::Int64)collID;
    value["partitionID"] = (Json::Int64)partID;
    value["numRows"] = (Json::Int64)rows;
    value["memorySize"] = (Json::Int64)memory;
    value["isNew"] = newFlag;
    value["createTime"] = (Json::UInt64)created;
    value["endTime"] = (Json::UInt64)ended;
    value["startPositions"] = positionsToJson(startPos);
    value["endPositions"] = positionsToJson(endPos);
    return value;
}
