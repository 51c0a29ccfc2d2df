#pragma once
#include <cstdint>
#include <json/json.h>
#include "ReplicaTypes.hpp"

// Point-in-time copy of a segment's counters, consumed by flush decisions.
struct SegmentStatisticsUpdates {
    UniqueID segmentID = 0;
    int64_t memorySize = 0;
    int64_t numRows = 0;
    bool isNewSegment = false;
    Timestamp createTime = 0;
    Timestamp endTime = 0;
    MsgPositions startPositions;
    MsgPositions endPositions;

    Json::Value toJson() const;
};

class Segment {
public:
    Segment(UniqueID segmentID, UniqueID collectionID, UniqueID partitionID,
            Timestamp createTime, MsgPositions startPositions);

    UniqueID segmentID() const;
    UniqueID collectionID() const;
    UniqueID partitionID() const;
    int64_t numRows() const;
    int64_t memorySize() const;
    bool isNew() const;
    Timestamp createTime() const;
    Timestamp endTime() const;
    const MsgPositions& startPositions() const;
    const MsgPositions& endPositions() const;

    // Adds deltaRows, overwrites endTime and endPositions, and resets
    // memorySize to zero. Throws std::invalid_argument on a negative delta or
    // when the row count would overflow.
    void applyStatistics(int64_t deltaRows, Timestamp endTime, MsgPositions endPositions);

    // Snapshot-and-acknowledge: the returned snapshot carries the current
    // new flag, which is then cleared.
    SegmentStatisticsUpdates takeStatistics();

    Json::Value toJson() const;

private:
    UniqueID id;
    UniqueID collID;
    UniqueID partID;
    int64_t rows;
    int64_t memory;
    bool newFlag;
    Timestamp created;
    Timestamp ended;
    MsgPositions startPos;
    MsgPositions endPos;
};
