#pragma once
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include <json/json.h>
#include "CollectionRegistry.hpp"
#include "ReplicaConfig.hpp"
#include "SegmentRegistry.hpp"

// Collections and segments owned by this data node, behind one reader/writer
// lock. Readers share the lock; mutations and statistics snapshots (which
// clear the new flag) take it exclusively.
class CollectionReplica {
public:
    CollectionReplica() = default;
    explicit CollectionReplica(const ReplicaConfig& config);

    // collection
    int getCollectionNum() const;
    void addCollection(UniqueID collectionID, const Json::Value& schema);
    // Missing IDs are a silent no-op, unlike removeSegment.
    void removeCollection(UniqueID collectionID);
    std::shared_ptr<const Collection> getCollectionByID(UniqueID collectionID) const;
    std::shared_ptr<const Collection> getCollectionByName(const std::string& collectionName) const;
    UniqueID getCollectionIDByName(const std::string& collectionName) const;
    bool hasCollection(UniqueID collectionID) const;

    // segment
    void addSegment(UniqueID segmentID, UniqueID collectionID, UniqueID partitionID,
                    Timestamp createTime, MsgPositions startPositions);
    void removeSegment(UniqueID segmentID);
    bool hasSegment(UniqueID segmentID) const;
    void updateStatistics(UniqueID segmentID, int64_t numRows, Timestamp endTime,
                          MsgPositions endPositions);
    SegmentStatisticsUpdates getSegmentStatisticsUpdates(UniqueID segmentID);
    std::vector<SegmentStatisticsUpdates> getAllSegmentStatisticsUpdates();
    std::shared_ptr<const Segment> getSegmentByID(UniqueID segmentID) const;
    int getSegmentNum() const;
    std::vector<UniqueID> listSegmentIDs() const;

    const ReplicaConfig& config() const;

private:
    ReplicaConfig replicaConfig;
    CollectionRegistry collections;
    SegmentRegistry segments;
    mutable std::shared_mutex mutex;
};
